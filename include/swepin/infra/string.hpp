/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to
 * `std::string` used by the normalizer (digit scanning), the formatter
 * (zero padding), the table renderer (UTF-8 aware alignment) and the CLI
 * (line sanitizing).
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace swepin::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content, empty if `s` is blank.
     *
     * @code
     * std::string clean = swepin::infra::String::trim("  811218-9876\r\n"); // "811218-9876"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// @brief True if `s` is non-empty and consists solely of ASCII digits.
    static bool is_digits(std::string_view s);

    /**
     * @brief Converts a run of ASCII digits to its integer value.
     *
     * @note The caller guarantees `is_digits(s)`; no overflow checks are made
     * because every field of an identity number is at most four digits.
     */
    static int to_int(std::string_view s);

    /**
     * @brief Renders a non-negative integer left-padded with zeros.
     *
     * @code
     * String::zero_pad(7, 2);   // "07"
     * String::zero_pad(123, 3); // "123"
     * @endcode
     */
    static std::string zero_pad(int value, std::size_t width);

    /**
     * @brief Counts the terminal columns occupied by a UTF-8 string.
     *
     * Every code point is counted as one column; continuation bytes are skipped.
     * This is enough for the Latin-1 range and the box drawing characters used
     * by the table renderer.
     */
    static std::size_t display_width(std::string_view s);

    /// @brief Left-aligns `s` in a field of `width` columns.
    static std::string pad_right(const std::string& s, std::size_t width);

    /// @brief Centers `s` in a field of `width` columns (extra space goes right).
    static std::string center(const std::string& s, std::size_t width);

    /// @brief Repeats a (possibly multi-byte) glyph `count` times.
    static std::string repeat(std::string_view glyph, std::size_t count);
};

} // namespace swepin::infra
