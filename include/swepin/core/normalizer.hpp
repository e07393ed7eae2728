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
 * @file normalizer.hpp
 * @brief First pipeline stage: separator stripping and layout detection.
 *
 * @details
 * The normalizer accepts exactly four textual layouts and rejects everything
 * else before any field is interpreted:
 *
 * | Layout                      | Example         |
 * |-----------------------------|-----------------|
 * | `LONG_WITHOUT_SEPARATOR`    | `198112189876`  |
 * | `LONG_WITH_SEPARATOR`       | `19811218-9876` |
 * | `SHORT_WITH_SEPARATOR`      | `811218-9876`   |
 * | `SHORT_WITHOUT_SEPARATOR`   | `8112189876`    |
 */

#pragma once

#include "swepin/core/result.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace swepin::core {

/**
 * @enum PinFormat
 * @brief The canonical textual layouts of an identity number.
 */
enum class PinFormat {
    LONG_WITHOUT_SEPARATOR,  ///< `YYYYMMDDBBBC` (12 digits).
    LONG_WITH_SEPARATOR,     ///< `YYYYMMDD-BBBC`.
    SHORT_WITH_SEPARATOR,    ///< `YYMMDD-BBBC`.
    SHORT_WITHOUT_SEPARATOR  ///< `YYMMDDBBBC` (10 digits).
};

/// @brief Human readable layout pattern, e.g. `"YYYYMMDD-NNNN"`.
std::string to_string(PinFormat format);

/**
 * @struct NormalizedInput
 * @brief Structurally valid input: 10 or 12 digits plus the separator, if any.
 */
struct NormalizedInput {
    std::string digits;            ///< Separator-free digit run.
    std::optional<char> separator; ///< `'-'` or `'+'` when written.
    PinFormat format;

    /// @brief True for the 12-digit layouts, where the century is explicit.
    bool has_century() const { return digits.size() == 12; }
};

/**
 * @class Normalizer
 * @brief Static structural checks on raw input.
 */
class Normalizer {
  public:
    /**
     * @brief Splits `input` into digits and separator and detects its layout.
     *
     * **Rejection rules (all `ErrorKind::FORMAT`):**
     * - any character other than ASCII digits, `-` and `+`;
     * - more than one separator;
     * - a separator anywhere but immediately before the final four digits;
     * - a digit count other than 10 or 12.
     */
    static Result<NormalizedInput> normalize(std::string_view input);

    /**
     * @brief True if `input` is structurally valid and written in exactly `format`.
     *
     * No date or checksum validation is performed.
     */
    static bool matches(std::string_view input, PinFormat format);
};

} // namespace swepin::core
