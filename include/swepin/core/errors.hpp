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
 * @file errors.hpp
 * @brief Error taxonomy of the identity number engine.
 *
 * @details
 * Input problems are values (`ParseError`) carried back to the caller inside a
 * `Result`. Only internal defects, i.e. a generated number that fails its own
 * re-validation, are thrown (`GeneratorInvariantError`).
 */

#pragma once

#include <stdexcept>
#include <string>

namespace swepin::core {

/**
 * @enum ErrorKind
 * @brief Classification of a rejected input.
 */
enum class ErrorKind {
    FORMAT,            ///< Length, character set or separator position violation.
    CENTURY_AMBIGUITY, ///< Separator and reference date admit no century.
    INVALID_DATE,      ///< Month or (coordination) day is not a real calendar day.
    CHECKSUM           ///< Check digit differs from the Luhn result.
};

/// @brief Stable name of an error kind (`"FormatError"`, `"ChecksumError"`, ...).
std::string to_string(ErrorKind kind);

/**
 * @struct ParseError
 * @brief A rejected input together with the offending field.
 *
 * `expected` and `actual` are short human readable fragments, e.g.
 * `expected = "01-12"`, `actual = "13"` for field `"month"`.
 */
struct ParseError {
    ErrorKind kind;
    std::string field;
    std::string expected;
    std::string actual;

    /**
     * @brief A complete sentence suitable for an end user.
     *
     * @code
     * // "ChecksumError: validation digit mismatch (expected 1, got 4)"
     * @endcode
     */
    std::string message() const;
};

/**
 * @class GeneratorInvariantError
 * @brief Thrown when a synthesized identity number fails re-validation.
 *
 * This signals a logic defect in the generator, never a user error, and is not
 * meant to be caught and retried.
 */
class GeneratorInvariantError : public std::logic_error {
  public:
    explicit GeneratorInvariantError(const std::string& what) : std::logic_error(what) {}
};

} // namespace swepin::core
