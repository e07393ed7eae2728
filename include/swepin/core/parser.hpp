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
 * @file parser.hpp
 * @brief Entry point of the validation pipeline.
 *
 * @details
 * The parser chains the stages in a fixed order and stops at the first failure:
 *
 * 1. `Normalizer`          structure and layout        (`FORMAT`)
 * 2. `CalendarValidator`   month and day ranges        (`INVALID_DATE`)
 * 3. `CenturyResolver`     four-digit year, separator  (`CENTURY_AMBIGUITY`)
 * 4. `CalendarValidator`   day exists in that month    (`INVALID_DATE`)
 * 5. `Checksum`            Luhn check digit            (`CHECKSUM`)
 *
 * Bad input never throws; the failure is returned inside the `Result`.
 */

#pragma once

#include "swepin/core/date.hpp"
#include "swepin/core/normalizer.hpp"
#include "swepin/core/pin.hpp"
#include "swepin/core/result.hpp"

#include <string_view>

namespace swepin::core {

using ParseResult = Result<Pin>;

/**
 * @class Parser
 * @brief Static factory for `Pin` instances.
 */
class Parser {
  public:
    /**
     * @brief Validates `input` in any of the four accepted layouts.
     *
     * @param input Raw text, e.g. `"811218-9876"` or `"198112189876"`.
     * @param reference The day used for century inference and the separator.
     * Defaults to `Date::today()`, evaluated at the call site.
     *
     * @code
     * auto result = swepin::core::Parser::parse("121212+1212", Date{2026, 10, 19});
     * // result.value().full_year() == 1912
     * @endcode
     */
    static ParseResult parse(std::string_view input, const Date& reference = Date::today());

    /**
     * @brief Validates `input` only if it is written as `YYYYMMDD-NNNN`.
     *
     * Any other layout, including a `+` separator, is a `FORMAT` error. The
     * resulting `Pin` still derives its separator from the age.
     */
    static ParseResult parse_strict(std::string_view input,
                                    const Date& reference = Date::today());

    /// @brief Shorthand for `parse(input, reference).ok()`.
    static bool is_valid(std::string_view input, const Date& reference = Date::today());

  private:
    static ParseResult build(std::string_view input, const NormalizedInput& normalized,
                             const Date& reference);

    static ParseResult reject(std::string_view input, ParseError error);
};

} // namespace swepin::core
