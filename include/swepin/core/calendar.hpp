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
 * @file calendar.hpp
 * @brief Birth date validation, aware of the coordination number day offset.
 *
 * @details
 * Coordination numbers ("samordningsnummer") are issued to people without a
 * Swedish residence and are written with the day of month plus 60. The raw day
 * field therefore has two live ranges, 01-31 and 61-91; 00, 32-60 and 92-99
 * can never occur.
 */

#pragma once

#include "swepin/core/date.hpp"
#include "swepin/core/result.hpp"

#include <optional>

namespace swepin::core {

/// @brief Value added to the day of month in a coordination number.
inline constexpr int COORDINATION_OFFSET = 60;

/**
 * @class CalendarValidator
 * @brief Static month/day checks.
 */
class CalendarValidator {
  public:
    /// @brief True if the written day denotes a coordination number (61-91).
    static bool is_coordination_day(int raw_day);

    /// @brief The calendar day behind a written day (offset removed when present).
    static int calendar_day(int raw_day);

    /**
     * @brief Year-independent range checks.
     *
     * Verifies month 1-12 and that the raw day lies in 1-31 or 61-91. Run before
     * century inference so that an impossible month is reported as such.
     *
     * @return The `INVALID_DATE` error, or std::nullopt if both fields are in range.
     */
    static std::optional<ParseError> check_ranges(int month, int raw_day);

    /**
     * @brief Full calendar validation.
     *
     * Applies `check_ranges()` and then the Gregorian days-per-month rule for
     * `year`, including February 29 in leap years.
     *
     * @return The birth date with the coordination offset removed.
     */
    static Result<Date> validate(int year, int month, int raw_day);
};

} // namespace swepin::core
