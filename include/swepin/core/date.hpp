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
 * @file date.hpp
 * @brief Proleptic Gregorian calendar date used for birth and reference dates.
 *
 * @details
 * `Date` is a plain value type. It carries no time zone: reference dates are
 * local calendar days, matching how ages are computed by Swedish authorities.
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace swepin::core {

/**
 * @struct Date
 * @brief A calendar day (year, month 1-12, day 1-31).
 *
 * A default constructed or aggregate-initialised `Date` is not validated; use
 * `is_valid()` before trusting values that came from user input.
 */
struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    /**
     * @brief The current local calendar day.
     *
     * This is the documented default for every reference-date parameter in the
     * library. It is evaluated at the call site, never cached.
     */
    static Date today();

    /**
     * @brief Parses an ISO 8601 calendar date (`YYYY-MM-DD`).
     *
     * @return std::nullopt for any other layout or for a non-existent day.
     */
    static std::optional<Date> from_iso(std::string_view text);

    /// @brief Gregorian rule: divisible by 4, not by 100 unless also by 400.
    static bool is_leap_year(int year);

    /// @brief Days in `month` of `year`, or 0 when `month` is outside 1-12.
    static int days_in_month(int year, int month);

    /// @brief True if `(year, month, day)` names an existing calendar day.
    static bool is_valid(int year, int month, int day);

    /// @brief Days since 1970-01-01 (negative before the epoch).
    long to_days() const;

    /// @brief Inverse of `to_days()`.
    static Date from_days(long days);

    /// @brief `YYYY-MM-DD`.
    std::string iso() const;

    /**
     * @brief Completed years between this date (a birth date) and `on`.
     *
     * The birthday counts as reached on the day itself. A person born on
     * February 29 becomes a year older on March 1 in common years. Returns a
     * negative value when `on` precedes this date by at least one year.
     */
    int age_at(const Date& on) const;
};

bool operator==(const Date& lhs, const Date& rhs);
bool operator!=(const Date& lhs, const Date& rhs);
bool operator<(const Date& lhs, const Date& rhs);
bool operator<=(const Date& lhs, const Date& rhs);
bool operator>(const Date& lhs, const Date& rhs);
bool operator>=(const Date& lhs, const Date& rhs);

} // namespace swepin::core
