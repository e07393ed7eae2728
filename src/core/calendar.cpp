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
 * @file calendar.cpp
 * @brief Implementation of birth date validation.
 */

#include "swepin/core/calendar.hpp"

#include "swepin/infra/string.hpp"

#include <string>

namespace swepin::core {

bool CalendarValidator::is_coordination_day(int raw_day)
{
    return raw_day > COORDINATION_OFFSET;
}

int CalendarValidator::calendar_day(int raw_day)
{
    return is_coordination_day(raw_day) ? raw_day - COORDINATION_OFFSET : raw_day;
}

std::optional<ParseError> CalendarValidator::check_ranges(int month, int raw_day)
{
    if (month < 1 || month > 12) {
        return ParseError{ErrorKind::INVALID_DATE, "month", "01-12",
                          infra::String::zero_pad(month, 2)};
    }

    bool regular = raw_day >= 1 && raw_day <= 31;
    bool coordination = raw_day >= 1 + COORDINATION_OFFSET && raw_day <= 31 + COORDINATION_OFFSET;
    if (!regular && !coordination) {
        return ParseError{ErrorKind::INVALID_DATE, "day", "01-31, or 61-91 for coordination numbers",
                          infra::String::zero_pad(raw_day, 2)};
    }
    return std::nullopt;
}

Result<Date> CalendarValidator::validate(int year, int month, int raw_day)
{
    if (auto error = check_ranges(month, raw_day)) {
        return *error;
    }

    int day = calendar_day(raw_day);
    if (!Date::is_valid(year, month, day)) {
        std::string expected = "01-" + std::to_string(Date::days_in_month(year, month)) + " for " +
                               std::to_string(year) + "-" + infra::String::zero_pad(month, 2);
        std::string actual = infra::String::zero_pad(day, 2);
        if (is_coordination_day(raw_day)) {
            actual += " (written " + std::to_string(raw_day) + ")";
        }
        return ParseError{ErrorKind::INVALID_DATE, "day", expected, actual};
    }
    return Date{year, month, day};
}

} // namespace swepin::core
