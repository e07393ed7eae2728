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
 * @file pin.cpp
 * @brief Derived views of a validated identity number.
 */

#include "swepin/core/pin.hpp"

#include "swepin/core/calendar.hpp"

namespace swepin::core {

bool Pin::is_coordination_number() const
{
    return CalendarValidator::is_coordination_day(day_);
}

int Pin::calendar_day() const
{
    return CalendarValidator::calendar_day(day_);
}

Date Pin::birth_date() const
{
    return Date{full_year_, month_, calendar_day()};
}

int Pin::age(const Date& on) const
{
    return birth_date().age_at(on);
}

Gender Pin::gender() const
{
    return gender_digit() % 2 == 1 ? Gender::MALE : Gender::FEMALE;
}

/**
 * @brief Identity is the number itself; the original spelling and the
 * reference date do not take part.
 */
bool operator==(const Pin& lhs, const Pin& rhs)
{
    return lhs.full_year() == rhs.full_year() && lhs.month() == rhs.month() &&
           lhs.day() == rhs.day() && lhs.birth_number() == rhs.birth_number() &&
           lhs.check_digit() == rhs.check_digit();
}

bool operator!=(const Pin& lhs, const Pin& rhs)
{
    return !(lhs == rhs);
}

} // namespace swepin::core
