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
 * @file date.cpp
 * @brief Calendar arithmetic for `Date`.
 *
 * @details
 * Day ordinals use the era-based civil calendar conversion (400-year cycles of
 * 146097 days), which is exact for every Gregorian year, negative years included.
 */

#include "swepin/core/date.hpp"

#include "swepin/infra/string.hpp"

#include <chrono>
#include <ctime>
#include <tuple>

namespace swepin::core {

Date Date::today()
{
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&time, &local);
    return Date{local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};
}

std::optional<Date> Date::from_iso(std::string_view text)
{
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    std::string_view y = text.substr(0, 4);
    std::string_view m = text.substr(5, 2);
    std::string_view d = text.substr(8, 2);
    if (!infra::String::is_digits(y) || !infra::String::is_digits(m) ||
        !infra::String::is_digits(d)) {
        return std::nullopt;
    }

    Date date{infra::String::to_int(y), infra::String::to_int(m), infra::String::to_int(d)};
    if (!is_valid(date.year, date.month, date.day)) {
        return std::nullopt;
    }
    return date;
}

bool Date::is_leap_year(int year)
{
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int Date::days_in_month(int year, int month)
{
    switch (month) {
    case 1:
    case 3:
    case 5:
    case 7:
    case 8:
    case 10:
    case 12:
        return 31;
    case 4:
    case 6:
    case 9:
    case 11:
        return 30;
    case 2:
        return is_leap_year(year) ? 29 : 28;
    default:
        return 0;
    }
}

bool Date::is_valid(int year, int month, int day)
{
    return day >= 1 && day <= days_in_month(year, month);
}

long Date::to_days() const
{
    long y = year - (month <= 2 ? 1 : 0);
    long era = (y >= 0 ? y : y - 399) / 400;
    long yoe = y - era * 400;
    long mp = (month + 9) % 12; // March = 0
    long doy = (153 * mp + 2) / 5 + day - 1;
    long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date Date::from_days(long days)
{
    days += 719468;
    long era = (days >= 0 ? days : days - 146096) / 146097;
    long doe = days - era * 146097;
    long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    long mp = (5 * doy + 2) / 153;
    long d = doy - (153 * mp + 2) / 5 + 1;
    long m = mp < 10 ? mp + 3 : mp - 9;
    long y = yoe + era * 400 + (m <= 2 ? 1 : 0);
    return Date{static_cast<int>(y), static_cast<int>(m), static_cast<int>(d)};
}

std::string Date::iso() const
{
    return infra::String::zero_pad(year, 4) + "-" + infra::String::zero_pad(month, 2) + "-" +
           infra::String::zero_pad(day, 2);
}

int Date::age_at(const Date& on) const
{
    int years = on.year - year;
    if (std::tie(on.month, on.day) < std::tie(month, day)) {
        years--;
    }
    return years;
}

bool operator==(const Date& lhs, const Date& rhs)
{
    return std::tie(lhs.year, lhs.month, lhs.day) == std::tie(rhs.year, rhs.month, rhs.day);
}

bool operator!=(const Date& lhs, const Date& rhs)
{
    return !(lhs == rhs);
}

bool operator<(const Date& lhs, const Date& rhs)
{
    return std::tie(lhs.year, lhs.month, lhs.day) < std::tie(rhs.year, rhs.month, rhs.day);
}

bool operator<=(const Date& lhs, const Date& rhs)
{
    return !(rhs < lhs);
}

bool operator>(const Date& lhs, const Date& rhs)
{
    return rhs < lhs;
}

bool operator>=(const Date& lhs, const Date& rhs)
{
    return !(lhs < rhs);
}

} // namespace swepin::core
