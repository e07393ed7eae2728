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
 * @file century.cpp
 * @brief Implementation of century inference.
 */

#include "swepin/core/century.hpp"

#include "swepin/infra/logger.hpp"
#include "swepin/infra/string.hpp"

#include <string>

namespace swepin::core {

char CenturyResolver::separator_for(const Date& birth, const Date& reference)
{
    return birth.age_at(reference) >= CENTENARIAN_AGE ? '+' : '-';
}

Result<CenturyResolution> CenturyResolver::resolve(int year2, std::optional<int> century,
                                                   std::optional<char> separator, int month,
                                                   int calendar_day, const Date& reference)
{
    if (century) {
        Date birth{*century * 100 + year2, month, calendar_day};
        char derived = separator_for(birth, reference);
        if (separator && *separator == '+' && derived == '-') {
            return ParseError{ErrorKind::CENTURY_AMBIGUITY, "separator",
                              "'-' for holders younger than 100 on " + reference.iso(),
                              "'+' with birth year " + std::to_string(birth.year)};
        }
        return CenturyResolution{birth.year, derived};
    }

    char wanted = separator.value_or('-');
    int base = (reference.year / 100) * 100 + year2;

    // Newest candidate first; at most one of the two can satisfy the separator.
    for (int full_year : {base, base - 100}) {
        Date birth{full_year, month, calendar_day};
        if (reference < birth) {
            infra::Logger::log(infra::LogLevel::TRACE,
                               "Century: candidate " + std::to_string(full_year) +
                                   " lies after the reference date");
            continue;
        }
        if (separator_for(birth, reference) == wanted) {
            return CenturyResolution{full_year, wanted};
        }
        infra::Logger::log(infra::LogLevel::TRACE,
                           "Century: candidate " + std::to_string(full_year) +
                               " does not match separator '" + std::string(1, wanted) + "'");
    }

    return ParseError{ErrorKind::CENTURY_AMBIGUITY, "separator",
                      wanted == '+' ? "a birth year at least 100 years before " + reference.iso()
                                    : "a birth year less than 100 years before " + reference.iso(),
                      "'" + std::string(1, wanted) + "' with year digits " +
                          infra::String::zero_pad(year2, 2)};
}

} // namespace swepin::core
