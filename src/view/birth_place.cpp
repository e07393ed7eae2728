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
 * @file birth_place.cpp
 * @brief The pre-1990 county code table.
 */

#include "swepin/view/birth_place.hpp"

#include "swepin/infra/string.hpp"

namespace swepin::view {

namespace {

struct CodeRange {
    int first;
    int last;
    const char* county;
};

// Sorted, contiguous, covering 00-99.
constexpr CodeRange COUNTY_CODES[] = {
    {0, 13, "Stockholms stad"},
    {14, 15, "Stockholms län"},
    {16, 18, "Uppsala län"},
    {19, 23, "Södermanlands län"},
    {24, 26, "Östergötlands län"},
    {27, 28, "Jönköpings län"},
    {29, 31, "Kronobergs län"},
    {32, 33, "Kalmar län"},
    {34, 34, "Gotlands län"},
    {35, 38, "Blekinge län"},
    {39, 45, "Kristianstads län"},
    {46, 58, "Malmöhus län"},
    {59, 61, "Hallands län"},
    {62, 64, "Göteborgs och Bohus län"},
    {65, 67, "Älvsborgs län"},
    {68, 70, "Skaraborgs län"},
    {71, 73, "Värmlands län"},
    {74, 74, "Extra nummer"},
    {75, 77, "Örebro län"},
    {78, 81, "Västmanlands län"},
    {82, 84, "Kopparbergs län"},
    {85, 85, "Extra nummer"},
    {86, 88, "Gävleborgs län"},
    {89, 92, "Västernorrlands län"},
    {93, 94, "Jämtlands län"},
    {95, 97, "Västerbottens län"},
    {98, 99, "Norrbottens län"},
};

} // namespace

std::optional<std::string> BirthPlace::county_for_code(int code)
{
    for (const auto& range : COUNTY_CODES) {
        if (code >= range.first && code <= range.last) {
            return std::string(range.county);
        }
    }
    return std::nullopt;
}

std::optional<std::string> BirthPlace::county(const core::Pin& pin)
{
    if (pin.full_year() >= BIRTH_PLACE_CUTOFF_YEAR || pin.is_coordination_number()) {
        return std::nullopt;
    }
    return county_for_code(infra::String::to_int(pin.birth_place()));
}

} // namespace swepin::view
