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
 * @file birth_place.hpp
 * @brief Historical birth place codes.
 *
 * @details
 * Until 1990 the first two digits of the birth number identified the county
 * ("län") where the holder was registered at birth. Numbers issued from 1990
 * onwards, and all coordination numbers, carry no regional meaning.
 */

#pragma once

#include "swepin/core/pin.hpp"

#include <optional>
#include <string>

namespace swepin::view {

/// @brief First birth year whose birth place digits carry no regional meaning.
inline constexpr int BIRTH_PLACE_CUTOFF_YEAR = 1990;

/**
 * @class BirthPlace
 * @brief Static county lookup.
 */
class BirthPlace {
  public:
    /**
     * @brief County name for a two-digit code (00-99).
     *
     * Codes 74 and 85 were reserved as extra numbers and map to `"Extra nummer"`.
     *
     * @return std::nullopt for codes outside 00-99.
     */
    static std::optional<std::string> county_for_code(int code);

    /**
     * @brief County of registration for `pin`.
     *
     * @return std::nullopt for holders born in 1990 or later and for
     * coordination numbers.
     */
    static std::optional<std::string> county(const core::Pin& pin);
};

} // namespace swepin::view
