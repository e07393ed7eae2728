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
 * @file century.hpp
 * @brief Four-digit birth year reconstruction and separator semantics.
 *
 * @details
 * The short layouts drop the century. The separator then carries the missing
 * information: `-` means the holder is younger than 100 at the reference date,
 * `+` means 100 or older. This header owns that rule in both directions.
 */

#pragma once

#include "swepin/core/date.hpp"
#include "swepin/core/result.hpp"

#include <optional>

namespace swepin::core {

/// @brief Age at which the short form switches from `-` to `+`.
inline constexpr int CENTENARIAN_AGE = 100;

/**
 * @struct CenturyResolution
 * @brief The outcome of century inference.
 */
struct CenturyResolution {
    int full_year;  ///< Four-digit birth year.
    char separator; ///< Separator implied by the age at the reference date.
};

/**
 * @class CenturyResolver
 * @brief Static century inference.
 */
class CenturyResolver {
  public:
    /**
     * @brief Resolves the birth year of an identity number.
     *
     * **Explicit century** (12-digit input): the year is `century * 100 + year2`
     * and the separator is derived from the age. A written `-` is a plain layout
     * marker. A written `+` on a holder younger than 100 contradicts the century
     * and yields `CENTURY_AMBIGUITY`.
     *
     * **Implicit century** (10-digit input): candidates are the reference
     * century and the one before it. A candidate survives if the birth date is
     * not after `reference` and its age matches the separator (`+` at least 100,
     * `-` or none below 100). No survivor yields `CENTURY_AMBIGUITY`.
     *
     * @param year2 The two written year digits (0-99).
     * @param century The two written century digits, if present.
     * @param separator The written separator, if any.
     * @param month Birth month (already range checked).
     * @param calendar_day Birth day with any coordination offset removed.
     * @param reference The day ages are measured on.
     */
    static Result<CenturyResolution> resolve(int year2, std::optional<int> century,
                                             std::optional<char> separator, int month,
                                             int calendar_day, const Date& reference);

    /// @brief `'+'` if the holder is at least 100 on `reference`, else `'-'`.
    static char separator_for(const Date& birth, const Date& reference);
};

} // namespace swepin::core
