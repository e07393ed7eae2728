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
 * @file checksum.hpp
 * @brief Luhn (mod 10) check digit over the nine significant digits.
 *
 * @details
 * The nine digits are `YYMMDDBBB`: two-digit year, month, day as written
 * (so 61-91 for coordination numbers) and the three-digit birth number. The
 * century never takes part in the computation.
 */

#pragma once

#include <cstddef>
#include <string_view>

namespace swepin::core {

/// @brief Number of digits covered by the check digit.
inline constexpr std::size_t CHECKSUM_DIGITS = 9;

/**
 * @class Checksum
 * @brief Static Luhn computation and verification.
 */
class Checksum {
  public:
    /**
     * @brief Computes the check digit for exactly nine ASCII digits.
     *
     * **Algorithm:**
     * 1. Digits at odd positions (1st, 3rd, ... 9th from the left) are doubled.
     * 2. A product of 10 or more is replaced by the sum of its digits (minus 9).
     * 3. The check digit is `(10 - sum % 10) % 10`.
     *
     * @return int A value in 0-9.
     * @throws std::invalid_argument if `digits` is not nine ASCII digits.
     *
     * @code
     * Checksum::compute("811218987"); // 6, as in 811218-9876
     * @endcode
     */
    static int compute(std::string_view digits);

    /**
     * @brief Recomputes the check digit and compares it with `provided`.
     *
     * @throws std::invalid_argument if `digits` is not nine ASCII digits.
     */
    static bool verify(std::string_view digits, int provided);
};

} // namespace swepin::core
