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
 * @file checksum.cpp
 * @brief Implementation of the Luhn check digit.
 */

#include "swepin/core/checksum.hpp"

#include "swepin/infra/string.hpp"

#include <stdexcept>
#include <string>

namespace swepin::core {

int Checksum::compute(std::string_view digits)
{
    if (digits.size() != CHECKSUM_DIGITS || !infra::String::is_digits(digits)) {
        throw std::invalid_argument("Checksum: expected 9 digits, got '" + std::string(digits) +
                                    "'");
    }

    int sum = 0;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        int value = digits[i] - '0';
        // Index 0 is position 1 (odd), which is doubled.
        if (i % 2 == 0) {
            value *= 2;
        }
        if (value > 9) {
            value -= 9;
        }
        sum += value;
    }
    return (10 - sum % 10) % 10;
}

bool Checksum::verify(std::string_view digits, int provided)
{
    return compute(digits) == provided;
}

} // namespace swepin::core
