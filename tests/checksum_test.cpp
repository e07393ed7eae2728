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
 * @file checksum_test.cpp
 * @brief Unit tests for the Luhn check digit.
 */

#include "swepin/core/checksum.hpp"
#include "swepin/infra/string.hpp"
#include "framework.hpp"

#include <stdexcept>
#include <string>

using swepin::core::Checksum;

/**
 * @brief Check digits of well known sample numbers.
 */
void test_checksum_known_values()
{
    ASSERT_EQ(Checksum::compute("811218987"), 6); // 811218-9876
    ASSERT_EQ(Checksum::compute("121212121"), 2); // 121212-1212
    ASSERT_EQ(Checksum::compute("801224123"), 1); // 801224-1231
    ASSERT_EQ(Checksum::compute("801284123"), 8); // coordination 801284-1238
    ASSERT_EQ(Checksum::compute("000000000"), 0);
    // 9*2=18 -> 9 five times, plus 9 four times = 81.
    ASSERT_EQ(Checksum::compute("999999999"), 9);
}

void test_checksum_verify()
{
    ASSERT_TRUE(Checksum::verify("811218987", 6));
    ASSERT_FALSE(Checksum::verify("811218987", 5));
    ASSERT_FALSE(Checksum::verify("801224123", 4));
}

/**
 * @brief `compute` is total over nine-digit strings and `verify` accepts its output.
 *
 * Walks the nine-digit space with a prime stride so every position and digit
 * value is exercised.
 */
void test_checksum_totality()
{
    for (long n = 0; n < 1000000000L; n += 9973) {
        std::string digits = swepin::infra::String::zero_pad(static_cast<int>(n), 9);
        int check = Checksum::compute(digits);
        ASSERT_TRUE(check >= 0 && check <= 9);
        ASSERT_TRUE(Checksum::verify(digits, check));
    }
}

/**
 * @brief A single changed digit always changes the check digit.
 */
void test_checksum_detects_single_digit_errors()
{
    std::string base = "811218987";
    int expected = Checksum::compute(base);
    for (size_t pos = 0; pos < base.size(); ++pos) {
        for (char d = '0'; d <= '9'; ++d) {
            if (d == base[pos]) {
                continue;
            }
            std::string mutated = base;
            mutated[pos] = d;
            ASSERT_NE(Checksum::compute(mutated), expected);
        }
    }
}

void test_checksum_rejects_malformed_input()
{
    ASSERT_THROWS(Checksum::compute("12345678"), std::invalid_argument);
    ASSERT_THROWS(Checksum::compute("1234567890"), std::invalid_argument);
    ASSERT_THROWS(Checksum::compute("12345678A"), std::invalid_argument);
}
