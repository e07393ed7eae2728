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
 * @file pin.hpp
 * @brief The validated, immutable Swedish personal identity number.
 *
 * @details
 * ```
 *  C C Y Y M M D D  -/+  B B G  K
 *  │   │   │   │     │   │   │  └── check digit (Luhn over YYMMDDBBG)
 *  │   │   │   │     │   │   └───── gender digit (odd = male, even = female)
 *  │   │   │   │     │   └───────── birth place digits (historical, pre-1990)
 *  │   │   │   │     └───────────── '-' below 100 years, '+' from 100
 *  │   │   │   └─────────────────── day 01-31, or 61-91 for coordination numbers
 *  │   │   └─────────────────────── month 01-12
 *  │   └─────────────────────────── year within century
 *  └─────────────────────────────── century (derived for 10-digit input)
 * ```
 */

#pragma once

#include "swepin/core/date.hpp"

#include <string>

namespace swepin::core {

class Parser;

/**
 * @enum Gender
 * @brief Legal gender encoded by the parity of the gender digit.
 */
enum class Gender { FEMALE, MALE };

/**
 * @class Pin
 * @brief A personal identity number that passed every validation stage.
 *
 * @details
 * Instances are created exclusively by `Parser`; there is no way to build a
 * partially validated `Pin`. All accessors are `const` and every derived view
 * (age, birth date, gender) is computed from the stored fields on demand.
 */
class Pin {
  public:
    /// @brief The input string exactly as it was given to the parser.
    const std::string& original() const { return original_; }

    /// @brief Two-digit century, e.g. `"19"`.
    const std::string& century() const { return century_; }

    /// @brief Two-digit year within the century, e.g. `"80"`.
    const std::string& year() const { return year_; }

    /// @brief Four-digit birth year.
    int full_year() const { return full_year_; }

    int month() const { return month_; }

    /// @brief The day as written: 1-31, or 61-91 for a coordination number.
    int day() const { return day_; }

    /// @brief `'-'` or `'+'`, consistent with the age on `reference_date()`.
    char separator() const { return separator_; }

    /// @brief Birth place digits followed by the gender digit, e.g. `"123"`.
    const std::string& birth_number() const { return birth_number_; }

    /// @brief First two digits of the birth number.
    std::string birth_place() const { return birth_number_.substr(0, 2); }

    /// @brief Third digit of the birth number.
    int gender_digit() const { return birth_number_[2] - '0'; }

    int check_digit() const { return check_digit_; }

    /// @brief The date the number was validated against (century and separator).
    const Date& reference_date() const { return reference_date_; }

    bool is_coordination_number() const;

    /// @brief Day of month with the coordination offset removed.
    int calendar_day() const;

    /// @brief The real birth date (never offset by 60).
    Date birth_date() const;

    /// @brief Completed years on `on`.
    int age(const Date& on) const;

    /// @brief Completed years on `reference_date()`.
    int age() const { return age(reference_date_); }

    Gender gender() const;
    bool male() const { return gender() == Gender::MALE; }
    bool female() const { return gender() == Gender::FEMALE; }

  private:
    friend class Parser;

    Pin() = default;

    std::string original_;
    std::string century_;
    std::string year_;
    int full_year_ = 0;
    int month_ = 0;
    int day_ = 0;
    char separator_ = '-';
    std::string birth_number_;
    int check_digit_ = 0;
    Date reference_date_;
};

bool operator==(const Pin& lhs, const Pin& rhs);
bool operator!=(const Pin& lhs, const Pin& rhs);

} // namespace swepin::core
