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
 * @file formatter.cpp
 * @brief Implementation of the canonical layouts.
 */

#include "swepin/core/formatter.hpp"

#include "swepin/infra/string.hpp"

namespace swepin::core {

namespace {

/// @brief `YYMMDD` with the day as written.
std::string date_part(const Pin& pin)
{
    return pin.year() + infra::String::zero_pad(pin.month(), 2) +
           infra::String::zero_pad(pin.day(), 2);
}

/// @brief `BBBC`.
std::string number_part(const Pin& pin)
{
    return pin.birth_number() + std::to_string(pin.check_digit());
}

} // namespace

std::string Formatter::format(const Pin& pin, PinFormat layout)
{
    switch (layout) {
    case PinFormat::LONG_WITHOUT_SEPARATOR:
        return long_form(pin);
    case PinFormat::LONG_WITH_SEPARATOR:
        return long_form_with_separator(pin);
    case PinFormat::SHORT_WITH_SEPARATOR:
        return short_form_with_separator(pin);
    case PinFormat::SHORT_WITHOUT_SEPARATOR:
        return short_form(pin);
    }
    return long_form(pin);
}

std::string Formatter::long_form(const Pin& pin)
{
    return pin.century() + date_part(pin) + number_part(pin);
}

std::string Formatter::long_form_with_separator(const Pin& pin)
{
    return pin.century() + date_part(pin) + pin.separator() + number_part(pin);
}

std::string Formatter::short_form_with_separator(const Pin& pin)
{
    return date_part(pin) + pin.separator() + number_part(pin);
}

std::string Formatter::short_form(const Pin& pin)
{
    return date_part(pin) + number_part(pin);
}

} // namespace swepin::core
