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
 * @file formatter.hpp
 * @brief Canonical textual forms of a validated identity number.
 */

#pragma once

#include "swepin/core/normalizer.hpp"
#include "swepin/core/pin.hpp"

#include <string>

namespace swepin::core {

/**
 * @class Formatter
 * @brief Pure projections of a `Pin` into its four layouts.
 *
 * For `19121212+1212`:
 * | Method                        | Output          |
 * |-------------------------------|-----------------|
 * | `long_form`                   | `191212121212`  |
 * | `long_form_with_separator`    | `19121212+1212` |
 * | `short_form_with_separator`   | `121212+1212`   |
 * | `short_form`                  | `1212121212`    |
 */
class Formatter {
  public:
    static std::string format(const Pin& pin, PinFormat layout);

    static std::string long_form(const Pin& pin);
    static std::string long_form_with_separator(const Pin& pin);
    static std::string short_form_with_separator(const Pin& pin);
    static std::string short_form(const Pin& pin);
};

} // namespace swepin::core
