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
 * @file pretty.hpp
 * @brief Box-drawn terminal table describing an identity number.
 */

#pragma once

#include "swepin/core/date.hpp"
#include "swepin/core/pin.hpp"
#include "swepin/view/labels.hpp"

#include <cstddef>
#include <string>

namespace swepin::view {

/**
 * @class PrettyPrinter
 * @brief Renders every field and derived property as a two-column table.
 *
 * @details
 * Sections: original number, birth date (with coordination details), separator,
 * birth number (with the historical county when known), derived properties and
 * the four canonical formats. Columns are aligned by display width, so Swedish
 * captions with multi-byte characters line up.
 */
class PrettyPrinter {
  public:
    static constexpr std::size_t PROPERTY_WIDTH = 28;
    static constexpr std::size_t VALUE_WIDTH = 40;

    /**
     * @brief Renders the table as newline separated lines (no trailing newline).
     *
     * @param on The day the age is computed for.
     */
    static std::string render(const core::Pin& pin, Language language, const core::Date& on);
};

} // namespace swepin::view
