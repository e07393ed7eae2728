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
 * @file labels.hpp
 * @brief Closed set of projection fields and their localized key names.
 */

#pragma once

#include "swepin/core/pin.hpp"

#include <optional>
#include <string>

namespace swepin::view {

/**
 * @enum Language
 * @brief Output languages supported by the projections.
 */
enum class Language {
    ENG, ///< English keys and captions.
    SWE  ///< Swedish keys and captions (UTF-8).
};

/// @brief Maps `"eng"`/`"en"` and `"swe"`/`"sv"` to a `Language`.
std::optional<Language> parse_language(const std::string& name);

/**
 * @enum Field
 * @brief Every key that can appear in a map or JSON projection.
 *
 * `BIRTH_DATE`, `BIRTH_NUMBER_GROUP`, `DERIVED_INFO` and `FORMATS` name the
 * nested JSON objects; all other values are leaves.
 */
enum class Field {
    PERSONAL_IDENTITY_NUMBER,
    BIRTH_DATE,
    CENTURY,
    YEAR,
    FULL_YEAR,
    MONTH,
    DAY,
    ISO_DATE,
    ACTUAL_DAY,
    SEPARATOR,
    BIRTH_NUMBER_GROUP,
    BIRTH_NUMBER,
    BIRTH_PLACE,
    GENDER_DIGIT,
    VALIDATION_DIGIT,
    DERIVED_INFO,
    AGE,
    GENDER,
    IS_COORDINATION_NUMBER,
    FORMATS,
    LONG_FORMAT,
    LONG_FORMAT_WITH_SEPARATOR,
    SHORT_FORMAT,
    SHORT_FORMAT_WITHOUT_SEPARATOR
};

/**
 * @class Labels
 * @brief Static lookup of localized key names.
 */
class Labels {
  public:
    /**
     * @brief The key under which `field` is emitted.
     *
     * @code
     * Labels::key(Field::BIRTH_DATE, Language::ENG); // "birth_date"
     * Labels::key(Field::BIRTH_DATE, Language::SWE); // "födelsedatum"
     * @endcode
     */
    static std::string key(Field field, Language language);

    /// @brief `"male"`/`"female"` or `"man"`/`"kvinna"`.
    static std::string gender(core::Gender gender, Language language);
};

} // namespace swepin::view
