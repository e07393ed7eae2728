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
 * @file labels.cpp
 * @brief Localized key tables.
 */

#include "swepin/view/labels.hpp"

namespace swepin::view {

std::optional<Language> parse_language(const std::string& name)
{
    if (name == "eng" || name == "en") {
        return Language::ENG;
    }
    if (name == "swe" || name == "sv") {
        return Language::SWE;
    }
    return std::nullopt;
}

std::string Labels::key(Field field, Language language)
{
    bool sv = language == Language::SWE;
    switch (field) {
    case Field::PERSONAL_IDENTITY_NUMBER:
        return sv ? "personnummer" : "personal_identity_number";
    case Field::BIRTH_DATE:
        return sv ? "födelsedatum" : "birth_date";
    case Field::CENTURY:
        return sv ? "sekel" : "century";
    case Field::YEAR:
        return sv ? "år" : "year";
    case Field::FULL_YEAR:
        return sv ? "fullständigt_år" : "full_year";
    case Field::MONTH:
        return sv ? "månad" : "month";
    case Field::DAY:
        return sv ? "dag" : "day";
    case Field::ISO_DATE:
        return sv ? "iso_datum" : "iso_date";
    case Field::ACTUAL_DAY:
        return sv ? "faktisk_dag" : "actual_day";
    case Field::SEPARATOR:
        return sv ? "skiljetecken" : "separator";
    case Field::BIRTH_NUMBER_GROUP:
        return sv ? "födelsenummer" : "birth_number";
    case Field::BIRTH_NUMBER:
        return sv ? "komplett" : "complete";
    case Field::BIRTH_PLACE:
        return sv ? "födelseort" : "birth_place";
    case Field::GENDER_DIGIT:
        return sv ? "könssiffra" : "gender_digit";
    case Field::VALIDATION_DIGIT:
        return sv ? "kontrollsiffra" : "validation_digit";
    case Field::DERIVED_INFO:
        return sv ? "härledd_information" : "derived_info";
    case Field::AGE:
        return sv ? "ålder" : "age";
    case Field::GENDER:
        return sv ? "kön" : "gender";
    case Field::IS_COORDINATION_NUMBER:
        return sv ? "är_samordningsnummer" : "is_coordination_number";
    case Field::FORMATS:
        return sv ? "format" : "formats";
    case Field::LONG_FORMAT:
        return sv ? "långt_format" : "long_format";
    case Field::LONG_FORMAT_WITH_SEPARATOR:
        return sv ? "långt_format_med_skiljetecken" : "long_format_with_separator";
    case Field::SHORT_FORMAT:
        return sv ? "kort_format" : "short_format";
    case Field::SHORT_FORMAT_WITHOUT_SEPARATOR:
        return sv ? "kort_format_utan_skiljetecken" : "short_format_without_separator";
    }
    return "";
}

std::string Labels::gender(core::Gender gender, Language language)
{
    if (language == Language::SWE) {
        return gender == core::Gender::MALE ? "man" : "kvinna";
    }
    return gender == core::Gender::MALE ? "male" : "female";
}

} // namespace swepin::view
