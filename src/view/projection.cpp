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
 * @file projection.cpp
 * @brief Implementation of the map and JSON projections.
 */

#include "swepin/view/projection.hpp"

#include "swepin/core/formatter.hpp"
#include "swepin/infra/string.hpp"

#include <cstdlib>
#include <stdexcept>

namespace swepin::view {

using core::Formatter;
using infra::String;

std::map<std::string, std::string> Projection::to_map(const core::Pin& pin, Language language,
                                                      const core::Date& on)
{
    auto k = [language](Field field) { return Labels::key(field, language); };

    std::map<std::string, std::string> out;
    out[k(Field::PERSONAL_IDENTITY_NUMBER)] = pin.original();
    out[k(Field::CENTURY)] = pin.century();
    out[k(Field::YEAR)] = pin.year();
    out[k(Field::FULL_YEAR)] = std::to_string(pin.full_year());
    out[k(Field::MONTH)] = String::zero_pad(pin.month(), 2);
    out[k(Field::DAY)] = String::zero_pad(pin.day(), 2);
    out[k(Field::ISO_DATE)] = pin.birth_date().iso();
    if (pin.is_coordination_number()) {
        out[k(Field::ACTUAL_DAY)] = String::zero_pad(pin.calendar_day(), 2);
    }
    out[k(Field::SEPARATOR)] = std::string(1, pin.separator());
    out[k(Field::BIRTH_NUMBER_GROUP)] = pin.birth_number();
    out[k(Field::BIRTH_PLACE)] = pin.birth_place();
    out[k(Field::GENDER_DIGIT)] = std::to_string(pin.gender_digit());
    out[k(Field::VALIDATION_DIGIT)] = std::to_string(pin.check_digit());
    out[k(Field::AGE)] = std::to_string(pin.age(on));
    out[k(Field::GENDER)] = Labels::gender(pin.gender(), language);
    out[k(Field::IS_COORDINATION_NUMBER)] = pin.is_coordination_number() ? "true" : "false";
    out[k(Field::LONG_FORMAT)] = Formatter::long_form(pin);
    out[k(Field::LONG_FORMAT_WITH_SEPARATOR)] = Formatter::long_form_with_separator(pin);
    out[k(Field::SHORT_FORMAT)] = Formatter::short_form_with_separator(pin);
    out[k(Field::SHORT_FORMAT_WITHOUT_SEPARATOR)] = Formatter::short_form(pin);
    return out;
}

/**
 * @brief Builds the nested document section by section.
 *
 * Each section object is attached to the root right after creation, so a
 * single `cJSON_Delete(root)` releases everything.
 */
cJSON* Projection::to_cjson(const core::Pin& pin, Language language, const core::Date& on)
{
    auto k = [language](Field field) { return Labels::key(field, language); };

    cJSON* root = cJSON_CreateObject();
    cJSON_AddStringToObject(root, k(Field::PERSONAL_IDENTITY_NUMBER).c_str(),
                            pin.original().c_str());

    cJSON* birth_date = cJSON_CreateObject();
    cJSON_AddItemToObject(root, k(Field::BIRTH_DATE).c_str(), birth_date);
    cJSON_AddStringToObject(birth_date, k(Field::CENTURY).c_str(), pin.century().c_str());
    cJSON_AddStringToObject(birth_date, k(Field::YEAR).c_str(), pin.year().c_str());
    cJSON_AddStringToObject(birth_date, k(Field::FULL_YEAR).c_str(),
                            std::to_string(pin.full_year()).c_str());
    cJSON_AddStringToObject(birth_date, k(Field::MONTH).c_str(),
                            String::zero_pad(pin.month(), 2).c_str());
    cJSON_AddStringToObject(birth_date, k(Field::DAY).c_str(),
                            String::zero_pad(pin.day(), 2).c_str());
    cJSON_AddStringToObject(birth_date, k(Field::ISO_DATE).c_str(),
                            pin.birth_date().iso().c_str());
    if (pin.is_coordination_number()) {
        cJSON_AddNumberToObject(birth_date, k(Field::ACTUAL_DAY).c_str(), pin.calendar_day());
    }

    cJSON_AddStringToObject(root, k(Field::SEPARATOR).c_str(),
                            std::string(1, pin.separator()).c_str());

    cJSON* birth_number = cJSON_CreateObject();
    cJSON_AddItemToObject(root, k(Field::BIRTH_NUMBER_GROUP).c_str(), birth_number);
    cJSON_AddStringToObject(birth_number, k(Field::BIRTH_NUMBER).c_str(),
                            pin.birth_number().c_str());
    cJSON_AddStringToObject(birth_number, k(Field::BIRTH_PLACE).c_str(),
                            pin.birth_place().c_str());
    cJSON_AddStringToObject(birth_number, k(Field::GENDER_DIGIT).c_str(),
                            std::to_string(pin.gender_digit()).c_str());

    cJSON_AddStringToObject(root, k(Field::VALIDATION_DIGIT).c_str(),
                            std::to_string(pin.check_digit()).c_str());

    cJSON* derived = cJSON_CreateObject();
    cJSON_AddItemToObject(root, k(Field::DERIVED_INFO).c_str(), derived);
    cJSON_AddNumberToObject(derived, k(Field::AGE).c_str(), pin.age(on));
    cJSON_AddStringToObject(derived, k(Field::GENDER).c_str(),
                            Labels::gender(pin.gender(), language).c_str());
    cJSON_AddBoolToObject(derived, k(Field::IS_COORDINATION_NUMBER).c_str(),
                          pin.is_coordination_number());

    cJSON* formats = cJSON_CreateObject();
    cJSON_AddItemToObject(root, k(Field::FORMATS).c_str(), formats);
    cJSON_AddStringToObject(formats, k(Field::LONG_FORMAT).c_str(),
                            Formatter::long_form(pin).c_str());
    cJSON_AddStringToObject(formats, k(Field::LONG_FORMAT_WITH_SEPARATOR).c_str(),
                            Formatter::long_form_with_separator(pin).c_str());
    cJSON_AddStringToObject(formats, k(Field::SHORT_FORMAT).c_str(),
                            Formatter::short_form_with_separator(pin).c_str());
    cJSON_AddStringToObject(formats, k(Field::SHORT_FORMAT_WITHOUT_SEPARATOR).c_str(),
                            Formatter::short_form(pin).c_str());

    return root;
}

std::string Projection::to_json(const core::Pin& pin, Language language, const core::Date& on,
                                bool formatted)
{
    cJSON* root = to_cjson(pin, language, on);
    char* raw = formatted ? cJSON_Print(root) : cJSON_PrintUnformatted(root);
    cJSON_Delete(root);
    if (!raw) {
        throw std::runtime_error("Projection: cJSON failed to serialize document");
    }

    std::string out(raw);
    free(raw);
    return out;
}

} // namespace swepin::view
