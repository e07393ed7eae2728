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
 * @file view_test.cpp
 * @brief Tests for the presentation layer: labels, map and JSON projections,
 * the pretty printer and birth county lookup.
 */

#include "swepin/core/parser.hpp"
#include "swepin/infra/string.hpp"
#include "swepin/view/birth_place.hpp"
#include "swepin/view/labels.hpp"
#include "swepin/view/pretty.hpp"
#include "swepin/view/projection.hpp"
#include "framework.hpp"

#include <cJSON.h>
#include <sstream>
#include <string>

using namespace swepin;
using core::Date;
using core::Parser;
using view::Language;
using view::Projection;

namespace {

const Date REF{2026, 10, 19};

core::Pin sample(const char* input)
{
    return Parser::parse(input, REF).value();
}

} // namespace

void test_labels_language_names()
{
    ASSERT_TRUE(view::parse_language("eng") == Language::ENG);
    ASSERT_TRUE(view::parse_language("en") == Language::ENG);
    ASSERT_TRUE(view::parse_language("swe") == Language::SWE);
    ASSERT_TRUE(view::parse_language("sv") == Language::SWE);
    ASSERT_FALSE(view::parse_language("fin").has_value());

    ASSERT_EQ(view::Labels::gender(core::Gender::FEMALE, Language::SWE), std::string("kvinna"));
    ASSERT_EQ(view::Labels::gender(core::Gender::MALE, Language::ENG), std::string("male"));
}

void test_projection_map_english()
{
    auto map = Projection::to_map(sample("811218-9876"), Language::ENG, REF);

    ASSERT_EQ(map["personal_identity_number"], std::string("811218-9876"));
    ASSERT_EQ(map["century"], std::string("19"));
    ASSERT_EQ(map["full_year"], std::string("1981"));
    ASSERT_EQ(map["month"], std::string("12"));
    ASSERT_EQ(map["iso_date"], std::string("1981-12-18"));
    ASSERT_EQ(map["separator"], std::string("-"));
    ASSERT_EQ(map["birth_number"], std::string("987"));
    ASSERT_EQ(map["birth_place"], std::string("98"));
    ASSERT_EQ(map["gender_digit"], std::string("7"));
    ASSERT_EQ(map["validation_digit"], std::string("6"));
    ASSERT_EQ(map["age"], std::string("44"));
    ASSERT_EQ(map["gender"], std::string("male"));
    ASSERT_EQ(map["is_coordination_number"], std::string("false"));
    ASSERT_EQ(map["long_format"], std::string("198112189876"));
    ASSERT_EQ(map["short_format"], std::string("811218-9876"));
    ASSERT_TRUE(map.find("actual_day") == map.end());
}

/**
 * @brief Swedish keys, and the actual day only for coordination numbers.
 */
void test_projection_map_swedish()
{
    auto map = Projection::to_map(sample("19801284-1238"), Language::SWE, REF);

    ASSERT_EQ(map["personnummer"], std::string("19801284-1238"));
    ASSERT_EQ(map["dag"], std::string("84"));
    ASSERT_EQ(map["faktisk_dag"], std::string("24"));
    ASSERT_EQ(map["iso_datum"], std::string("1980-12-24"));
    ASSERT_EQ(map["kön"], std::string("man"));
    ASSERT_EQ(map["ålder"], std::string("45"));
    ASSERT_EQ(map["är_samordningsnummer"], std::string("true"));
    ASSERT_TRUE(map.find("gender") == map.end());
}

/**
 * @brief The JSON document parses back into the nested layout.
 */
void test_projection_json()
{
    std::string json = Projection::to_json(sample("811218-9876"), Language::ENG, REF);
    cJSON* root = cJSON_Parse(json.c_str());
    ASSERT_TRUE(root != nullptr);

    cJSON* number = cJSON_GetObjectItemCaseSensitive(root, "personal_identity_number");
    bool number_ok = cJSON_IsString(number) && std::string(number->valuestring) == "811218-9876";

    cJSON* birth_date = cJSON_GetObjectItemCaseSensitive(root, "birth_date");
    cJSON* iso = cJSON_GetObjectItemCaseSensitive(birth_date, "iso_date");
    bool iso_ok = cJSON_IsString(iso) && std::string(iso->valuestring) == "1981-12-18";

    cJSON* derived = cJSON_GetObjectItemCaseSensitive(root, "derived_info");
    cJSON* age = cJSON_GetObjectItemCaseSensitive(derived, "age");
    bool age_ok = cJSON_IsNumber(age) && age->valueint == 44;
    cJSON* coordination = cJSON_GetObjectItemCaseSensitive(derived, "is_coordination_number");
    bool coordination_ok = cJSON_IsFalse(coordination);

    cJSON* formats = cJSON_GetObjectItemCaseSensitive(root, "formats");
    bool formats_ok = cJSON_GetArraySize(formats) == 4;

    cJSON_Delete(root);

    ASSERT_TRUE(number_ok);
    ASSERT_TRUE(iso_ok);
    ASSERT_TRUE(age_ok);
    ASSERT_TRUE(coordination_ok);
    ASSERT_TRUE(formats_ok);
}

void test_projection_json_swedish()
{
    std::string json = Projection::to_json(sample("811218-9876"), Language::SWE, REF, true);
    cJSON* root = cJSON_Parse(json.c_str());
    ASSERT_TRUE(root != nullptr);

    bool has_number = cJSON_HasObjectItem(root, "personnummer");
    bool has_birth_date = cJSON_IsObject(cJSON_GetObjectItemCaseSensitive(root, "födelsedatum"));
    bool has_english = cJSON_HasObjectItem(root, "birth_date");
    cJSON_Delete(root);

    ASSERT_TRUE(has_number);
    ASSERT_TRUE(has_birth_date);
    ASSERT_FALSE(has_english);
    ASSERT_TRUE(json.find('\n') != std::string::npos);
}

/**
 * @brief Every line of the table has the same display width.
 */
void test_pretty_printer_layout()
{
    for (Language language : {Language::ENG, Language::SWE}) {
        std::string table = view::PrettyPrinter::render(sample("811218-9876"), language, REF);
        std::istringstream lines(table);
        std::string line;
        int count = 0;
        while (std::getline(lines, line)) {
            ASSERT_EQ(infra::String::display_width(line), static_cast<std::size_t>(71));
            count++;
        }
        ASSERT_TRUE(count > 20);
    }
}

void test_pretty_printer_content()
{
    std::string english = view::PrettyPrinter::render(sample("811218-9876"), Language::ENG, REF);
    ASSERT_TRUE(english.find("Swedish Personal Identity Number Details") != std::string::npos);
    ASSERT_TRUE(english.find("Original Number") != std::string::npos);
    ASSERT_TRUE(english.find("Norrbottens län") != std::string::npos);
    ASSERT_TRUE(english.find("Male") != std::string::npos);
    ASSERT_TRUE(english.find("198112189876") != std::string::npos);

    std::string swedish =
        view::PrettyPrinter::render(sample("19801284-1238"), Language::SWE, REF);
    ASSERT_TRUE(swedish.find("Svenskt Personnummer Detaljer") != std::string::npos);
    ASSERT_TRUE(swedish.find("Ursprungligt personnummer") != std::string::npos);
    ASSERT_TRUE(swedish.find("Ja (dag + 60)") != std::string::npos);
    ASSERT_TRUE(swedish.find("Födelselän") == std::string::npos);
}

void test_birth_place_counties()
{
    ASSERT_TRUE(view::BirthPlace::county_for_code(0) == std::string("Stockholms stad"));
    ASSERT_TRUE(view::BirthPlace::county_for_code(34) == std::string("Gotlands län"));
    ASSERT_TRUE(view::BirthPlace::county_for_code(74) == std::string("Extra nummer"));
    ASSERT_TRUE(view::BirthPlace::county_for_code(99) == std::string("Norrbottens län"));
    ASSERT_FALSE(view::BirthPlace::county_for_code(100).has_value());

    ASSERT_TRUE(view::BirthPlace::county(sample("811218-9876")) == std::string("Norrbottens län"));
    ASSERT_FALSE(view::BirthPlace::county(sample("19801284-1238")).has_value());
    ASSERT_FALSE(view::BirthPlace::county(sample("199001011239")).has_value());
}
