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
 * @file pretty.cpp
 * @brief Implementation of the terminal table.
 */

#include "swepin/view/pretty.hpp"

#include "swepin/core/formatter.hpp"
#include "swepin/infra/string.hpp"
#include "swepin/view/birth_place.hpp"

#include <vector>

namespace swepin::view {

using core::Formatter;
using infra::String;

namespace {

/// @brief Captions of one language.
struct Captions {
    const char* title;
    const char* property;
    const char* value;
    const char* original;
    const char* birth_date;
    const char* century;
    const char* year;
    const char* full_year;
    const char* month;
    const char* day;
    const char* full_date;
    const char* coordination;
    const char* coordination_yes;
    const char* coordination_no;
    const char* actual_day;
    const char* separator;
    const char* birth_number;
    const char* complete;
    const char* birth_place;
    const char* county;
    const char* gender_digit;
    const char* validation_digit;
    const char* derived;
    const char* age;
    const char* gender;
    const char* male;
    const char* female;
    const char* formats;
    const char* long_plain;
    const char* long_separated;
    const char* short_separated;
    const char* short_plain;
};

constexpr Captions ENGLISH = {
    "Swedish Personal Identity Number Details",
    "Property",
    "Value",
    "Original Number",
    "BIRTH DATE",
    "  Century",
    "  Year (2 digits)",
    "  Full Year (4 digits)",
    "  Month",
    "  Day",
    "  Full Date",
    "  Coordination Number",
    "Yes (day + 60)",
    "No",
    "  Actual Day",
    "SEPARATOR",
    "BIRTH NUMBER",
    "  Complete Number",
    "  Birth Place Digits",
    "  Birth County",
    "  Gender Digit",
    "  Validation Digit",
    "DERIVED PROPERTIES",
    "  Age",
    "  Gender",
    "Male",
    "Female",
    "FORMATS",
    "  Long (12 digits) w/o sep",
    "  Long w/ separator",
    "  Short (10 digits) w/ sep",
    "  Short w/o separator",
};

constexpr Captions SWEDISH = {
    "Svenskt Personnummer Detaljer",
    "Egenskap",
    "Värde",
    "Ursprungligt personnummer",
    "FÖDELSEDATUM",
    "  Sekel",
    "  År (2 siffror)",
    "  Helt år (4 siffror)",
    "  Månad",
    "  Dag",
    "  Fullständigt datum",
    "  Samordningsnummer",
    "Ja (dag + 60)",
    "Nej",
    "  Faktisk dag",
    "SKILJETECKEN",
    "FÖDELSENUMMER",
    "  Fullständigt nummer",
    "  Födelseortssiffror",
    "  Födelselän",
    "  Könssiffra",
    "  Kontrollsiffra",
    "HÄRLEDDA EGENSKAPER",
    "  Ålder",
    "  Kön",
    "Man",
    "Kvinna",
    "FORMAT",
    "  Långt (12 siffror) utan",
    "  Långt med skiljetecken",
    "  Kort (10 siffror) med",
    "  Kort utan skiljetecken",
};

class Table {
  public:
    void border(const char* left, const char* middle, const char* right)
    {
        lines_.push_back(std::string(left) + String::repeat("━", PrettyPrinter::PROPERTY_WIDTH) +
                         middle + String::repeat("━", PrettyPrinter::VALUE_WIDTH) + right);
    }

    void divider() { border("┣", "╋", "┫"); }

    void title(const std::string& text)
    {
        std::size_t width = PrettyPrinter::PROPERTY_WIDTH + PrettyPrinter::VALUE_WIDTH + 1;
        lines_.push_back("┃" + String::center(text, width) + "┃");
    }

    void row(const std::string& property, const std::string& value)
    {
        lines_.push_back("┃ " + String::center(property, PrettyPrinter::PROPERTY_WIDTH - 2) +
                         " ┃ " + String::pad_right(value, PrettyPrinter::VALUE_WIDTH - 2) + " ┃");
    }

    std::string str() const
    {
        std::string out;
        for (std::size_t i = 0; i < lines_.size(); ++i) {
            if (i > 0) {
                out += '\n';
            }
            out += lines_[i];
        }
        return out;
    }

  private:
    std::vector<std::string> lines_;
};

} // namespace

std::string PrettyPrinter::render(const core::Pin& pin, Language language, const core::Date& on)
{
    const Captions& c = language == Language::SWE ? SWEDISH : ENGLISH;
    Table table;

    table.border("┏", "┳", "┓");
    table.title(c.title);
    table.divider();
    table.row(c.property, c.value);
    table.divider();
    table.row(c.original, pin.original());
    table.divider();

    table.row(c.birth_date, "");
    table.divider();
    table.row(c.century, pin.century());
    table.row(c.year, pin.year());
    table.row(c.full_year, std::to_string(pin.full_year()));
    table.row(c.month, String::zero_pad(pin.month(), 2));
    table.row(c.day, String::zero_pad(pin.day(), 2));
    table.row(c.full_date, pin.birth_date().iso());
    if (pin.is_coordination_number()) {
        table.row(c.coordination, c.coordination_yes);
        table.row(c.actual_day, std::to_string(pin.calendar_day()));
    } else {
        table.row(c.coordination, c.coordination_no);
    }
    table.divider();

    table.row(c.separator, std::string(1, pin.separator()));
    table.divider();

    table.row(c.birth_number, "");
    table.divider();
    table.row(c.complete, pin.birth_number());
    table.row(c.birth_place, pin.birth_place());
    if (auto county = BirthPlace::county(pin)) {
        table.row(c.county, *county);
    }
    table.row(c.gender_digit, std::to_string(pin.gender_digit()));
    table.row(c.validation_digit, std::to_string(pin.check_digit()));
    table.divider();

    table.row(c.derived, "");
    table.divider();
    table.row(c.age, std::to_string(pin.age(on)));
    table.row(c.gender, pin.male() ? c.male : c.female);
    table.divider();

    table.row(c.formats, "");
    table.divider();
    table.row(c.long_plain, Formatter::long_form(pin));
    table.row(c.long_separated, Formatter::long_form_with_separator(pin));
    table.row(c.short_separated, Formatter::short_form_with_separator(pin));
    table.row(c.short_plain, Formatter::short_form(pin));

    table.border("┗", "┻", "┛");
    return table.str();
}

} // namespace swepin::view
