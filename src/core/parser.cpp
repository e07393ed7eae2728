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
 * @file parser.cpp
 * @brief Implementation of the validation pipeline.
 */

#include "swepin/core/parser.hpp"

#include "swepin/core/calendar.hpp"
#include "swepin/core/century.hpp"
#include "swepin/core/checksum.hpp"
#include "swepin/infra/logger.hpp"
#include "swepin/infra/string.hpp"

#include <optional>
#include <string>

namespace swepin::core {

ParseResult Parser::reject(std::string_view input, ParseError error)
{
    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Parser: rejected '" + std::string(input) + "': " + error.message());
    return error;
}

ParseResult Parser::parse(std::string_view input, const Date& reference)
{
    auto normalized = Normalizer::normalize(input);
    if (!normalized) {
        return reject(input, normalized.error());
    }
    return build(input, normalized.value(), reference);
}

ParseResult Parser::parse_strict(std::string_view input, const Date& reference)
{
    auto normalized = Normalizer::normalize(input);
    if (!normalized || normalized.value().format != PinFormat::LONG_WITH_SEPARATOR ||
        normalized.value().separator != '-') {
        return reject(input, ParseError{ErrorKind::FORMAT, "layout",
                                        "strict format " +
                                            to_string(PinFormat::LONG_WITH_SEPARATOR),
                                        "'" + std::string(input) + "'"});
    }
    return build(input, normalized.value(), reference);
}

bool Parser::is_valid(std::string_view input, const Date& reference)
{
    return parse(input, reference).ok();
}

/**
 * @brief Interprets the digit fields of a structurally valid input.
 *
 * Field offsets are relative to the end of the digit run so that 10- and
 * 12-digit inputs share one code path: the last ten digits are always
 * `YYMMDDBBBC`.
 */
ParseResult Parser::build(std::string_view input, const NormalizedInput& normalized,
                          const Date& reference)
{
    std::string_view digits = normalized.digits;
    std::string_view tail = digits.substr(digits.size() - 10);

    std::optional<int> century;
    if (normalized.has_century()) {
        century = infra::String::to_int(digits.substr(0, 2));
    }
    int year2 = infra::String::to_int(tail.substr(0, 2));
    int month = infra::String::to_int(tail.substr(2, 2));
    int raw_day = infra::String::to_int(tail.substr(4, 2));

    if (auto error = CalendarValidator::check_ranges(month, raw_day)) {
        return reject(input, *error);
    }

    auto resolution = CenturyResolver::resolve(year2, century, normalized.separator, month,
                                               CalendarValidator::calendar_day(raw_day),
                                               reference);
    if (!resolution) {
        return reject(input, resolution.error());
    }

    auto birth = CalendarValidator::validate(resolution.value().full_year, month, raw_day);
    if (!birth) {
        return reject(input, birth.error());
    }

    std::string_view significant = tail.substr(0, 9);
    int provided = tail[9] - '0';
    if (!Checksum::verify(significant, provided)) {
        return reject(input, ParseError{ErrorKind::CHECKSUM, "validation digit",
                                        std::to_string(Checksum::compute(significant)),
                                        std::to_string(provided)});
    }

    Pin pin;
    pin.original_ = std::string(input);
    pin.full_year_ = resolution.value().full_year;
    pin.century_ = infra::String::zero_pad(pin.full_year_ / 100, 2);
    pin.year_ = std::string(tail.substr(0, 2));
    pin.month_ = month;
    pin.day_ = raw_day;
    pin.separator_ = resolution.value().separator;
    pin.birth_number_ = std::string(tail.substr(6, 3));
    pin.check_digit_ = provided;
    pin.reference_date_ = reference;
    return pin;
}

} // namespace swepin::core
