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
 * @file generator.cpp
 * @brief Implementation of identity number synthesis.
 */

#include "swepin/core/generator.hpp"

#include "swepin/core/calendar.hpp"
#include "swepin/core/century.hpp"
#include "swepin/core/checksum.hpp"
#include "swepin/core/parser.hpp"
#include "swepin/infra/logger.hpp"
#include "swepin/infra/random.hpp"
#include "swepin/infra/string.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace swepin::core {

Generator::Generator() : engine_(infra::Random::seed()) {}

Generator::Generator(std::uint64_t seed) : engine_(seed) {}

/**
 * @brief Resolves the options into an inclusive birth date window.
 *
 * The upper bound never passes the reference date. Without centenarians the
 * lower bound starts the day after the last birth date that would reach 100
 * on the reference date.
 */
Generator::Window Generator::window_for(const GeneratorOptions& options)
{
    Date reference = options.reference_date.value_or(Date::today());
    int end_year = options.end_year.value_or(reference.year);

    // Four year digits in the long form.
    if (options.start_year < 0 || end_year > 9999) {
        throw std::invalid_argument("Generator: birth years must lie within 0-9999, got " +
                                    std::to_string(options.start_year) + "-" +
                                    std::to_string(end_year));
    }
    if (options.start_year > end_year) {
        throw std::invalid_argument("Generator: start_year " + std::to_string(options.start_year) +
                                    " is after end_year " + std::to_string(end_year));
    }
    if (!(options.male_ratio >= 0.0 && options.male_ratio <= 1.0)) {
        throw std::invalid_argument("Generator: male_ratio must be within [0, 1]");
    }
    if (!(options.coordination_ratio >= 0.0 && options.coordination_ratio <= 1.0)) {
        throw std::invalid_argument("Generator: coordination_ratio must be within [0, 1]");
    }

    Window window{Date{options.start_year, 1, 1}, std::min(Date{end_year, 12, 31}, reference),
                  reference};

    if (!options.include_centenarians) {
        // Born on or before this tuple means 100 or older on the reference date.
        Date oldest{reference.year - CENTENARIAN_AGE, reference.month, reference.day};
        Date youngest_allowed = Date::is_valid(oldest.year, oldest.month, oldest.day)
                                    ? Date::from_days(oldest.to_days() + 1)
                                    : Date{oldest.year, 3, 1};
        window.first = std::max(window.first, youngest_allowed);
    }

    if (window.last < window.first) {
        throw std::invalid_argument("Generator: no birth dates between " + window.first.iso() +
                                    " and " + window.last.iso());
    }
    return window;
}

/**
 * @brief Uniform year, then uniform day within the part of that year inside
 * the window.
 */
Date Generator::draw_birth_date(const Window& window)
{
    std::uniform_int_distribution<int> year_dist(window.first.year, window.last.year);
    int year = year_dist(engine_);

    Date lo = std::max(window.first, Date{year, 1, 1});
    Date hi = std::min(window.last, Date{year, 12, 31});
    std::uniform_int_distribution<long> day_dist(lo.to_days(), hi.to_days());
    return Date::from_days(day_dist(engine_));
}

Pin Generator::draw(const GeneratorOptions& options, const Window& window)
{
    Date birth = draw_birth_date(window);

    int written_day = birth.day;
    if (options.include_coordination_numbers) {
        std::bernoulli_distribution coordination(options.coordination_ratio);
        if (coordination(engine_)) {
            written_day += COORDINATION_OFFSET;
        }
    }

    std::bernoulli_distribution male(options.male_ratio);
    std::uniform_int_distribution<int> place_dist(0, 99);
    std::uniform_int_distribution<int> half_dist(0, 4);
    int place = place_dist(engine_);
    int gender_digit = 2 * half_dist(engine_) + (male(engine_) ? 1 : 0);

    std::string birth_number = infra::String::zero_pad(place, 2) + std::to_string(gender_digit);
    std::string significant = infra::String::zero_pad(birth.year % 100, 2) +
                              infra::String::zero_pad(birth.month, 2) +
                              infra::String::zero_pad(written_day, 2) + birth_number;
    int check = Checksum::compute(significant);
    char separator = CenturyResolver::separator_for(birth, window.reference);

    std::string candidate =
        infra::String::zero_pad(birth.year / 100, 2) + significant + std::to_string(check);

    auto parsed = Parser::parse(candidate, window.reference);
    if (!parsed) {
        std::string what = "Generator: candidate " + candidate +
                           " failed re-validation: " + parsed.error().message();
        infra::Logger::log(infra::LogLevel::FATAL, what);
        throw GeneratorInvariantError(what);
    }

    const Pin& pin = parsed.value();
    if (pin.full_year() != birth.year || pin.month() != birth.month ||
        pin.day() != written_day || pin.birth_number() != birth_number ||
        pin.check_digit() != check || pin.separator() != separator) {
        std::string what = "Generator: candidate " + candidate +
                           " re-parsed with different fields (separator '" +
                           std::string(1, pin.separator()) + "', expected '" +
                           std::string(1, separator) + "')";
        infra::Logger::log(infra::LogLevel::FATAL, what);
        throw GeneratorInvariantError(what);
    }
    return pin;
}

Pin Generator::next(const GeneratorOptions& options)
{
    return draw(options, window_for(options));
}

std::vector<Pin> Generator::generate(const GeneratorOptions& options)
{
    Window window = window_for(options);
    infra::Logger::log(infra::LogLevel::DEBUG,
                       "Generator: drawing " + std::to_string(options.count) +
                           " identity numbers born " + window.first.iso() + " to " +
                           window.last.iso());

    std::vector<Pin> pins;
    pins.reserve(options.count);
    for (std::size_t i = 0; i < options.count; ++i) {
        pins.push_back(draw(options, window));
    }
    return pins;
}

std::vector<Pin> generate_pins(const GeneratorOptions& options)
{
    Generator generator(infra::Random::seed());
    return generator.generate(options);
}

} // namespace swepin::core
