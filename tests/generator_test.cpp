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
 * @file generator_test.cpp
 * @brief Tests for the random identity number generator.
 */

#include "swepin/core/checksum.hpp"
#include "swepin/core/formatter.hpp"
#include "swepin/core/generator.hpp"
#include "swepin/core/parser.hpp"
#include "framework.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace swepin::core;

namespace {

const Date REF{2026, 10, 19};

GeneratorOptions options_at_reference()
{
    GeneratorOptions options;
    options.reference_date = REF;
    return options;
}

} // namespace

/**
 * @brief Every generated number re-parses in its long and short forms to the
 * same birth year.
 *
 * Covers coordination numbers on and off and the extreme gender ratios over
 * the whole default window, centenarians included.
 */
void test_generator_output_always_valid()
{
    Generator generator(20261019);
    std::size_t checked = 0;

    for (bool coordination : {true, false}) {
        for (double male_ratio : {0.0, 0.5, 1.0}) {
            GeneratorOptions options = options_at_reference();
            options.count = 1667;
            options.include_coordination_numbers = coordination;
            options.coordination_ratio = 0.3;
            options.male_ratio = male_ratio;

            for (const Pin& pin : generator.generate(options)) {
                auto from_long = Parser::parse(Formatter::long_form(pin), REF);
                ASSERT_TRUE(from_long.ok());
                ASSERT_EQ(from_long.value().full_year(), pin.full_year());

                auto from_short = Parser::parse(Formatter::short_form_with_separator(pin), REF);
                ASSERT_TRUE(from_short.ok());
                ASSERT_EQ(from_short.value().full_year(), pin.full_year());

                std::string digits = Formatter::short_form(pin);
                ASSERT_TRUE(Checksum::verify(digits.substr(0, 9), pin.check_digit()));

                ASSERT_EQ(pin.separator(), pin.age() >= 100 ? '+' : '-');
                ASSERT_TRUE(pin.birth_date() <= REF);
                ASSERT_TRUE(pin.full_year() >= 1920);

                if (!coordination) {
                    ASSERT_FALSE(pin.is_coordination_number());
                }
                if (male_ratio == 0.0) {
                    ASSERT_TRUE(pin.female());
                }
                if (male_ratio == 1.0) {
                    ASSERT_TRUE(pin.male());
                }
                checked++;
            }
        }
    }
    ASSERT_EQ(checked, static_cast<std::size_t>(10002));
}

/**
 * @brief Two generators with the same seed produce the same sequence.
 */
void test_generator_seeded_determinism()
{
    GeneratorOptions options = options_at_reference();
    options.count = 50;

    auto a = Generator(42).generate(options);
    auto b = Generator(42).generate(options);
    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i) {
        ASSERT_TRUE(a[i] == b[i]);
    }

    auto c = Generator(43).generate(options);
    bool differs = false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        differs = differs || a[i] != c[i];
    }
    ASSERT_TRUE(differs);
}

void test_generator_rejects_invalid_options()
{
    Generator generator(7);

    GeneratorOptions reversed = options_at_reference();
    reversed.start_year = 2000;
    reversed.end_year = 1990;
    ASSERT_THROWS(generator.generate(reversed), std::invalid_argument);

    GeneratorOptions ratio = options_at_reference();
    ratio.male_ratio = 1.5;
    ASSERT_THROWS(generator.generate(ratio), std::invalid_argument);

    GeneratorOptions coordination = options_at_reference();
    coordination.coordination_ratio = -0.1;
    ASSERT_THROWS(generator.generate(coordination), std::invalid_argument);

    // Entirely after the reference day.
    GeneratorOptions future = options_at_reference();
    future.start_year = 2030;
    future.end_year = 2035;
    ASSERT_THROWS(generator.generate(future), std::invalid_argument);

    // Every birth date in the window would be a centenarian.
    GeneratorOptions old = options_at_reference();
    old.start_year = 1900;
    old.end_year = 1920;
    old.include_centenarians = false;
    ASSERT_THROWS(generator.generate(old), std::invalid_argument);

    // Years that do not fit four digits.
    GeneratorOptions negative = options_at_reference();
    negative.start_year = -50;
    ASSERT_THROWS(generator.generate(negative), std::invalid_argument);

    GeneratorOptions distant;
    distant.reference_date = Date{10050, 1, 1};
    distant.start_year = 10000;
    distant.end_year = 10010;
    ASSERT_THROWS(generator.generate(distant), std::invalid_argument);

    // Default end year follows the reference year.
    GeneratorOptions open_ended;
    open_ended.reference_date = Date{10050, 1, 1};
    ASSERT_THROWS(generator.next(open_ended), std::invalid_argument);
}

void test_generator_without_centenarians()
{
    GeneratorOptions options = options_at_reference();
    options.count = 2000;
    options.start_year = 1900;
    options.include_centenarians = false;

    for (const Pin& pin : Generator(11).generate(options)) {
        ASSERT_TRUE(pin.age() < 100);
        ASSERT_EQ(pin.separator(), '-');
    }
}

void test_generator_ratios()
{
    GeneratorOptions options = options_at_reference();
    options.count = 0;
    ASSERT_TRUE(Generator(1).generate(options).empty());

    options.count = 500;
    options.coordination_ratio = 1.0;
    for (const Pin& pin : Generator(2).generate(options)) {
        ASSERT_TRUE(pin.is_coordination_number());
    }

    options.count = 4000;
    options.coordination_ratio = 0.0;
    options.male_ratio = 0.5;
    std::size_t males = 0;
    for (const Pin& pin : Generator(3).generate(options)) {
        ASSERT_FALSE(pin.is_coordination_number());
        if (pin.male()) {
            males++;
        }
    }
    ASSERT_TRUE(males > 1600 && males < 2400);
}

/**
 * @brief Narrow windows stay inside the requested years.
 */
void test_generator_year_window()
{
    GeneratorOptions options = options_at_reference();
    options.count = 300;
    options.start_year = 1955;
    options.end_year = 1956;

    for (const Pin& pin : Generator(5).generate(options)) {
        ASSERT_TRUE(pin.full_year() == 1955 || pin.full_year() == 1956);
    }

    // Current year: bounded by the reference day, not December 31.
    options.start_year = 2026;
    options.end_year = 2026;
    for (const Pin& pin : Generator(6).generate(options)) {
        ASSERT_TRUE(pin.birth_date() <= REF);
    }
}

/**
 * @brief The free function may be called from several threads at once.
 */
void test_generator_concurrent_use()
{
    constexpr int kThreads = 4;
    std::vector<std::vector<Pin>> batches(kThreads);
    std::vector<std::thread> workers;

    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&batches, t] {
            GeneratorOptions options = options_at_reference();
            options.count = 250;
            batches[t] = generate_pins(options);
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    for (const auto& batch : batches) {
        ASSERT_EQ(batch.size(), static_cast<std::size_t>(250));
        for (const Pin& pin : batch) {
            ASSERT_TRUE(Parser::is_valid(Formatter::long_form(pin), REF));
        }
    }
}
