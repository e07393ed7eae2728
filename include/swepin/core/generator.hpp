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
 * @file generator.hpp
 * @brief Synthesis of random, checksum-consistent identity numbers.
 *
 * @details
 * The generator runs the validation pipeline backwards: it samples a birth
 * date, birth place and gender digit, computes the Luhn digit and the
 * separator, and then feeds the result through `Parser` as a self-check.
 * A candidate that fails re-validation is a defect and aborts the batch with
 * `GeneratorInvariantError`.
 */

#pragma once

#include "swepin/core/date.hpp"
#include "swepin/core/pin.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <vector>

namespace swepin::core {

/**
 * @struct GeneratorOptions
 * @brief Constraints for a generated batch.
 */
struct GeneratorOptions {
    /// @brief Number of identity numbers to produce.
    std::size_t count = 10;

    /// @brief Earliest birth year (inclusive).
    int start_year = 1920;

    /// @brief Latest birth year (inclusive); unset means the reference year.
    std::optional<int> end_year;

    /// @brief Allow coordination numbers (day + 60).
    bool include_coordination_numbers = true;

    /// @brief Probability that a number is a coordination number, when allowed.
    double coordination_ratio = 0.1;

    /// @brief Allow holders aged 100 or more (written with `+`).
    bool include_centenarians = true;

    /// @brief Probability of an odd (male) gender digit, in [0, 1].
    double male_ratio = 0.5;

    /// @brief Day ages and separators are computed on; unset means `Date::today()`.
    std::optional<Date> reference_date;
};

/**
 * @class Generator
 * @brief A seeded source of valid identity numbers.
 *
 * @details
 * Each instance owns its random engine and is meant to be used from a single
 * thread. Two instances built with the same seed produce the same sequence for
 * the same options, which makes test fixtures reproducible.
 */
class Generator {
  public:
    /// @brief Seeds the engine from the calling thread's entropy source.
    Generator();

    explicit Generator(std::uint64_t seed);

    /**
     * @brief Produces `options.count` identity numbers.
     *
     * @throws std::invalid_argument if the options describe an empty birth date
     * window or a ratio outside [0, 1].
     * @throws GeneratorInvariantError if any candidate fails re-validation. No
     * partial batch is returned.
     */
    std::vector<Pin> generate(const GeneratorOptions& options);

    /// @brief Produces a single identity number under `options` (ignores `count`).
    Pin next(const GeneratorOptions& options);

  private:
    struct Window {
        Date first;
        Date last;
        Date reference;
    };

    static Window window_for(const GeneratorOptions& options);
    Date draw_birth_date(const Window& window);
    Pin draw(const GeneratorOptions& options, const Window& window);

    std::mt19937_64 engine_;
};

/**
 * @brief Convenience batch generation with a per-thread engine.
 *
 * Safe to call concurrently from several threads.
 */
std::vector<Pin> generate_pins(const GeneratorOptions& options);

} // namespace swepin::core
