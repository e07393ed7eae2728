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
 * @file random.hpp
 * @brief Per-thread entropy source for identity number synthesis.
 *
 * @details
 * Declares the `Random` utility, which hands out a Mersenne Twister engine that
 * is private to the calling thread. Concurrent generator calls therefore never
 * share engine state and cannot produce correlated sequences.
 */

#pragma once

#include <cstdint>
#include <random>

namespace swepin::infra {

/**
 * @class Random
 * @brief A static accessor for thread-confined random engines.
 */
class Random {
  public:
    /**
     * @brief Returns the calling thread's engine, seeding it on first use.
     *
     * The engine is seeded from `std::random_device`. The reference stays valid
     * for the lifetime of the thread and must not be handed to other threads.
     *
     * @code
     * std::uniform_int_distribution<int> digit(0, 9);
     * int d = digit(swepin::infra::Random::engine());
     * @endcode
     */
    static std::mt19937_64& engine();

    /**
     * @brief Draws a fresh 64-bit seed from the calling thread's engine.
     *
     * Used to seed independent engines (e.g. one `Generator` per worker thread).
     */
    static std::uint64_t seed();
};

} // namespace swepin::infra
