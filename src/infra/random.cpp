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
 * @file random.cpp
 * @brief Implementation of the per-thread entropy source.
 */

#include "swepin/infra/random.hpp"

namespace swepin::infra {

/**
 * @brief Returns the thread-local 64-bit Mersenne Twister.
 *
 * `thread_local` gives each thread its own isolated engine, so no lock is
 * needed on the generation path.
 */
std::mt19937_64& Random::engine()
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    return gen;
}

std::uint64_t Random::seed()
{
    static thread_local std::uniform_int_distribution<std::uint64_t> dis;
    return dis(engine());
}

} // namespace swepin::infra
