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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for swepin.
 *
 * @details
 * This header declares the `Logger` class, the single reporting channel used by
 * the parser, the generator and the command line front end. Output is serialized
 * through one mutex so lines written by concurrent generator threads never interleave.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace swepin::infra {

/**
 * @enum LogLevel
 * @brief Severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Per-digit and per-candidate details (century candidates, checksum sums).
    DEBUG, ///< Rejected inputs and generator batch progress.
    INFO,  ///< Nominal operational events (CLI start, batch completion).
    WARN,  ///< Non-blocking anomalies (e.g. an input line that could not be read).
    ERROR, ///< Recoverable failures reported to the caller.
    FATAL  ///< Broken internal invariants; the current operation is abandoned.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging.
 *
 * @details
 * Messages below the configured minimum level are discarded before the lock is
 * taken. The threshold itself is atomic, so `set_level()` may race with `log()`.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * swepin::infra::Logger::log(LogLevel::DEBUG, "Parser: rejected input '12'");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that reaches the console (default `INFO`).
     */
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /**
     * @brief Maps a textual level name (`"trace"` ... `"fatal"`) to a `LogLevel`.
     *
     * @return std::nullopt if the name is not recognised.
     */
    static std::optional<LogLevel> parse_level(const std::string& name);

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved lines.
    static std::mutex mutex_;

    /// @brief Minimum severity written to the console.
    static std::atomic<LogLevel> threshold_;
};

} // namespace swepin::infra
