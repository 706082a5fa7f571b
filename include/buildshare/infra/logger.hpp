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
 * @brief Thread-safe diagnostic logging facility for BuildShare.
 *
 * @details
 * This header declares the `Logger` class, the centralized reporting interface
 * shared by the storage engine, the build store and the network layer. Output to
 * `stdout`/`stderr` is serialized across threads so that entries never interleave.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <string>

namespace buildshare::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 *
 * Used to categorize the criticality of log entries, to select the output
 * stream, and to filter entries below the configured threshold.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details (index lookups, sweep passes).
    DEBUG, ///< Diagnostic information intended for development and troubleshooting.
    INFO,  ///< Nominal operational events (startup sequence, records created).
    WARN,  ///< Non-blocking anomalies (identifier collisions, retries).
    ERROR, ///< Recoverable runtime errors reported to a caller.
    FATAL  ///< Critical failures after which the process must not keep serving.
};

/**
 * @class Logger
 * @brief A static utility class providing system-wide logging capabilities.
 *
 * @details
 * The Logger implements a thread-safe, static interface for writing diagnostic
 * artifacts. An internal mutex serializes access to the console; a process-wide
 * threshold discards entries below the configured severity before the lock is taken.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout` (Standard Output).
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr` (Standard Error).
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * buildshare::infra::Logger::log(LogLevel::INFO, "Store: Build created (code=4fTz91kQ2)");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /**
     * @brief Sets the minimum severity that reaches the console.
     * @param level Entries strictly below this level are dropped.
     */
    static void set_level(LogLevel level);

    /// @brief Returns the current minimum severity.
    static LogLevel level();

    /**
     * @brief Parses a textual level ("trace", "debug", "info", "warn", "error", "fatal").
     *
     * Matching is case-insensitive.
     *
     * @throws std::invalid_argument If the name is not a known level.
     */
    static LogLevel parse_level(const std::string& name);

  private:
    /// @brief Guards `std::cout` and `std::cerr` against interleaved writes.
    static std::mutex mutex_;

    /// @brief Process-wide severity threshold.
    static std::atomic<LogLevel> threshold_;
};

} // namespace buildshare::infra
