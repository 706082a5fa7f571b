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
 * @file clock.hpp
 * @brief Injectable wall-clock abstraction and timestamp helpers.
 *
 * @details
 * Expiry timestamps, Snowflake identifiers and the TTL sweep all read the time
 * through a `Clock` so that a `ManualClock` can drive them deterministically.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace buildshare::infra {

using TimePoint = std::chrono::system_clock::time_point;

/**
 * @class Clock
 * @brief Abstract source of the current UTC time.
 */
class Clock {
  public:
    virtual ~Clock() = default;

    /// @brief Returns the current instant.
    virtual TimePoint now() const = 0;
};

/**
 * @class SystemClock
 * @brief Production clock backed by `std::chrono::system_clock`.
 */
class SystemClock : public Clock {
  public:
    TimePoint now() const override;
};

/**
 * @class ManualClock
 * @brief A clock that only moves when told to. Thread-safe.
 */
class ManualClock : public Clock {
  public:
    explicit ManualClock(TimePoint start = std::chrono::system_clock::now());

    TimePoint now() const override;

    /// @brief Moves the clock forward (or backward, for a negative duration).
    void advance(std::chrono::milliseconds delta);

    /// @brief Jumps to an absolute instant.
    void set(TimePoint point);

  private:
    mutable std::mutex mutex_;
    TimePoint current_;
};

/// @brief Milliseconds since the Unix epoch.
int64_t to_epoch_ms(TimePoint point);

/// @brief Inverse of `to_epoch_ms`.
TimePoint from_epoch_ms(int64_t millis);

/**
 * @brief Formats an instant as ISO 8601 UTC with millisecond precision.
 *
 * @code
 * format_iso8601(from_epoch_ms(0)); // "1970-01-01T00:00:00.000Z"
 * @endcode
 */
std::string format_iso8601(TimePoint point);

} // namespace buildshare::infra
