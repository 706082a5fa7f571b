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
 * @file clock.cpp
 * @brief System and manual clock implementations.
 */

#include "buildshare/infra/clock.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace buildshare::infra {

TimePoint SystemClock::now() const
{
    return std::chrono::system_clock::now();
}

ManualClock::ManualClock(TimePoint start) : current_(start) {}

TimePoint ManualClock::now() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

void ManualClock::advance(std::chrono::milliseconds delta)
{
    std::lock_guard<std::mutex> lock(mutex_);
    current_ += delta;
}

void ManualClock::set(TimePoint point)
{
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = point;
}

int64_t to_epoch_ms(TimePoint point)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(point.time_since_epoch()).count();
}

TimePoint from_epoch_ms(int64_t millis)
{
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
        std::chrono::milliseconds(millis)));
}

/**
 * @brief UTC timestamp with millisecond precision, e.g. `2026-01-31T00:00:00.000Z`.
 */
std::string format_iso8601(TimePoint point)
{
    int64_t millis = to_epoch_ms(point);
    int64_t seconds = millis / 1000;
    int64_t remainder = millis % 1000;
    // Floor toward negative infinity for instants before 1970
    if (remainder < 0) {
        remainder += 1000;
        seconds -= 1;
    }

    std::time_t time = static_cast<std::time_t>(seconds);
    std::tm utc{};
    gmtime_r(&time, &utc);

    std::ostringstream ss;
    ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << "." << std::setw(3) << std::setfill('0')
       << remainder << "Z";
    return ss.str();
}

} // namespace buildshare::infra
