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
 * @file id_generator.cpp
 * @brief Implementation of the Snowflake identifier generator.
 */

#include "buildshare/infra/id_generator.hpp"

#include <stdexcept>
#include <string>

namespace buildshare::infra {

IdGenerator::IdGenerator(const Clock& clock, uint32_t worker_id)
    : clock_(clock), worker_id_(worker_id)
{
    if (worker_id > MAX_WORKER_ID) {
        throw std::invalid_argument("Worker id " + std::to_string(worker_id) +
                                    " exceeds the maximum of " + std::to_string(MAX_WORKER_ID));
    }
}

/**
 * @brief Generates the next Snowflake identifier.
 *
 * Implementation Strategy:
 * 1. **Clock Sample**: Reads the injected clock and rebases it on `EPOCH_MS`.
 * 2. **Monotonic Guard**: A sample at or behind the last issued timestamp reuses
 * that timestamp and bumps the sequence.
 * 3. **Overflow**: An exhausted sequence borrows the next millisecond.
 * 4. **Packing**: Shifts timestamp, worker id and sequence into their bit ranges.
 */
uint64_t IdGenerator::generate()
{
    // 1. Clock Sample (a clock before the epoch pins to zero)
    int64_t now_ms = to_epoch_ms(clock_.now()) - EPOCH_MS;
    if (now_ms < 0) {
        now_ms = 0;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    // 2. Monotonic Guard
    if (now_ms > last_ms_) {
        last_ms_ = now_ms;
        sequence_ = 0;
    } else if (sequence_ < MAX_SEQUENCE) {
        ++sequence_;
    } else {
        // 3. Overflow: run ahead of the clock rather than block
        ++last_ms_;
        sequence_ = 0;
    }

    // 4. Packing
    uint64_t timestamp = static_cast<uint64_t>(last_ms_) & ((1ULL << TIMESTAMP_BITS) - 1);
    return (timestamp << (WORKER_BITS + SEQUENCE_BITS)) |
           (static_cast<uint64_t>(worker_id_) << SEQUENCE_BITS) | sequence_;
}

int64_t IdGenerator::timestamp_of(uint64_t id)
{
    return static_cast<int64_t>(id >> (WORKER_BITS + SEQUENCE_BITS)) + EPOCH_MS;
}

uint32_t IdGenerator::worker_of(uint64_t id)
{
    return static_cast<uint32_t>((id >> SEQUENCE_BITS) & MAX_WORKER_ID);
}

} // namespace buildshare::infra
