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
 * @file id_generator.hpp
 * @brief Time-ordered 64-bit identifier generation (Snowflake layout).
 *
 * @details
 * This file declares the `IdGenerator` class, which produces the primary keys
 * (`_id`) of build records. Identifiers embed a timestamp, the worker id of the
 * generating process and a per-millisecond sequence, so two generators with
 * distinct worker ids can never produce the same value.
 */

#pragma once

#include "buildshare/infra/clock.hpp"

#include <cstdint>
#include <mutex>

namespace buildshare::infra {

/**
 * @class IdGenerator
 * @brief Thread-safe Snowflake identifier generator.
 *
 * @details
 * **Bit Layout (most significant first):**
 * - 1 bit: always zero (identifiers are non-negative as signed 64-bit values).
 * - 41 bits: milliseconds since `EPOCH_MS` (2015-01-01T00:00:00Z).
 * - 10 bits: worker id (`0..1023`).
 * - 12 bits: sequence within the millisecond.
 *
 * When the sequence overflows within one millisecond, or the clock is observed to
 * move backwards, the generator advances its own logical timestamp instead of
 * waiting for the clock. Identifiers therefore stay strictly increasing per
 * generator and `generate()` never blocks.
 */
class IdGenerator {
  public:
    static constexpr int64_t EPOCH_MS = 1420070400000LL;
    static constexpr int TIMESTAMP_BITS = 41;
    static constexpr int WORKER_BITS = 10;
    static constexpr int SEQUENCE_BITS = 12;
    static constexpr uint32_t MAX_WORKER_ID = (1u << WORKER_BITS) - 1;
    static constexpr uint32_t MAX_SEQUENCE = (1u << SEQUENCE_BITS) - 1;

    /**
     * @brief Binds the generator to a clock and a worker id.
     *
     * @param clock Time source; must outlive the generator.
     * @param worker_id Partition of the identifier space owned by this process.
     * @throws std::invalid_argument If `worker_id` exceeds `MAX_WORKER_ID`.
     */
    IdGenerator(const Clock& clock, uint32_t worker_id);

    /**
     * @brief Produces the next identifier.
     *
     * @code
     * buildshare::infra::IdGenerator ids(clock, 7);
     * uint64_t id = ids.generate();
     * @endcode
     */
    uint64_t generate();

    uint32_t worker_id() const { return worker_id_; }

    /// @brief Extracts the embedded timestamp (Unix epoch milliseconds).
    static int64_t timestamp_of(uint64_t id);

    /// @brief Extracts the embedded worker id.
    static uint32_t worker_of(uint64_t id);

  private:
    const Clock& clock_;
    uint32_t worker_id_;

    std::mutex mutex_;
    int64_t last_ms_ = -1;
    uint32_t sequence_ = 0;
};

} // namespace buildshare::infra
