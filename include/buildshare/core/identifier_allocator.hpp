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
 * @file identifier_allocator.hpp
 * @brief Allocation of fresh record identifiers.
 */

#pragma once

#include "buildshare/infra/clock.hpp"
#include "buildshare/infra/id_generator.hpp"
#include "buildshare/storage/db.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace buildshare::core {

/**
 * @class AllocationError
 * @brief Every drawn identifier was already taken.
 */
class AllocationError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/**
 * @class IdentifierAllocator
 * @brief Draws Snowflake identifiers and checks them against stored records.
 *
 * @details
 * An identifier is taken when a record uses it as `_id`, or when a legacy
 * record already answers to its shortcode under `Code`.
 *
 * The check and the later insert are separate steps. A concurrent writer can
 * still claim the same `_id` in between; the insert then reports
 * `DUPLICATE_KEY` and the caller allocates again.
 */
class IdentifierAllocator {
  public:
    static constexpr int DEFAULT_ATTEMPTS = 5;

    /**
     * @param db Store checked for existing identifiers.
     * @param collection Collection whose `_id` space is allocated from.
     * @param clock Time source of the Snowflake generator.
     * @param worker_id Snowflake worker partition (0..1023).
     * @param max_attempts Identifiers drawn before giving up.
     * @throws std::invalid_argument On a bad worker id or a non-positive attempt count.
     */
    IdentifierAllocator(const storage::Db& db, std::string collection, const infra::Clock& clock,
                        uint32_t worker_id, int max_attempts = DEFAULT_ATTEMPTS);

    /**
     * @brief Returns an identifier no stored record uses.
     * @throws AllocationError After `max_attempts` collisions.
     */
    uint64_t allocate();

    /// @brief True if the identifier or its shortcode is already in use.
    bool exists(uint64_t id) const;

  private:
    const storage::Db& db_;
    std::string collection_;
    infra::IdGenerator generator_;
    int max_attempts_;
};

} // namespace buildshare::core
