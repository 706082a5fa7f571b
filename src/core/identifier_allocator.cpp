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
 * @file identifier_allocator.cpp
 * @brief Check-then-return allocation of Snowflake identifiers.
 */

#include "buildshare/core/identifier_allocator.hpp"

#include "buildshare/codec/base62.hpp"
#include "buildshare/infra/logger.hpp"
#include "buildshare/model/build_record.hpp"

#include <cJSON.h>
#include <memory>

namespace buildshare::core {

namespace {

using JsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

JsonPtr equality(const char* field, const std::string& value)
{
    JsonPtr query(cJSON_CreateObject(), &cJSON_Delete);
    cJSON_AddStringToObject(query.get(), field, value.c_str());
    return query;
}

} // namespace

/**
 * @brief Binds the allocator to one collection.
 * @throws std::invalid_argument If `max_attempts` is below one.
 */
IdentifierAllocator::IdentifierAllocator(const storage::Db& db, std::string collection,
                                         const infra::Clock& clock, uint32_t worker_id,
                                         int max_attempts)
    : db_(db), collection_(std::move(collection)), generator_(clock, worker_id),
      max_attempts_(max_attempts)
{
    if (max_attempts_ < 1) {
        throw std::invalid_argument("Allocator: At least one attempt is required");
    }
}

/**
 * @brief Collision check.
 *
 * 1. The identifier itself as `_id`.
 * 2. Its shortcode as a legacy `Code`, which shares the lookup space of
 * current shortcodes.
 */
bool IdentifierAllocator::exists(uint64_t id) const
{
    if (db_.count(collection_, equality(model::field::ID, std::to_string(id)).get()) > 0) {
        return true;
    }
    return db_.count(collection_,
                     equality(model::field::LEGACY_CODE, codec::Base62::encode(id)).get()) > 0;
}

/**
 * @brief Draws identifiers until one is free.
 * @throws AllocationError After `max_attempts` collisions.
 */
uint64_t IdentifierAllocator::allocate()
{
    for (int attempt = 1; attempt <= max_attempts_; ++attempt) {
        uint64_t id = generator_.generate();
        if (!exists(id)) {
            return id;
        }
        infra::Logger::log(infra::LogLevel::WARN, "Allocator: Identifier " + std::to_string(id) +
                                                      " already in use (attempt " +
                                                      std::to_string(attempt) + ")");
    }
    throw AllocationError("Allocator: No free identifier after " + std::to_string(max_attempts_) +
                          " attempts");
}

} // namespace buildshare::core
