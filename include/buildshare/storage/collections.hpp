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
 * @file collections.hpp
 * @brief Logical entity name -> physical collection name.
 */

#pragma once

#include <string>
#include <unordered_map>

namespace buildshare::storage {

/**
 * @class CollectionRegistry
 * @brief Immutable mapping resolved once at startup.
 *
 * Built-in entities: `BuildRecord -> Builds`. Overrides may rename a built-in
 * entity's collection but cannot introduce new entities.
 */
class CollectionRegistry {
  public:
    static constexpr const char* BUILD_RECORD = "BuildRecord";

    CollectionRegistry();

    /**
     * @throws std::invalid_argument For an unknown entity, or a collection name
     * that is empty, starts with `_`, or contains a path separator.
     */
    explicit CollectionRegistry(const std::unordered_map<std::string, std::string>& overrides);

    /**
     * @brief Physical collection of an entity.
     * @throws std::out_of_range If the entity is not registered.
     */
    const std::string& resolve(const std::string& entity) const;

  private:
    std::unordered_map<std::string, std::string> mapping_;
};

} // namespace buildshare::storage
