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

#include "buildshare/storage/collections.hpp"

#include <stdexcept>

namespace buildshare::storage {

CollectionRegistry::CollectionRegistry() : mapping_{{BUILD_RECORD, "Builds"}} {}

CollectionRegistry::CollectionRegistry(
    const std::unordered_map<std::string, std::string>& overrides)
    : CollectionRegistry()
{
    for (const auto& [entity, collection] : overrides) {
        auto it = mapping_.find(entity);
        if (it == mapping_.end()) {
            throw std::invalid_argument("Collections: Unknown entity '" + entity + "'");
        }
        // `_`-prefixed names are reserved for store metadata
        if (collection.empty() || collection[0] == '_' ||
            collection.find_first_of("/\\") != std::string::npos) {
            throw std::invalid_argument("Collections: Invalid collection name '" + collection +
                                        "' for " + entity);
        }
        it->second = collection;
    }
}

/// @throws std::out_of_range For an entity that has no collection.
const std::string& CollectionRegistry::resolve(const std::string& entity) const
{
    auto it = mapping_.find(entity);
    if (it == mapping_.end()) {
        throw std::out_of_range("Collections: No collection registered for '" + entity + "'");
    }
    return it->second;
}

} // namespace buildshare::storage
