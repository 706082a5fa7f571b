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
 * @file query.hpp
 * @brief Document filter evaluation.
 *
 * @details
 * A query is a JSON object. Each member other than `$or` is an equality test
 * on a top-level field, and all of them must hold. `$or` holds an array of
 * sub-queries of which at least one must hold.
 *
 * @code
 * { "archetype": "Tanker", "$or": [ { "primary": "Fire" }, { "secondary": "Fire" } ] }
 * @endcode
 */

#pragma once

#include <cJSON.h>
#include <optional>
#include <string>

namespace buildshare::storage {

class Query {
  public:
    /// @brief Operator key introducing a disjunction.
    static constexpr const char* OR_OPERATOR = "$or";

    /**
     * @brief Evaluates a query against one document.
     *
     * A `null` or empty query matches every document. A query value of JSON
     * `null` matches a missing field. A malformed `$or` (not an array) or an
     * empty `$or` array matches nothing.
     */
    static bool matches(const cJSON* doc, const cJSON* query);

    /**
     * @brief Normalized hash-index key for a scalar value.
     *
     * Strings and numbers are prefixed with their type, so `"1"` and `1` never
     * share a bucket.
     *
     * @return std::nullopt For values that cannot be indexed (objects, arrays,
     * booleans, null).
     */
    static std::optional<std::string> index_key(const cJSON* value);
};

} // namespace buildshare::storage
