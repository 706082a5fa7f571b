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
 * @file query.cpp
 * @brief Filter evaluation over cJSON documents.
 */

#include "buildshare/storage/query.hpp"

#include <cstdio>
#include <cstring>

namespace buildshare::storage {

/**
 * @brief Evaluates a filter: every top-level condition must hold.
 *
 * - `{"$or": [f1, f2, ...]}` holds when any branch matches.
 * - `{"field": value}` holds on deep equality; a `null` value also matches a
 *   missing field.
 */
bool Query::matches(const cJSON* doc, const cJSON* query)
{
    if (query == nullptr) {
        return true;
    }

    const cJSON* condition = nullptr;
    cJSON_ArrayForEach(condition, query)
    {
        if (condition->string == nullptr) {
            return false;
        }

        if (std::strcmp(condition->string, OR_OPERATOR) == 0) {
            if (!cJSON_IsArray(condition)) {
                return false;
            }
            bool any = false;
            const cJSON* branch = nullptr;
            cJSON_ArrayForEach(branch, condition)
            {
                if (matches(doc, branch)) {
                    any = true;
                    break;
                }
            }
            if (!any) {
                return false;
            }
            continue;
        }

        const cJSON* field = cJSON_GetObjectItemCaseSensitive(doc, condition->string);
        if (field == nullptr) {
            if (!cJSON_IsNull(condition)) {
                return false;
            }
            continue;
        }
        if (!cJSON_Compare(field, condition, true)) {
            return false;
        }
    }
    return true;
}

/// @brief Type-tagged key so that `"1"` and `1` land in different buckets.
std::optional<std::string> Query::index_key(const cJSON* value)
{
    if (cJSON_IsString(value) && value->valuestring != nullptr) {
        return std::string("s:") + value->valuestring;
    }
    if (cJSON_IsNumber(value)) {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "n:%.17g", value->valuedouble);
        return std::string(buffer);
    }
    return std::nullopt;
}

} // namespace buildshare::storage
