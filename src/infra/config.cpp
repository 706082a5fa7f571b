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
 * @file config.cpp
 * @brief JSON configuration loader built on cJSON.
 */

#include "buildshare/infra/config.hpp"

#include "buildshare/infra/id_generator.hpp"
#include "buildshare/infra/logger.hpp"

#include <cJSON.h>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace buildshare::infra {

namespace {

/// @brief Overwrites `out` when `key` is present. Absent keys keep their default.
void read_string(const cJSON* root, const char* key, std::string& out)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, key);
    if (!item)
        return;
    if (!cJSON_IsString(item) || item->valuestring == nullptr)
        throw std::runtime_error(std::string("Config: '") + key + "' must be a string");
    out = item->valuestring;
}

void read_int(const cJSON* root, const char* key, int& out)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(root, key);
    if (!item)
        return;
    if (!cJSON_IsNumber(item))
        throw std::runtime_error(std::string("Config: '") + key + "' must be a number");
    out = item->valueint;
}

void require_range(const char* key, int value, int min, int max)
{
    if (value < min || value > max) {
        throw std::runtime_error(std::string("Config: '") + key + "' must be between " +
                                 std::to_string(min) + " and " + std::to_string(max));
    }
}

} // namespace

/**
 * @brief Parses and validates a configuration document.
 *
 * 1. **Syntax:** the text must be a JSON object.
 * 2. **Types:** every present key must have the expected type.
 * 3. **Semantics:** required keys and value ranges.
 *
 * @throws std::runtime_error Naming the offending key.
 */
Config parse_config(const std::string& json_text)
{
    std::unique_ptr<cJSON, decltype(&cJSON_Delete)> doc(cJSON_Parse(json_text.c_str()),
                                                         &cJSON_Delete);
    if (!doc) {
        throw std::runtime_error("Config: Invalid JSON syntax");
    }
    if (!cJSON_IsObject(doc.get())) {
        throw std::runtime_error("Config: Top-level value must be an object");
    }
    const cJSON* root = doc.get();

    Config config;
    read_string(root, "data_path", config.data_path);
    read_int(root, "port", config.port);
    read_string(root, "base_url", config.base_url);
    read_string(root, "app_protocol", config.app_protocol);
    read_int(root, "retention_days", config.retention_days);

    int worker_id = static_cast<int>(config.worker_id);
    read_int(root, "worker_id", worker_id);
    require_range("worker_id", worker_id, 0, static_cast<int>(IdGenerator::MAX_WORKER_ID));
    config.worker_id = static_cast<uint32_t>(worker_id);

    read_int(root, "allocation_attempts", config.allocation_attempts);
    read_int(root, "insert_attempts", config.insert_attempts);
    read_int(root, "ttl_sweep_interval_seconds", config.ttl_sweep_interval_seconds);
    read_string(root, "log_level", config.log_level);

    const cJSON* collections = cJSON_GetObjectItemCaseSensitive(root, "collections");
    if (collections) {
        if (!cJSON_IsObject(collections))
            throw std::runtime_error("Config: 'collections' must be an object");
        const cJSON* entry = nullptr;
        cJSON_ArrayForEach(entry, collections)
        {
            if (!cJSON_IsString(entry) || entry->valuestring == nullptr)
                throw std::runtime_error("Config: collection names must be strings");
            config.collections[entry->string] = entry->valuestring;
        }
    }

    // Required keys
    if (config.base_url.empty())
        throw std::runtime_error("Config: 'base_url' must be configured");
    if (config.app_protocol.empty())
        throw std::runtime_error("Config: 'app_protocol' must be configured");

    require_range("port", config.port, 1, 65535);
    require_range("retention_days", config.retention_days, 1, 3650);
    require_range("allocation_attempts", config.allocation_attempts, 1, 100);
    require_range("insert_attempts", config.insert_attempts, 1, 100);
    require_range("ttl_sweep_interval_seconds", config.ttl_sweep_interval_seconds, 1, 86400);

    // Validate the level name now rather than at the first log call
    try {
        Logger::parse_level(config.log_level);
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Config: ") + e.what());
    }

    return config;
}

Config load_config(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Config: Cannot open configuration file '" + path + "'");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse_config(buffer.str());
}

} // namespace buildshare::infra
