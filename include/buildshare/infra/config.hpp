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
 * @file config.hpp
 * @brief Process configuration object and its JSON loader.
 *
 * @details
 * Configuration is read once at startup and passed by value or reference into
 * the components that need it. Nothing reads configuration from global state.
 *
 * **Example file:**
 * @code
 * {
 *   "data_path": "/var/lib/buildshare",
 *   "port": 5555,
 *   "base_url": "https://mids.app",
 *   "app_protocol": "mrb",
 *   "retention_days": 30,
 *   "worker_id": 1,
 *   "log_level": "info",
 *   "collections": { "BuildRecord": "Builds" }
 * }
 * @endcode
 */

#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace buildshare::infra {

/**
 * @struct Config
 * @brief All tunables of a BuildShare process, with their defaults.
 */
struct Config {
    std::string data_path = "./buildshare_data";
    int port = 5555;

    /// @brief Public origin used for download and image links. Required.
    std::string base_url;

    /// @brief Custom URL scheme handled by the desktop client (e.g. "mrb"). Required.
    std::string app_protocol;

    int retention_days = 30;
    uint32_t worker_id = 0;
    int allocation_attempts = 5;
    int insert_attempts = 3;
    int ttl_sweep_interval_seconds = 60;
    std::string log_level = "info";

    /// @brief Logical entity name -> physical collection name overrides.
    std::unordered_map<std::string, std::string> collections;
};

/**
 * @brief Parses configuration from JSON text.
 *
 * Unknown keys are ignored. Keys that are present must have the right JSON type.
 *
 * @throws std::runtime_error On invalid JSON, a wrongly typed key, a missing
 * `base_url`/`app_protocol`, or an out-of-range value.
 */
Config parse_config(const std::string& json_text);

/**
 * @brief Reads and parses a configuration file.
 *
 * @throws std::runtime_error If the file cannot be read or `parse_config` fails.
 */
Config load_config(const std::string& path);

} // namespace buildshare::infra
