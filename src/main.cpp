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
 * @file main.cpp
 * @brief Application Entry Point (Bootstrap).
 *
 * @details
 * 1. Argument parsing and configuration loading.
 * 2. Signal handler registration (SIGINT/SIGTERM).
 * 3. Storage, store and index initialization.
 * 4. Expiry monitor and network loop.
 */

#include "buildshare/core/build_store.hpp"
#include "buildshare/infra/clock.hpp"
#include "buildshare/infra/config.hpp"
#include "buildshare/infra/logger.hpp"
#include "buildshare/network/server.hpp"
#include "buildshare/storage/collections.hpp"
#include "buildshare/storage/db.hpp"
#include "buildshare/storage/ttl_monitor.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace buildshare;

/// @brief Active server, read by the signal handler.
static network::Server* g_server = nullptr;

static void signal_handler(int)
{
    if (g_server) {
        g_server->request_stop();
    }
}

static void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [CONFIG_PATH]\n"
              << "Options:\n"
              << "  CONFIG_PATH Path to a JSON configuration file (Default: ./buildshare.json)\n"
              << "  --help      Show this help message\n";
}

int main(int argc, char* argv[])
{
    if (argc > 1 && std::string(argv[1]) == "--help") {
        print_help(argv[0]);
        return 0;
    }

    std::string config_path = argc > 1 ? argv[1] : "./buildshare.json";

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        infra::Config config = infra::load_config(config_path);
        infra::Logger::set_level(infra::Logger::parse_level(config.log_level));

        infra::Logger::log(infra::LogLevel::INFO, "System: Booting BuildShare...");
        infra::Logger::log(infra::LogLevel::INFO,
                           "Config: Persistence Path set to '" + config.data_path + "'");

        infra::SystemClock clock;
        storage::Db db(config.data_path);
        storage::CollectionRegistry collections(config.collections);

        core::BuildStore store(db, collections, core::UrlBuilder(config.base_url, config.app_protocol),
                               core::StoreSettings::from_config(config), clock);
        store.initialize();

        storage::TtlMonitor monitor(db, clock,
                                    std::chrono::seconds(config.ttl_sweep_interval_seconds));
        monitor.start();

        network::Server server(store, config.port);
        g_server = &server;
        bool served = server.run();
        g_server = nullptr;

        monitor.stop();
        if (!served) {
            return 1;
        }
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::FATAL,
                           "System: Critical Failure: " + std::string(e.what()));
        return 1;
    }

    infra::Logger::log(infra::LogLevel::INFO, "System: Shutdown complete.");
    return 0;
}
