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
 * @file ttl_monitor.hpp
 * @brief Background thread enforcing TTL indexes.
 */

#pragma once

#include "buildshare/infra/clock.hpp"
#include "buildshare/storage/db.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace buildshare::storage {

/**
 * @class TtlMonitor
 * @brief Periodically calls `Db::sweep_expired` with the injected clock's time.
 *
 * Expiry granularity is the sweep interval: a document may outlive its
 * deadline by up to one interval.
 */
class TtlMonitor {
  public:
    static constexpr std::chrono::seconds DEFAULT_INTERVAL{60};

    TtlMonitor(Db& db, const infra::Clock& clock,
               std::chrono::milliseconds interval = DEFAULT_INTERVAL);

    /// @brief Stops and joins the sweeper thread.
    ~TtlMonitor();

    TtlMonitor(const TtlMonitor&) = delete;
    TtlMonitor& operator=(const TtlMonitor&) = delete;

    /// @brief Starts the sweeper thread. No effect if already running.
    void start();

    /// @brief Wakes the sweeper and waits for it to exit.
    void stop();

    /// @brief Performs one sweep on the calling thread.
    size_t run_once();

    bool running() const;

  private:
    Db& db_;
    const infra::Clock& clock_;
    std::chrono::milliseconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_requested_ = false;
    std::thread worker_;

    void loop();
};

} // namespace buildshare::storage
