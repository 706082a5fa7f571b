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
 * @file ttl_monitor.cpp
 * @brief Background enforcement of TTL indexes.
 */

#include "buildshare/storage/ttl_monitor.hpp"

#include "buildshare/infra/logger.hpp"

#include <exception>
#include <stdexcept>

namespace buildshare::storage {

/**
 * @brief Binds the monitor to a store. No thread runs until `start()`.
 * @throws std::invalid_argument If the interval is not positive.
 */
TtlMonitor::TtlMonitor(Db& db, const infra::Clock& clock, std::chrono::milliseconds interval)
    : db_(db), clock_(clock), interval_(interval)
{
    if (interval_.count() <= 0) {
        throw std::invalid_argument("TTL: Sweep interval must be positive");
    }
}

/**
 * @brief Destructor. Stops and joins the sweeper.
 */
TtlMonitor::~TtlMonitor()
{
    stop();
}

/**
 * @brief Launches the sweeper thread. A second call is a no-op.
 */
void TtlMonitor::start()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable()) {
        return;
    }
    stop_requested_ = false;
    worker_ = std::thread([this] { loop(); });
    infra::Logger::log(infra::LogLevel::INFO,
                       "TTL: Monitor started (interval " + std::to_string(interval_.count()) +
                           " ms)");
}

/**
 * @brief Wakes the sweeper and joins it.
 *
 * The thread handle is moved out under the lock and joined outside it, since
 * the loop needs the same mutex to observe the stop flag.
 */
void TtlMonitor::stop()
{
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!worker_.joinable()) {
            return;
        }
        stop_requested_ = true;
        worker = std::move(worker_);
    }
    wake_.notify_all();
    worker.join();
    infra::Logger::log(infra::LogLevel::INFO, "TTL: Monitor stopped");
}

bool TtlMonitor::running() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return worker_.joinable();
}

/// @brief One synchronous sweep at the clock's current time.
size_t TtlMonitor::run_once()
{
    return db_.sweep_expired(clock_.now());
}

/**
 * @brief Sweeper thread body.
 *
 * 1. Sleeps for one interval, or until `stop()` signals.
 * 2. Sweeps without holding the monitor mutex.
 * 3. Logs a failed sweep and keeps the schedule; the next pass retries.
 */
void TtlMonitor::loop()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        if (wake_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        try {
            run_once();
        } catch (const std::exception& e) {
            infra::Logger::log(infra::LogLevel::ERROR, std::string("TTL: Sweep failed: ") + e.what());
        }
        lock.lock();
    }
}

} // namespace buildshare::storage
