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
 * @file scheduler.hpp
 * @brief Fixed-size worker pool for asynchronous task execution.
 *
 * @details
 * This header defines the `Scheduler` class, a producer-consumer thread pool.
 * The network server hands each client session to it, so that store operations
 * run off the accept loop.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace buildshare::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool for executing tasks asynchronously.
 *
 * @details
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 * - **Drain:** `wait_idle()` blocks until the queue is empty and no task is running.
 */
class Scheduler {
  public:
    /**
     * @brief Spawns the worker threads.
     *
     * @param threads Number of workers. Zero (an undetectable hardware concurrency)
     * falls back to two workers.
     */
    explicit Scheduler(size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Drains the queue and joins every worker.
     *
     * @note Blocking. Pending tasks still run before the workers exit.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a task for asynchronous execution.
     *
     * @code
     * scheduler.enqueue([&store, input]() { store.create(input); });
     * @endcode
     */
    void enqueue(std::function<void()> task);

    /// @brief Blocks until every submitted task has finished.
    void wait_idle();

    size_t size() const { return workers_.size(); }

  private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    std::mutex queue_mutex_;
    std::condition_variable condition_;

    /// @brief Signaled whenever the pool may have become idle.
    std::condition_variable idle_condition_;

    /// @brief Tasks dequeued but not yet finished.
    size_t active_ = 0;

    std::atomic<bool> stop_;

    void worker_loop();
};

} // namespace buildshare::infra
