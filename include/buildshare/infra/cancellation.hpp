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
 * @file cancellation.hpp
 * @brief Cooperative cancellation flag for long-running scans.
 */

#pragma once

#include <atomic>

namespace buildshare::infra {

/**
 * @class CancellationToken
 * @brief A flag that a caller raises and a long-running operation polls.
 *
 * Scans check the token between documents and abandon the work once it is set.
 * Cancellation is never forced; the operation decides where it is safe to stop.
 */
class CancellationToken {
  public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }

    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

  private:
    std::atomic<bool> cancelled_{false};
};

} // namespace buildshare::infra
