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
 * @file server.hpp
 * @brief TCP front door of the build store.
 *
 * @details
 * Requests and responses travel as length-prefixed frames: a 4-byte
 * little-endian payload length followed by that many bytes of JSON. Each
 * accepted connection becomes one session task on the `infra::Scheduler`.
 */

#pragma once

#include "buildshare/core/build_store.hpp"
#include "buildshare/infra/scheduler.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace buildshare::network {

/**
 * @class Server
 * @brief A thread-pooled TCP server for build store sessions.
 *
 * @details
 * **Operational Workflow:**
 * 1. **Accept:** The calling thread blocks on `accept()`.
 * 2. **Dispatch:** Each connection is handed to the `infra::Scheduler`.
 * 3. **Process:** The worker reads frames, runs them through `Handler`, writes replies.
 * 4. **Cleanup:** Open sockets are tracked so that `stop()` can unblock every worker.
 */
class Server {
  public:
    /// @brief Largest accepted frame payload. Bigger frames end the session.
    static constexpr uint32_t MAX_FRAME_BYTES = 16u * 1024u * 1024u;

    /// @brief Pause after `accept()` runs out of descriptors or memory.
    static constexpr std::chrono::milliseconds ACCEPT_BACKOFF{100};

    /**
     * @param store Shared by every session. Must outlive the server.
     * @param port TCP port to bind; 0 lets the kernel pick one.
     * @param workers Session worker threads.
     */
    Server(core::BuildStore& store, int port,
           size_t workers = std::thread::hardware_concurrency());

    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    /**
     * @brief Binds, listens and runs the accept loop.
     *
     * @note Blocking. Returns once `stop()` or `request_stop()` is called.
     * Transient `accept()` failures are logged and the loop keeps serving.
     * @return false if the listener could not be set up or broke while serving.
     */
    bool run();

    /// @brief Closes the listener and every client socket.
    void stop();

    /**
     * @brief Asks a running accept loop to exit.
     *
     * Only touches an atomic flag and calls `shutdown(2)`, so it may be
     * invoked from a signal handler.
     */
    void request_stop() noexcept;

    /// @brief Port actually bound, once `run()` is listening.
    int port() const { return bound_port_.load(); }

    bool running() const { return running_.load(); }

    /// @brief True when `accept()` may be retried after failing with `err`.
    static bool accept_error_is_transient(int err) noexcept;

    /// @brief Reads one frame. `nullopt` on EOF, I/O error or an oversized frame.
    static std::optional<std::string> read_frame(int sock);

    /// @brief Writes one frame. False on I/O error.
    static bool write_frame(int sock, const std::string& payload);

  private:
    core::BuildStore& store_;
    int port_;
    std::atomic<int> bound_port_;
    std::atomic<int> server_fd_;
    std::atomic<bool> running_;

    /// @brief Latched by `stop()`/`request_stop()`; a stop that races `run()` start-up still wins.
    std::atomic<bool> stop_requested_;

    std::vector<int> client_sockets_;
    std::mutex client_mutex_;

    /// @brief Declared last so that workers are joined before the registry is destroyed.
    infra::Scheduler scheduler_;

    void handle_client(int sock);
    void add_client(int sock);
    void remove_client(int sock);
};

} // namespace buildshare::network
