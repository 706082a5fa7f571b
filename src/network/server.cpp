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
 * @file server.cpp
 * @brief Implementation of the multi-threaded TCP server.
 *
 * @details
 * This file implements the listener loop, the length-prefixed session framing
 * and the client socket registry. Request processing itself is delegated to
 * `Handler` on the worker scheduler.
 */

#include "buildshare/network/server.hpp"

#include "buildshare/infra/logger.hpp"
#include "buildshare/network/handler.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace buildshare::network {

namespace {

/// @brief Reads exactly `len` bytes. False on EOF or a socket error.
bool read_exact(int sock, char* out, size_t len)
{
    size_t done = 0;
    while (done < len) {
        ssize_t n = recv(sock, out + done, len - done, 0);
        if (n > 0) {
            done += static_cast<size_t>(n);
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            return false;
        }
    }
    return true;
}

/// @brief Writes all `len` bytes. `MSG_NOSIGNAL` keeps a vanished peer from raising SIGPIPE.
bool write_all(int sock, const char* data, size_t len)
{
    size_t done = 0;
    while (done < len) {
        ssize_t n = send(sock, data + done, len - done, MSG_NOSIGNAL);
        if (n > 0) {
            done += static_cast<size_t>(n);
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            return false;
        }
    }
    return true;
}

} // namespace

/**
 * @brief Constructs the Server instance.
 * @param store Build store shared by every session.
 * @param port Port number to bind; 0 for an ephemeral port.
 * @param workers Size of the session worker pool.
 */
Server::Server(core::BuildStore& store, int port, size_t workers)
    : store_(store), port_(port), bound_port_(0), server_fd_(-1), running_(false),
      stop_requested_(false), scheduler_(workers)
{
}

/**
 * @brief Destructor. Ensures clean shutdown of resources.
 */
Server::~Server()
{
    stop();
}

/**
 * @brief Frame decoder.
 *
 * 1. Reads the 4-byte little-endian length header.
 * 2. Rejects lengths above `MAX_FRAME_BYTES` before allocating.
 * 3. Reads the payload in full.
 */
std::optional<std::string> Server::read_frame(int sock)
{
    unsigned char header[4];
    if (!read_exact(sock, reinterpret_cast<char*>(header), sizeof(header))) {
        return std::nullopt;
    }

    uint32_t len = static_cast<uint32_t>(header[0]) | (static_cast<uint32_t>(header[1]) << 8) |
                   (static_cast<uint32_t>(header[2]) << 16) |
                   (static_cast<uint32_t>(header[3]) << 24);
    if (len > MAX_FRAME_BYTES) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Network: Rejected frame of " + std::to_string(len) + " bytes");
        return std::nullopt;
    }

    // A zero-length frame is legal; the handler answers it with a validation error
    std::string payload(len, '\0');
    if (len > 0 && !read_exact(sock, &payload[0], len)) {
        return std::nullopt;
    }
    return payload;
}

/**
 * @brief Frame encoder: header and payload go out as two writes on the same socket.
 */
bool Server::write_frame(int sock, const std::string& payload)
{
    if (payload.size() > UINT32_MAX) {
        return false;
    }
    uint32_t len = static_cast<uint32_t>(payload.size());
    unsigned char header[4] = {static_cast<unsigned char>(len & 0xFF),
                               static_cast<unsigned char>((len >> 8) & 0xFF),
                               static_cast<unsigned char>((len >> 16) & 0xFF),
                               static_cast<unsigned char>((len >> 24) & 0xFF)};
    return write_all(sock, reinterpret_cast<const char*>(header), sizeof(header)) &&
           write_all(sock, payload.data(), payload.size());
}

/**
 * @brief Async-signal-safe stop request.
 *
 * The listener is only shut down here, not closed; `run()` closes it through
 * `stop()` once `accept()` has returned.
 */
void Server::request_stop() noexcept
{
    stop_requested_ = true;
    running_ = false;
    int fd = server_fd_.load();
    if (fd >= 0) {
        shutdown(fd, SHUT_RDWR);
    }
}

/**
 * @brief Gracefully terminates the server.
 *
 * 1. Clears the running flag so no new session is accepted.
 * 2. Closes the listener, unblocking `accept()`.
 * 3. Shuts down every client socket, unblocking the workers in `recv()`.
 */
void Server::stop()
{
    stop_requested_ = true;
    running_ = false;

    // 1. Terminate the main listener socket
    int fd = server_fd_.exchange(-1);
    if (fd >= 0) {
        infra::Logger::log(infra::LogLevel::INFO, "Network: Stopping server...");
        shutdown(fd, SHUT_RDWR);
        close(fd);
    }

    // 2. Wake every session; each worker closes its own socket in remove_client()
    std::lock_guard<std::mutex> lock(client_mutex_);
    for (int sock : client_sockets_) {
        shutdown(sock, SHUT_RDWR);
    }
}

/**
 * @brief Main Server Event Loop.
 *
 * Initializes the socket, binds to the port, and enters the accept loop.
 * This function blocks until `stop()` is called or the listener breaks.
 */
bool Server::run()
{
    // Create an IPv4 TCP stream socket
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        infra::Logger::log(infra::LogLevel::FATAL, "Network: Failed to create socket.");
        return false;
    }

    // Allow immediate address reuse to facilitate quick restarts
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) != 0) {
        infra::Logger::log(infra::LogLevel::ERROR, "Network: setsockopt failed.");
        close(fd);
        return false;
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(static_cast<uint16_t>(port_));

    // Bind to the specified port
    if (bind(fd, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) < 0) {
        infra::Logger::log(infra::LogLevel::FATAL,
                           "Network: Failed to bind to port " + std::to_string(port_));
        close(fd);
        return false;
    }

    // Backlog of 128 pending connections
    if (listen(fd, 128) < 0) {
        infra::Logger::log(infra::LogLevel::FATAL, "Network: Failed to listen.");
        close(fd);
        return false;
    }

    // Port 0 binds an ephemeral port; report the real one
    socklen_t addr_len = sizeof(address);
    if (getsockname(fd, reinterpret_cast<struct sockaddr*>(&address), &addr_len) == 0) {
        bound_port_ = ntohs(address.sin_port);
    }

    // A stop requested during set-up must not be overwritten
    server_fd_ = fd;
    running_ = !stop_requested_;
    infra::Logger::log(infra::LogLevel::INFO,
                       "Network: BuildShare listening on port " + std::to_string(bound_port_));

    bool listener_failed = false;

    // Accept Loop: The Delegator
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t len = sizeof(client_addr);

        // Block here until a client connects
        int sock = accept(fd, reinterpret_cast<struct sockaddr*>(&client_addr), &len);

        if (sock >= 0) {
            if (!running_) {
                // Shutdown occurred while blocked on accept
                close(sock);
                break;
            }

            char ip[INET_ADDRSTRLEN] = {0};
            const char* client_ip = inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));
            infra::Logger::log(infra::LogLevel::INFO, std::string("Network: New connection from ") +
                                                          (client_ip ? client_ip : "unknown"));

            // 1. Register socket for tracking
            add_client(sock);

            // 2. Dispatch the session to the worker pool
            scheduler_.enqueue([this, sock]() { handle_client(sock); });
            continue;
        }

        int err = errno;
        if (!running_) {
            // Intentional shutdown: stop() unblocked accept()
            break;
        }
        if (!accept_error_is_transient(err)) {
            infra::Logger::log(infra::LogLevel::FATAL,
                               "Network: Listener unusable (Error code: " + std::to_string(err) +
                                   ")");
            listener_failed = true;
            break;
        }
        if (err == EINTR) {
            continue;
        }

        infra::Logger::log(infra::LogLevel::ERROR,
                           "Network: Accept failed (Error code: " + std::to_string(err) + ")");
        if (err == EMFILE || err == ENFILE || err == ENOBUFS || err == ENOMEM) {
            // Out of descriptors or memory; give finishing sessions a moment to release some
            std::this_thread::sleep_for(ACCEPT_BACKOFF);
        }
    }

    stop();
    infra::Logger::log(infra::LogLevel::INFO, "Network: Server event loop terminated.");
    return !listener_failed;
}

/**
 * @brief Classifies an `accept()` errno.
 *
 * Only errors that mean the listening socket itself is gone or misused are
 * fatal. Everything else concerns a single pending connection or a passing
 * resource shortage.
 */
bool Server::accept_error_is_transient(int err) noexcept
{
    switch (err) {
    case EBADF:
    case EFAULT:
    case EINVAL:
    case ENOTSOCK:
    case EOPNOTSUPP:
        return false;
    default:
        return true;
    }
}

/**
 * @brief Client Handler Routine (Worker Thread Context).
 *
 * Processes frames for a single client connection until disconnection.
 */
void Server::handle_client(int sock)
{
    while (running_) {
        // 1. Read one complete request frame
        std::optional<std::string> request = read_frame(sock);
        if (!request) {
            infra::Logger::log(infra::LogLevel::DEBUG, "Network: Session ended.");
            break;
        }

        // 2. Process and answer
        std::string resp = Handler::process(store_, *request);
        if (!write_frame(sock, resp)) {
            infra::Logger::log(infra::LogLevel::DEBUG, "Network: Socket write failed.");
            break;
        }

        // 3. Protocol-level disconnect
        if (resp == Handler::GOODBYE) {
            infra::Logger::log(infra::LogLevel::INFO,
                               "Network: Client requested disconnect via protocol.");
            break;
        }
    }

    // Cleanup: Deregister and close socket
    remove_client(sock);
}

/**
 * @brief Thread-safe client registration.
 */
void Server::add_client(int sock)
{
    std::lock_guard<std::mutex> lock(client_mutex_);
    client_sockets_.push_back(sock);
}

/**
 * @brief Thread-safe client removal and resource cleanup.
 */
void Server::remove_client(int sock)
{
    std::lock_guard<std::mutex> lock(client_mutex_);
    auto it = std::find(client_sockets_.begin(), client_sockets_.end(), sock);
    if (it != client_sockets_.end()) {
        // Only close if still in the list (avoids double-close)
        close(sock);
        client_sockets_.erase(it);
    }
}

} // namespace buildshare::network
