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
 * @file engine.cpp
 * @brief Implementation of the append-only log.
 *
 * @details
 * Frame format: `[4-byte Little Endian Length Header] + [N-byte UTF-8 Payload]`.
 * The length header gives strict record boundaries, so payloads may contain
 * newlines and the reader never scans for delimiters.
 */

#include "buildshare/storage/engine.hpp"

#include "buildshare/infra/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace buildshare::storage {

namespace {

/// @brief Writes a frame length header, little-endian regardless of host order.
void write_length(std::ofstream& file, uint32_t length)
{
    char header[4];
    header[0] = static_cast<char>(length & 0xFF);
    header[1] = static_cast<char>((length >> 8) & 0xFF);
    header[2] = static_cast<char>((length >> 16) & 0xFF);
    header[3] = static_cast<char>((length >> 24) & 0xFF);
    file.write(header, sizeof(header));
}

} // namespace

/**
 * @brief Constructs the storage engine.
 * @param base_path Directory holding one log file per collection.
 */
Engine::Engine(std::string base_path) : base_path_(std::move(base_path)) {}

/**
 * @brief Initializes the storage directory structure.
 *
 * @throws std::filesystem::filesystem_error If the directory cannot be created.
 */
void Engine::init()
{
    if (!fs::exists(base_path_)) {
        fs::create_directories(base_path_);
    }
}

/**
 * @brief Resolves the absolute file path for a given collection.
 */
std::string Engine::get_path(const std::string& collection) const
{
    return base_path_ + "/" + collection + EXTENSION;
}

/**
 * @brief Scans the storage directory for collection logs.
 *
 * Filesystem errors yield a partial or empty list; the store then simply
 * starts with fewer collections.
 *
 * @return std::vector<std::string> Collection names (file stems).
 */
std::vector<std::string> Engine::list_collections()
{
    std::vector<std::string> collections;

    std::error_code ec;
    if (!fs::exists(base_path_, ec)) {
        return collections;
    }

    for (const auto& entry : fs::directory_iterator(base_path_, ec)) {
        // Skips `.tmp` leftovers of an interrupted compaction
        if (entry.is_regular_file() && entry.path().extension() == EXTENSION) {
            collections.push_back(entry.path().stem().string());
        }
    }
    return collections;
}

/**
 * @brief Replays the binary log file.
 *
 * 1. **Header Read:** 4 bytes, decoded little-endian regardless of host order.
 * 2. **Sanity Check:** oversized headers end the replay (corrupt tail).
 * 3. **Body Read:** a short read means a torn final frame, which is dropped.
 */
std::vector<std::string> Engine::load_log(const std::string& collection)
{
    std::lock_guard<std::mutex> lock(io_mutex_);

    std::vector<std::string> logs;
    std::ifstream file(get_path(collection), std::ios::binary);
    if (!file.is_open()) {
        // New collection: nothing to replay
        return logs;
    }

    while (file.peek() != EOF) {
        // 1. Read Header
        unsigned char header[4];
        file.read(reinterpret_cast<char*>(header), sizeof(header));
        if (file.gcount() < static_cast<std::streamsize>(sizeof(header))) {
            infra::Logger::log(infra::LogLevel::WARN,
                               "Storage: Torn frame header at end of " + collection);
            break;
        }

        uint32_t payload_length = static_cast<uint32_t>(header[0]) |
                                  (static_cast<uint32_t>(header[1]) << 8) |
                                  (static_cast<uint32_t>(header[2]) << 16) |
                                  (static_cast<uint32_t>(header[3]) << 24);
        // 2. Sanity Check
        if (payload_length > MAX_FRAME_BYTES) {
            infra::Logger::log(infra::LogLevel::ERROR,
                               "Storage: Oversized frame in " + collection + ". Replay stopped.");
            break;
        }

        // 3. Read Body
        std::string buffer;
        buffer.resize(payload_length);
        if (payload_length > 0) {
            file.read(&buffer[0], payload_length);
        }

        if (file.gcount() == static_cast<std::streamsize>(payload_length) || payload_length == 0) {
            logs.push_back(std::move(buffer));
        } else {
            infra::Logger::log(infra::LogLevel::WARN,
                               "Storage: Torn frame payload at end of " + collection);
            break;
        }
    }
    return logs;
}

/**
 * @brief Appends a single frame to the collection log.
 *
 * @param collection Target collection.
 * @param raw_json Serialized document; at most `MAX_FRAME_BYTES`.
 * @return true If the frame was written and flushed.
 */
bool Engine::append(const std::string& collection, const std::string& raw_json)
{
    // A frame the replay would refuse must never reach the log
    if (raw_json.size() > MAX_FRAME_BYTES) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Storage: Frame too large for " + collection + " (" +
                               std::to_string(raw_json.size()) + " bytes)");
        return false;
    }

    std::lock_guard<std::mutex> lock(io_mutex_);

    std::ofstream file(get_path(collection), std::ios::binary | std::ios::app);
    if (!file.is_open()) {
        return false;
    }

    // 1. Write Header, 2. Write Payload, 3. Flush to the OS
    write_length(file, static_cast<uint32_t>(raw_json.size()));
    file.write(raw_json.data(), static_cast<std::streamsize>(raw_json.size()));
    file.flush();

    return file.good();
}

/**
 * @brief Atomically replaces a log with a compacted snapshot.
 *
 * **Strategy:**
 * 1. Writes all active documents to a temporary file.
 * 2. Renames the temporary file over the live log. Rename is atomic on POSIX,
 *    so a crash leaves either the old log or the new one.
 */
bool Engine::compact(const std::string& collection, const std::vector<std::string>& active_docs)
{
    std::lock_guard<std::mutex> lock(io_mutex_);

    std::string path = get_path(collection);
    std::string temp_path = path + ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return false;
        }

        for (const auto& doc : active_docs) {
            write_length(file, static_cast<uint32_t>(doc.size()));
            file.write(doc.data(), static_cast<std::streamsize>(doc.size()));
        }
        file.flush();

        if (!file.good()) {
            // Leave the live log untouched
            file.close();
            std::error_code ec;
            fs::remove(temp_path, ec);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Storage: Compaction swap failed for " + collection + ": " +
                               ec.message());
        return false;
    }
    return true;
}

} // namespace buildshare::storage
