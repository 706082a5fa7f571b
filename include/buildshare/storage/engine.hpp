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
 * @file engine.hpp
 * @brief Append-only log persistence for document collections.
 *
 * @details
 * Every collection is one file, `<base_path>/<collection>.bsl`, holding a
 * sequence of frames `[4-byte little-endian length][UTF-8 JSON document]`.
 * A newer frame for the same `_id` supersedes older ones; a frame carrying
 * `"_deleted": true` is a tombstone.
 */

#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace buildshare::storage {

/**
 * @class Engine
 * @brief Manages physical durability using an Append-Only Log (AOL) strategy.
 *
 * @details
 * **Storage Characteristics:**
 * 1. **Sequential Writes:** appends never rewrite existing bytes.
 * 2. **Write-Ahead:** `Db` appends a frame before it changes its in-memory state.
 * 3. **Crash Recovery:** state is rebuilt by replaying frames in order; a torn
 * final frame is ignored.
 */
class Engine {
  public:
    /// @brief File extension of collection logs.
    static constexpr const char* EXTENSION = ".bsl";

    /// @brief Largest frame accepted on replay; larger headers are treated as corruption.
    static constexpr uint32_t MAX_FRAME_BYTES = 256u * 1024u * 1024u;

    /**
     * @param base_path Directory holding the collection logs.
     */
    explicit Engine(std::string base_path);

    /**
     * @brief Creates the base directory if it does not exist.
     *
     * @throws std::filesystem::filesystem_error If the directory cannot be created.
     */
    void init();

    /**
     * @brief Replays one collection log.
     *
     * @param collection The collection to load.
     * @return std::vector<std::string> Raw JSON frames in write order. Empty if
     * the collection has no log yet.
     */
    std::vector<std::string> load_log(const std::string& collection);

    /**
     * @brief Appends one frame and flushes it to the OS.
     *
     * @return true If the whole frame was written.
     * @return false On any filesystem error (disk full, permission denied).
     */
    bool append(const std::string& collection, const std::string& raw_json);

    /**
     * @brief Rewrites a log so that it holds only `active_docs`.
     *
     * Writes a temporary file and renames it over the log, so a crash leaves
     * either the old or the new log, never a partial one.
     *
     * @return true If the new log replaced the old one.
     */
    bool compact(const std::string& collection, const std::vector<std::string>& active_docs);

    /// @brief Names of every collection that has a log file.
    std::vector<std::string> list_collections();

    const std::string& base_path() const { return base_path_; }

  private:
    std::string base_path_;

    /// @brief Serializes file access; `Db` may append from shared-lock paths.
    std::mutex io_mutex_;

    std::string get_path(const std::string& collection) const;
};

} // namespace buildshare::storage
