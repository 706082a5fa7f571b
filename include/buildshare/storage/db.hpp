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
 * @file db.hpp
 * @brief Embedded document store: in-memory collections over the append-only log.
 *
 * @details
 * `Db` owns every collection in memory as a cJSON array, keeps a primary index
 * on `_id` plus optional secondary hash indexes, and writes every mutation to
 * the `Engine` log before applying it in memory. Secondary indexes may be
 * unique and may carry a TTL (`expire_after`), which `sweep_expired` enforces.
 */

#pragma once

#include "buildshare/infra/cancellation.hpp"
#include "buildshare/infra/clock.hpp"
#include "buildshare/storage/engine.hpp"

#include <cJSON.h>
#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace buildshare::storage {

/**
 * @enum WriteStatus
 * @brief Outcome of a mutating operation.
 */
enum class WriteStatus {
    OK,               ///< Persisted and applied.
    DUPLICATE_KEY,    ///< `_id` or a unique index value already taken.
    NOT_FOUND,        ///< No document matched the query.
    INVALID_DOCUMENT, ///< Not an object, no string `_id`, or an attempt to change `_id`.
    IO_ERROR          ///< The log append failed; memory is unchanged.
};

const char* to_string(WriteStatus status);

/**
 * @struct IndexOptions
 * @brief Secondary index definition.
 */
struct IndexOptions {
    /// @brief Reject writes that would give two documents the same value.
    bool unique = false;

    /// @brief TTL: documents expire once `field + expire_after <= now`.
    /// The field must hold epoch milliseconds.
    std::optional<std::chrono::seconds> expire_after;

    bool operator==(const IndexOptions& other) const
    {
        return unique == other.unique && expire_after == other.expire_after;
    }
};

/**
 * @class Db
 * @brief The central database controller managing memory, persistence, and querying.
 *
 * @details
 * **Core Responsibilities:**
 * - **Concurrency Control:** `std::shared_mutex`; reads share, writes are exclusive.
 * - **Memory Management:** primary store and indexes live in RAM.
 * - **Persistence:** every write is appended to the log first.
 * - **Query Execution:** equality and `$or` filters (see `Query`).
 *
 * Every operation is atomic with respect to a single document.
 */
class Db {
  public:
    /**
     * @brief Opens (or creates) a data directory and replays its logs.
     *
     * @param data_dir Directory holding the `.bsl` logs.
     * @throws std::filesystem::filesystem_error If the directory cannot be created.
     */
    explicit Db(std::string data_dir);

    ~Db();

    Db(const Db&) = delete;
    Db& operator=(const Db&) = delete;

    // ========================================================================
    //  CRUD OPERATIONS (Thread-Safe)
    // ========================================================================

    /**
     * @brief Inserts one document. The document must carry a string `_id`.
     *
     * @note Acquires a **Writer Lock** (Exclusive).
     */
    WriteStatus insert(const std::string& coll, const cJSON* doc);

    /**
     * @brief Returns a copy of the first matching document.
     *
     * @warning The caller owns the returned pointer. `nullptr` if nothing matched.
     * @note Acquires a **Reader Lock** (Shared).
     */
    cJSON* find_one(const std::string& coll, const cJSON* query) const;

    /**
     * @brief Returns copies of all matching documents in insertion order.
     *
     * @param cancel Polled between documents during scans. May be `nullptr`.
     * @return cJSON* An array owned by the caller, or `nullptr` if cancelled.
     * @note Acquires a **Reader Lock** (Shared).
     */
    cJSON* find(const std::string& coll, const cJSON* query,
                const infra::CancellationToken* cancel = nullptr) const;

    /// @brief Number of matching documents (all documents for a null query).
    int count(const std::string& coll, const cJSON* query) const;

    /**
     * @brief Overwrites the members of `fields` on the first matching document.
     *
     * Members not named in `fields` are kept. `_id` cannot be changed.
     *
     * @note Acquires a **Writer Lock** (Exclusive).
     */
    WriteStatus update_one(const std::string& coll, const cJSON* query, const cJSON* fields);

    /**
     * @brief Deletes the first matching document by writing a tombstone.
     *
     * @note Acquires a **Writer Lock** (Exclusive).
     */
    WriteStatus remove_one(const std::string& coll, const cJSON* query);

    // ========================================================================
    //  ADMINISTRATIVE OPERATIONS
    // ========================================================================

    /**
     * @brief Defines a secondary index and backfills existing data.
     *
     * Idempotent for an identical definition. A different definition on an
     * already indexed field, or a unique index over existing duplicates, fails.
     * Definitions persist in `_indexes` and are restored on startup.
     */
    bool create_index(const std::string& coll, const std::string& field,
                      IndexOptions options = {});

    /// @brief Current definition of an index, if any.
    std::optional<IndexOptions> index_options(const std::string& coll,
                                              const std::string& field) const;

    /**
     * @brief Deletes every document whose TTL field has passed.
     *
     * Documents without a numeric value in the TTL field never expire.
     *
     * @return size_t Number of documents removed.
     */
    size_t sweep_expired(infra::TimePoint now);

    /**
     * @brief Rewrites a collection log with only its live documents.
     */
    bool trigger_compaction(const std::string& coll);

  private:
    using DocList = std::vector<cJSON*>;
    using FieldIndex = std::unordered_map<std::string, DocList>;

    /// @brief The persistence layer responsible for physical disk I/O.
    Engine storage_;

    mutable std::shared_mutex rw_lock_;

    /// @brief Collection Name -> JSON Document Array.
    std::unordered_map<std::string, cJSON*> memory_store_;

    /// @brief Collection -> _id -> Document.
    std::unordered_map<std::string, std::unordered_map<std::string, cJSON*>> id_indexes_;

    /// @brief Collection -> Field -> Normalized Value -> Documents.
    std::unordered_map<std::string, std::unordered_map<std::string, FieldIndex>> custom_indexes_;

    /// @brief Collection -> Field -> Definition.
    std::unordered_map<std::string, std::unordered_map<std::string, IndexOptions>> indexed_fields_;

    /// @brief Frames in each log since its last compaction.
    std::unordered_map<std::string, size_t> log_frames_;

    void load_all();
    void load_index_definitions();
    void rebuild_index(const std::string& coll, cJSON* array);
    void update_custom_index(const std::string& coll, cJSON* doc, bool add);
    cJSON* get_collection(const std::string& name);
    bool persist_index_definitions();

    DocList candidates(const std::string& coll, const cJSON* query) const;
    cJSON* first_match(const std::string& coll, const cJSON* query) const;
    bool violates_unique(const std::string& coll, const cJSON* doc, const cJSON* self) const;

    bool append_frame(const std::string& coll, const cJSON* doc);
    bool write_tombstone(const std::string& coll, const std::string& id);
    void detach(const std::string& coll, cJSON* doc);
    void maybe_compact(const std::string& coll);
    bool compact_collection(const std::string& coll);
};

} // namespace buildshare::storage
