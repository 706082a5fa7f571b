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
 * @file db.cpp
 * @brief Implementation of the document store.
 *
 * @details
 * Write path for every mutation: check constraints -> append frame -> apply
 * in memory. A failed append leaves memory untouched, so the in-memory state
 * never runs ahead of what a replay would reconstruct.
 */

#include "buildshare/storage/db.hpp"

#include "buildshare/infra/logger.hpp"
#include "buildshare/storage/query.hpp"

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <unordered_set>

namespace buildshare::storage {

namespace {

constexpr const char* INDEX_COLLECTION = "_indexes";
constexpr const char* ID_FIELD = "_id";
constexpr const char* TOMBSTONE_FIELD = "_deleted";

/// @brief Logs are rewritten once they hold this many frames and over twice the live count.
constexpr size_t COMPACTION_MIN_FRAMES = 200;

/// @brief The document's `_id`, or nullptr when missing, empty or not a string.
const char* id_of(const cJSON* doc)
{
    const cJSON* id = cJSON_GetObjectItemCaseSensitive(doc, ID_FIELD);
    if (cJSON_IsString(id) && id->valuestring != nullptr && id->valuestring[0] != '\0') {
        return id->valuestring;
    }
    return nullptr;
}

} // namespace

/**
 * @brief Log-friendly name of a write outcome.
 */
const char* to_string(WriteStatus status)
{
    switch (status) {
    case WriteStatus::OK:
        return "OK";
    case WriteStatus::DUPLICATE_KEY:
        return "DUPLICATE_KEY";
    case WriteStatus::NOT_FOUND:
        return "NOT_FOUND";
    case WriteStatus::INVALID_DOCUMENT:
        return "INVALID_DOCUMENT";
    case WriteStatus::IO_ERROR:
        return "IO_ERROR";
    }
    return "UNKNOWN";
}

/**
 * @brief Constructs the document store and restores its state.
 *
 * **Startup Sequence:**
 * 1. Initializes the storage subsystem (creates the data directory).
 * 2. Replays the collection logs to rebuild memory and indexes (`load_all`).
 *
 * @throws std::runtime_error If the data directory cannot be created.
 */
Db::Db(std::string data_dir) : storage_(std::move(data_dir))
{
    infra::Logger::log(infra::LogLevel::INFO,
                       "Storage: Opening data directory " + storage_.base_path());
    storage_.init();
    load_all();
    infra::Logger::log(infra::LogLevel::INFO, "Storage: Engine online.");
}

/**
 * @brief Destructor. Frees every in-memory collection.
 *
 * Indexes only hold borrowed pointers into these arrays, so nothing else
 * needs releasing.
 */
Db::~Db()
{
    for (auto& [name, array] : memory_store_) {
        cJSON_Delete(array);
    }
}

/**
 * @brief Restores database state by replaying the logs.
 *
 * **Replay Strategy:**
 * 1. **Metadata Phase**: index definitions from `_indexes`, so that data
 * loaded afterwards is indexed with the right options.
 * 2. **Data Phase**: last frame per `_id` wins; a tombstone drops the document.
 * First-seen order is kept.
 * 3. **Indexing Phase**: primary and secondary indexes are rebuilt.
 * 4. **Compaction Heuristic**: logs more than half obsolete are rewritten.
 */
void Db::load_all()
{
    // Phase 1: Load Index Metadata
    load_index_definitions();

    for (const auto& name : storage_.list_collections()) {
        if (name == INDEX_COLLECTION) {
            continue;
        }

        // Phase 2: Fold the log into the latest version of each document
        std::vector<std::string> logs = storage_.load_log(name);
        std::unordered_map<std::string, cJSON*> latest;
        std::vector<std::string> order;

        for (const auto& frame : logs) {
            cJSON* item = cJSON_Parse(frame.c_str());
            if (item == nullptr) {
                infra::Logger::log(infra::LogLevel::ERROR,
                                   "Storage: Corrupt frame in " + name + ". Skipping.");
                continue;
            }

            const char* id = id_of(item);
            if (id == nullptr) {
                infra::Logger::log(infra::LogLevel::ERROR,
                                   "Storage: Frame without _id in " + name + ". Skipping.");
                cJSON_Delete(item);
                continue;
            }
            std::string uuid = id;

            auto it = latest.find(uuid);
            if (cJSON_IsTrue(cJSON_GetObjectItemCaseSensitive(item, TOMBSTONE_FIELD))) {
                // Tombstone: Hard delete from snapshot
                if (it != latest.end()) {
                    cJSON_Delete(it->second);
                    latest.erase(it);
                }
                cJSON_Delete(item);
            } else if (it != latest.end()) {
                // Newer version of a known document
                cJSON_Delete(it->second);
                it->second = item;
            } else {
                latest.emplace(uuid, item);
                order.push_back(uuid);
            }
        }

        // Keep first-seen order
        cJSON* collection = cJSON_CreateArray();
        for (const auto& uuid : order) {
            auto it = latest.find(uuid);
            if (it != latest.end()) {
                cJSON_AddItemToArray(collection, it->second);
                latest.erase(it);
            }
        }
        memory_store_[name] = collection;
        log_frames_[name] = logs.size();

        // Phase 3: Indexes
        rebuild_index(name, collection);

        size_t live = static_cast<size_t>(cJSON_GetArraySize(collection));
        infra::Logger::log(infra::LogLevel::DEBUG, "Storage: Loaded " + std::to_string(live) +
                                                       " documents from " + name);

        // Phase 4: Compaction heuristic
        maybe_compact(name);
    }
}

/**
 * @brief Loads index definitions from the metadata log.
 *
 * A corrupt metadata frame is logged and ignored; the store then starts
 * without indexes and `BuildStore::initialize()` declares them again.
 */
void Db::load_index_definitions()
{
    std::vector<std::string> logs = storage_.load_log(INDEX_COLLECTION);
    if (logs.empty()) {
        return;
    }

    // The metadata log is rewritten whole on every change; only the last frame counts.
    cJSON* definitions = cJSON_Parse(logs.back().c_str());
    if (!cJSON_IsArray(definitions)) {
        infra::Logger::log(infra::LogLevel::ERROR, "Storage: Index metadata is corrupt. Ignored.");
        cJSON_Delete(definitions);
        return;
    }

    cJSON* item = nullptr;
    cJSON_ArrayForEach(item, definitions)
    {
        cJSON* coll = cJSON_GetObjectItemCaseSensitive(item, "collection");
        cJSON* field = cJSON_GetObjectItemCaseSensitive(item, "field");
        if (!cJSON_IsString(coll) || !cJSON_IsString(field)) {
            continue;
        }

        IndexOptions options;
        options.unique = cJSON_IsTrue(cJSON_GetObjectItemCaseSensitive(item, "unique"));
        cJSON* ttl = cJSON_GetObjectItemCaseSensitive(item, "expireAfterSeconds");
        if (cJSON_IsNumber(ttl)) {
            options.expire_after = std::chrono::seconds(static_cast<int64_t>(ttl->valuedouble));
        }
        indexed_fields_[coll->valuestring][field->valuestring] = options;
    }
    cJSON_Delete(definitions);
}

/**
 * @brief Rewrites the metadata log with the full set of index definitions.
 *
 * @return true If the new metadata reached disk.
 */
bool Db::persist_index_definitions()
{
    cJSON* definitions = cJSON_CreateArray();
    for (const auto& [coll, fields] : indexed_fields_) {
        for (const auto& [field, options] : fields) {
            cJSON* obj = cJSON_CreateObject();
            cJSON_AddStringToObject(obj, "collection", coll.c_str());
            cJSON_AddStringToObject(obj, "field", field.c_str());
            cJSON_AddBoolToObject(obj, "unique", options.unique);
            if (options.expire_after) {
                cJSON_AddNumberToObject(obj, "expireAfterSeconds",
                                        static_cast<double>(options.expire_after->count()));
            }
            cJSON_AddItemToArray(definitions, obj);
        }
    }

    char* raw = cJSON_PrintUnformatted(definitions);
    cJSON_Delete(definitions);
    if (raw == nullptr) {
        return false;
    }
    bool ok = storage_.compact(INDEX_COLLECTION, {std::string(raw)});
    free(raw);
    return ok;
}

/**
 * @brief Rebuilds internal indexes (Primary & Secondary) from a dataset.
 *
 * @param coll The target collection.
 * @param array The document list.
 */
void Db::rebuild_index(const std::string& coll, cJSON* array)
{
    infra::Logger::log(infra::LogLevel::TRACE, "Index: Rebuilding indexes for " + coll);
    id_indexes_[coll].clear();
    custom_indexes_[coll].clear();

    cJSON* item = nullptr;
    cJSON_ArrayForEach(item, array)
    {
        const char* id = id_of(item);
        if (id != nullptr) {
            id_indexes_[coll][id] = item;
        }
        update_custom_index(coll, item, true);
    }
}

/**
 * @brief Adds or removes one document from every secondary index of its collection.
 *
 * Documents whose field is missing or not a string/number are left out of
 * that index.
 */
void Db::update_custom_index(const std::string& coll, cJSON* doc, bool add)
{
    auto fields = indexed_fields_.find(coll);
    if (fields == indexed_fields_.end()) {
        return;
    }

    for (const auto& [field, options] : fields->second) {
        std::optional<std::string> key =
            Query::index_key(cJSON_GetObjectItemCaseSensitive(doc, field.c_str()));
        if (!key) {
            continue;
        }

        FieldIndex& index = custom_indexes_[coll][field];
        if (add) {
            // Buckets keep insertion order, matching a full scan
            index[*key].push_back(doc);
            continue;
        }

        auto bucket = index.find(*key);
        if (bucket == index.end()) {
            continue;
        }
        auto it = std::find(bucket->second.begin(), bucket->second.end(), doc);
        if (it != bucket->second.end()) {
            bucket->second.erase(it);
        }
        if (bucket->second.empty()) {
            // Drop empty buckets so lookups on retired keys stay cheap
            index.erase(bucket);
        }
    }
}

/**
 * @brief Returns a collection's array, creating an empty one on first write.
 */
cJSON* Db::get_collection(const std::string& name)
{
    auto it = memory_store_.find(name);
    if (it != memory_store_.end()) {
        return it->second;
    }
    cJSON* array = cJSON_CreateArray();
    memory_store_[name] = array;
    id_indexes_[name];
    return array;
}

/**
 * @brief Picks the documents a query has to be evaluated against.
 *
 * **Plans:**
 * 1. Single `_id` equality: primary index.
 * 2. Single equality on an indexed field: that field's bucket.
 * 3. Anything else: the whole collection.
 */
Db::DocList Db::candidates(const std::string& coll, const cJSON* query) const
{
    DocList docs;
    auto store = memory_store_.find(coll);
    if (store == memory_store_.end()) {
        return docs;
    }

    if (query != nullptr && cJSON_GetArraySize(query) == 1 && query->child->string != nullptr) {
        const cJSON* child = query->child;

        // Plan 1: primary key
        if (std::strcmp(child->string, ID_FIELD) == 0 && cJSON_IsString(child)) {
            auto ids = id_indexes_.find(coll);
            if (ids != id_indexes_.end()) {
                auto hit = ids->second.find(child->valuestring);
                if (hit != ids->second.end()) {
                    docs.push_back(hit->second);
                }
            }
            return docs;
        }

        // Plan 2: secondary index bucket
        auto fields = indexed_fields_.find(coll);
        std::optional<std::string> key = Query::index_key(child);
        if (key && fields != indexed_fields_.end() && fields->second.count(child->string)) {
            auto indexes = custom_indexes_.find(coll);
            if (indexes == custom_indexes_.end()) {
                return docs;
            }
            auto index = indexes->second.find(child->string);
            if (index == indexes->second.end()) {
                return docs;
            }
            auto bucket = index->second.find(*key);
            if (bucket != index->second.end()) {
                docs = bucket->second;
            }
            return docs;
        }
    }

    // Plan 3: full scan
    infra::Logger::log(infra::LogLevel::TRACE, "Query: Full scan on " + coll);
    cJSON* item = nullptr;
    cJSON_ArrayForEach(item, store->second)
    {
        docs.push_back(item);
    }
    return docs;
}

/// @brief First matching document in collection order; borrowed, not copied.
cJSON* Db::first_match(const std::string& coll, const cJSON* query) const
{
    for (cJSON* doc : candidates(coll, query)) {
        if (Query::matches(doc, query)) {
            return doc;
        }
    }
    return nullptr;
}

/**
 * @brief Checks `doc` against every unique index of the collection.
 *
 * @param self The stored version of `doc` during an update, so that a document
 * never collides with itself. nullptr on insert.
 * @return true If another document already holds one of the unique values.
 */
bool Db::violates_unique(const std::string& coll, const cJSON* doc, const cJSON* self) const
{
    auto fields = indexed_fields_.find(coll);
    auto indexes = custom_indexes_.find(coll);
    if (fields == indexed_fields_.end() || indexes == custom_indexes_.end()) {
        return false;
    }

    for (const auto& [field, options] : fields->second) {
        if (!options.unique) {
            continue;
        }
        // Sparse: documents without the field never collide
        std::optional<std::string> key =
            Query::index_key(cJSON_GetObjectItemCaseSensitive(doc, field.c_str()));
        if (!key) {
            continue;
        }
        auto index = indexes->second.find(field);
        if (index == indexes->second.end()) {
            continue;
        }
        auto bucket = index->second.find(*key);
        if (bucket == index->second.end()) {
            continue;
        }
        for (const cJSON* other : bucket->second) {
            if (other != self) {
                return true;
            }
        }
    }
    return false;
}

/**
 * @brief Serializes one document and appends it to the collection log.
 */
bool Db::append_frame(const std::string& coll, const cJSON* doc)
{
    char* raw = cJSON_PrintUnformatted(doc);
    if (raw == nullptr) {
        return false;
    }
    bool ok = storage_.append(coll, raw);
    free(raw);

    if (ok) {
        ++log_frames_[coll];
    } else {
        infra::Logger::log(infra::LogLevel::ERROR, "Storage: Append failed for " + coll);
    }
    return ok;
}

/**
 * @brief Appends a deletion marker for `id`.
 */
bool Db::write_tombstone(const std::string& coll, const std::string& id)
{
    cJSON* tomb = cJSON_CreateObject();
    cJSON_AddStringToObject(tomb, ID_FIELD, id.c_str());
    cJSON_AddBoolToObject(tomb, TOMBSTONE_FIELD, true);
    bool ok = append_frame(coll, tomb);
    cJSON_Delete(tomb);
    return ok;
}

/**
 * @brief Unlinks a document from its indexes and frees it.
 *
 * @note Caller holds the write lock and has already logged the tombstone.
 */
void Db::detach(const std::string& coll, cJSON* doc)
{
    update_custom_index(coll, doc, false);
    const char* id = id_of(doc);
    if (id != nullptr) {
        id_indexes_[coll].erase(id);
    }
    cJSON_Delete(cJSON_DetachItemViaPointer(memory_store_[coll], doc));
}

/**
 * @brief Inserts a copy of `doc`.
 *
 * 1. **Shape**: an object with a non-empty string `_id` and no tombstone flag.
 * 2. **Constraints**: `_id` and every unique index value must be free.
 * 3. **Durability**: the frame is appended before memory changes.
 *
 * @return WriteStatus `DUPLICATE_KEY` when a constraint rejects the document.
 */
WriteStatus Db::insert(const std::string& coll, const cJSON* doc)
{
    if (!cJSON_IsObject(doc) || coll == INDEX_COLLECTION ||
        cJSON_GetObjectItemCaseSensitive(doc, TOMBSTONE_FIELD) != nullptr) {
        return WriteStatus::INVALID_DOCUMENT;
    }
    const char* id = id_of(doc);
    if (id == nullptr) {
        return WriteStatus::INVALID_DOCUMENT;
    }
    std::string uuid = id;

    // Exclusive Lock: constraint check and write must be one step
    std::unique_lock lock(rw_lock_);

    auto ids = id_indexes_.find(coll);
    if (ids != id_indexes_.end() && ids->second.count(uuid)) {
        return WriteStatus::DUPLICATE_KEY;
    }
    if (violates_unique(coll, doc, nullptr)) {
        return WriteStatus::DUPLICATE_KEY;
    }
    if (!append_frame(coll, doc)) {
        return WriteStatus::IO_ERROR;
    }

    // Apply to memory only after the append succeeded
    cJSON* item = cJSON_Duplicate(doc, 1);
    cJSON_AddItemToArray(get_collection(coll), item);
    id_indexes_[coll][uuid] = item;
    update_custom_index(coll, item, true);

    infra::Logger::log(infra::LogLevel::TRACE, "CRUD: Inserted " + uuid + " -> " + coll);
    return WriteStatus::OK;
}

/**
 * @brief Returns a deep copy of the first match, or nullptr. Caller owns the result.
 */
cJSON* Db::find_one(const std::string& coll, const cJSON* query) const
{
    std::shared_lock lock(rw_lock_);
    cJSON* doc = first_match(coll, query);
    return doc != nullptr ? cJSON_Duplicate(doc, 1) : nullptr;
}

/**
 * @brief Returns deep copies of every match as a cJSON array.
 *
 * The cancellation token is polled once per candidate document.
 *
 * @return cJSON* Owned by the caller; nullptr if the scan was cancelled.
 */
cJSON* Db::find(const std::string& coll, const cJSON* query,
                const infra::CancellationToken* cancel) const
{
    // Shared Lock: allows concurrent readers
    std::shared_lock lock(rw_lock_);

    cJSON* result = cJSON_CreateArray();
    for (cJSON* doc : candidates(coll, query)) {
        if (cancel != nullptr && cancel->is_cancelled()) {
            infra::Logger::log(infra::LogLevel::DEBUG, "Query: Scan on " + coll + " cancelled");
            cJSON_Delete(result);
            return nullptr;
        }
        if (Query::matches(doc, query)) {
            cJSON_AddItemToArray(result, cJSON_Duplicate(doc, 1));
        }
    }
    return result;
}

/**
 * @brief Counts matching documents without copying them.
 */
int Db::count(const std::string& coll, const cJSON* query) const
{
    std::shared_lock lock(rw_lock_);

    auto store = memory_store_.find(coll);
    if (store == memory_store_.end()) {
        return 0;
    }
    if (query == nullptr || cJSON_GetArraySize(query) == 0) {
        // Empty filter matches everything
        return cJSON_GetArraySize(store->second);
    }

    int total = 0;
    for (const cJSON* doc : candidates(coll, query)) {
        if (Query::matches(doc, query)) {
            ++total;
        }
    }
    return total;
}

/**
 * @brief Sets top-level fields on the first matching document.
 *
 * The merged document is validated and logged in full before it replaces the
 * stored one, so a replay yields exactly the state returned here.
 *
 * @param fields Fields to set. Must not touch `_id` or the tombstone flag.
 */
WriteStatus Db::update_one(const std::string& coll, const cJSON* query, const cJSON* fields)
{
    if (!cJSON_IsObject(fields) || cJSON_GetObjectItemCaseSensitive(fields, ID_FIELD) != nullptr ||
        cJSON_GetObjectItemCaseSensitive(fields, TOMBSTONE_FIELD) != nullptr) {
        return WriteStatus::INVALID_DOCUMENT;
    }

    std::unique_lock lock(rw_lock_);

    cJSON* target = first_match(coll, query);
    if (target == nullptr) {
        return WriteStatus::NOT_FOUND;
    }

    // 1. Merge into a private copy
    cJSON* updated = cJSON_Duplicate(target, 1);
    const cJSON* field = nullptr;
    cJSON_ArrayForEach(field, fields)
    {
        cJSON_DeleteItemFromObjectCaseSensitive(updated, field->string);
        cJSON_AddItemToObject(updated, field->string, cJSON_Duplicate(field, 1));
    }

    // 2. Validate and persist
    if (violates_unique(coll, updated, target)) {
        cJSON_Delete(updated);
        return WriteStatus::DUPLICATE_KEY;
    }
    if (!append_frame(coll, updated)) {
        cJSON_Delete(updated);
        return WriteStatus::IO_ERROR;
    }

    // 3. Swap the copy in and reindex
    std::string uuid = id_of(target);
    update_custom_index(coll, target, false);
    cJSON_ReplaceItemViaPointer(memory_store_[coll], target, updated);
    id_indexes_[coll][uuid] = updated;
    update_custom_index(coll, updated, true);

    infra::Logger::log(infra::LogLevel::TRACE, "CRUD: Updated " + uuid + " in " + coll);
    maybe_compact(coll);
    return WriteStatus::OK;
}

/**
 * @brief Deletes the first matching document by logging a tombstone.
 */
WriteStatus Db::remove_one(const std::string& coll, const cJSON* query)
{
    std::unique_lock lock(rw_lock_);

    cJSON* target = first_match(coll, query);
    if (target == nullptr) {
        return WriteStatus::NOT_FOUND;
    }

    std::string uuid = id_of(target);
    if (!write_tombstone(coll, uuid)) {
        return WriteStatus::IO_ERROR;
    }
    detach(coll, target);

    infra::Logger::log(infra::LogLevel::TRACE, "CRUD: Removed " + uuid + " from " + coll);
    maybe_compact(coll);
    return WriteStatus::OK;
}

/**
 * @brief Defines a secondary index and backfills existing data.
 *
 * Idempotent for an identical definition. A different definition on the same
 * field, or a unique index over existing duplicates, is refused.
 *
 * @return true If the index exists with exactly these options afterwards.
 */
bool Db::create_index(const std::string& coll, const std::string& field, IndexOptions options)
{
    if (coll.empty() || field.empty() || field == ID_FIELD) {
        return false;
    }

    std::unique_lock lock(rw_lock_);

    auto& definitions = indexed_fields_[coll];
    auto existing = definitions.find(field);
    if (existing != definitions.end()) {
        if (existing->second == options) {
            return true;
        }
        infra::Logger::log(infra::LogLevel::ERROR, "Index: Conflicting definition for " + coll +
                                                       "." + field);
        return false;
    }

    // Existing data must already satisfy a unique constraint
    auto store = memory_store_.find(coll);
    if (options.unique && store != memory_store_.end()) {
        std::unordered_set<std::string> seen;
        cJSON* item = nullptr;
        cJSON_ArrayForEach(item, store->second)
        {
            std::optional<std::string> key =
                Query::index_key(cJSON_GetObjectItemCaseSensitive(item, field.c_str()));
            if (key && !seen.insert(*key).second) {
                infra::Logger::log(infra::LogLevel::ERROR, "Index: Duplicate values prevent a "
                                                           "unique index on " +
                                                               coll + "." + field);
                return false;
            }
        }
    }

    definitions[field] = options;
    if (store != memory_store_.end()) {
        rebuild_index(coll, store->second);
    }

    if (!persist_index_definitions()) {
        // Roll back so memory matches what a restart would load
        definitions.erase(field);
        if (store != memory_store_.end()) {
            rebuild_index(coll, store->second);
        }
        infra::Logger::log(infra::LogLevel::ERROR, "Index: Could not persist " + coll + "." + field);
        return false;
    }

    infra::Logger::log(infra::LogLevel::INFO, "Index: Created index on " + coll + "." + field +
                                                  (options.unique ? " (unique)" : "") +
                                                  (options.expire_after ? " (ttl)" : ""));
    return true;
}

/**
 * @brief Definition of an index, if one exists.
 */
std::optional<IndexOptions> Db::index_options(const std::string& coll,
                                              const std::string& field) const
{
    std::shared_lock lock(rw_lock_);
    auto fields = indexed_fields_.find(coll);
    if (fields == indexed_fields_.end()) {
        return std::nullopt;
    }
    auto it = fields->second.find(field);
    if (it == fields->second.end()) {
        return std::nullopt;
    }
    return it->second;
}

/**
 * @brief TTL enforcement.
 *
 * For each TTL index, every document whose field holds epoch milliseconds at
 * or before `now - expire_after` is tombstoned. An append failure stops the
 * sweep of that index; the next sweep retries.
 */
size_t Db::sweep_expired(infra::TimePoint now)
{
    std::unique_lock lock(rw_lock_);

    const int64_t now_ms = infra::to_epoch_ms(now);
    size_t removed = 0;

    for (const auto& [coll, fields] : indexed_fields_) {
        auto store = memory_store_.find(coll);
        if (store == memory_store_.end()) {
            continue;
        }

        size_t removed_here = 0;
        for (const auto& [field, options] : fields) {
            if (!options.expire_after) {
                continue;
            }
            const int64_t grace_ms =
                std::chrono::duration_cast<std::chrono::milliseconds>(*options.expire_after)
                    .count();

            // Collect first; detaching while iterating would break the array walk
            DocList expired;
            cJSON* item = nullptr;
            cJSON_ArrayForEach(item, store->second)
            {
                const cJSON* value = cJSON_GetObjectItemCaseSensitive(item, field.c_str());
                if (cJSON_IsNumber(value) &&
                    static_cast<int64_t>(value->valuedouble) + grace_ms <= now_ms) {
                    expired.push_back(item);
                }
            }

            for (cJSON* doc : expired) {
                const char* id = id_of(doc);
                if (id == nullptr) {
                    continue;
                }
                if (!write_tombstone(coll, id)) {
                    infra::Logger::log(infra::LogLevel::ERROR,
                                       "TTL: Sweep of " + coll + " interrupted by I/O failure");
                    break;
                }
                detach(coll, doc);
                ++removed_here;
            }
        }

        if (removed_here > 0) {
            maybe_compact(coll);
        }
        removed += removed_here;
    }

    if (removed > 0) {
        infra::Logger::log(infra::LogLevel::INFO,
                           "TTL: Expired " + std::to_string(removed) + " documents");
    }
    return removed;
}

/**
 * @brief Compaction heuristic: rewrite once more than half the log is obsolete.
 */
void Db::maybe_compact(const std::string& coll)
{
    auto store = memory_store_.find(coll);
    if (store == memory_store_.end()) {
        return;
    }
    size_t live = static_cast<size_t>(cJSON_GetArraySize(store->second));
    size_t frames = log_frames_[coll];
    if (frames >= COMPACTION_MIN_FRAMES && frames > live * 2) {
        infra::Logger::log(infra::LogLevel::INFO, "Maintenance: Auto-compacting " + coll);
        compact_collection(coll);
    }
}

/**
 * @brief Performs Log Compaction (Garbage Collection).
 *
 * Rewrites the log with the current in-memory snapshot, purging obsolete
 * versions and tombstones.
 *
 * @note Caller holds the write lock.
 */
bool Db::compact_collection(const std::string& coll)
{
    auto store = memory_store_.find(coll);
    if (store == memory_store_.end()) {
        return false;
    }

    std::vector<std::string> active_docs;
    cJSON* item = nullptr;
    cJSON_ArrayForEach(item, store->second)
    {
        char* raw = cJSON_PrintUnformatted(item);
        if (raw == nullptr) {
            return false;
        }
        active_docs.emplace_back(raw);
        free(raw);
    }

    bool ok = storage_.compact(coll, active_docs);
    if (ok) {
        log_frames_[coll] = active_docs.size();
        infra::Logger::log(infra::LogLevel::DEBUG, "Maintenance: Compaction complete for " + coll);
    } else {
        infra::Logger::log(infra::LogLevel::ERROR, "Maintenance: Compaction failed for " + coll);
    }
    return ok;
}

/**
 * @brief Thread-safe trigger for manual compaction.
 */
bool Db::trigger_compaction(const std::string& coll)
{
    std::unique_lock lock(rw_lock_);
    return compact_collection(coll);
}

} // namespace buildshare::storage
