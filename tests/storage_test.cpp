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
 * @file storage_test.cpp
 * @brief Durability, indexing, query and expiry tests for the document store.
 *
 * @details
 * 1. Append-only log replay across restarts, including tombstones and compaction.
 * 2. Unique, plain and TTL index definitions and their persistence.
 * 3. Query matching (`$or`, equality, missing fields) and cancellation.
 */

#include "buildshare/infra/cancellation.hpp"
#include "buildshare/infra/clock.hpp"
#include "buildshare/storage/collections.hpp"
#include "buildshare/storage/db.hpp"
#include "buildshare/storage/engine.hpp"
#include "buildshare/storage/query.hpp"
#include "buildshare/storage/ttl_monitor.hpp"
#include "framework.hpp"

#include <cJSON.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

using namespace buildshare;

namespace {

using JsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

JsonPtr json(const char* text)
{
    return JsonPtr(cJSON_Parse(text), cJSON_Delete);
}

std::string string_field(const cJSON* doc, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(doc, key);
    return cJSON_IsString(item) ? item->valuestring : "";
}

} // namespace

void test_db_insert_and_find()
{
    test::TempDir dir;
    storage::Db db(dir.path());

    ASSERT_TRUE(db.insert("Builds", json(R"({"_id":"1","archetype":"Tanker"})").get()) ==
                storage::WriteStatus::OK);

    JsonPtr found(db.find_one("Builds", json(R"({"archetype":"Tanker"})").get()), cJSON_Delete);
    ASSERT_TRUE(found != nullptr);
    ASSERT_EQ(string_field(found.get(), "_id"), std::string("1"));

    JsonPtr missing(db.find_one("Builds", json(R"({"archetype":"Blaster"})").get()), cJSON_Delete);
    ASSERT_TRUE(missing == nullptr);
}

/**
 * @brief Documents without a string `_id`, or carrying reserved keys, never reach the log.
 */
void test_db_rejects_invalid_documents()
{
    test::TempDir dir;
    storage::Db db(dir.path());

    ASSERT_TRUE(db.insert("Builds", json(R"({"archetype":"Tanker"})").get()) ==
                storage::WriteStatus::INVALID_DOCUMENT);
    ASSERT_TRUE(db.insert("Builds", json(R"({"_id":7})").get()) ==
                storage::WriteStatus::INVALID_DOCUMENT);
    ASSERT_TRUE(db.insert("Builds", json(R"({"_id":"1","_deleted":true})").get()) ==
                storage::WriteStatus::INVALID_DOCUMENT);
    ASSERT_TRUE(db.insert("_indexes", json(R"({"_id":"1"})").get()) ==
                storage::WriteStatus::INVALID_DOCUMENT);

    ASSERT_TRUE(db.insert("Builds", json(R"({"_id":"1"})").get()) == storage::WriteStatus::OK);
    ASSERT_TRUE(db.insert("Builds", json(R"({"_id":"1"})").get()) ==
                storage::WriteStatus::DUPLICATE_KEY);
    ASSERT_EQ(db.count("Builds", nullptr), 1);
}

/**
 * @brief Inserts, updates and removes are all replayed after a restart.
 */
void test_db_persistence()
{
    test::TempDir dir;
    {
        storage::Db db(dir.path());
        db.insert("Builds", json(R"({"_id":"a","name":"first"})").get());
        db.insert("Builds", json(R"({"_id":"b","name":"second"})").get());
        db.insert("Builds", json(R"({"_id":"c","name":"third"})").get());

        ASSERT_TRUE(db.update_one("Builds", json(R"({"_id":"a"})").get(),
                                  json(R"({"name":"renamed"})").get()) == storage::WriteStatus::OK);
        ASSERT_TRUE(db.remove_one("Builds", json(R"({"_id":"b"})").get()) ==
                    storage::WriteStatus::OK);
    }

    storage::Db reopened(dir.path());
    ASSERT_EQ(reopened.count("Builds", nullptr), 2);

    JsonPtr a(reopened.find_one("Builds", json(R"({"_id":"a"})").get()), cJSON_Delete);
    ASSERT_EQ(string_field(a.get(), "name"), std::string("renamed"));

    JsonPtr b(reopened.find_one("Builds", json(R"({"_id":"b"})").get()), cJSON_Delete);
    ASSERT_TRUE(b == nullptr);
}

void test_db_update_and_remove_missing()
{
    test::TempDir dir;
    storage::Db db(dir.path());

    ASSERT_TRUE(db.update_one("Builds", json(R"({"_id":"x"})").get(),
                              json(R"({"name":"n"})").get()) == storage::WriteStatus::NOT_FOUND);
    ASSERT_TRUE(db.remove_one("Builds", json(R"({"_id":"x"})").get()) ==
                storage::WriteStatus::NOT_FOUND);

    db.insert("Builds", json(R"({"_id":"x"})").get());
    ASSERT_TRUE(db.update_one("Builds", json(R"({"_id":"x"})").get(),
                              json(R"({"_id":"y"})").get()) ==
                storage::WriteStatus::INVALID_DOCUMENT);
}

/**
 * @brief A unique index blocks duplicates on insert and on update.
 */
void test_db_unique_index()
{
    test::TempDir dir;
    storage::Db db(dir.path());

    storage::IndexOptions unique;
    unique.unique = true;
    ASSERT_TRUE(db.create_index("Builds", "shortcode", unique));

    ASSERT_TRUE(db.insert("Builds", json(R"({"_id":"1","shortcode":"abc"})").get()) ==
                storage::WriteStatus::OK);
    ASSERT_TRUE(db.insert("Builds", json(R"({"_id":"2","shortcode":"abc"})").get()) ==
                storage::WriteStatus::DUPLICATE_KEY);
    ASSERT_TRUE(db.insert("Builds", json(R"({"_id":"3","shortcode":"xyz"})").get()) ==
                storage::WriteStatus::OK);

    ASSERT_TRUE(db.update_one("Builds", json(R"({"_id":"3"})").get(),
                              json(R"({"shortcode":"abc"})").get()) ==
                storage::WriteStatus::DUPLICATE_KEY);

    // Sparse: documents without the field never collide.
    ASSERT_TRUE(db.insert("Builds", json(R"({"_id":"4"})").get()) == storage::WriteStatus::OK);
    ASSERT_TRUE(db.insert("Builds", json(R"({"_id":"5"})").get()) == storage::WriteStatus::OK);
}

void test_db_unique_index_refused_over_duplicates()
{
    test::TempDir dir;
    storage::Db db(dir.path());
    db.insert("Builds", json(R"({"_id":"1","shortcode":"same"})").get());
    db.insert("Builds", json(R"({"_id":"2","shortcode":"same"})").get());

    storage::IndexOptions unique;
    unique.unique = true;
    ASSERT_FALSE(db.create_index("Builds", "shortcode", unique));
    ASSERT_FALSE(db.index_options("Builds", "shortcode").has_value());
}

/**
 * @brief Re-declaring an index is a no-op; a different definition is refused.
 */
void test_db_index_idempotence()
{
    test::TempDir dir;
    storage::Db db(dir.path());

    storage::IndexOptions ttl;
    ttl.expire_after = std::chrono::seconds(0);
    ASSERT_TRUE(db.create_index("Builds", "expiresAt", ttl));
    ASSERT_TRUE(db.create_index("Builds", "expiresAt", ttl));

    storage::IndexOptions other;
    other.expire_after = std::chrono::seconds(60);
    ASSERT_FALSE(db.create_index("Builds", "expiresAt", other));

    ASSERT_FALSE(db.create_index("Builds", "_id"));
    ASSERT_FALSE(db.create_index("Builds", ""));
}

void test_db_index_definitions_survive_restart()
{
    test::TempDir dir;
    {
        storage::Db db(dir.path());
        storage::IndexOptions unique;
        unique.unique = true;
        db.create_index("Builds", "shortcode", unique);

        storage::IndexOptions ttl;
        ttl.expire_after = std::chrono::seconds(30);
        db.create_index("Builds", "expiresAt", ttl);
        db.insert("Builds", json(R"({"_id":"1","shortcode":"abc"})").get());
    }

    storage::Db reopened(dir.path());
    auto unique = reopened.index_options("Builds", "shortcode");
    ASSERT_TRUE(unique.has_value());
    ASSERT_TRUE(unique->unique);

    auto ttl = reopened.index_options("Builds", "expiresAt");
    ASSERT_TRUE(ttl.has_value());
    ASSERT_TRUE(ttl->expire_after == std::chrono::seconds(30));

    ASSERT_TRUE(reopened.insert("Builds", json(R"({"_id":"2","shortcode":"abc"})").get()) ==
                storage::WriteStatus::DUPLICATE_KEY);
}

/**
 * @brief `$or` selects documents matching any branch, through indexed and
 * unindexed fields alike.
 */
void test_db_or_query()
{
    test::TempDir dir;
    storage::Db db(dir.path());
    db.create_index("Builds", "archetype");

    db.insert("Builds", json(R"({"_id":"1","archetype":"Tanker","primary":"Fire"})").get());
    db.insert("Builds", json(R"({"_id":"2","archetype":"Blaster","primary":"Ice"})").get());
    db.insert("Builds", json(R"({"_id":"3","archetype":"Defender","primary":"Dark"})").get());

    auto query = json(R"({"$or":[{"archetype":"Tanker"},{"primary":"Ice"}]})");
    JsonPtr result(db.find("Builds", query.get()), cJSON_Delete);
    ASSERT_TRUE(result != nullptr);
    ASSERT_EQ(cJSON_GetArraySize(result.get()), 2);
    ASSERT_EQ(db.count("Builds", query.get()), 2);

    ASSERT_EQ(db.count("Builds", json(R"({"$or":[]})").get()), 0);
}

void test_query_matching_rules()
{
    auto doc = json(R"({"_id":"1","archetype":"Tanker","level":50})");

    ASSERT_TRUE(storage::Query::matches(doc.get(), nullptr));
    ASSERT_TRUE(storage::Query::matches(doc.get(), json("{}").get()));
    ASSERT_TRUE(storage::Query::matches(doc.get(), json(R"({"level":50})").get()));
    ASSERT_FALSE(storage::Query::matches(doc.get(), json(R"({"level":"50"})").get()));
    ASSERT_TRUE(storage::Query::matches(doc.get(), json(R"({"shortcode":null})").get()));
    ASSERT_FALSE(storage::Query::matches(doc.get(), json(R"({"archetype":null})").get()));

    ASSERT_EQ(storage::Query::index_key(cJSON_GetObjectItem(doc.get(), "archetype")).value(),
              std::string("s:Tanker"));
    ASSERT_FALSE(storage::Query::index_key(nullptr).has_value());
}

void test_db_find_cancelled()
{
    test::TempDir dir;
    storage::Db db(dir.path());
    db.insert("Builds", json(R"({"_id":"1","archetype":"Tanker"})").get());

    infra::CancellationToken token;
    token.cancel();
    cJSON* result = db.find("Builds", json(R"({"archetype":"Tanker"})").get(), &token);
    ASSERT_TRUE(result == nullptr);
}

/**
 * @brief Documents expire once their timestamp plus the grace period has passed.
 */
void test_db_sweep_expired()
{
    test::TempDir dir;
    storage::Db db(dir.path());

    storage::IndexOptions ttl;
    ttl.expire_after = std::chrono::seconds(0);
    db.create_index("Builds", "expiresAt", ttl);

    db.insert("Builds", json(R"({"_id":"old","expiresAt":1000})").get());
    db.insert("Builds", json(R"({"_id":"new","expiresAt":5000})").get());
    db.insert("Builds", json(R"({"_id":"legacy"})").get());

    ASSERT_EQ(db.sweep_expired(infra::from_epoch_ms(999)), static_cast<size_t>(0));
    ASSERT_EQ(db.sweep_expired(infra::from_epoch_ms(2000)), static_cast<size_t>(1));
    ASSERT_EQ(db.count("Builds", nullptr), 2);

    storage::Db reopened(dir.path());
    ASSERT_EQ(reopened.count("Builds", json(R"({"_id":"old"})").get()), 0);
}

void test_ttl_monitor_run_once()
{
    test::TempDir dir;
    storage::Db db(dir.path());
    infra::ManualClock clock(infra::from_epoch_ms(0));

    storage::IndexOptions ttl;
    ttl.expire_after = std::chrono::seconds(0);
    db.create_index("Builds", "expiresAt", ttl);
    db.insert("Builds", json(R"({"_id":"1","expiresAt":60000})").get());

    storage::TtlMonitor monitor(db, clock, std::chrono::milliseconds(50));
    ASSERT_EQ(monitor.run_once(), static_cast<size_t>(0));

    clock.advance(std::chrono::minutes(2));
    monitor.start();
    ASSERT_TRUE(monitor.running());
    monitor.stop();
    ASSERT_FALSE(monitor.running());

    monitor.run_once();
    ASSERT_EQ(db.count("Builds", nullptr), 0);

    ASSERT_THROWS(storage::TtlMonitor(db, clock, std::chrono::milliseconds(0)),
                  std::invalid_argument);
}

void test_db_compaction_keeps_live_documents()
{
    test::TempDir dir;
    {
        storage::Db db(dir.path());
        for (int i = 0; i < 20; ++i) {
            std::string doc = R"({"_id":")" + std::to_string(i) + R"(","n":)" +
                              std::to_string(i) + "}";
            db.insert("Builds", json(doc.c_str()).get());
        }
        for (int i = 0; i < 15; ++i) {
            std::string query = R"({"_id":")" + std::to_string(i) + R"("})";
            db.remove_one("Builds", json(query.c_str()).get());
        }
        ASSERT_TRUE(db.trigger_compaction("Builds"));
    }

    storage::Db reopened(dir.path());
    ASSERT_EQ(reopened.count("Builds", nullptr), 5);
    ASSERT_EQ(reopened.count("Builds", json(R"({"n":19})").get()), 1);
}

void test_engine_log_roundtrip()
{
    test::TempDir dir;
    storage::Engine engine(dir.path());
    engine.init();

    ASSERT_TRUE(engine.load_log("Empty").empty());
    ASSERT_TRUE(engine.append("Builds", R"({"_id":"1"})"));
    ASSERT_TRUE(engine.append("Builds", R"({"_id":"2"})"));

    auto frames = engine.load_log("Builds");
    ASSERT_EQ(frames.size(), static_cast<size_t>(2));
    ASSERT_EQ(frames[1], std::string(R"({"_id":"2"})"));
}

void test_collection_registry()
{
    storage::CollectionRegistry defaults;
    ASSERT_EQ(defaults.resolve(storage::CollectionRegistry::BUILD_RECORD), std::string("Builds"));
    ASSERT_THROWS(defaults.resolve("Unknown"), std::out_of_range);

    storage::CollectionRegistry custom({{"BuildRecord", "SharedBuilds"}});
    ASSERT_EQ(custom.resolve("BuildRecord"), std::string("SharedBuilds"));

    ASSERT_THROWS(storage::CollectionRegistry({{"Other", "X"}}), std::invalid_argument);
    ASSERT_THROWS(storage::CollectionRegistry({{"BuildRecord", "_indexes"}}),
                  std::invalid_argument);
    ASSERT_THROWS(storage::CollectionRegistry({{"BuildRecord", "../etc"}}), std::invalid_argument);
}
