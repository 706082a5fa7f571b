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
 * @file store_test.cpp
 * @brief Lifecycle tests for shared build records.
 *
 * @details
 * Every test runs against a real `storage::Db` in a scratch directory with a
 * `ManualClock`, so expiry windows can be crossed without sleeping.
 */

#include "buildshare/codec/base62.hpp"
#include "buildshare/core/build_store.hpp"
#include "buildshare/core/identifier_allocator.hpp"
#include "buildshare/core/url_builder.hpp"
#include "buildshare/infra/cancellation.hpp"
#include "buildshare/infra/id_generator.hpp"
#include "buildshare/infra/scheduler.hpp"
#include "buildshare/model/build_file.hpp"
#include "buildshare/storage/ttl_monitor.hpp"
#include "fixtures.hpp"
#include "framework.hpp"

#include <cJSON.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>

using namespace buildshare;
using core::ErrorKind;

namespace {

using JsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

/// @brief Writes a record the way the previous service stored it.
void insert_legacy(storage::Db& db, const std::string& collection, const std::string& code)
{
    JsonPtr doc(cJSON_CreateObject(), cJSON_Delete);
    cJSON_AddStringToObject(doc.get(), "_id", ("legacy-" + code).c_str());
    cJSON_AddStringToObject(doc.get(), "Code", code.c_str());
    cJSON_AddStringToObject(doc.get(), "BuildData",
                            codec::Payload::compress_and_encode(test::sample_build_json()).c_str());
    cJSON_AddStringToObject(doc.get(), "ImageData",
                            codec::Payload::compress_and_encode(test::sample_image()).c_str());
    cJSON_AddStringToObject(doc.get(), "PageData",
                            codec::Payload::compress_and_encode(std::string("<html>ok</html>"))
                                .c_str());
    if (db.insert(collection, doc.get()) != storage::WriteStatus::OK) {
        throw std::runtime_error("legacy insert failed");
    }
}

/// @brief Occupies a shortcode under a foreign `_id`, so only the unique index can catch it.
void claim_shortcode(storage::Db& db, const std::string& collection, const std::string& shortcode)
{
    JsonPtr doc(cJSON_CreateObject(), cJSON_Delete);
    cJSON_AddStringToObject(doc.get(), "_id", ("claimed-" + shortcode).c_str());
    cJSON_AddStringToObject(doc.get(), "shortcode", shortcode.c_str());
    if (db.insert(collection, doc.get()) != storage::WriteStatus::OK) {
        throw std::runtime_error("claim insert failed");
    }
}

/**
 * @struct TunedStore
 * @brief A store with explicit settings over its own scratch directory.
 */
struct TunedStore {
    test::TempDir dir;
    infra::ManualClock clock{infra::from_epoch_ms(1767225600000LL)};
    storage::Db db{dir.path()};
    storage::CollectionRegistry collections;
    std::string collection = collections.resolve(storage::CollectionRegistry::BUILD_RECORD);
    core::BuildStore store;

    explicit TunedStore(const core::StoreSettings& settings)
        : store(db, collections, core::UrlBuilder("https://mids.app", "mrb"), settings, clock)
    {
        store.initialize();
    }
};

} // namespace

void test_url_builder()
{
    core::UrlBuilder urls(" https://mids.app/some/path?x=1 ", "mrb");
    ASSERT_EQ(urls.origin(), std::string("https://mids.app"));
    ASSERT_EQ(urls.download_url("abc"), std::string("https://mids.app/build/download/abc"));
    ASSERT_EQ(urls.image_url("abc"), std::string("https://mids.app/build/image/abc.png"));
    ASSERT_EQ(urls.schema_url("abc"), std::string("mrb://abc"));

    ASSERT_THROWS(core::UrlBuilder("", "mrb"), std::invalid_argument);
    ASSERT_THROWS(core::UrlBuilder("mids.app", "mrb"), std::invalid_argument);
    ASSERT_THROWS(core::UrlBuilder("https://", "mrb"), std::invalid_argument);
    ASSERT_THROWS(core::UrlBuilder("https://mids.app", " "), std::invalid_argument);
}

/**
 * @brief Taken identifiers are skipped; a run of collisions is an `AllocationError`.
 */
void test_identifier_allocator_bounds()
{
    test::TempDir dir;
    storage::Db db(dir.path());
    infra::ManualClock clock(infra::from_epoch_ms(1767225600000LL));

    // A twin generator on the same frozen clock yields the same sequence.
    infra::IdGenerator twin(clock, 0);
    for (int i = 0; i < 3; ++i) {
        std::string doc = R"({"_id":")" + std::to_string(twin.generate()) + R"("})";
        JsonPtr parsed(cJSON_Parse(doc.c_str()), cJSON_Delete);
        db.insert("Builds", parsed.get());
    }

    core::IdentifierAllocator tight(db, "Builds", clock, 0, 3);
    ASSERT_THROWS(tight.allocate(), core::AllocationError);

    core::IdentifierAllocator roomy(db, "Builds", clock, 0, 5);
    uint64_t id = roomy.allocate();
    ASSERT_FALSE(roomy.exists(id));
}

void test_store_create()
{
    test::StoreFixture fx;

    auto result = fx.store->create(test::sample_input());
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.status(), std::string("Success"));
    ASSERT_EQ(result.message(), std::string("Build created successfully"));

    const auto& tx = result.value();
    ASSERT_FALSE(tx.shortcode.empty());
    ASSERT_EQ(tx.download_url, "https://mids.app/build/download/" + tx.shortcode);
    ASSERT_EQ(tx.schema_url, "mrb://" + tx.shortcode);
    ASSERT_EQ(tx.expires_at, std::string("2026-01-31T00:00:00.000Z"));

    auto stored = fx.store->retrieve(tx.shortcode);
    ASSERT_TRUE(stored.ok());
    ASSERT_EQ(stored.value().archetype, std::string("Tanker"));
    ASSERT_EQ(stored.value().id, std::to_string(codec::Base62::decode_u64(tx.shortcode)));
}

/**
 * @brief Validation failures report the first missing field and write nothing.
 */
void test_store_create_validation()
{
    test::StoreFixture fx;

    auto no_sets = fx.store->create(test::sample_input("Tanker", "", "Fiery Melee"));
    ASSERT_TRUE(no_sets.error() == ErrorKind::VALIDATION);
    ASSERT_EQ(no_sets.message(), std::string("Primary and Secondary powersets are required."));
    ASSERT_EQ(no_sets.status(), std::string("Failed"));

    auto no_archetype = fx.store->create(test::sample_input("  "));
    ASSERT_EQ(no_archetype.message(), std::string("Archetype is required."));

    model::CreateInput no_payload = test::sample_input();
    no_payload.image_data.clear();
    ASSERT_EQ(fx.store->create(no_payload).message(),
              std::string("Build and image data are required."));

    ASSERT_EQ(fx.db->count(fx.store->collection(), nullptr), 0);
    ASSERT_THROWS(no_sets.value(), std::logic_error);
}

/**
 * @brief Update keeps omitted fields, replaces payloads and restarts the expiry window.
 */
void test_store_update()
{
    test::StoreFixture fx;
    std::string code = fx.store->create(test::sample_input()).value().shortcode;

    fx.clock.advance(std::chrono::hours(24 * 10));

    model::UpdateInput change;
    change.primary = std::string("Dark Armor");
    change.build_data = codec::Payload::compress_and_encode(test::sample_build_json());
    change.image_data = codec::Payload::compress_and_encode(std::string("new image"));

    auto result = fx.store->update(code, change);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().shortcode, code);
    ASSERT_EQ(result.value().expires_at, std::string("2026-02-10T00:00:00.000Z"));

    auto stored = fx.store->retrieve(code).value();
    ASSERT_EQ(stored.primary, std::string("Dark Armor"));
    ASSERT_EQ(stored.secondary, std::string("Fiery Melee"));
    ASSERT_EQ(stored.name.value(), std::string("Blaze"));
    ASSERT_EQ(stored.image_data, change.image_data);

    ASSERT_TRUE(fx.store->update("missing", change).error() == ErrorKind::NOT_FOUND);
    model::UpdateInput empty;
    ASSERT_TRUE(fx.store->update(code, empty).error() == ErrorKind::VALIDATION);
}

void test_store_remove()
{
    test::StoreFixture fx;
    std::string code = fx.store->create(test::sample_input()).value().shortcode;

    auto missing = fx.store->remove("nope");
    ASSERT_TRUE(missing.error() == ErrorKind::NOT_FOUND);
    ASSERT_EQ(missing.message(), std::string("No record found with the given shortcode to delete."));

    ASSERT_TRUE(fx.store->remove(code).ok());
    ASSERT_TRUE(fx.store->exists(code).error() == ErrorKind::NOT_FOUND);
    ASSERT_TRUE(fx.store->remove("  ").error() == ErrorKind::VALIDATION);
}

void test_store_survives_restart()
{
    test::StoreFixture fx;
    std::string code = fx.store->create(test::sample_input()).value().shortcode;

    fx.reopen();
    ASSERT_TRUE(fx.store->exists(code).ok());
    ASSERT_TRUE(fx.store->generate_file(code).ok());
}

/**
 * @brief The regenerated file is the stored build, indented, under a readable name.
 */
void test_store_generate_file()
{
    test::StoreFixture fx;
    std::string code = fx.store->create(test::sample_input()).value().shortcode;

    auto result = fx.store->generate_file(code);
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().file_name,
              std::string("Blaze [Tanker] (Fiery Aura - Fiery Melee).mbd"));

    model::BuildFile file = model::BuildFile::parse(result.value().data_bytes);
    ASSERT_EQ(file.class_name, std::string("Class_Tanker"));
    ASSERT_EQ(file.power_entries.size(), static_cast<size_t>(2));

    std::string text(result.value().data_bytes.begin(), result.value().data_bytes.end());
    ASSERT_TRUE(text.find('\n') != std::string::npos);
}

void test_store_corrupt_payload()
{
    test::StoreFixture fx;

    model::CreateInput garbage = test::sample_input();
    garbage.build_data = "definitely-not-a-payload";
    std::string bad_code = fx.store->create(garbage).value().shortcode;
    ASSERT_TRUE(fx.store->generate_file(bad_code).error() == ErrorKind::DATA_CORRUPTION);

    model::CreateInput not_json = test::sample_input();
    not_json.build_data = codec::Payload::compress_and_encode(std::string("{ nope"));
    std::string json_code = fx.store->create(not_json).value().shortcode;
    ASSERT_TRUE(fx.store->generate_file(json_code).error() == ErrorKind::DATA_CORRUPTION);

    ASSERT_TRUE(fx.store->generate_file("unknown").error() == ErrorKind::NOT_FOUND);
}

void test_store_image_and_page()
{
    test::StoreFixture fx;
    std::string code = fx.store->create(test::sample_input()).value().shortcode;

    auto image = fx.store->retrieve_image(code);
    ASSERT_TRUE(image.ok());
    ASSERT_TRUE(image.value() == test::sample_image());

    auto page = fx.store->retrieve_page(code);
    ASSERT_TRUE(page.error() == ErrorKind::NOT_FOUND);
    ASSERT_EQ(page.message(), std::string("No page data found."));
}

/**
 * @brief Values may span fields but must follow archetype, primary, secondary order.
 */
void test_store_search()
{
    test::StoreFixture fx;
    fx.store->create(test::sample_input("Tanker", "Fire", "Ice"));
    fx.store->create(test::sample_input("Blaster", "Fire", "Energy"));
    fx.store->create(test::sample_input("Defender", "Dark", "Psionic"));

    auto ordered = fx.store->search("Tanker, Fire, Ice");
    ASSERT_TRUE(ordered.ok());
    ASSERT_EQ(ordered.value().size(), static_cast<size_t>(2));

    auto single = fx.store->search("Psionic");
    ASSERT_EQ(single.value().size(), static_cast<size_t>(1));
    ASSERT_EQ(single.value()[0].archetype, std::string("Defender"));

    auto reversed = fx.store->search("Fire,Tanker");
    ASSERT_TRUE(reversed.error() == ErrorKind::VALIDATION);
    ASSERT_EQ(reversed.message(),
              std::string("Parameters must be listed in order when multiple parameters are "
                          "provided."));

    ASSERT_TRUE(fx.store->search(" , ").error() == ErrorKind::VALIDATION);
    ASSERT_TRUE(fx.store->search("Scrapper").error() == ErrorKind::NOT_FOUND);

    infra::CancellationToken token;
    token.cancel();
    ASSERT_TRUE(fx.store->search("Fire", &token).error() == ErrorKind::CANCELLED);
}

/**
 * @brief Concurrent creates never hand out the same shortcode.
 */
void test_store_concurrent_creates()
{
    test::StoreFixture fx;
    std::mutex guard;
    std::set<std::string> codes;
    int failures = 0;

    {
        infra::Scheduler scheduler(8);
        for (int i = 0; i < 64; ++i) {
            scheduler.enqueue([&]() {
                auto result = fx.store->create(test::sample_input());
                std::lock_guard<std::mutex> lock(guard);
                if (result.ok()) {
                    codes.insert(result.value().shortcode);
                } else {
                    failures++;
                }
            });
        }
        scheduler.wait_idle();
    }

    ASSERT_EQ(failures, 0);
    ASSERT_EQ(codes.size(), static_cast<size_t>(64));
    ASSERT_EQ(fx.db->count(fx.store->collection(), nullptr), 64);
}

/**
 * @brief Records disappear once the retention window has passed, legacy ones never do.
 */
void test_store_records_expire()
{
    test::StoreFixture fx;
    std::string code = fx.store->create(test::sample_input()).value().shortcode;
    insert_legacy(*fx.db, fx.store->collection(), "old1");

    storage::TtlMonitor monitor(*fx.db, fx.clock);

    fx.clock.advance(std::chrono::hours(24 * 29));
    ASSERT_EQ(monitor.run_once(), static_cast<size_t>(0));
    ASSERT_TRUE(fx.store->exists(code).ok());

    fx.clock.advance(std::chrono::hours(24 * 2));
    ASSERT_EQ(monitor.run_once(), static_cast<size_t>(1));
    ASSERT_TRUE(fx.store->retrieve(code).error() == ErrorKind::NOT_FOUND);
    ASSERT_TRUE(fx.store->exists("old1").ok());
}

void test_store_legacy_records()
{
    test::StoreFixture fx;
    insert_legacy(*fx.db, fx.store->collection(), "old1");

    auto record = fx.store->retrieve("old1");
    ASSERT_TRUE(record.ok());
    ASSERT_TRUE(record.value().legacy);
    ASSERT_FALSE(record.value().expires_at.has_value());

    auto file = fx.store->generate_file("old1");
    ASSERT_TRUE(file.ok());
    ASSERT_EQ(file.value().file_name, std::string("old1.mbd"));

    auto page = fx.store->retrieve_page("old1");
    ASSERT_TRUE(page.ok());
    ASSERT_EQ(page.value(), std::string("<html>ok</html>"));

    ASSERT_TRUE(fx.store->retrieve_image("old1").ok());
}

void test_store_rejects_bad_settings()
{
    test::TempDir dir;
    storage::Db db(dir.path());
    storage::CollectionRegistry collections;
    infra::ManualClock clock;

    core::StoreSettings settings;
    settings.insert_attempts = 0;
    ASSERT_THROWS(core::BuildStore(db, collections, core::UrlBuilder("https://mids.app", "mrb"),
                                   settings, clock),
                  std::invalid_argument);
}

/**
 * @brief A legacy record answering to a candidate's shortcode makes that candidate taken.
 */
void test_identifier_allocator_skips_legacy_codes()
{
    test::TempDir dir;
    storage::Db db(dir.path());
    infra::ManualClock clock(infra::from_epoch_ms(1767225600000LL));

    infra::IdGenerator twin(clock, 0);
    uint64_t first = twin.generate();
    uint64_t second = twin.generate();
    insert_legacy(db, "Builds", codec::Base62::encode(first));

    core::IdentifierAllocator allocator(db, "Builds", clock, 0, 2);
    ASSERT_EQ(allocator.allocate(), second);
    ASSERT_TRUE(allocator.exists(first));
}

/**
 * @brief A shortcode taken behind the allocator's back is retried with a fresh identifier.
 */
void test_store_create_retries_duplicate_shortcode()
{
    core::StoreSettings settings;
    settings.insert_attempts = 3;
    TunedStore fx(settings);

    // Mirrors the store's own generator: same clock, same worker.
    infra::IdGenerator twin(fx.clock, settings.worker_id);
    claim_shortcode(fx.db, fx.collection, codec::Base62::encode(twin.generate()));
    claim_shortcode(fx.db, fx.collection, codec::Base62::encode(twin.generate()));
    uint64_t expected = twin.generate();

    auto result = fx.store.create(test::sample_input());
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().shortcode, codec::Base62::encode(expected));
    ASSERT_EQ(fx.db.count(fx.collection, nullptr), 3);
    ASSERT_TRUE(fx.store.retrieve(result.value().shortcode).ok());
}

/**
 * @brief Once every insert attempt collides, create reports a conflict and writes nothing.
 */
void test_store_create_gives_up_after_insert_attempts()
{
    core::StoreSettings settings;
    settings.insert_attempts = 3;
    TunedStore fx(settings);

    infra::IdGenerator twin(fx.clock, settings.worker_id);
    for (int i = 0; i < settings.insert_attempts; ++i) {
        claim_shortcode(fx.db, fx.collection, codec::Base62::encode(twin.generate()));
    }

    auto result = fx.store.create(test::sample_input());
    ASSERT_FALSE(result.ok());
    ASSERT_TRUE(result.error() == ErrorKind::CONFLICT);
    ASSERT_EQ(fx.db.count(fx.collection, nullptr), settings.insert_attempts);
}

/**
 * @brief Running out of free identifiers is a conflict, not an infrastructure failure.
 */
void test_store_create_conflict_on_exhausted_identifiers()
{
    core::StoreSettings settings;
    settings.allocation_attempts = 2;
    TunedStore fx(settings);

    infra::IdGenerator twin(fx.clock, settings.worker_id);
    for (int i = 0; i < settings.allocation_attempts; ++i) {
        std::string doc = R"({"_id":")" + std::to_string(twin.generate()) + R"("})";
        JsonPtr parsed(cJSON_Parse(doc.c_str()), cJSON_Delete);
        ASSERT_TRUE(fx.db.insert(fx.collection, parsed.get()) == storage::WriteStatus::OK);
    }

    auto result = fx.store.create(test::sample_input());
    ASSERT_TRUE(result.error() == ErrorKind::CONFLICT);
    ASSERT_EQ(fx.db.count(fx.collection, nullptr), settings.allocation_attempts);
}

/**
 * @brief An update cannot blank out a powerset that create insisted on.
 */
void test_store_update_rejects_blank_powersets()
{
    test::StoreFixture fx;
    std::string code = fx.store->create(test::sample_input()).value().shortcode;

    model::UpdateInput change;
    change.build_data = codec::Payload::compress_and_encode(test::sample_build_json());
    change.image_data = codec::Payload::compress_and_encode(test::sample_image());

    change.primary = std::string("");
    ASSERT_TRUE(fx.store->update(code, change).error() == ErrorKind::VALIDATION);

    change.primary.reset();
    change.secondary = std::string("   ");
    ASSERT_TRUE(fx.store->update(code, change).error() == ErrorKind::VALIDATION);

    auto stored = fx.store->retrieve(code).value();
    ASSERT_EQ(stored.primary, std::string("Fiery Aura"));
    ASSERT_EQ(stored.secondary, std::string("Fiery Melee"));
    ASSERT_TRUE(stored.expires_at.value() ==
                infra::from_epoch_ms(1767225600000LL) + std::chrono::hours(24 * 30));
}
