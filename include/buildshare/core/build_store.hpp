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
 * @file build_store.hpp
 * @brief Lifecycle of shared build records.
 *
 * @details
 * `BuildStore` validates requests, assigns identifiers and shortcodes, keeps
 * the expiry window current, and turns stored payloads back into files. All
 * synchronization lives in `storage::Db`; the store itself holds no locks and
 * may be called from any number of threads.
 */

#pragma once

#include "buildshare/core/identifier_allocator.hpp"
#include "buildshare/core/result.hpp"
#include "buildshare/core/url_builder.hpp"
#include "buildshare/infra/cancellation.hpp"
#include "buildshare/infra/clock.hpp"
#include "buildshare/infra/config.hpp"
#include "buildshare/model/build_record.hpp"
#include "buildshare/storage/collections.hpp"
#include "buildshare/storage/db.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace buildshare::core {

/**
 * @struct StoreSettings
 * @brief Tunables of the store.
 */
struct StoreSettings {
    /// @brief Lifetime granted by every create and update.
    std::chrono::milliseconds retention = std::chrono::hours(24 * 30);

    uint32_t worker_id = 0;
    int allocation_attempts = IdentifierAllocator::DEFAULT_ATTEMPTS;

    /// @brief Inserts retried with a fresh identifier after a duplicate key.
    int insert_attempts = 3;

    static StoreSettings from_config(const infra::Config& config);
};

/**
 * @class BuildStore
 * @brief Create, update, delete, look up, search and regenerate build records.
 *
 * Every operation returns an `OperationResult`; no exception leaves the store.
 */
class BuildStore {
  public:
    /**
     * @param db Backing document store. Must outlive the store.
     * @param collections Resolves the `BuildRecord` collection.
     * @param urls Link builder for transaction results.
     * @param settings Retention and retry bounds.
     * @param clock Time source for expiry and identifiers. Must outlive the store.
     */
    BuildStore(storage::Db& db, const storage::CollectionRegistry& collections, UrlBuilder urls,
               StoreSettings settings, const infra::Clock& clock);

    /**
     * @brief Ensures the indexes the store relies on.
     *
     * Unique `shortcode`, TTL on `expiresAt`, plain indexes on the search
     * fields and on the legacy `Code`. Safe to call on every startup.
     *
     * @throws std::runtime_error If any index cannot be created.
     */
    void initialize();

    /**
     * @brief Stores a new build.
     *
     * @code
     * auto result = store.create(input);
     * if (result.ok()) share(result.value().download_url);
     * @endcode
     */
    OperationResult<model::TransactionResult> create(const model::CreateInput& input);

    /// @brief Replaces payloads, applies supplied fields, and restarts the expiry window.
    OperationResult<model::TransactionResult> update(const std::string& code,
                                                     const model::UpdateInput& input);

    OperationResult<Unit> remove(const std::string& code);

    OperationResult<model::BuildRecord> retrieve(const std::string& code);

    OperationResult<Unit> exists(const std::string& code);

    /**
     * @brief Rebuilds the `.mbd` file of a record.
     *
     * Payloads that fail to inflate or parse are `DATA_CORRUPTION`.
     */
    OperationResult<model::FileData> generate_file(const std::string& code);

    /**
     * @brief Finds records whose archetype, primary or secondary equals any
     * of the comma-separated values.
     *
     * With several values they must follow archetype, primary, secondary
     * order, judged by where each value actually occurs in stored records.
     */
    OperationResult<std::vector<model::BuildRecord>>
    search(const std::string& criteria, const infra::CancellationToken* cancel = nullptr);

    /// @brief Decompressed PNG preview of a record.
    OperationResult<std::vector<uint8_t>> retrieve_image(const std::string& code);

    /// @brief Decompressed HTML page of a legacy record.
    OperationResult<std::string> retrieve_page(const std::string& code);

    const std::string& collection() const { return collection_; }

  private:
    storage::Db& db_;
    std::string collection_;
    UrlBuilder urls_;
    StoreSettings settings_;
    const infra::Clock& clock_;
    IdentifierAllocator allocator_;

    std::optional<model::BuildRecord> find_by_code(const std::string& code) const;
    model::TransactionResult make_result(const std::string& shortcode,
                                         infra::TimePoint expires_at) const;
    infra::TimePoint next_expiry() const;
    bool values_in_order(const std::vector<std::string>& values) const;
};

} // namespace buildshare::core
