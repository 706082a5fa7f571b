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
 * @file build_store.cpp
 * @brief Implementation of the build record lifecycle.
 *
 * @details
 * Records are addressed by shortcode. Current records carry it in
 * `shortcode`; legacy records in `Code`. Both are indexed, so every lookup is
 * at most two index lookups. Writes then address the record by `_id`.
 */

#include "buildshare/core/build_store.hpp"

#include "buildshare/codec/base62.hpp"
#include "buildshare/codec/payload.hpp"
#include "buildshare/infra/logger.hpp"
#include "buildshare/infra/string.hpp"
#include "buildshare/model/build_file.hpp"

#include <cJSON.h>
#include <exception>
#include <memory>

namespace buildshare::core {

namespace {

using JsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

/// @brief Search precedence: a value may only be followed by values of the same or a later field.
constexpr const char* SEARCH_FIELDS[] = {model::field::ARCHETYPE, model::field::PRIMARY,
                                         model::field::SECONDARY};
constexpr int SEARCH_FIELD_COUNT = 3;

/// @brief `{field: value}` filter.
JsonPtr equality(const char* field, const std::string& value)
{
    JsonPtr query(cJSON_CreateObject(), &cJSON_Delete);
    cJSON_AddStringToObject(query.get(), field, value.c_str());
    return query;
}

bool blank(const std::string& s)
{
    return infra::String::trim(s).empty();
}

} // namespace

/**
 * @brief Wire name of an error kind, as sent in the `error` field of a response.
 */
const char* to_string(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::NONE:
        return "none";
    case ErrorKind::VALIDATION:
        return "validation";
    case ErrorKind::NOT_FOUND:
        return "not_found";
    case ErrorKind::CONFLICT:
        return "conflict";
    case ErrorKind::DATA_CORRUPTION:
        return "data_corruption";
    case ErrorKind::INFRASTRUCTURE:
        return "infrastructure";
    case ErrorKind::CANCELLED:
        return "cancelled";
    }
    return "unknown";
}

StoreSettings StoreSettings::from_config(const infra::Config& config)
{
    StoreSettings settings;
    settings.retention = std::chrono::hours(24 * config.retention_days);
    settings.worker_id = config.worker_id;
    settings.allocation_attempts = config.allocation_attempts;
    settings.insert_attempts = config.insert_attempts;
    return settings;
}

/**
 * @brief Wires the store to its collaborators.
 *
 * @throws std::invalid_argument On non-positive retention or insert attempts.
 * @throws std::out_of_range If the collection registry lacks the build entity.
 */
BuildStore::BuildStore(storage::Db& db, const storage::CollectionRegistry& collections,
                       UrlBuilder urls, StoreSettings settings, const infra::Clock& clock)
    : db_(db), collection_(collections.resolve(storage::CollectionRegistry::BUILD_RECORD)),
      urls_(std::move(urls)), settings_(settings), clock_(clock),
      allocator_(db, collection_, clock, settings.worker_id, settings.allocation_attempts)
{
    if (settings_.insert_attempts < 1) {
        throw std::invalid_argument("Store: At least one insert attempt is required");
    }
    if (settings_.retention.count() <= 0) {
        throw std::invalid_argument("Store: Retention must be positive");
    }
}

/**
 * @brief Declares the collection's indexes.
 *
 * Safe to call on every start: identical definitions are accepted as they
 * are. The TTL index on `expiresAt` is what `TtlMonitor` sweeps against.
 *
 * @throws std::runtime_error If any index cannot be ensured. Startup must abort.
 */
void BuildStore::initialize()
{
    storage::IndexOptions unique;
    unique.unique = true;

    storage::IndexOptions ttl;
    ttl.expire_after = std::chrono::seconds(0);

    const std::pair<const char*, storage::IndexOptions> indexes[] = {
        {model::field::SHORTCODE, unique},
        {model::field::EXPIRES_AT, ttl},
        {model::field::ARCHETYPE, {}},
        {model::field::PRIMARY, {}},
        {model::field::SECONDARY, {}},
        {model::field::LEGACY_CODE, {}},
    };

    for (const auto& [field, options] : indexes) {
        if (!db_.create_index(collection_, field, options)) {
            throw std::runtime_error("Store: Could not ensure index on " + collection_ + "." +
                                     field);
        }
    }
    infra::Logger::log(infra::LogLevel::INFO, "Store: Indexes ready on " + collection_);
}

/**
 * @brief Point lookup: current `shortcode` first, then legacy `Code`.
 *
 * @throws model::RecordFormatError If the stored document is malformed.
 */
std::optional<model::BuildRecord> BuildStore::find_by_code(const std::string& code) const
{
    JsonPtr doc(db_.find_one(collection_, equality(model::field::SHORTCODE, code).get()),
                &cJSON_Delete);
    if (!doc) {
        doc.reset(db_.find_one(collection_, equality(model::field::LEGACY_CODE, code).get()));
    }
    if (!doc) {
        return std::nullopt;
    }
    return model::from_document(doc.get());
}

infra::TimePoint BuildStore::next_expiry() const
{
    // Stored with millisecond precision; round now so the result matches the record.
    return infra::from_epoch_ms(infra::to_epoch_ms(clock_.now() + settings_.retention));
}

/// @brief Shortcode plus the links derived from it.
model::TransactionResult BuildStore::make_result(const std::string& shortcode,
                                                 infra::TimePoint expires_at) const
{
    model::TransactionResult result;
    result.shortcode = shortcode;
    result.download_url = urls_.download_url(shortcode);
    result.image_url = urls_.image_url(shortcode);
    result.schema_url = urls_.schema_url(shortcode);
    result.expires_at = infra::format_iso8601(expires_at);
    return result;
}

/**
 * @brief Create pipeline.
 *
 * 1. **Validation:** required fields, no I/O on failure.
 * 2. **Allocation:** a fresh Snowflake identifier; the shortcode is its Base62 form.
 * 3. **Insert:** one atomic write of the complete record. A duplicate key
 * (lost race on `_id` or `shortcode`) retries with a new identifier.
 */
OperationResult<model::TransactionResult> BuildStore::create(const model::CreateInput& input)
{
    using Result = OperationResult<model::TransactionResult>;

    // 1. Validation
    if (blank(input.primary) || blank(input.secondary)) {
        return Result::failure(ErrorKind::VALIDATION,
                               "Primary and Secondary powersets are required.");
    }
    if (blank(input.archetype)) {
        return Result::failure(ErrorKind::VALIDATION, "Archetype is required.");
    }
    if (input.build_data.empty() || input.image_data.empty()) {
        return Result::failure(ErrorKind::VALIDATION, "Build and image data are required.");
    }

    try {
        for (int attempt = 1; attempt <= settings_.insert_attempts; ++attempt) {
            // 2. Allocation
            uint64_t id = allocator_.allocate();

            model::BuildRecord record;
            record.id = std::to_string(id);
            record.shortcode = codec::Base62::encode(id);
            record.archetype = input.archetype;
            record.primary = input.primary;
            record.secondary = input.secondary;
            record.name = input.name;
            record.description = input.description;
            record.build_data = input.build_data;
            record.image_data = input.image_data;
            record.expires_at = next_expiry();

            // 3. Insert
            JsonPtr doc(model::to_document(record), &cJSON_Delete);
            storage::WriteStatus status = db_.insert(collection_, doc.get());

            if (status == storage::WriteStatus::OK) {
                infra::Logger::log(infra::LogLevel::INFO,
                                   "Store: Created build " + record.shortcode);
                return Result::success("Build created successfully",
                                       make_result(record.shortcode, *record.expires_at));
            }
            if (status != storage::WriteStatus::DUPLICATE_KEY) {
                return Result::failure(ErrorKind::INFRASTRUCTURE,
                                       std::string("Could not create the build record: ") +
                                           storage::to_string(status));
            }
            infra::Logger::log(infra::LogLevel::WARN, "Store: Duplicate key on insert (attempt " +
                                                          std::to_string(attempt) + ")");
        }
        return Result::failure(ErrorKind::CONFLICT,
                               "Could not create the build record: identifier collisions "
                               "persisted after " +
                                   std::to_string(settings_.insert_attempts) + " attempts");
    } catch (const AllocationError& e) {
        return Result::failure(ErrorKind::CONFLICT,
                               std::string("Could not create the build record: ") + e.what());
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::ERROR, std::string("Store: Create failed: ") + e.what());
        return Result::failure(ErrorKind::INFRASTRUCTURE,
                               std::string("Could not create the build record: ") + e.what());
    }
}

/**
 * @brief Update pipeline.
 *
 * 1. **Validation:** shortcode, payloads, and no blank powersets.
 * 2. **Lookup:** by current or legacy shortcode.
 * 3. **Write:** supplied optional fields, both payloads and a fresh `expiresAt`
 * in one `update_one`. A legacy record gains an expiry this way.
 */
OperationResult<model::TransactionResult> BuildStore::update(const std::string& code,
                                                             const model::UpdateInput& input)
{
    using Result = OperationResult<model::TransactionResult>;

    if (blank(code)) {
        return Result::failure(ErrorKind::VALIDATION, "Shortcode is required.");
    }
    if ((input.primary && blank(*input.primary)) || (input.secondary && blank(*input.secondary))) {
        return Result::failure(ErrorKind::VALIDATION,
                               "Primary and Secondary powersets cannot be blank.");
    }
    if (input.build_data.empty() || input.image_data.empty()) {
        return Result::failure(ErrorKind::VALIDATION, "Build and image data are required.");
    }

    try {
        std::optional<model::BuildRecord> existing = find_by_code(code);
        if (!existing) {
            return Result::failure(ErrorKind::NOT_FOUND, "Build record not found.");
        }

        // Sliding expiry: every successful update restarts the retention window
        infra::TimePoint expires_at = next_expiry();

        JsonPtr fields(cJSON_CreateObject(), &cJSON_Delete);
        if (input.name) {
            cJSON_AddStringToObject(fields.get(), model::field::NAME, input.name->c_str());
        }
        if (input.description) {
            cJSON_AddStringToObject(fields.get(), model::field::DESCRIPTION,
                                    input.description->c_str());
        }
        if (input.primary) {
            cJSON_AddStringToObject(fields.get(), model::field::PRIMARY, input.primary->c_str());
        }
        if (input.secondary) {
            cJSON_AddStringToObject(fields.get(), model::field::SECONDARY,
                                    input.secondary->c_str());
        }
        cJSON_AddStringToObject(fields.get(), model::field::BUILD_DATA, input.build_data.c_str());
        cJSON_AddStringToObject(fields.get(), model::field::IMAGE_DATA, input.image_data.c_str());
        cJSON_AddNumberToObject(fields.get(), model::field::EXPIRES_AT,
                                static_cast<double>(infra::to_epoch_ms(expires_at)));

        storage::WriteStatus status = db_.update_one(
            collection_, equality(model::field::ID, existing->id).get(), fields.get());

        // Removed or swept between lookup and write
        if (status == storage::WriteStatus::NOT_FOUND) {
            return Result::failure(ErrorKind::NOT_FOUND, "Build record not found.");
        }
        if (status != storage::WriteStatus::OK) {
            return Result::failure(ErrorKind::INFRASTRUCTURE,
                                   std::string("Could not update the build record: ") +
                                       storage::to_string(status));
        }

        infra::Logger::log(infra::LogLevel::INFO, "Store: Updated build " + existing->shortcode);
        return Result::success("Build updated successfully",
                               make_result(existing->shortcode, expires_at));
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::ERROR, std::string("Store: Update failed: ") + e.what());
        return Result::failure(ErrorKind::INFRASTRUCTURE,
                               std::string("Could not update the build record: ") + e.what());
    }
}

/**
 * @brief Deletes exactly the record answering to `code`.
 */
OperationResult<Unit> BuildStore::remove(const std::string& code)
{
    using Result = OperationResult<Unit>;
    const char* missing = "No record found with the given shortcode to delete.";

    if (blank(code)) {
        return Result::failure(ErrorKind::VALIDATION, "Shortcode is required.");
    }

    try {
        std::optional<model::BuildRecord> existing = find_by_code(code);
        if (!existing) {
            return Result::failure(ErrorKind::NOT_FOUND, missing);
        }

        storage::WriteStatus status =
            db_.remove_one(collection_, equality(model::field::ID, existing->id).get());
        if (status == storage::WriteStatus::NOT_FOUND) {
            return Result::failure(ErrorKind::NOT_FOUND, missing);
        }
        if (status != storage::WriteStatus::OK) {
            return Result::failure(ErrorKind::INFRASTRUCTURE,
                                   std::string("Could not delete the build record: ") +
                                       storage::to_string(status));
        }

        infra::Logger::log(infra::LogLevel::INFO, "Store: Deleted build " + code);
        return Result::success("Build successfully deleted.", Unit{});
    } catch (const std::exception& e) {
        return Result::failure(ErrorKind::INFRASTRUCTURE,
                               std::string("Could not delete the build record: ") + e.what());
    }
}

/**
 * @brief Full record, payloads included.
 *
 * Expired records that the monitor has not swept yet are still returned.
 */
OperationResult<model::BuildRecord> BuildStore::retrieve(const std::string& code)
{
    using Result = OperationResult<model::BuildRecord>;

    if (blank(code)) {
        return Result::failure(ErrorKind::VALIDATION, "Shortcode is required.");
    }

    try {
        std::optional<model::BuildRecord> record = find_by_code(code);
        if (!record) {
            return Result::failure(ErrorKind::NOT_FOUND, "No record found.");
        }
        return Result::success("Build retrieved successfully", std::move(*record));
    } catch (const model::RecordFormatError& e) {
        return Result::failure(ErrorKind::DATA_CORRUPTION,
                               std::string("Could not retrieve the build record: ") + e.what());
    } catch (const std::exception& e) {
        return Result::failure(ErrorKind::INFRASTRUCTURE,
                               std::string("Could not retrieve the build record: ") + e.what());
    }
}

OperationResult<Unit> BuildStore::exists(const std::string& code)
{
    // Counting avoids copying the payloads out of the store
    using Result = OperationResult<Unit>;

    if (blank(code)) {
        return Result::failure(ErrorKind::VALIDATION, "Shortcode is required.");
    }

    try {
        if (db_.count(collection_, equality(model::field::SHORTCODE, code).get()) > 0 ||
            db_.count(collection_, equality(model::field::LEGACY_CODE, code).get()) > 0) {
            return Result::success("Build located successfully", Unit{});
        }
        return Result::failure(ErrorKind::NOT_FOUND, "No record found.");
    } catch (const std::exception& e) {
        return Result::failure(ErrorKind::INFRASTRUCTURE,
                               std::string("Could not locate the build record: ") + e.what());
    }
}

/**
 * @brief Rebuilds the downloadable `.mbd` file.
 *
 * 1. **Lookup:** absence is `NOT_FOUND`.
 * 2. **Decode:** base64 and zlib; failure is `DATA_CORRUPTION`.
 * 3. **Reserialize:** the build file is parsed and written back indented.
 */
OperationResult<model::FileData> BuildStore::generate_file(const std::string& code)
{
    using Result = OperationResult<model::FileData>;

    if (blank(code)) {
        return Result::failure(ErrorKind::VALIDATION, "Shortcode is required.");
    }

    std::optional<model::BuildRecord> record;
    try {
        record = find_by_code(code);
    } catch (const model::RecordFormatError& e) {
        return Result::failure(ErrorKind::DATA_CORRUPTION,
                               std::string("Error processing the build record: ") + e.what());
    } catch (const std::exception& e) {
        return Result::failure(ErrorKind::INFRASTRUCTURE,
                               std::string("Could not retrieve the build record: ") + e.what());
    }
    if (!record) {
        return Result::failure(ErrorKind::NOT_FOUND, "No record found.");
    }

    try {
        std::vector<uint8_t> raw = codec::Payload::decode_and_decompress(record->build_data);
        std::string indented = model::BuildFile::parse(raw).serialize();

        model::FileData file;
        file.file_name = model::FileData::file_name_for(*record);
        file.data_bytes.assign(indented.begin(), indented.end());
        return Result::success("Successfully reconstructed the build file from the record.",
                               std::move(file));
    } catch (const codec::PayloadError& e) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Store: Undecodable build data on " + code + ": " + e.what());
        return Result::failure(ErrorKind::DATA_CORRUPTION,
                               std::string("Error processing the build record: ") + e.what());
    } catch (const model::BuildFileError& e) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Store: Unparseable build data on " + code + ": " + e.what());
        return Result::failure(ErrorKind::DATA_CORRUPTION,
                               std::string("Error processing the build record: ") + e.what());
    } catch (const std::exception& e) {
        return Result::failure(ErrorKind::INFRASTRUCTURE,
                               std::string("Error processing the build record: ") + e.what());
    }
}

/**
 * @brief Ordering check for multi-value searches.
 *
 * Each value is assigned the first field, at or after its predecessor's, in
 * which some record holds it. A value that only occurs in earlier fields is
 * out of order. A value that occurs nowhere imposes no constraint.
 */
bool BuildStore::values_in_order(const std::vector<std::string>& values) const
{
    int previous = 0;
    for (const auto& value : values) {
        int implied = -1;
        for (int idx = previous; idx < SEARCH_FIELD_COUNT; ++idx) {
            if (db_.count(collection_, equality(SEARCH_FIELDS[idx], value).get()) > 0) {
                implied = idx;
                break;
            }
        }
        if (implied >= 0) {
            previous = implied;
            continue;
        }
        for (int idx = 0; idx < previous; ++idx) {
            if (db_.count(collection_, equality(SEARCH_FIELDS[idx], value).get()) > 0) {
                return false;
            }
        }
    }
    return true;
}

/**
 * @brief Loose multi-value search.
 *
 * A record matches when any of its archetype, primary or secondary equals any
 * supplied value. Records that fail to map are logged and skipped.
 */
OperationResult<std::vector<model::BuildRecord>>
BuildStore::search(const std::string& criteria, const infra::CancellationToken* cancel)
{
    using Result = OperationResult<std::vector<model::BuildRecord>>;

    std::vector<std::string> values = infra::String::split(criteria, ',');
    if (values.empty()) {
        return Result::failure(ErrorKind::VALIDATION, "At least one search parameter is required.");
    }

    try {
        if (values.size() > 1 && !values_in_order(values)) {
            return Result::failure(
                ErrorKind::VALIDATION,
                "Parameters must be listed in order when multiple parameters are provided.");
        }
        if (cancel != nullptr && cancel->is_cancelled()) {
            return Result::failure(ErrorKind::CANCELLED, "Search was cancelled.");
        }

        // values x fields, all alternatives of one $or
        JsonPtr query(cJSON_CreateObject(), &cJSON_Delete);
        cJSON* any = cJSON_AddArrayToObject(query.get(), "$or");
        for (const auto& value : values) {
            for (const char* field : SEARCH_FIELDS) {
                cJSON_AddItemToArray(any, equality(field, value).release());
            }
        }

        JsonPtr found(db_.find(collection_, query.get(), cancel), &cJSON_Delete);
        if (!found) {
            return Result::failure(ErrorKind::CANCELLED, "Search was cancelled.");
        }

        std::vector<model::BuildRecord> records;
        cJSON* doc = nullptr;
        cJSON_ArrayForEach(doc, found.get())
        {
            try {
                records.push_back(model::from_document(doc));
            } catch (const model::RecordFormatError& e) {
                infra::Logger::log(infra::LogLevel::WARN,
                                   std::string("Store: Skipping malformed record: ") + e.what());
            }
        }

        if (records.empty()) {
            return Result::failure(ErrorKind::NOT_FOUND,
                                   "No build records found matching the criteria.");
        }
        return Result::success("Build records retrieved successfully", std::move(records));
    } catch (const std::exception& e) {
        return Result::failure(ErrorKind::INFRASTRUCTURE,
                               std::string("Error retrieving build records: ") + e.what());
    }
}

/**
 * @brief Decoded PNG preview of a record.
 */
OperationResult<std::vector<uint8_t>> BuildStore::retrieve_image(const std::string& code)
{
    using Result = OperationResult<std::vector<uint8_t>>;

    OperationResult<model::BuildRecord> record = retrieve(code);
    if (!record.ok()) {
        return Result::failure(record.error(), record.message());
    }
    if (record.value().image_data.empty()) {
        return Result::failure(ErrorKind::NOT_FOUND, "No image data found.");
    }

    try {
        return Result::success("Image retrieved successfully",
                               codec::Payload::decode_and_decompress(record.value().image_data));
    } catch (const codec::PayloadError& e) {
        return Result::failure(ErrorKind::DATA_CORRUPTION,
                               std::string("Error processing the build image: ") + e.what());
    } catch (const std::exception& e) {
        return Result::failure(ErrorKind::INFRASTRUCTURE,
                               std::string("Error processing the build image: ") + e.what());
    }
}

/**
 * @brief Decoded HTML page. Only legacy records carry one.
 */
OperationResult<std::string> BuildStore::retrieve_page(const std::string& code)
{
    using Result = OperationResult<std::string>;

    OperationResult<model::BuildRecord> record = retrieve(code);
    if (!record.ok()) {
        return Result::failure(record.error(), record.message());
    }
    if (!record.value().page_data || record.value().page_data->empty()) {
        return Result::failure(ErrorKind::NOT_FOUND, "No page data found.");
    }

    try {
        std::vector<uint8_t> html = codec::Payload::decode_and_decompress(*record.value().page_data);
        return Result::success("Page retrieved successfully", std::string(html.begin(), html.end()));
    } catch (const codec::PayloadError& e) {
        return Result::failure(ErrorKind::DATA_CORRUPTION,
                               std::string("Error processing the build page: ") + e.what());
    } catch (const std::exception& e) {
        return Result::failure(ErrorKind::INFRASTRUCTURE,
                               std::string("Error processing the build page: ") + e.what());
    }
}

} // namespace buildshare::core
