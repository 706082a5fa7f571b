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
 * @file build_record.cpp
 * @brief Mapping between build records and stored documents.
 *
 * @details
 * Current documents use camelCase keys. Records written by the previous
 * service use PascalCase (`Code`, `BuildData`, `ImageData`, `PageData`) and
 * carry no expiry; both shapes map to the same `BuildRecord`.
 */

#include "buildshare/model/build_record.hpp"

namespace buildshare::model {

namespace {

/// @brief Reads an optional string member, trying each key in turn.
std::optional<std::string> read_string(const cJSON* doc, const char* key,
                                       const char* legacy_key = nullptr)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(doc, key);
    if (item == nullptr && legacy_key != nullptr) {
        item = cJSON_GetObjectItemCaseSensitive(doc, legacy_key);
    }
    if (item == nullptr || cJSON_IsNull(item)) {
        return std::nullopt;
    }
    if (!cJSON_IsString(item)) {
        throw RecordFormatError(std::string("Record: '") + key + "' must be a string");
    }
    return std::string(item->valuestring);
}

} // namespace

/**
 * @brief Download name of a record's build file.
 *
 * `Name [Archetype] (Primary - Secondary).mbd`, without the name part when the
 * record has none. Legacy records are named after their code.
 */
std::string FileData::file_name_for(const BuildRecord& record)
{
    if (record.legacy) {
        return record.shortcode + ".mbd";
    }
    std::string sets = "(" + record.primary + " - " + record.secondary + ").mbd";
    if (record.name && !record.name->empty()) {
        return *record.name + " [" + record.archetype + "] " + sets;
    }
    return record.archetype + " " + sets;
}

/**
 * @brief Serializes a record in the current layout. Caller owns the result.
 */
cJSON* to_document(const BuildRecord& record)
{
    cJSON* doc = cJSON_CreateObject();
    cJSON_AddStringToObject(doc, field::ID, record.id.c_str());
    cJSON_AddStringToObject(doc, field::SHORTCODE, record.shortcode.c_str());
    cJSON_AddStringToObject(doc, field::ARCHETYPE, record.archetype.c_str());
    cJSON_AddStringToObject(doc, field::PRIMARY, record.primary.c_str());
    cJSON_AddStringToObject(doc, field::SECONDARY, record.secondary.c_str());
    if (record.name) {
        cJSON_AddStringToObject(doc, field::NAME, record.name->c_str());
    }
    if (record.description) {
        cJSON_AddStringToObject(doc, field::DESCRIPTION, record.description->c_str());
    }
    cJSON_AddStringToObject(doc, field::BUILD_DATA, record.build_data.c_str());
    cJSON_AddStringToObject(doc, field::IMAGE_DATA, record.image_data.c_str());
    if (record.expires_at) {
        cJSON_AddNumberToObject(doc, field::EXPIRES_AT,
                                static_cast<double>(infra::to_epoch_ms(*record.expires_at)));
    }
    return doc;
}

/**
 * @brief Maps a stored document, current or legacy.
 *
 * @throws RecordFormatError On a missing `_id` or shortcode, or a mistyped field.
 */
BuildRecord from_document(const cJSON* doc)
{
    if (!cJSON_IsObject(doc)) {
        throw RecordFormatError("Record: Document is not an object");
    }

    BuildRecord record;

    std::optional<std::string> id = read_string(doc, field::ID);
    if (!id) {
        throw RecordFormatError("Record: Document has no _id");
    }
    record.id = *id;

    // A current shortcode wins over a legacy one
    if (std::optional<std::string> code = read_string(doc, field::SHORTCODE)) {
        record.shortcode = *code;
    } else if (std::optional<std::string> legacy = read_string(doc, field::LEGACY_CODE)) {
        record.shortcode = *legacy;
        record.legacy = true;
    } else {
        throw RecordFormatError("Record: Document " + record.id + " has no shortcode");
    }

    record.archetype = read_string(doc, field::ARCHETYPE).value_or("");
    record.primary = read_string(doc, field::PRIMARY).value_or("");
    record.secondary = read_string(doc, field::SECONDARY).value_or("");
    record.name = read_string(doc, field::NAME);
    record.description = read_string(doc, field::DESCRIPTION);
    record.build_data = read_string(doc, field::BUILD_DATA, field::LEGACY_BUILD_DATA).value_or("");
    record.image_data = read_string(doc, field::IMAGE_DATA, field::LEGACY_IMAGE_DATA).value_or("");
    record.page_data = read_string(doc, field::LEGACY_PAGE_DATA);

    const cJSON* expires = cJSON_GetObjectItemCaseSensitive(doc, field::EXPIRES_AT);
    if (cJSON_IsNumber(expires)) {
        record.expires_at = infra::from_epoch_ms(static_cast<int64_t>(expires->valuedouble));
    } else if (expires != nullptr && !cJSON_IsNull(expires)) {
        throw RecordFormatError("Record: 'expiresAt' must be epoch milliseconds");
    }
    return record;
}

} // namespace buildshare::model
