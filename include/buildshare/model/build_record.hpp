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
 * @file build_record.hpp
 * @brief The persisted build entity, its inputs, and its results.
 *
 * @details
 * **Document layout (current):**
 * @code
 * { "_id": "123...", "shortcode": "aB3x", "archetype": "Tanker",
 *   "primary": "Fire", "secondary": "Ice", "name": "...", "description": "...",
 *   "buildData": "<base64>", "imageData": "<base64>", "expiresAt": 1735689600000 }
 * @endcode
 *
 * **Legacy layout** (read-only): `Code`, `BuildData`, `ImageData`, `PageData`,
 * no archetype or power sets, usually no `expiresAt`.
 */

#pragma once

#include "buildshare/infra/clock.hpp"

#include <cJSON.h>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace buildshare::model {

/// @brief Document keys.
namespace field {
constexpr const char* ID = "_id";
constexpr const char* SHORTCODE = "shortcode";
constexpr const char* ARCHETYPE = "archetype";
constexpr const char* PRIMARY = "primary";
constexpr const char* SECONDARY = "secondary";
constexpr const char* NAME = "name";
constexpr const char* DESCRIPTION = "description";
constexpr const char* BUILD_DATA = "buildData";
constexpr const char* IMAGE_DATA = "imageData";
constexpr const char* EXPIRES_AT = "expiresAt";

constexpr const char* LEGACY_CODE = "Code";
constexpr const char* LEGACY_BUILD_DATA = "BuildData";
constexpr const char* LEGACY_IMAGE_DATA = "ImageData";
constexpr const char* LEGACY_PAGE_DATA = "PageData";
} // namespace field

/**
 * @class RecordFormatError
 * @brief A stored document cannot be mapped to a `BuildRecord`.
 */
class RecordFormatError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

struct BuildRecord {
    std::string id;
    std::string shortcode;
    std::string archetype;
    std::string primary;
    std::string secondary;
    std::optional<std::string> name;
    std::optional<std::string> description;

    /// @brief base64(zlib(build JSON)).
    std::string build_data;

    /// @brief base64(zlib(PNG)).
    std::string image_data;

    /// @brief base64(zlib(HTML)); legacy records only.
    std::optional<std::string> page_data;

    /// @brief Absent on legacy records, which never expire.
    std::optional<infra::TimePoint> expires_at;

    /// @brief Written by the earlier service (PascalCase keys, `Code`).
    bool legacy = false;
};

/// @brief Fields accepted when a build is submitted.
struct CreateInput {
    std::string archetype;
    std::string primary;
    std::string secondary;
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::string build_data;
    std::string image_data;
};

/**
 * @brief Fields accepted when a build is replaced.
 *
 * Unset optionals keep the stored value. Payloads are always replaced.
 */
struct UpdateInput {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> primary;
    std::optional<std::string> secondary;
    std::string build_data;
    std::string image_data;
};

/// @brief Links handed back after a create or update.
struct TransactionResult {
    std::string shortcode;
    std::string download_url;
    std::string image_url;
    std::string schema_url;

    /// @brief ISO 8601, UTC, millisecond precision.
    std::string expires_at;
};

/// @brief A regenerated `.mbd` file.
struct FileData {
    std::string file_name;
    std::vector<uint8_t> data_bytes;

    /**
     * @brief Download name for a record.
     *
     * `"{name} [{archetype}] ({primary} - {secondary}).mbd"`, without the name
     * part when the record has none, and `"{shortcode}.mbd"` for legacy records.
     */
    static std::string file_name_for(const BuildRecord& record);
};

/**
 * @brief Current-layout document for a record.
 *
 * @warning The caller owns the returned pointer.
 */
cJSON* to_document(const BuildRecord& record);

/**
 * @brief Maps a stored document (current or legacy layout) to a record.
 *
 * @throws RecordFormatError If `_id` or both code keys are missing, or a
 * present key has the wrong JSON type.
 */
BuildRecord from_document(const cJSON* doc);

} // namespace buildshare::model
