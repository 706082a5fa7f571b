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
 * @file build_file.hpp
 * @brief Typed form of a `.mbd` character build.
 *
 * @details
 * The desktop client uploads builds as JSON with PascalCase keys. Reading is
 * lenient about key case and missing members; writing always produces the
 * canonical PascalCase layout, indented, with absent optionals as `null`.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace buildshare::model {

/**
 * @class BuildFileError
 * @brief The build JSON is malformed or a member has the wrong type.
 */
class BuildFileError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// @brief Application and game database versions the build was made with.
struct MetaData {
    std::string app;
    std::string version;
    std::string database;
    std::string database_version;
};

struct EnhancementData {
    std::string uid;
    std::string grade = "None";
    int io_level = 1;
    std::string relative_level = "Even";
    bool obtained = false;
};

struct SubPowerData {
    std::string power_name;
    bool stat_include = false;
};

struct SlotData {
    int level = 0;
    bool is_inherent = false;
    std::optional<EnhancementData> enhancement;
    std::optional<EnhancementData> flipped_enhancement;
};

struct PowerData {
    std::string power_name;

    /// @brief -1 when the power has not been picked.
    int level = -1;

    bool stat_include = false;
    bool proc_include = false;
    int variable_value = 0;
    int inherent_slots_used = 0;
    std::vector<SubPowerData> sub_power_entries;
    std::vector<SlotData> slot_entries;
};

/**
 * @struct BuildFile
 * @brief A whole character build.
 */
struct BuildFile {
    std::optional<MetaData> built_with;
    std::string level;
    std::string class_name;
    std::string origin;
    std::string alignment;
    std::string name;
    std::optional<std::string> comment;
    std::vector<std::string> power_sets;
    int last_power = 0;

    /// @brief Empty power slots are kept as `std::nullopt`.
    std::vector<std::optional<PowerData>> power_entries;

    /**
     * @brief Parses build JSON.
     *
     * Keys are matched case-insensitively. Missing members and JSON `null`
     * keep their defaults.
     *
     * @throws BuildFileError If the text is not JSON, the root is not an
     * object, or a member has the wrong JSON type.
     */
    static BuildFile parse(const std::string& json_text);

    /// @overload
    static BuildFile parse(const std::vector<uint8_t>& json_bytes);

    /// @brief Indented PascalCase JSON.
    std::string serialize() const;
};

} // namespace buildshare::model
