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
 * @file build_file.cpp
 * @brief cJSON mapping for `BuildFile`.
 */

#include "buildshare/model/build_file.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <memory>

namespace buildshare::model {

namespace {

using JsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

/// @brief Member lookup; `nullptr` for a missing or JSON `null` member.
const cJSON* member(const cJSON* obj, const char* key)
{
    const cJSON* item = cJSON_GetObjectItem(obj, key);
    return cJSON_IsNull(item) ? nullptr : item;
}

void read_string(const cJSON* obj, const char* key, std::string& out)
{
    const cJSON* item = member(obj, key);
    if (item == nullptr) {
        return;
    }
    if (!cJSON_IsString(item)) {
        throw BuildFileError(std::string("BuildFile: '") + key + "' must be a string");
    }
    out = item->valuestring;
}

void read_int(const cJSON* obj, const char* key, int& out)
{
    const cJSON* item = member(obj, key);
    if (item == nullptr) {
        return;
    }
    if (!cJSON_IsNumber(item)) {
        throw BuildFileError(std::string("BuildFile: '") + key + "' must be a number");
    }
    out = item->valueint;
}

void read_bool(const cJSON* obj, const char* key, bool& out)
{
    const cJSON* item = member(obj, key);
    if (item == nullptr) {
        return;
    }
    if (!cJSON_IsBool(item)) {
        throw BuildFileError(std::string("BuildFile: '") + key + "' must be a boolean");
    }
    out = cJSON_IsTrue(item);
}

const cJSON* read_object(const cJSON* obj, const char* key)
{
    const cJSON* item = member(obj, key);
    if (item != nullptr && !cJSON_IsObject(item)) {
        throw BuildFileError(std::string("BuildFile: '") + key + "' must be an object");
    }
    return item;
}

const cJSON* read_array(const cJSON* obj, const char* key)
{
    const cJSON* item = member(obj, key);
    if (item != nullptr && !cJSON_IsArray(item)) {
        throw BuildFileError(std::string("BuildFile: '") + key + "' must be an array");
    }
    return item;
}

EnhancementData parse_enhancement(const cJSON* obj)
{
    EnhancementData enh;
    read_string(obj, "Uid", enh.uid);
    read_string(obj, "Grade", enh.grade);
    read_int(obj, "IoLevel", enh.io_level);
    read_string(obj, "RelativeLevel", enh.relative_level);
    read_bool(obj, "Obtained", enh.obtained);
    return enh;
}

SlotData parse_slot(const cJSON* obj)
{
    SlotData slot;
    read_int(obj, "Level", slot.level);
    read_bool(obj, "IsInherent", slot.is_inherent);
    if (const cJSON* enh = read_object(obj, "Enhancement")) {
        slot.enhancement = parse_enhancement(enh);
    }
    if (const cJSON* enh = read_object(obj, "FlippedEnhancement")) {
        slot.flipped_enhancement = parse_enhancement(enh);
    }
    return slot;
}

PowerData parse_power(const cJSON* obj)
{
    PowerData power;
    read_string(obj, "PowerName", power.power_name);
    read_int(obj, "Level", power.level);
    read_bool(obj, "StatInclude", power.stat_include);
    read_bool(obj, "ProcInclude", power.proc_include);
    read_int(obj, "VariableValue", power.variable_value);
    read_int(obj, "InherentSlotsUsed", power.inherent_slots_used);

    const cJSON* subs = read_array(obj, "SubPowerEntries");
    const cJSON* slots = read_array(obj, "SlotEntries");

    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, subs)
    {
        if (!cJSON_IsObject(item)) {
            throw BuildFileError("BuildFile: 'SubPowerEntries' items must be objects");
        }
        SubPowerData sub;
        read_string(item, "PowerName", sub.power_name);
        read_bool(item, "StatInclude", sub.stat_include);
        power.sub_power_entries.push_back(std::move(sub));
    }

    cJSON_ArrayForEach(item, slots)
    {
        if (!cJSON_IsObject(item)) {
            throw BuildFileError("BuildFile: 'SlotEntries' items must be objects");
        }
        power.slot_entries.push_back(parse_slot(item));
    }
    return power;
}

/// @brief An empty slot is written as `null`, as the desktop client expects.
cJSON* enhancement_to_json(const std::optional<EnhancementData>& enh)
{
    if (!enh) {
        return cJSON_CreateNull();
    }
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddStringToObject(obj, "Uid", enh->uid.c_str());
    cJSON_AddStringToObject(obj, "Grade", enh->grade.c_str());
    cJSON_AddNumberToObject(obj, "IoLevel", enh->io_level);
    cJSON_AddStringToObject(obj, "RelativeLevel", enh->relative_level.c_str());
    cJSON_AddBoolToObject(obj, "Obtained", enh->obtained);
    return obj;
}

cJSON* power_to_json(const PowerData& power)
{
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddStringToObject(obj, "PowerName", power.power_name.c_str());
    cJSON_AddNumberToObject(obj, "Level", power.level);
    cJSON_AddBoolToObject(obj, "StatInclude", power.stat_include);
    cJSON_AddBoolToObject(obj, "ProcInclude", power.proc_include);
    cJSON_AddNumberToObject(obj, "VariableValue", power.variable_value);
    cJSON_AddNumberToObject(obj, "InherentSlotsUsed", power.inherent_slots_used);

    cJSON* subs = cJSON_AddArrayToObject(obj, "SubPowerEntries");
    for (const auto& sub : power.sub_power_entries) {
        cJSON* s = cJSON_CreateObject();
        cJSON_AddStringToObject(s, "PowerName", sub.power_name.c_str());
        cJSON_AddBoolToObject(s, "StatInclude", sub.stat_include);
        cJSON_AddItemToArray(subs, s);
    }

    cJSON* slots = cJSON_AddArrayToObject(obj, "SlotEntries");
    for (const auto& slot : power.slot_entries) {
        cJSON* s = cJSON_CreateObject();
        cJSON_AddNumberToObject(s, "Level", slot.level);
        cJSON_AddBoolToObject(s, "IsInherent", slot.is_inherent);
        cJSON_AddItemToObject(s, "Enhancement", enhancement_to_json(slot.enhancement));
        cJSON_AddItemToObject(s, "FlippedEnhancement",
                              enhancement_to_json(slot.flipped_enhancement));
        cJSON_AddItemToArray(slots, s);
    }
    return obj;
}

} // namespace

/**
 * @brief Parses a build file.
 *
 * Missing members keep their defaults; present members of the wrong type are
 * rejected.
 *
 * @throws BuildFileError On invalid JSON or a mistyped member.
 */
BuildFile BuildFile::parse(const std::string& json_text)
{
    JsonPtr root(cJSON_Parse(json_text.c_str()), &cJSON_Delete);
    if (!root) {
        throw BuildFileError("BuildFile: Build data is not valid JSON");
    }
    if (!cJSON_IsObject(root.get())) {
        throw BuildFileError("BuildFile: Build data must be a JSON object");
    }

    const cJSON* obj = root.get();
    BuildFile file;

    if (const cJSON* meta = read_object(obj, "BuiltWith")) {
        MetaData data;
        read_string(meta, "App", data.app);
        read_string(meta, "Version", data.version);
        read_string(meta, "Database", data.database);
        read_string(meta, "DatabaseVersion", data.database_version);
        file.built_with = std::move(data);
    }

    read_string(obj, "Level", file.level);
    read_string(obj, "Class", file.class_name);
    read_string(obj, "Origin", file.origin);
    read_string(obj, "Alignment", file.alignment);
    read_string(obj, "Name", file.name);

    if (const cJSON* comment = member(obj, "Comment")) {
        if (!cJSON_IsString(comment)) {
            throw BuildFileError("BuildFile: 'Comment' must be a string");
        }
        file.comment = comment->valuestring;
    }

    const cJSON* sets = read_array(obj, "PowerSets");
    const cJSON* entries = read_array(obj, "PowerEntries");

    const cJSON* item = nullptr;
    cJSON_ArrayForEach(item, sets)
    {
        if (!cJSON_IsString(item)) {
            throw BuildFileError("BuildFile: 'PowerSets' items must be strings");
        }
        file.power_sets.emplace_back(item->valuestring);
    }

    read_int(obj, "LastPower", file.last_power);

    // `null` marks an unpicked power slot and must survive the round trip
    cJSON_ArrayForEach(item, entries)
    {
        if (cJSON_IsNull(item)) {
            file.power_entries.emplace_back(std::nullopt);
        } else if (cJSON_IsObject(item)) {
            file.power_entries.emplace_back(parse_power(item));
        } else {
            throw BuildFileError("BuildFile: 'PowerEntries' items must be objects or null");
        }
    }
    return file;
}

BuildFile BuildFile::parse(const std::vector<uint8_t>& json_bytes)
{
    return parse(std::string(json_bytes.begin(), json_bytes.end()));
}

/**
 * @brief Writes the file back, indented, with keys in the client's order.
 */
std::string BuildFile::serialize() const
{
    JsonPtr root(cJSON_CreateObject(), &cJSON_Delete);
    cJSON* obj = root.get();

    if (built_with) {
        cJSON* meta = cJSON_AddObjectToObject(obj, "BuiltWith");
        cJSON_AddStringToObject(meta, "App", built_with->app.c_str());
        cJSON_AddStringToObject(meta, "Version", built_with->version.c_str());
        cJSON_AddStringToObject(meta, "Database", built_with->database.c_str());
        cJSON_AddStringToObject(meta, "DatabaseVersion", built_with->database_version.c_str());
    } else {
        cJSON_AddNullToObject(obj, "BuiltWith");
    }

    cJSON_AddStringToObject(obj, "Level", level.c_str());
    cJSON_AddStringToObject(obj, "Class", class_name.c_str());
    cJSON_AddStringToObject(obj, "Origin", origin.c_str());
    cJSON_AddStringToObject(obj, "Alignment", alignment.c_str());
    cJSON_AddStringToObject(obj, "Name", name.c_str());
    if (comment) {
        cJSON_AddStringToObject(obj, "Comment", comment->c_str());
    } else {
        cJSON_AddNullToObject(obj, "Comment");
    }

    cJSON* sets = cJSON_AddArrayToObject(obj, "PowerSets");
    for (const auto& set : power_sets) {
        cJSON_AddItemToArray(sets, cJSON_CreateString(set.c_str()));
    }

    cJSON_AddNumberToObject(obj, "LastPower", last_power);

    cJSON* entries = cJSON_AddArrayToObject(obj, "PowerEntries");
    for (const auto& entry : power_entries) {
        cJSON_AddItemToArray(entries, entry ? power_to_json(*entry) : cJSON_CreateNull());
    }

    char* raw = cJSON_Print(obj);
    if (raw == nullptr) {
        throw BuildFileError("BuildFile: Serialization failed");
    }
    std::string out(raw);
    free(raw);
    return out;
}

} // namespace buildshare::model
