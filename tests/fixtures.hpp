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
 * @file fixtures.hpp
 * @brief Sample build files and store wiring shared by the record-level tests.
 */

#pragma once

#include "buildshare/codec/payload.hpp"
#include "buildshare/core/build_store.hpp"
#include "buildshare/infra/clock.hpp"
#include "buildshare/storage/collections.hpp"
#include "buildshare/storage/db.hpp"
#include "framework.hpp"

#include <memory>
#include <string>
#include <vector>

namespace buildshare::test {

/// @brief A small but complete build file as the desktop client writes it.
inline std::string sample_build_json()
{
    return R"({
  "BuiltWith": { "App": "Mids Reborn", "Version": "3.7.0", "Database": "Homecoming", "DatabaseVersion": "2025.7.1" },
  "Level": "50",
  "Class": "Class_Tanker",
  "Origin": "Science",
  "Alignment": "Hero",
  "Name": "Blaze",
  "Comment": null,
  "PowerSets": ["Tanker_Defense.Fiery_Aura", "Tanker_Melee.Fiery_Melee", ""],
  "LastPower": 24,
  "PowerEntries": [
    {
      "PowerName": "Tanker_Defense.Fiery_Aura.Blazing_Aura",
      "Level": 0,
      "StatInclude": true,
      "ProcInclude": false,
      "VariableValue": 0,
      "InherentSlotsUsed": 0,
      "SubPowerEntries": [],
      "SlotEntries": [
        { "Level": 0, "IsInherent": false,
          "Enhancement": { "Uid": "Crafted_Damage", "Grade": "None", "IoLevel": 49,
                           "RelativeLevel": "Even", "Obtained": false },
          "FlippedEnhancement": null }
      ]
    },
    null
  ]
})";
}

/// @brief Any bytes stand in for the PNG preview; the store never decodes images.
inline std::vector<uint8_t> sample_image()
{
    return {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A, 1, 2, 3, 4};
}

inline model::CreateInput sample_input(const std::string& archetype = "Tanker",
                                       const std::string& primary = "Fiery Aura",
                                       const std::string& secondary = "Fiery Melee")
{
    model::CreateInput input;
    input.archetype = archetype;
    input.primary = primary;
    input.secondary = secondary;
    input.name = std::string("Blaze");
    input.build_data = codec::Payload::compress_and_encode(sample_build_json());
    input.image_data = codec::Payload::compress_and_encode(sample_image());
    return input;
}

/**
 * @struct StoreFixture
 * @brief A fully initialized store over a scratch directory and a manual clock.
 */
struct StoreFixture {
    TempDir dir;
    infra::ManualClock clock{infra::from_epoch_ms(1767225600000LL)}; // 2026-01-01T00:00:00Z
    std::unique_ptr<storage::Db> db;
    storage::CollectionRegistry collections;
    std::unique_ptr<core::BuildStore> store;

    StoreFixture() { open(); }

    /// @brief Drops the store and database, then reloads them from disk.
    void reopen()
    {
        store.reset();
        db.reset();
        open();
    }

  private:
    void open()
    {
        db = std::make_unique<storage::Db>(dir.path());
        store = std::make_unique<core::BuildStore>(
            *db, collections, core::UrlBuilder("https://mids.app", "mrb"), core::StoreSettings{},
            clock);
        store->initialize();
    }
};

} // namespace buildshare::test
