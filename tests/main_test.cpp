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
 * @file main_test.cpp
 * @brief Central orchestrator for the BuildShare test suite.
 */

#include "buildshare/infra/logger.hpp"
#include "framework.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================

// Infrastructure (infra_test.cpp)
void test_snowflake_layout();
void test_snowflake_monotonic_under_frozen_clock();
void test_snowflake_unique_across_threads();
void test_snowflake_rejects_wide_worker();
void test_string_trim();
void test_string_split();
void test_iso8601_format();
void test_manual_clock_advance();
void test_scheduler_runs_all_tasks();
void test_logger_parse_level();
void test_config_defaults_and_overrides();
void test_config_rejects_invalid();
void test_config_load_file();

// Codecs (codec_test.cpp)
void test_base62_known_values();
void test_base62_u64_roundtrip();
void test_base62_byte_buffers();
void test_base62_rejects_bad_input();
void test_base64_known_vector();
void test_payload_roundtrip();
void test_payload_rejects_corruption();

// Storage Engine (storage_test.cpp)
void test_db_insert_and_find();
void test_db_rejects_invalid_documents();
void test_db_persistence();
void test_db_update_and_remove_missing();
void test_db_unique_index();
void test_db_unique_index_refused_over_duplicates();
void test_db_index_idempotence();
void test_db_index_definitions_survive_restart();
void test_db_or_query();
void test_query_matching_rules();
void test_db_find_cancelled();
void test_db_sweep_expired();
void test_ttl_monitor_run_once();
void test_db_compaction_keeps_live_documents();
void test_engine_log_roundtrip();
void test_collection_registry();

// Record Model (model_test.cpp)
void test_build_file_parse();
void test_build_file_lenient_keys();
void test_build_file_rejects_bad_shapes();
void test_build_file_serialize_stable();
void test_record_document_mapping();
void test_record_legacy_document();
void test_record_rejects_malformed();
void test_file_name_for_current_records();

// Build Store (store_test.cpp)
void test_url_builder();
void test_identifier_allocator_bounds();
void test_store_create();
void test_store_create_validation();
void test_store_update();
void test_store_remove();
void test_store_survives_restart();
void test_store_generate_file();
void test_store_corrupt_payload();
void test_store_image_and_page();
void test_store_search();
void test_store_concurrent_creates();
void test_store_records_expire();
void test_store_legacy_records();
void test_store_rejects_bad_settings();
void test_identifier_allocator_skips_legacy_codes();
void test_store_create_retries_duplicate_shortcode();
void test_store_create_gives_up_after_insert_attempts();
void test_store_create_conflict_on_exhausted_identifiers();
void test_store_update_rejects_blank_powersets();

// Network Protocol (handler_test.cpp)
void test_handle_create_and_lookup();
void test_handle_update_search_delete();
void test_handle_invalid_requests();
void test_frame_codec();
void test_server_session();
void test_accept_error_classification();
void test_server_survives_client_reset();

/**
 * @return 0 when every test passed, 1 otherwise.
 */
int main()
{
    buildshare::infra::Logger::set_level(buildshare::infra::LogLevel::ERROR);
    std::cout << "\033[36mInitiating BuildShare Test Suite...\033[0m" << std::endl;

    // --- 1. Infrastructure ---
    // Identifier packing, strings, clocks, worker pool, configuration.
    RUN_TEST(test_snowflake_layout);
    RUN_TEST(test_snowflake_monotonic_under_frozen_clock);
    RUN_TEST(test_snowflake_unique_across_threads);
    RUN_TEST(test_snowflake_rejects_wide_worker);
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_split);
    RUN_TEST(test_iso8601_format);
    RUN_TEST(test_manual_clock_advance);
    RUN_TEST(test_scheduler_runs_all_tasks);
    RUN_TEST(test_logger_parse_level);
    RUN_TEST(test_config_defaults_and_overrides);
    RUN_TEST(test_config_rejects_invalid);
    RUN_TEST(test_config_load_file);

    // --- 2. Codecs ---
    // Base-62 shortcodes and compressed payloads.
    RUN_TEST(test_base62_known_values);
    RUN_TEST(test_base62_u64_roundtrip);
    RUN_TEST(test_base62_byte_buffers);
    RUN_TEST(test_base62_rejects_bad_input);
    RUN_TEST(test_base64_known_vector);
    RUN_TEST(test_payload_roundtrip);
    RUN_TEST(test_payload_rejects_corruption);

    // --- 3. Storage Engine ---
    // Log replay, indexes, queries, expiry.
    RUN_TEST(test_db_insert_and_find);
    RUN_TEST(test_db_rejects_invalid_documents);
    RUN_TEST(test_db_persistence);
    RUN_TEST(test_db_update_and_remove_missing);
    RUN_TEST(test_db_unique_index);
    RUN_TEST(test_db_unique_index_refused_over_duplicates);
    RUN_TEST(test_db_index_idempotence);
    RUN_TEST(test_db_index_definitions_survive_restart);
    RUN_TEST(test_db_or_query);
    RUN_TEST(test_query_matching_rules);
    RUN_TEST(test_db_find_cancelled);
    RUN_TEST(test_db_sweep_expired);
    RUN_TEST(test_ttl_monitor_run_once);
    RUN_TEST(test_db_compaction_keeps_live_documents);
    RUN_TEST(test_engine_log_roundtrip);
    RUN_TEST(test_collection_registry);

    // --- 4. Record Model ---
    // Build file schema and document mapping.
    RUN_TEST(test_build_file_parse);
    RUN_TEST(test_build_file_lenient_keys);
    RUN_TEST(test_build_file_rejects_bad_shapes);
    RUN_TEST(test_build_file_serialize_stable);
    RUN_TEST(test_record_document_mapping);
    RUN_TEST(test_record_legacy_document);
    RUN_TEST(test_record_rejects_malformed);
    RUN_TEST(test_file_name_for_current_records);

    // --- 5. Build Store ---
    // Record lifecycle, search and expiry end to end.
    RUN_TEST(test_url_builder);
    RUN_TEST(test_identifier_allocator_bounds);
    RUN_TEST(test_store_create);
    RUN_TEST(test_store_create_validation);
    RUN_TEST(test_store_update);
    RUN_TEST(test_store_remove);
    RUN_TEST(test_store_survives_restart);
    RUN_TEST(test_store_generate_file);
    RUN_TEST(test_store_corrupt_payload);
    RUN_TEST(test_store_image_and_page);
    RUN_TEST(test_store_search);
    RUN_TEST(test_store_concurrent_creates);
    RUN_TEST(test_store_records_expire);
    RUN_TEST(test_store_legacy_records);
    RUN_TEST(test_store_rejects_bad_settings);
    RUN_TEST(test_identifier_allocator_skips_legacy_codes);
    RUN_TEST(test_store_create_retries_duplicate_shortcode);
    RUN_TEST(test_store_create_gives_up_after_insert_attempts);
    RUN_TEST(test_store_create_conflict_on_exhausted_identifiers);
    RUN_TEST(test_store_update_rejects_blank_powersets);

    // --- 6. Network Protocol ---
    // JSON-In -> Store-Execute -> JSON-Out, plus framing.
    RUN_TEST(test_handle_create_and_lookup);
    RUN_TEST(test_handle_update_search_delete);
    RUN_TEST(test_handle_invalid_requests);
    RUN_TEST(test_frame_codec);
    RUN_TEST(test_server_session);
    RUN_TEST(test_accept_error_classification);
    RUN_TEST(test_server_survives_client_reset);

    buildshare::test::print_summary();
    return (buildshare::test::failed_count == 0) ? 0 : 1;
}
