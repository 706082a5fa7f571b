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
 * @file handler.cpp
 * @brief Request decoding, store dispatch, response encoding.
 *
 * @details
 * 1. **Ingest**: parse the frame as a JSON object.
 * 2. **Decode**: read `action` and its typed arguments.
 * 3. **Execute**: call the matching `BuildStore` operation.
 * 4. **Respond**: encode the result; bytes travel as base64.
 */

#include "buildshare/network/handler.hpp"

#include "buildshare/codec/payload.hpp"
#include "buildshare/infra/logger.hpp"

#include <cJSON.h>
#include <cstdlib>
#include <optional>
#include <stdexcept>

namespace buildshare::network {

namespace {

/// @brief A request argument is missing or mistyped.
class RequestError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// @brief A string argument; absent and `null` both mean "not supplied".
std::optional<std::string> optional_string(const cJSON* obj, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (item == nullptr || cJSON_IsNull(item)) {
        return std::nullopt;
    }
    if (!cJSON_IsString(item)) {
        throw RequestError(std::string("Argument '") + key + "' must be a string");
    }
    return std::string(item->valuestring);
}

std::string required_string(const cJSON* obj, const char* key)
{
    std::optional<std::string> value = optional_string(obj, key);
    if (!value) {
        throw RequestError(std::string("Missing argument: '") + key + "'");
    }
    return *value;
}

const cJSON* required_object(const cJSON* obj, const char* key)
{
    const cJSON* item = cJSON_GetObjectItemCaseSensitive(obj, key);
    if (!cJSON_IsObject(item)) {
        throw RequestError(std::string("Missing payload: '") + key + "'");
    }
    return item;
}

cJSON* transaction_json(const model::TransactionResult& tx)
{
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddStringToObject(obj, "shortcode", tx.shortcode.c_str());
    cJSON_AddStringToObject(obj, "downloadUrl", tx.download_url.c_str());
    cJSON_AddStringToObject(obj, "imageUrl", tx.image_url.c_str());
    cJSON_AddStringToObject(obj, "schemaUrl", tx.schema_url.c_str());
    cJSON_AddStringToObject(obj, "expiresAt", tx.expires_at.c_str());
    return obj;
}

cJSON* record_json(const model::BuildRecord& record, bool with_payloads)
{
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddStringToObject(obj, "id", record.id.c_str());
    cJSON_AddStringToObject(obj, "shortcode", record.shortcode.c_str());
    cJSON_AddStringToObject(obj, "archetype", record.archetype.c_str());
    cJSON_AddStringToObject(obj, "primary", record.primary.c_str());
    cJSON_AddStringToObject(obj, "secondary", record.secondary.c_str());
    if (record.name) {
        cJSON_AddStringToObject(obj, "name", record.name->c_str());
    }
    if (record.description) {
        cJSON_AddStringToObject(obj, "description", record.description->c_str());
    }
    if (record.expires_at) {
        cJSON_AddStringToObject(obj, "expiresAt", infra::format_iso8601(*record.expires_at).c_str());
    } else {
        cJSON_AddNullToObject(obj, "expiresAt");
    }
    cJSON_AddBoolToObject(obj, "legacy", record.legacy);
    if (with_payloads) {
        cJSON_AddStringToObject(obj, "buildData", record.build_data.c_str());
        cJSON_AddStringToObject(obj, "imageData", record.image_data.c_str());
    }
    return obj;
}

/// @brief Copies the outcome of a store call into the response object.
template <typename T>
bool apply(cJSON* resp, const core::OperationResult<T>& result, std::string& msg)
{
    msg = result.message();
    if (!result.ok()) {
        cJSON_AddStringToObject(resp, "error", core::to_string(result.error()));
    }
    return result.ok();
}

model::CreateInput create_input(const cJSON* build)
{
    model::CreateInput input;
    input.archetype = optional_string(build, "archetype").value_or("");
    input.primary = optional_string(build, "primary").value_or("");
    input.secondary = optional_string(build, "secondary").value_or("");
    input.name = optional_string(build, "name");
    input.description = optional_string(build, "description");
    input.build_data = optional_string(build, "buildData").value_or("");
    input.image_data = optional_string(build, "imageData").value_or("");
    return input;
}

model::UpdateInput update_input(const cJSON* build)
{
    model::UpdateInput input;
    input.name = optional_string(build, "name");
    input.description = optional_string(build, "description");
    input.primary = optional_string(build, "primary");
    input.secondary = optional_string(build, "secondary");
    input.build_data = optional_string(build, "buildData").value_or("");
    input.image_data = optional_string(build, "imageData").value_or("");
    return input;
}

/// @brief Executes one decoded action; returns true on success.
bool dispatch(core::BuildStore& store, const std::string& action, const cJSON* req, cJSON* resp,
              std::string& msg)
{
    if (action == "create") {
        auto result = store.create(create_input(required_object(req, "build")));
        if (apply(resp, result, msg)) {
            cJSON_AddItemToObject(resp, "data", transaction_json(result.value()));
        }
        return result.ok();
    }

    // Actions without a shortcode argument
    if (action == "search") {
        auto result = store.search(required_string(req, "criteria"));
        if (apply(resp, result, msg)) {
            cJSON* data = cJSON_AddArrayToObject(resp, "data");
            for (const auto& record : result.value()) {
                cJSON_AddItemToArray(data, record_json(record, false));
            }
        }
        return result.ok();
    }

    // Every remaining action addresses one record
    std::string code = required_string(req, "code");

    if (action == "update") {
        auto result = store.update(code, update_input(required_object(req, "build")));
        if (apply(resp, result, msg)) {
            cJSON_AddItemToObject(resp, "data", transaction_json(result.value()));
        }
        return result.ok();
    }
    if (action == "delete") {
        return apply(resp, store.remove(code), msg);
    }
    if (action == "exists") {
        return apply(resp, store.exists(code), msg);
    }
    if (action == "retrieve") {
        auto result = store.retrieve(code);
        if (apply(resp, result, msg)) {
            cJSON_AddItemToObject(resp, "data", record_json(result.value(), true));
        }
        return result.ok();
    }
    // Binary payloads travel base64-encoded inside the JSON response
    if (action == "download") {
        auto result = store.generate_file(code);
        if (apply(resp, result, msg)) {
            cJSON* data = cJSON_AddObjectToObject(resp, "data");
            cJSON_AddStringToObject(data, "fileName", result.value().file_name.c_str());
            cJSON_AddStringToObject(
                data, "content", codec::Payload::base64_encode(result.value().data_bytes).c_str());
        }
        return result.ok();
    }
    if (action == "image") {
        auto result = store.retrieve_image(code);
        if (apply(resp, result, msg)) {
            cJSON* data = cJSON_AddObjectToObject(resp, "data");
            cJSON_AddStringToObject(data, "contentType", "image/png");
            cJSON_AddStringToObject(data, "content",
                                    codec::Payload::base64_encode(result.value()).c_str());
        }
        return result.ok();
    }
    if (action == "page") {
        auto result = store.retrieve_page(code);
        if (apply(resp, result, msg)) {
            cJSON* data = cJSON_AddObjectToObject(resp, "data");
            cJSON_AddStringToObject(data, "contentType", "text/html");
            cJSON_AddStringToObject(data, "content", result.value().c_str());
        }
        return result.ok();
    }

    msg = "Unknown action opcode: " + action;
    cJSON_AddStringToObject(resp, "error", core::to_string(core::ErrorKind::VALIDATION));
    return false;
}

/// @brief Standalone error document for failures before or outside dispatch.
std::string error_response(const std::string& message, core::ErrorKind kind)
{
    cJSON* resp = cJSON_CreateObject();
    cJSON_AddStringToObject(resp, "status", "error");
    cJSON_AddStringToObject(resp, "message", message.c_str());
    cJSON_AddStringToObject(resp, "error", core::to_string(kind));
    char* raw = cJSON_PrintUnformatted(resp);
    std::string out = raw != nullptr ? raw : "{\"status\":\"error\"}";
    free(raw);
    cJSON_Delete(resp);
    return out;
}

} // namespace

/**
 * @brief Main request processing pipeline.
 *
 * Malformed requests map to `validation`; an unexpected exception from below
 * the store is logged and maps to `infrastructure`.
 */
std::string Handler::process(core::BuildStore& store, const std::string& raw_json)
{
    // 1. Ingest
    if (raw_json.empty()) {
        return error_response("Empty request payload", core::ErrorKind::VALIDATION);
    }

    cJSON* req = cJSON_Parse(raw_json.c_str());
    if (!cJSON_IsObject(req)) {
        cJSON_Delete(req);
        return error_response("Invalid JSON syntax", core::ErrorKind::VALIDATION);
    }

    // 2. Decode
    const cJSON* act = cJSON_GetObjectItemCaseSensitive(req, "action");
    std::string action = cJSON_IsString(act) ? act->valuestring : "";

    if (action == "exit") {
        cJSON_Delete(req);
        return GOODBYE;
    }

    cJSON* resp_root = cJSON_CreateObject();
    bool success = false;
    std::string msg;

    // 3. Execute
    try {
        success = dispatch(store, action, req, resp_root, msg);
    } catch (const RequestError& e) {
        cJSON_Delete(resp_root);
        cJSON_Delete(req);
        return error_response(e.what(), core::ErrorKind::VALIDATION);
    } catch (const std::exception& e) {
        infra::Logger::log(infra::LogLevel::ERROR,
                           "Network: Action '" + action + "' failed: " + e.what());
        cJSON_Delete(resp_root);
        cJSON_Delete(req);
        return error_response(e.what(), core::ErrorKind::INFRASTRUCTURE);
    }

    // 4. Respond
    cJSON_AddStringToObject(resp_root, "status", success ? "ok" : "error");
    if (!msg.empty()) {
        cJSON_AddStringToObject(resp_root, "message", msg.c_str());
    }

    char* raw_output = cJSON_PrintUnformatted(resp_root);
    std::string final_response =
        raw_output != nullptr ? raw_output
                              : error_response("Response serialization failed",
                                               core::ErrorKind::INFRASTRUCTURE);

    free(raw_output);
    cJSON_Delete(resp_root);
    cJSON_Delete(req);

    return final_response;
}

} // namespace buildshare::network
