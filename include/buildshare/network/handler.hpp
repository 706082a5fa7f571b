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
 * @file handler.hpp
 * @brief JSON command protocol in front of the build store.
 *
 * @details
 * The `Handler` is a thin adapter: it decodes a request object, calls one
 * `BuildStore` operation, and encodes the `OperationResult`. It holds no state
 * and makes no decisions the store does not already make.
 */

#pragma once

#include "buildshare/core/build_store.hpp"

#include <string>

namespace buildshare::network {

/**
 * @class Handler
 * @brief A static controller for interpreting requests and marshaling responses.
 *
 * @details
 * **Actions:**
 * | action     | arguments                  | data on success                         |
 * |------------|----------------------------|-----------------------------------------|
 * | `create`   | `build` object             | transaction result                      |
 * | `update`   | `code`, `build` object     | transaction result                      |
 * | `delete`   | `code`                     | none                                    |
 * | `retrieve` | `code`                     | full record                             |
 * | `exists`   | `code`                     | none                                    |
 * | `download` | `code`                     | `fileName`, base64 `content`            |
 * | `image`    | `code`                     | `contentType`, base64 `content`         |
 * | `page`     | `code`                     | `contentType`, HTML `content`           |
 * | `search`   | `criteria` (comma list)    | records without payloads                |
 * | `exit`     | none                       | closes the session                      |
 *
 * **Response Formats:**
 * - **Success:** `{"status": "ok", "message": "...", "data": ...}`
 * - **Error:** `{"status": "error", "message": "...", "error": "not_found"}`
 */
class Handler {
  public:
    /// @brief Exact response to `exit`; the server closes the session after sending it.
    static constexpr const char* GOODBYE = "{\"status\":\"goodbye\",\"message\":\"Closing connection\"}";

    /**
     * @brief Processes one request frame.
     *
     * @code
     * // Request:
     * { "action": "search", "criteria": "Tanker,Fire" }
     * @endcode
     *
     * @return std::string Compact JSON response. Never throws.
     */
    static std::string process(core::BuildStore& store, const std::string& raw_json);
};

} // namespace buildshare::network
