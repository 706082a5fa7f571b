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
 * @file payload.hpp
 * @brief Base64 + zlib codec for build, image and page payloads.
 *
 * @details
 * Clients upload payloads already deflated and base64-encoded; the server
 * stores them verbatim and only inflates them on read paths (file download,
 * image serving, legacy page preview).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace buildshare::codec {

/**
 * @class PayloadError
 * @brief A stored payload cannot be decoded or inflated.
 *
 * Deterministic for a given input: retrying the same bytes always fails.
 */
class PayloadError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

class Payload {
  public:
    /// @brief Upper bound on an inflated payload.
    static constexpr size_t MAX_INFLATED_BYTES = 64 * 1024 * 1024;

    /**
     * @brief Decodes base64 text and inflates the result.
     *
     * Accepts zlib- and gzip-wrapped deflate streams (detected from the header).
     *
     * @param base64_text Padded standard base64 (`A-Z a-z 0-9 + /`).
     * @return std::vector<uint8_t> The original uncompressed bytes.
     * @throws PayloadError On malformed base64, a corrupt or truncated stream,
     * trailing bytes after the stream, or output above `MAX_INFLATED_BYTES`.
     */
    static std::vector<uint8_t> decode_and_decompress(const std::string& base64_text);

    /**
     * @brief Deflates bytes (zlib wrapper) and base64-encodes the result.
     *
     * @throws PayloadError If zlib reports an error.
     */
    static std::string compress_and_encode(const std::vector<uint8_t>& raw);

    /// @overload
    static std::string compress_and_encode(const std::string& raw);

    /// @brief Plain base64 encoding without line breaks.
    static std::string base64_encode(const std::vector<uint8_t>& bytes);

    /**
     * @brief Plain base64 decoding.
     * @throws PayloadError On malformed input.
     */
    static std::vector<uint8_t> base64_decode(const std::string& text);
};

} // namespace buildshare::codec
