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
 * @file payload.cpp
 * @brief Payload codec on top of OpenSSL's EVP base64 and zlib.
 */

#include "buildshare/codec/payload.hpp"

#include <cstring>
#include <memory>
#include <openssl/evp.h>
#include <zlib.h>

namespace buildshare::codec {

namespace {

constexpr size_t CHUNK_SIZE = 32768;

/// @brief Owns an `EVP_ENCODE_CTX` for the duration of one decode.
struct EncodeCtxDeleter {
    void operator()(EVP_ENCODE_CTX* ctx) const { EVP_ENCODE_CTX_free(ctx); }
};

/// @brief Releases inflate state on every exit path.
class InflateGuard {
  public:
    explicit InflateGuard(z_stream& zs) : zs_(zs) {}
    ~InflateGuard() { inflateEnd(&zs_); }

  private:
    z_stream& zs_;
};

} // namespace

std::string Payload::base64_encode(const std::vector<uint8_t>& bytes)
{
    if (bytes.empty()) {
        return "";
    }

    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), bytes.data(),
                                  static_cast<int>(bytes.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

/**
 * @brief Strict base64 decoding through the EVP streaming decoder.
 *
 * Unlike `EVP_DecodeBlock`, the streaming API honors `=` padding, so the
 * output length is exact, and it rejects any character outside the alphabet.
 */
std::vector<uint8_t> Payload::base64_decode(const std::string& text)
{
    std::unique_ptr<EVP_ENCODE_CTX, EncodeCtxDeleter> ctx(EVP_ENCODE_CTX_new());
    if (!ctx) {
        throw PayloadError("Payload: Unable to allocate base64 decoder");
    }
    EVP_DecodeInit(ctx.get());

    std::vector<uint8_t> out(3 * (text.size() / 4) + 3);
    int total = 0;
    int len = 0;

    if (EVP_DecodeUpdate(ctx.get(), out.data(), &len,
                         reinterpret_cast<const unsigned char*>(text.data()),
                         static_cast<int>(text.size())) < 0) {
        throw PayloadError("Payload: Malformed base64 data");
    }
    total += len;

    if (EVP_DecodeFinal(ctx.get(), out.data() + total, &len) < 0) {
        throw PayloadError("Payload: Truncated base64 data");
    }
    total += len;

    out.resize(static_cast<size_t>(total));
    return out;
}

/**
 * @brief Inflates a zlib or gzip stream.
 *
 * **Failure Modes:**
 * - Header or data errors reported by zlib.
 * - Input exhausted before `Z_STREAM_END` (truncation).
 * - Unconsumed input after `Z_STREAM_END` (trailing garbage).
 * - Output larger than `MAX_INFLATED_BYTES`.
 */
std::vector<uint8_t> Payload::decode_and_decompress(const std::string& base64_text)
{
    std::vector<uint8_t> compressed = base64_decode(base64_text);
    if (compressed.empty()) {
        throw PayloadError("Payload: Empty compressed stream");
    }

    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));

    // 15 window bits + 32 enables automatic zlib/gzip header detection.
    if (inflateInit2(&zs, 15 + 32) != Z_OK) {
        throw PayloadError("Payload: inflateInit failed");
    }
    InflateGuard guard(zs);

    zs.next_in = compressed.data();
    zs.avail_in = static_cast<uInt>(compressed.size());

    std::vector<uint8_t> out;
    uint8_t buffer[CHUNK_SIZE];
    int ret = Z_OK;

    while (ret != Z_STREAM_END) {
        zs.next_out = buffer;
        zs.avail_out = sizeof(buffer);

        ret = inflate(&zs, Z_NO_FLUSH);
        if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
            ret == Z_STREAM_ERROR) {
            throw PayloadError(std::string("Payload: Corrupt compressed stream (") +
                               (zs.msg ? zs.msg : "zlib error " + std::to_string(ret)) + ")");
        }

        size_t produced = sizeof(buffer) - zs.avail_out;
        if (out.size() + produced > MAX_INFLATED_BYTES) {
            throw PayloadError("Payload: Inflated size exceeds limit");
        }
        out.insert(out.end(), buffer, buffer + produced);

        if (ret == Z_BUF_ERROR || (ret == Z_OK && zs.avail_in == 0 && produced == 0)) {
            throw PayloadError("Payload: Truncated compressed stream");
        }
    }

    if (zs.avail_in != 0) {
        throw PayloadError("Payload: Trailing data after compressed stream");
    }
    return out;
}

/**
 * @brief zlib at maximum compression, then base64.
 * @throws PayloadError If zlib reports an error.
 */
std::string Payload::compress_and_encode(const std::vector<uint8_t>& raw)
{
    uLongf bound = compressBound(static_cast<uLong>(raw.size()));
    std::vector<uint8_t> compressed(bound);

    int ret = compress2(compressed.data(), &bound, raw.data(), static_cast<uLong>(raw.size()),
                        Z_BEST_COMPRESSION);
    if (ret != Z_OK) {
        throw PayloadError("Payload: Compression failed (zlib error " + std::to_string(ret) + ")");
    }
    compressed.resize(bound);
    return base64_encode(compressed);
}

std::string Payload::compress_and_encode(const std::string& raw)
{
    return compress_and_encode(std::vector<uint8_t>(raw.begin(), raw.end()));
}

} // namespace buildshare::codec
