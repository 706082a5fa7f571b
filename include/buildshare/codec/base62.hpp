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
 * @file base62.hpp
 * @brief Base-62 shortcode codec.
 *
 * @details
 * Shortcodes are the base-62 rendering of a record identifier. The input bytes
 * are read as one unsigned big-endian integer and written most-significant
 * digit first, using the alphabet `0-9`, then `a-z`, then `A-Z`.
 *
 * @warning The alphabet order is part of every shortcode ever issued. Changing
 * it would silently re-map existing codes.
 *
 * The codec is exact on numeric value only. Leading zero bytes are not
 * preserved: `encode({0x00, 0x01}) == encode({0x01}) == "1"`, and `decode("1")`
 * returns `{0x01}`.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace buildshare::codec {

class Base62 {
  public:
    /// @brief The 62 digit symbols, in digit-value order.
    static constexpr std::string_view ALPHABET =
        "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ";

    /**
     * @brief Encodes a big-endian unsigned integer.
     *
     * @param bytes The integer, most significant byte first. May be empty.
     * @return std::string The base-62 digits; `"0"` for zero or empty input.
     */
    static std::string encode(const std::vector<uint8_t>& bytes);

    /// @brief Encodes a 64-bit identifier.
    static std::string encode(uint64_t value);

    /**
     * @brief Decodes a shortcode to its minimal big-endian byte form.
     *
     * @return std::vector<uint8_t> Minimal bytes; the value zero yields `{0x00}`.
     * @throws std::invalid_argument On an empty string or a character outside `ALPHABET`.
     */
    static std::vector<uint8_t> decode(const std::string& text);

    /**
     * @brief Decodes a shortcode that must fit in 64 bits.
     *
     * @throws std::invalid_argument On an empty string or a character outside `ALPHABET`.
     * @throws std::out_of_range If the value exceeds `UINT64_MAX`.
     */
    static uint64_t decode_u64(const std::string& text);

  private:
    /// @brief Maps a symbol to its digit value, or -1.
    static int digit_of(char c);
};

} // namespace buildshare::codec
