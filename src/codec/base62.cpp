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
 * @file base62.cpp
 * @brief Arbitrary-precision base-62 conversion.
 *
 * @details
 * Both directions work on a big-endian byte buffer treated as a base-256
 * number, so identifiers of any width (8-byte Snowflakes, 12-byte object ids)
 * use the same code path.
 */

#include "buildshare/codec/base62.hpp"

#include <algorithm>
#include <stdexcept>

namespace buildshare::codec {

int Base62::digit_of(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'z')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'Z')
        return c - 'A' + 36;
    return -1;
}

/**
 * @brief Encodes by repeated long division of the byte buffer by 62.
 *
 * Each pass divides the whole number by 62, collects the remainder as the next
 * least significant digit, and drops leading zero bytes from the quotient.
 */
std::string Base62::encode(const std::vector<uint8_t>& bytes)
{
    std::vector<uint8_t> number(bytes.begin(), bytes.end());
    auto first = std::find_if(number.begin(), number.end(), [](uint8_t b) { return b != 0; });
    number.erase(number.begin(), first);

    if (number.empty()) {
        return std::string(1, ALPHABET[0]);
    }

    std::string digits;
    while (!number.empty()) {
        uint32_t remainder = 0;
        std::vector<uint8_t> quotient;
        quotient.reserve(number.size());

        for (uint8_t byte : number) {
            uint32_t accumulator = (remainder << 8) | byte;
            uint8_t q = static_cast<uint8_t>(accumulator / 62);
            remainder = accumulator % 62;
            if (!quotient.empty() || q != 0) {
                quotient.push_back(q);
            }
        }

        digits.push_back(ALPHABET[remainder]);
        number.swap(quotient);
    }

    std::reverse(digits.begin(), digits.end());
    return digits;
}

std::string Base62::encode(uint64_t value)
{
    std::vector<uint8_t> bytes(8);
    for (int i = 7; i >= 0; --i) {
        bytes[i] = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
    return encode(bytes);
}

/**
 * @brief Decodes by multiply-accumulate into a growing byte buffer.
 *
 * For each digit: `number = number * 62 + digit`, propagating the carry from
 * the least significant byte upwards and prepending a byte when it overflows.
 */
std::vector<uint8_t> Base62::decode(const std::string& text)
{
    if (text.empty()) {
        throw std::invalid_argument("Base62: Cannot decode an empty string");
    }

    std::vector<uint8_t> number{0};
    for (size_t pos = 0; pos < text.size(); ++pos) {
        int digit = digit_of(text[pos]);
        if (digit < 0) {
            throw std::invalid_argument("Base62: Invalid character '" + std::string(1, text[pos]) +
                                        "' at position " + std::to_string(pos));
        }

        uint32_t carry = static_cast<uint32_t>(digit);
        for (auto it = number.rbegin(); it != number.rend(); ++it) {
            uint32_t accumulator = static_cast<uint32_t>(*it) * 62 + carry;
            *it = static_cast<uint8_t>(accumulator & 0xFF);
            carry = accumulator >> 8;
        }
        while (carry > 0) {
            number.insert(number.begin(), static_cast<uint8_t>(carry & 0xFF));
            carry >>= 8;
        }
    }

    auto first = std::find_if(number.begin(), number.end(), [](uint8_t b) { return b != 0; });
    if (first == number.end()) {
        return {0};
    }
    number.erase(number.begin(), first);
    return number;
}

/**
 * @brief Decodes a shortcode back to its numeric identifier.
 * @throws std::out_of_range If the value needs more than 64 bits.
 */
uint64_t Base62::decode_u64(const std::string& text)
{
    std::vector<uint8_t> bytes = decode(text);
    if (bytes.size() > 8) {
        throw std::out_of_range("Base62: '" + text + "' does not fit in 64 bits");
    }

    // Big-endian, as produced by encode(uint64_t)
    uint64_t value = 0;
    for (uint8_t byte : bytes) {
        value = (value << 8) | byte;
    }
    return value;
}

} // namespace buildshare::codec
