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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "buildshare/infra/string.hpp"

#include <cctype>

namespace buildshare::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note The cast to `unsigned char` avoids undefined behavior in `std::isspace`
 * for negative `char` values (UTF-8 continuation bytes on signed-char platforms).
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::vector<std::string> String::split(const std::string& s, char delimiter)
{
    std::vector<std::string> parts;
    std::string::size_type begin = 0;

    while (begin <= s.size()) {
        std::string::size_type end = s.find(delimiter, begin);
        if (end == std::string::npos) {
            end = s.size();
        }

        std::string part = trim(s.substr(begin, end - begin));
        if (!part.empty()) {
            parts.push_back(std::move(part));
        }
        begin = end + 1;
    }
    return parts;
}

} // namespace buildshare::infra
