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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to
 * `std::string` used to sanitize configuration values and search criteria.
 */

#pragma once

#include <string>
#include <vector>

namespace buildshare::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * Whitespace is whatever `std::isspace` classifies as such in the "C" locale
     * (space, `\t`, `\n`, `\r`, `\v`, `\f`).
     *
     * @param s The source string to process.
     * @return std::string The trimmed content; empty if `s` is all whitespace.
     *
     * @code
     * std::string clean = buildshare::infra::String::trim("  Tanker \n"); // "Tanker"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Splits a delimited list, trimming each entry and dropping empty ones.
     *
     * @param s The delimited text (e.g. `"Tanker, Fire,,Ice"`).
     * @param delimiter The separator character.
     * @return std::vector<std::string> The non-empty entries in their original order.
     *
     * @code
     * auto parts = buildshare::infra::String::split("Tanker, Fire,,Ice", ',');
     * // {"Tanker", "Fire", "Ice"}
     * @endcode
     */
    static std::vector<std::string> split(const std::string& s, char delimiter);
};

} // namespace buildshare::infra
