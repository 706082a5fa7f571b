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
 * @file url_builder.cpp
 * @brief Public links derived from a shortcode.
 */

#include "buildshare/core/url_builder.hpp"

#include "buildshare/infra/string.hpp"

#include <stdexcept>

namespace buildshare::core {

/**
 * @brief Validates the configured base URL and reduces it to its origin.
 *
 * @throws std::invalid_argument On an empty, relative or host-less URL, or an
 * empty protocol.
 */
UrlBuilder::UrlBuilder(const std::string& base_url, std::string protocol)
    : protocol_(infra::String::trim(protocol))
{
    std::string url = infra::String::trim(base_url);
    if (url.empty()) {
        throw std::invalid_argument("UrlBuilder: Base URL must be configured.");
    }
    if (protocol_.empty()) {
        throw std::invalid_argument("UrlBuilder: Protocol must be configured.");
    }

    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        throw std::invalid_argument("UrlBuilder: Base URL must be absolute: " + url);
    }

    // Path, query and fragment are replaced by the link path.
    size_t authority_end = url.find_first_of("/?#", scheme_end + 3);
    origin_ = url.substr(0, authority_end);
    if (origin_.size() == scheme_end + 3) {
        throw std::invalid_argument("UrlBuilder: Base URL has no host: " + url);
    }
}

std::string UrlBuilder::download_url(const std::string& shortcode) const
{
    return origin_ + "/build/download/" + shortcode;
}

std::string UrlBuilder::image_url(const std::string& shortcode) const
{
    return origin_ + "/build/image/" + shortcode + ".png";
}

/// @brief Custom-scheme link that opens the build in the desktop client.
std::string UrlBuilder::schema_url(const std::string& shortcode) const
{
    return protocol_ + "://" + shortcode;
}

} // namespace buildshare::core
