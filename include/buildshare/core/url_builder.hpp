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
 * @file url_builder.hpp
 * @brief Public links for a shortcode.
 */

#pragma once

#include <string>

namespace buildshare::core {

/**
 * @class UrlBuilder
 * @brief Pure string construction; never touches the network.
 *
 * @code
 * UrlBuilder urls("https://mids.app/api?x=1", "mrb");
 * urls.download_url("aB3"); // "https://mids.app/build/download/aB3"
 * urls.schema_url("aB3");   // "mrb://aB3"
 * @endcode
 */
class UrlBuilder {
  public:
    /**
     * @param base_url Absolute URL. Only its scheme and authority are used.
     * @param protocol Custom scheme for the desktop client.
     * @throws std::invalid_argument If either is empty or `base_url` has no `scheme://`.
     */
    UrlBuilder(const std::string& base_url, std::string protocol);

    std::string download_url(const std::string& shortcode) const;
    std::string image_url(const std::string& shortcode) const;
    std::string schema_url(const std::string& shortcode) const;

    /// @brief `scheme://authority`, without a trailing slash.
    const std::string& origin() const { return origin_; }

  private:
    std::string origin_;
    std::string protocol_;
};

} // namespace buildshare::core
