/**
 * @file url.hpp
 * @brief Split absolute URLs (http, https, ws, wss, rtsp) into parts.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/net/export.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace camfleet {
namespace net {

struct CAMFLEET_NET_API Url {
    std::string scheme;    ///< lower-case
    std::string userinfo;  ///< "user:pass" or empty
    std::string host;
    uint16_t port = 0;     ///< explicit or scheme default
    std::string target;    ///< path plus query, always starts with '/'

    bool isSecure() const { return scheme == "https" || scheme == "wss"; }

    /// host, or host:port when the port is not the scheme default
    std::string hostHeader() const;

    /**
     * @brief Parse @p text. Returns nullopt for a missing scheme or host.
     */
    static std::optional<Url> parse(const std::string& text);

    static uint16_t defaultPort(const std::string& scheme);
};

}  // namespace net
}  // namespace camfleet
