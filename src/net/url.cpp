/**
 * @file url.cpp
 * @brief URL splitting.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/net/url.hpp"
#include "camfleet/utils/string_utils.hpp"

#include <cstdlib>

namespace camfleet {
namespace net {

uint16_t Url::defaultPort(const std::string& scheme) {
    if (scheme == "http" || scheme == "ws") return 80;
    if (scheme == "https" || scheme == "wss") return 443;
    if (scheme == "rtsp") return 554;
    return 0;
}

std::string Url::hostHeader() const {
    if (port == 0 || port == defaultPort(scheme)) {
        return host;
    }
    return host + ":" + std::to_string(port);
}

std::optional<Url> Url::parse(const std::string& text) {
    size_t schemeEnd = text.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return std::nullopt;
    }

    Url url;
    url.scheme = utils::to_lower(text.substr(0, schemeEnd));

    size_t authorityStart = schemeEnd + 3;
    size_t pathStart = text.find_first_of("/?", authorityStart);
    std::string authority = text.substr(authorityStart,
        pathStart == std::string::npos ? std::string::npos : pathStart - authorityStart);

    if (pathStart == std::string::npos) {
        url.target = "/";
    } else if (text[pathStart] == '?') {
        url.target = "/" + text.substr(pathStart);
    } else {
        url.target = text.substr(pathStart);
    }

    size_t at = authority.rfind('@');
    if (at != std::string::npos) {
        url.userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
    }

    size_t colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        std::string portText = authority.substr(colon + 1);
        char* end = nullptr;
        long port = std::strtol(portText.c_str(), &end, 10);
        if (portText.empty() || *end != '\0' || port <= 0 || port > 65535) {
            return std::nullopt;
        }
        url.port = static_cast<uint16_t>(port);
        url.host = authority.substr(0, colon);
    } else {
        url.host = authority;
        url.port = defaultPort(url.scheme);
    }

    if (url.host.empty()) {
        return std::nullopt;
    }
    return url;
}

}  // namespace net
}  // namespace camfleet
