/**
 * @file ipv4_network.cpp
 * @brief IPv4 CIDR parsing and host enumeration.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/net/ipv4_network.hpp"
#include "camfleet/net/platform.hpp"
#include "camfleet/utils/string_utils.hpp"

#include <cstdlib>

namespace camfleet {
namespace net {

std::optional<uint32_t> ipv4FromString(const std::string& text) {
    struct in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return std::nullopt;
    }
    return ntohl(addr.s_addr);
}

std::string ipv4ToString(uint32_t address) {
    struct in_addr addr{};
    addr.s_addr = htonl(address);
    char buf[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr, buf, sizeof(buf));
    return buf;
}

bool isIpv4Literal(const std::string& text) {
    return ipv4FromString(text).has_value();
}

std::optional<Ipv4Network> Ipv4Network::parse(const std::string& cidr) {
    std::string text = utils::trim(cidr);
    size_t slash = text.find('/');

    std::string addrText = text.substr(0, slash);
    int prefix = 32;
    if (slash != std::string::npos) {
        std::string prefixText = text.substr(slash + 1);
        char* end = nullptr;
        long value = std::strtol(prefixText.c_str(), &end, 10);
        if (prefixText.empty() || *end != '\0' || value < 0 || value > 32) {
            return std::nullopt;
        }
        prefix = static_cast<int>(value);
    }

    auto addr = ipv4FromString(addrText);
    if (!addr) {
        return std::nullopt;
    }

    uint32_t mask = prefix == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix));
    if ((*addr & ~mask) != 0) {
        return std::nullopt;
    }
    return Ipv4Network(*addr, prefix);
}

uint64_t Ipv4Network::hostCount() const {
    uint64_t total = 1ull << (32 - prefix_);
    return prefix_ >= 31 ? total : total - 2;
}

std::vector<std::string> Ipv4Network::hosts() const {
    std::vector<std::string> out;
    uint64_t total = 1ull << (32 - prefix_);
    uint64_t first = prefix_ >= 31 ? 0 : 1;
    uint64_t last = prefix_ >= 31 ? total : total - 1;
    out.reserve(static_cast<size_t>(last - first));
    for (uint64_t i = first; i < last; ++i) {
        out.push_back(ipv4ToString(static_cast<uint32_t>(network_ + i)));
    }
    return out;
}

bool Ipv4Network::contains(const std::string& ip) const {
    auto addr = ipv4FromString(ip);
    if (!addr) {
        return false;
    }
    uint32_t mask = prefix_ == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix_));
    return (*addr & mask) == network_;
}

std::string Ipv4Network::toString() const {
    return ipv4ToString(network_) + "/" + std::to_string(prefix_);
}

}  // namespace net
}  // namespace camfleet
