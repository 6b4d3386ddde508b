/**
 * @file ipv4_network.hpp
 * @brief IPv4 CIDR parsing and host enumeration.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/net/export.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace camfleet {
namespace net {

/**
 * @class Ipv4Network
 * @brief An IPv4 network such as 192.168.1.0/24.
 *
 * Host bits must be zero ("192.168.1.7/24" is rejected). hosts() excludes
 * the network and broadcast addresses except for /31 and /32.
 */
class CAMFLEET_NET_API Ipv4Network {
public:
    static std::optional<Ipv4Network> parse(const std::string& cidr);

    uint32_t network() const { return network_; }
    int prefixLength() const { return prefix_; }
    uint64_t hostCount() const;

    std::vector<std::string> hosts() const;
    bool contains(const std::string& ip) const;

    std::string toString() const;

private:
    Ipv4Network(uint32_t network, int prefix) : network_(network), prefix_(prefix) {}

    uint32_t network_;
    int prefix_;
};

/// True if @p text is a dotted-quad IPv4 address.
CAMFLEET_NET_API bool isIpv4Literal(const std::string& text);

/// Host-order conversions; ipv4FromString returns nullopt for non-literals.
CAMFLEET_NET_API std::optional<uint32_t> ipv4FromString(const std::string& text);
CAMFLEET_NET_API std::string ipv4ToString(uint32_t address);

}  // namespace net
}  // namespace camfleet
