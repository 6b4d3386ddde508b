/**
 * @file udp_socket.hpp
 * @brief UDP socket for multicast and broadcast probing.
 *
 * RAII wrapper used by the SSDP and WS-Discovery probes: one request is sent
 * to a group or broadcast address and replies are collected until a deadline.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/net/export.hpp"
#include "camfleet/net/platform.hpp"

#include <cstdint>
#include <string>

namespace camfleet {
namespace net {

/**
 * @struct SocketAddress
 * @brief IPv4 address and port pair.
 */
struct CAMFLEET_NET_API SocketAddress {
    std::string ip;
    uint16_t port;

    SocketAddress() : ip("0.0.0.0"), port(0) {}
    SocketAddress(const std::string& ip_, uint16_t port_) : ip(ip_), port(port_) {}

    std::string toString() const { return ip + ":" + std::to_string(port); }

    bool operator==(const SocketAddress& other) const {
        return ip == other.ip && port == other.port;
    }
};

/**
 * @class UdpSocket
 * @brief RAII IPv4 datagram socket.
 *
 * Usage:
 * @code
 * UdpSocket sock;
 * sock.setMulticastTTL(2);
 * sock.sendTo(SocketAddress("239.255.255.250", 1900), request);
 *
 * std::string reply;
 * SocketAddress sender;
 * while (sock.receiveFrom(reply, 500, sender) > 0) { ... }
 * @endcode
 */
class CAMFLEET_NET_API UdpSocket {
public:
    /// receiveFrom() result when nothing arrived in time.
    static constexpr int kTimedOut = -2;

    UdpSocket();
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& other) noexcept;
    UdpSocket& operator=(UdpSocket&& other) noexcept;

    bool isValid() const { return socket_ != INVALID_SOCKET_HANDLE; }

    /**
     * @brief Bind the socket to a local port.
     * @param port The port to bind to (0 for auto-assign).
     * @param address The local address to bind to (default: any).
     */
    bool bind(uint16_t port, const std::string& address = "0.0.0.0");

    uint16_t getLocalPort() const;

    /**
     * @brief Enable SO_REUSEADDR (and SO_REUSEPORT where available). Call before bind().
     */
    bool setReuseAddress(bool enable);

    bool setBroadcast(bool enable);

    /**
     * @brief Set the multicast TTL (1 = local subnet only).
     */
    bool setMulticastTTL(int ttl);

    bool setMulticastLoopback(bool enable);

    /**
     * @brief Send a datagram.
     * @return Number of bytes sent, or -1 on error.
     */
    int sendTo(const SocketAddress& dest, const void* data, size_t length);
    int sendTo(const SocketAddress& dest, const std::string& payload) {
        return sendTo(dest, payload.data(), payload.size());
    }

    /**
     * @brief Receive one datagram with timeout.
     * @param timeoutMs Timeout in milliseconds (0 = non-blocking, -1 = infinite).
     * @return Number of bytes received (0 for an empty datagram), kTimedOut
     *         on timeout, -1 on error.
     */
    int receiveFrom(void* buffer, size_t bufferSize, int timeoutMs, SocketAddress& sender);

    /**
     * @brief Receive one datagram into @p payload (resized to the datagram length).
     */
    int receiveFrom(std::string& payload, int timeoutMs, SocketAddress& sender);

    void close();

    int getLastError() const { return lastError_; }
    std::string getLastErrorString() const { return socketErrorString(lastError_); }

private:
    SocketHandle socket_;
    int lastError_;

    void setLastError();
};

}  // namespace net
}  // namespace camfleet
