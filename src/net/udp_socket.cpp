/**
 * @file udp_socket.cpp
 * @brief IPv4 datagram socket implementation.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/net/udp_socket.hpp"
#include "camfleet/utils/logger.hpp"

#include <vector>

namespace camfleet {
namespace net {

UdpSocket::UdpSocket()
    : socket_(INVALID_SOCKET_HANDLE)
    , lastError_(0)
{
    socket_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        setLastError();
        LOG_ERROR("UdpSocket", "Failed to create socket: {}", getLastErrorString());
    }
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& other) noexcept
    : socket_(other.socket_)
    , lastError_(other.lastError_)
{
    other.socket_ = INVALID_SOCKET_HANDLE;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        lastError_ = other.lastError_;
        other.socket_ = INVALID_SOCKET_HANDLE;
    }
    return *this;
}

bool UdpSocket::bind(uint16_t port, const std::string& address) {
    if (!isValid()) {
        return false;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);

    if (address.empty() || address == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("UdpSocket", "Invalid bind address: {}", address);
        return false;
    }

    if (::bind(socket_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) != 0) {
        setLastError();
        LOG_ERROR("UdpSocket", "Failed to bind to {}:{} - {}",
                  address, port, getLastErrorString());
        return false;
    }

    LOG_TRACE("UdpSocket", "Bound to {}:{}", address, port);
    return true;
}

uint16_t UdpSocket::getLocalPort() const {
    if (!isValid()) {
        return 0;
    }

    struct sockaddr_in addr{};
    socklen_t addrLen = sizeof(addr);
    if (getsockname(socket_, reinterpret_cast<struct sockaddr*>(&addr), &addrLen) != 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

bool UdpSocket::setReuseAddress(bool enable) {
    if (!isValid()) {
        return false;
    }

    int optval = enable ? 1 : 0;
    if (setsockopt(socket_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) != 0) {
        setLastError();
        return false;
    }
#ifdef SO_REUSEPORT
    // Best effort; SO_REUSEADDR alone is enough on most stacks
    if (setsockopt(socket_, SOL_SOCKET, SO_REUSEPORT, &optval, sizeof(optval)) != 0) {
        LOG_TRACE("UdpSocket", "SO_REUSEPORT unavailable: {}", socketErrorString(errno));
    }
#endif
    return true;
}

bool UdpSocket::setBroadcast(bool enable) {
    if (!isValid()) {
        return false;
    }

    int optval = enable ? 1 : 0;
    if (setsockopt(socket_, SOL_SOCKET, SO_BROADCAST, &optval, sizeof(optval)) != 0) {
        setLastError();
        return false;
    }
    return true;
}

bool UdpSocket::setMulticastTTL(int ttl) {
    if (!isValid()) {
        return false;
    }

    unsigned char ttlVal = static_cast<unsigned char>(ttl);
    if (setsockopt(socket_, IPPROTO_IP, IP_MULTICAST_TTL, &ttlVal, sizeof(ttlVal)) != 0) {
        setLastError();
        return false;
    }
    return true;
}

bool UdpSocket::setMulticastLoopback(bool enable) {
    if (!isValid()) {
        return false;
    }

    unsigned char loop = enable ? 1 : 0;
    if (setsockopt(socket_, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) != 0) {
        setLastError();
        return false;
    }
    return true;
}

int UdpSocket::sendTo(const SocketAddress& dest, const void* data, size_t length) {
    if (!isValid()) {
        return -1;
    }

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(dest.port);

    if (dest.ip == "<broadcast>" || dest.ip == "255.255.255.255") {
        addr.sin_addr.s_addr = INADDR_BROADCAST;
    } else if (inet_pton(AF_INET, dest.ip.c_str(), &addr.sin_addr) != 1) {
        LOG_ERROR("UdpSocket", "Invalid destination address: {}", dest.ip);
        return -1;
    }

    ssize_t result = ::sendto(socket_, data, length, 0,
                              reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr));
    if (result < 0) {
        setLastError();
        return -1;
    }
    return static_cast<int>(result);
}

int UdpSocket::receiveFrom(void* buffer, size_t bufferSize, int timeoutMs,
                           SocketAddress& sender) {
    if (!isValid()) {
        return -1;
    }

    if (timeoutMs >= 0) {
        int ready = waitForSocket(socket_, POLLIN, timeoutMs);
        if (ready < 0) {
            setLastError();
            return -1;
        }
        if (ready == 0) {
            return kTimedOut;
        }
    }

    struct sockaddr_in addr{};
    socklen_t addrLen = sizeof(addr);
    ssize_t result = ::recvfrom(socket_, buffer, bufferSize, 0,
                                reinterpret_cast<struct sockaddr*>(&addr), &addrLen);
    if (result < 0) {
        setLastError();
        return -1;
    }

    char ipStr[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr.sin_addr, ipStr, sizeof(ipStr));
    sender.ip = ipStr;
    sender.port = ntohs(addr.sin_port);

    return static_cast<int>(result);
}

int UdpSocket::receiveFrom(std::string& payload, int timeoutMs, SocketAddress& sender) {
    std::vector<char> buffer(65535);
    int received = receiveFrom(buffer.data(), buffer.size(), timeoutMs, sender);
    if (received >= 0) {
        payload.assign(buffer.data(), static_cast<size_t>(received));
    } else {
        payload.clear();
    }
    return received;
}

void UdpSocket::close() {
    if (isValid()) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

void UdpSocket::setLastError() {
    lastError_ = getLastSocketError();
}

}  // namespace net
}  // namespace camfleet
