/**
 * @file tcp_socket.hpp
 * @brief Non-blocking IPv4 TCP client socket with connect/read/write timeouts.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/net/byte_stream.hpp"
#include "camfleet/net/export.hpp"
#include "camfleet/net/platform.hpp"

#include <cstdint>
#include <string>

namespace camfleet {
namespace net {

/**
 * @class TcpSocket
 * @brief RAII TCP client. Every blocking operation is bounded by a timeout.
 *
 * Usage:
 * @code
 * TcpSocket sock;
 * if (!sock.connect("10.0.0.5", 554, 2000)) {
 *     LOG_WARN("Rtsp", "connect failed: {}", sock.lastError());
 * }
 * sock.writeAll(request, 2000);
 * char buf[1024];
 * int n = sock.read(buf, sizeof(buf), 2000);
 * @endcode
 */
class CAMFLEET_NET_API TcpSocket : public ByteStream {
public:
    TcpSocket();
    ~TcpSocket() override;

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;
    TcpSocket(TcpSocket&& other) noexcept;
    TcpSocket& operator=(TcpSocket&& other) noexcept;

    /**
     * @brief Resolve @p host (IPv4) and connect within @p timeoutMs.
     */
    bool connect(const std::string& host, uint16_t port, int timeoutMs);

    int read(void* buffer, size_t size, int timeoutMs) override;
    bool writeAll(const std::string& data, int timeoutMs) override;

    bool isOpen() const override { return socket_ != INVALID_SOCKET_HANDLE; }
    void close() override;
    std::string lastError() const override { return lastError_; }

    SocketHandle handle() const { return socket_; }

    /**
     * @brief True if a TCP connection to host:port completes within @p timeoutMs.
     */
    static bool probe(const std::string& host, uint16_t port, int timeoutMs);

private:
    SocketHandle socket_;
    std::string lastError_;
};

}  // namespace net
}  // namespace camfleet
