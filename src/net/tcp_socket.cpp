/**
 * @file tcp_socket.cpp
 * @brief Non-blocking TCP client implementation.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/net/tcp_socket.hpp"
#include "camfleet/utils/logger.hpp"

#include <chrono>

namespace camfleet {
namespace net {

namespace {

int remainingMs(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

}  // namespace

TcpSocket::TcpSocket()
    : socket_(INVALID_SOCKET_HANDLE)
{
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& other) noexcept
    : socket_(other.socket_)
    , lastError_(std::move(other.lastError_))
{
    other.socket_ = INVALID_SOCKET_HANDLE;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
    if (this != &other) {
        close();
        socket_ = other.socket_;
        lastError_ = std::move(other.lastError_);
        other.socket_ = INVALID_SOCKET_HANDLE;
    }
    return *this;
}

bool TcpSocket::connect(const std::string& host, uint16_t port, int timeoutMs) {
    close();

    struct addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0 || res == nullptr) {
        lastError_ = "resolve " + host + ": " + gai_strerror(rc);
        return false;
    }

    socket_ = ::socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (socket_ == INVALID_SOCKET_HANDLE) {
        lastError_ = "socket: " + socketErrorString(errno);
        ::freeaddrinfo(res);
        return false;
    }

    int one = 1;
    ::setsockopt(socket_, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    setNonBlocking(socket_, true);

    rc = ::connect(socket_, res->ai_addr, res->ai_addrlen);
    ::freeaddrinfo(res);

    if (rc != 0 && errno != EINPROGRESS) {
        lastError_ = "connect " + host + ":" + std::to_string(port) + ": " + socketErrorString(errno);
        close();
        return false;
    }

    if (rc != 0) {
        int ready = waitForSocket(socket_, POLLOUT, timeoutMs);
        if (ready == 0) {
            lastError_ = "connect " + host + ":" + std::to_string(port) + ": timed out";
            close();
            return false;
        }
        int soError = 0;
        socklen_t len = sizeof(soError);
        if (ready < 0 || ::getsockopt(socket_, SOL_SOCKET, SO_ERROR, &soError, &len) != 0 || soError != 0) {
            lastError_ = "connect " + host + ":" + std::to_string(port) + ": " +
                         socketErrorString(soError != 0 ? soError : errno);
            close();
            return false;
        }
    }

    LOG_TRACE("TcpSocket", "Connected to {}:{}", host, port);
    return true;
}

int TcpSocket::read(void* buffer, size_t size, int timeoutMs) {
    if (!isOpen()) {
        lastError_ = "socket closed";
        return -1;
    }

    int ready = waitForSocket(socket_, POLLIN, timeoutMs);
    if (ready == 0) {
        return 0;
    }
    if (ready < 0) {
        lastError_ = "poll: " + socketErrorString(errno);
        return -1;
    }

    ssize_t n;
    do {
        n = ::recv(socket_, buffer, size, 0);
    } while (n < 0 && errno == EINTR);

    if (n == 0) {
        lastError_ = "connection closed by peer";
        close();
        return -1;
    }
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return 0;
        }
        lastError_ = "recv: " + socketErrorString(errno);
        return -1;
    }
    return static_cast<int>(n);
}

bool TcpSocket::writeAll(const std::string& data, int timeoutMs) {
    if (!isOpen()) {
        lastError_ = "socket closed";
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(socket_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            lastError_ = "send: " + socketErrorString(errno);
            return false;
        }
        int ready = waitForSocket(socket_, POLLOUT, remainingMs(deadline));
        if (ready <= 0) {
            lastError_ = ready == 0 ? "send timed out" : "poll: " + socketErrorString(errno);
            return false;
        }
    }
    return true;
}

void TcpSocket::close() {
    if (isOpen()) {
        closeSocket(socket_);
        socket_ = INVALID_SOCKET_HANDLE;
    }
}

bool TcpSocket::probe(const std::string& host, uint16_t port, int timeoutMs) {
    TcpSocket sock;
    return sock.connect(host, port, timeoutMs);
}

}  // namespace net
}  // namespace camfleet
