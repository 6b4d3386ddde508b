/**
 * @file loopback_listener.hpp
 * @brief TCP listener on 127.0.0.1 with an ephemeral port, for loopback servers in tests
 */

#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cstdint>
#include <string>

namespace camfleet {
namespace testing {

class LoopbackListener {
public:
    LoopbackListener() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd_ < 0) {
            return;
        }
        int one = 1;
        ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(fd_, 16) != 0) {
            close();
            return;
        }

        socklen_t len = sizeof(addr);
        if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
            port_ = ntohs(addr.sin_port);
        }
    }

    ~LoopbackListener() { close(); }

    LoopbackListener(const LoopbackListener&) = delete;
    LoopbackListener& operator=(const LoopbackListener&) = delete;

    bool isValid() const { return fd_ >= 0 && port_ != 0; }
    uint16_t port() const { return port_; }

    /// @return Connected descriptor, or -1 if nothing arrived within @p timeoutMs.
    int accept(int timeoutMs) {
        pollfd pfd{fd_, POLLIN, 0};
        if (::poll(&pfd, 1, timeoutMs) <= 0) {
            return -1;
        }
        return ::accept(fd_, nullptr, nullptr);
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    /// Read from @p fd until @p terminator is seen, EOF, or @p timeoutMs of silence.
    static std::string readUntil(int fd, const std::string& terminator, int timeoutMs) {
        std::string data;
        char buf[4096];
        while (data.find(terminator) == std::string::npos) {
            pollfd pfd{fd, POLLIN, 0};
            if (::poll(&pfd, 1, timeoutMs) <= 0) {
                break;
            }
            ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) {
                break;
            }
            data.append(buf, static_cast<size_t>(n));
        }
        return data;
    }

    static bool writeAll(int fd, const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }

private:
    int fd_ = -1;
    uint16_t port_ = 0;
};

}  // namespace testing
}  // namespace camfleet
