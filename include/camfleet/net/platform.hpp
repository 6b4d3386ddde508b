/**
 * @file platform.hpp
 * @brief POSIX socket type definitions and includes.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include <arpa/inet.h>
#include <errno.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cstring>
#include <string>

namespace camfleet {
namespace net {

using SocketHandle = int;
constexpr SocketHandle INVALID_SOCKET_HANDLE = -1;

inline int getLastSocketError() { return errno; }
inline void closeSocket(SocketHandle s) { ::close(s); }

inline std::string socketErrorString(int code) {
    return std::string(std::strerror(code));
}

inline bool setNonBlocking(SocketHandle s, bool enable) {
    int flags = ::fcntl(s, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    flags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(s, F_SETFL, flags) == 0;
}

/**
 * @brief Wait until @p s is readable (POLLIN) or writable (POLLOUT).
 * @return 1 when ready, 0 on timeout, -1 on error.
 */
inline int waitForSocket(SocketHandle s, short events, int timeoutMs) {
    struct pollfd pfd{};
    pfd.fd = s;
    pfd.events = events;
    int rc;
    do {
        rc = ::poll(&pfd, 1, timeoutMs);
    } while (rc < 0 && errno == EINTR);
    if (rc > 0 && (pfd.revents & (POLLERR | POLLNVAL)) && !(pfd.revents & events)) {
        return -1;
    }
    return rc;
}

}  // namespace net
}  // namespace camfleet
