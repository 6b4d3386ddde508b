/**
 * @file byte_stream.hpp
 * @brief Minimal connected byte-stream interface (plain TCP or TLS).
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/net/export.hpp"

#include <cstddef>
#include <string>

namespace camfleet {
namespace net {

/**
 * @class ByteStream
 * @brief Connected, bidirectional stream with per-call timeouts.
 */
class CAMFLEET_NET_API ByteStream {
public:
    virtual ~ByteStream() = default;

    /**
     * @brief Read up to @p size bytes.
     * @return Bytes read, 0 on timeout, -1 on error or orderly close.
     */
    virtual int read(void* buffer, size_t size, int timeoutMs) = 0;

    /**
     * @brief Write all of @p data before @p timeoutMs expires.
     */
    virtual bool writeAll(const std::string& data, int timeoutMs) = 0;

    virtual bool isOpen() const = 0;
    virtual void close() = 0;

    /// Description of the most recent failure.
    virtual std::string lastError() const = 0;
};

}  // namespace net
}  // namespace camfleet
