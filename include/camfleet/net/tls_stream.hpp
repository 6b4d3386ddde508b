/**
 * @file tls_stream.hpp
 * @brief OpenSSL client session layered over a connected TcpSocket.
 *
 * Device firmware ships self-signed certificates, so peer verification is off
 * unless explicitly requested. The leaf certificate is always available after
 * the handshake for inspection.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/net/byte_stream.hpp"
#include "camfleet/net/export.hpp"
#include "camfleet/net/tcp_socket.hpp"

#include <memory>
#include <string>

typedef struct ssl_ctx_st SSL_CTX;
typedef struct ssl_st SSL;

namespace camfleet {
namespace net {

/**
 * @struct TlsOptions
 * @brief Client TLS policy.
 */
struct CAMFLEET_NET_API TlsOptions {
    bool verifyPeer = false;       ///< verify chain and hostname
    std::string caBundlePath;      ///< empty = system default paths
    std::string serverName;        ///< SNI / hostname check; empty = connect host
    bool restrictCiphers = false;  ///< TLS 1.2+ with ECDHE/DHE AEAD suites only
};

/**
 * @class TlsStream
 * @brief TLS client stream. Owns the underlying TcpSocket.
 */
class CAMFLEET_NET_API TlsStream : public ByteStream {
public:
    TlsStream(std::unique_ptr<TcpSocket> socket, TlsOptions options);
    ~TlsStream() override;

    TlsStream(const TlsStream&) = delete;
    TlsStream& operator=(const TlsStream&) = delete;

    /**
     * @brief Perform the client handshake within @p timeoutMs.
     * @param host Connect host, used for SNI when not an IP literal.
     */
    bool handshake(const std::string& host, int timeoutMs);

    int read(void* buffer, size_t size, int timeoutMs) override;
    bool writeAll(const std::string& data, int timeoutMs) override;

    bool isOpen() const override;
    void close() override;
    std::string lastError() const override { return lastError_; }

    /**
     * @brief PEM encoding of the peer's leaf certificate, empty if none.
     */
    std::string peerCertificatePem() const;

    /// Negotiated protocol version string, e.g. "TLSv1.3".
    std::string protocolVersion() const;

private:
    std::unique_ptr<TcpSocket> socket_;
    TlsOptions options_;
    SSL_CTX* ctx_;
    SSL* ssl_;
    bool established_;
    std::string lastError_;

    int waitFor(int sslError, int timeoutMs);
    void setErrorFromQueue(const std::string& prefix);
};

}  // namespace net
}  // namespace camfleet
