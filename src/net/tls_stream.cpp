/**
 * @file tls_stream.cpp
 * @brief OpenSSL client session over a non-blocking TcpSocket.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/net/tls_stream.hpp"
#include "camfleet/utils/logger.hpp"

#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <chrono>

namespace camfleet {
namespace net {

namespace {

constexpr const char* kRestrictedCiphers =
    "ECDHE+AESGCM:ECDHE+CHACHA20:DHE+AESGCM:DHE+CHACHA20:!aNULL:!MD5:!DSS";

bool isIpLiteral(const std::string& host) {
    unsigned char buf[sizeof(struct in6_addr)];
    return inet_pton(AF_INET, host.c_str(), buf) == 1 ||
           inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

int remainingMs(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

}  // namespace

TlsStream::TlsStream(std::unique_ptr<TcpSocket> socket, TlsOptions options)
    : socket_(std::move(socket))
    , options_(std::move(options))
    , ctx_(nullptr)
    , ssl_(nullptr)
    , established_(false)
{
    ctx_ = SSL_CTX_new(TLS_client_method());
    if (ctx_ == nullptr) {
        setErrorFromQueue("SSL_CTX_new");
        return;
    }

    if (options_.restrictCiphers) {
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
        if (SSL_CTX_set_cipher_list(ctx_, kRestrictedCiphers) != 1) {
            LOG_WARN("Tls", "Cipher restriction rejected, using library defaults");
        }
    }

    if (options_.verifyPeer) {
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        int loaded = options_.caBundlePath.empty()
            ? SSL_CTX_set_default_verify_paths(ctx_)
            : SSL_CTX_load_verify_locations(ctx_, options_.caBundlePath.c_str(), nullptr);
        if (loaded != 1) {
            LOG_WARN("Tls", "Failed to load trust store {}", options_.caBundlePath);
        }
    } else {
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
    }
}

TlsStream::~TlsStream() {
    close();
    if (ctx_ != nullptr) {
        SSL_CTX_free(ctx_);
        ctx_ = nullptr;
    }
}

bool TlsStream::handshake(const std::string& host, int timeoutMs) {
    if (ctx_ == nullptr) {
        return false;
    }
    if (!socket_ || !socket_->isOpen()) {
        lastError_ = "socket not connected";
        return false;
    }

    ssl_ = SSL_new(ctx_);
    if (ssl_ == nullptr) {
        setErrorFromQueue("SSL_new");
        return false;
    }
    SSL_set_fd(ssl_, socket_->handle());

    const std::string name = options_.serverName.empty() ? host : options_.serverName;
    if (!isIpLiteral(name)) {
        SSL_set_tlsext_host_name(ssl_, name.c_str());
    }
    if (options_.verifyPeer) {
        if (isIpLiteral(name)) {
            X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl_), name.c_str());
        } else {
            SSL_set1_host(ssl_, name.c_str());
        }
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    for (;;) {
        ERR_clear_error();
        int rc = SSL_connect(ssl_);
        if (rc == 1) {
            established_ = true;
            LOG_TRACE("Tls", "Handshake with {} complete ({})", host, protocolVersion());
            return true;
        }
        int err = SSL_get_error(ssl_, rc);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            int ready = waitFor(err, remainingMs(deadline));
            if (ready == 0) {
                lastError_ = "TLS handshake timed out";
                return false;
            }
            if (ready < 0) {
                lastError_ = "poll: " + socketErrorString(errno);
                return false;
            }
            continue;
        }
        if (options_.verifyPeer && SSL_get_verify_result(ssl_) != X509_V_OK) {
            lastError_ = std::string("certificate verify failed: ") +
                         X509_verify_cert_error_string(SSL_get_verify_result(ssl_));
        } else {
            setErrorFromQueue("TLS handshake");
        }
        return false;
    }
}

int TlsStream::read(void* buffer, size_t size, int timeoutMs) {
    if (!isOpen()) {
        lastError_ = "TLS session closed";
        return -1;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    for (;;) {
        ERR_clear_error();
        int n = SSL_read(ssl_, buffer, static_cast<int>(size));
        if (n > 0) {
            return n;
        }
        int err = SSL_get_error(ssl_, n);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            int ready = waitFor(err, remainingMs(deadline));
            if (ready == 0) {
                return 0;
            }
            if (ready < 0) {
                lastError_ = "poll: " + socketErrorString(errno);
                return -1;
            }
            continue;
        }
        if (err == SSL_ERROR_ZERO_RETURN) {
            lastError_ = "connection closed by peer";
        } else {
            setErrorFromQueue("SSL_read");
        }
        established_ = false;
        return -1;
    }
}

bool TlsStream::writeAll(const std::string& data, int timeoutMs) {
    if (!isOpen()) {
        lastError_ = "TLS session closed";
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    size_t sent = 0;
    while (sent < data.size()) {
        ERR_clear_error();
        int n = SSL_write(ssl_, data.data() + sent, static_cast<int>(data.size() - sent));
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        int err = SSL_get_error(ssl_, n);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
            int ready = waitFor(err, remainingMs(deadline));
            if (ready <= 0) {
                lastError_ = ready == 0 ? "TLS write timed out" : "poll: " + socketErrorString(errno);
                return false;
            }
            continue;
        }
        setErrorFromQueue("SSL_write");
        established_ = false;
        return false;
    }
    return true;
}

bool TlsStream::isOpen() const {
    return established_ && ssl_ != nullptr && socket_ && socket_->isOpen();
}

void TlsStream::close() {
    if (ssl_ != nullptr) {
        if (established_) {
            // Best-effort close_notify; the socket is non-blocking
            SSL_shutdown(ssl_);
        }
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    established_ = false;
    if (socket_) {
        socket_->close();
    }
}

std::string TlsStream::peerCertificatePem() const {
    if (ssl_ == nullptr) {
        return std::string();
    }

    X509* cert = SSL_get1_peer_certificate(ssl_);
    if (cert == nullptr) {
        return std::string();
    }

    std::string pem;
    BIO* bio = BIO_new(BIO_s_mem());
    if (bio != nullptr && PEM_write_bio_X509(bio, cert) == 1) {
        char* data = nullptr;
        long len = BIO_get_mem_data(bio, &data);
        if (len > 0) {
            pem.assign(data, static_cast<size_t>(len));
        }
    }
    BIO_free(bio);
    X509_free(cert);
    return pem;
}

std::string TlsStream::protocolVersion() const {
    return ssl_ != nullptr ? SSL_get_version(ssl_) : "";
}

int TlsStream::waitFor(int sslError, int timeoutMs) {
    short events = sslError == SSL_ERROR_WANT_WRITE ? POLLOUT : POLLIN;
    return waitForSocket(socket_->handle(), events, timeoutMs);
}

void TlsStream::setErrorFromQueue(const std::string& prefix) {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        lastError_ = prefix + " failed";
        if (errno != 0) {
            lastError_ += ": " + socketErrorString(errno);
        }
        return;
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    lastError_ = prefix + ": " + buf;
}

}  // namespace net
}  // namespace camfleet
