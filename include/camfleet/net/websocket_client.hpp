/**
 * @file websocket_client.hpp
 * @brief RFC 6455 WebSocket client over TcpSocket or TlsStream.
 *
 * Client frames are always masked. Pings are answered transparently inside
 * receive(); fragmented messages are reassembled before being returned.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/net/byte_stream.hpp"
#include "camfleet/net/export.hpp"
#include "camfleet/net/http_client.hpp"
#include "camfleet/net/tls_stream.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace camfleet {
namespace net {

struct CAMFLEET_NET_API WebSocketOptions {
    HttpHeaders headers;          ///< extra upgrade request headers (auth)
    TlsOptions tls;               ///< used for wss:// only
    int connectTimeoutMs = 5000;  ///< TCP connect + TLS + upgrade
};

enum class WsReadStatus {
    Message,   ///< a complete text or binary message was returned
    Timeout,   ///< nothing complete arrived in time
    Closed,    ///< peer closed or connection dropped
    Error      ///< protocol violation
};

struct CAMFLEET_NET_API WsFrame {
    bool fin = true;
    uint8_t opcode = 0;
    std::string payload;
};

enum class FrameParse {
    Complete,
    Incomplete,
    Invalid
};

/**
 * @class WebSocketClient
 * @brief Single-connection client.
 *
 * Usage:
 * @code
 * WebSocketClient ws;
 * WebSocketOptions opts;
 * opts.headers.emplace_back("Authorization", "Basic ...");
 * if (!ws.connect("wss://10.0.0.5/ws", opts)) {
 *     LOG_WARN("Ws", "{} (HTTP {})", ws.lastError(), ws.handshakeStatus());
 * }
 * ws.sendText("{\"type\":\"ping\"}");
 * std::string reply;
 * if (ws.receive(reply, 2000) == WsReadStatus::Message) { ... }
 * @endcode
 */
class CAMFLEET_NET_API WebSocketClient {
public:
    static constexpr uint8_t kOpContinuation = 0x0;
    static constexpr uint8_t kOpText = 0x1;
    static constexpr uint8_t kOpBinary = 0x2;
    static constexpr uint8_t kOpClose = 0x8;
    static constexpr uint8_t kOpPing = 0x9;
    static constexpr uint8_t kOpPong = 0xA;

    WebSocketClient() = default;
    ~WebSocketClient();

    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    /**
     * @brief Connect and perform the upgrade handshake.
     * @return False on transport failure, non-101 status or bad accept key.
     */
    bool connect(const std::string& url, const WebSocketOptions& options);

    /// HTTP status of the upgrade response, 0 if none was received.
    int handshakeStatus() const { return handshakeStatus_; }

    bool isOpen() const { return stream_ && stream_->isOpen() && !closed_; }

    bool sendText(const std::string& text, int timeoutMs = 5000);

    /**
     * @brief Wait up to @p timeoutMs for the next complete data message.
     * @param binary Set to true when the message was binary.
     */
    WsReadStatus receive(std::string& message, int timeoutMs, bool* binary = nullptr);

    /// Send a close frame (best effort) and drop the connection.
    void close();

    std::string lastError() const { return lastError_; }

    /// Peer leaf certificate for wss connections.
    std::string peerCertificatePem() const;

    static std::string computeAcceptKey(const std::string& key);

    /**
     * @brief Build one frame. An empty @p maskKey produces an unmasked frame.
     */
    static std::string encodeFrame(uint8_t opcode, const std::string& payload,
                                   const std::string& maskKey, bool fin = true);

    /**
     * @brief Parse one frame from the front of @p buffer.
     * @param consumed Set to the frame length on Complete.
     */
    static FrameParse decodeFrame(const std::string& buffer, WsFrame& frame, size_t& consumed);

private:
    bool sendFrame(uint8_t opcode, const std::string& payload, int timeoutMs);

    std::unique_ptr<ByteStream> stream_;
    TlsStream* tls_ = nullptr;   // non-owning view of stream_ when secure
    std::string buffer_;
    std::string fragments_;
    uint8_t fragmentOpcode_ = 0;
    int handshakeStatus_ = 0;
    bool closed_ = false;
    std::string lastError_;
};

}  // namespace net
}  // namespace camfleet
