/**
 * @file websocket_client.cpp
 * @brief RFC 6455 client implementation.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/net/websocket_client.hpp"
#include "camfleet/net/tcp_socket.hpp"
#include "camfleet/net/url.hpp"
#include "camfleet/utils/crypto.hpp"
#include "camfleet/utils/logger.hpp"
#include "camfleet/utils/string_utils.hpp"

#include <chrono>
#include <cstdlib>

namespace camfleet {
namespace net {

namespace {

constexpr const char* kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr size_t kMaxHandshakeBytes = 16 * 1024;
constexpr uint64_t kMaxFramePayload = 64ull * 1024 * 1024;

int remainingMs(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

}  // namespace

WebSocketClient::~WebSocketClient() {
    close();
}

std::string WebSocketClient::computeAcceptKey(const std::string& key) {
    return utils::base64Encode(utils::sha1Raw(key + kWebSocketGuid));
}

std::string WebSocketClient::encodeFrame(uint8_t opcode, const std::string& payload,
                                         const std::string& maskKey, bool fin) {
    std::string frame;
    frame.reserve(payload.size() + 14);
    frame.push_back(static_cast<char>((fin ? 0x80 : 0x00) | (opcode & 0x0F)));

    const uint8_t maskBit = maskKey.size() == 4 ? 0x80 : 0x00;
    const uint64_t len = payload.size();
    if (len < 126) {
        frame.push_back(static_cast<char>(maskBit | len));
    } else if (len <= 0xFFFF) {
        frame.push_back(static_cast<char>(maskBit | 126));
        frame.push_back(static_cast<char>((len >> 8) & 0xFF));
        frame.push_back(static_cast<char>(len & 0xFF));
    } else {
        frame.push_back(static_cast<char>(maskBit | 127));
        for (int shift = 56; shift >= 0; shift -= 8) {
            frame.push_back(static_cast<char>((len >> shift) & 0xFF));
        }
    }

    if (maskBit) {
        frame += maskKey;
        for (size_t i = 0; i < payload.size(); ++i) {
            frame.push_back(static_cast<char>(payload[i] ^ maskKey[i % 4]));
        }
    } else {
        frame += payload;
    }
    return frame;
}

FrameParse WebSocketClient::decodeFrame(const std::string& buffer, WsFrame& frame, size_t& consumed) {
    if (buffer.size() < 2) {
        return FrameParse::Incomplete;
    }

    const auto* data = reinterpret_cast<const uint8_t*>(buffer.data());
    if (data[0] & 0x70) {
        // No extensions negotiated, RSV bits must be clear
        return FrameParse::Invalid;
    }

    const bool fin = (data[0] & 0x80) != 0;
    const uint8_t opcode = data[0] & 0x0F;
    const bool masked = (data[1] & 0x80) != 0;
    uint64_t len = data[1] & 0x7F;
    size_t pos = 2;

    if (len == 126) {
        if (buffer.size() < pos + 2) return FrameParse::Incomplete;
        len = (static_cast<uint64_t>(data[2]) << 8) | data[3];
        pos += 2;
    } else if (len == 127) {
        if (buffer.size() < pos + 8) return FrameParse::Incomplete;
        len = 0;
        for (int i = 0; i < 8; ++i) {
            len = (len << 8) | data[2 + i];
        }
        pos += 8;
    }
    if (len > kMaxFramePayload) {
        return FrameParse::Invalid;
    }
    if ((opcode & 0x08) && (len > 125 || !fin)) {
        // Control frames are short and never fragmented
        return FrameParse::Invalid;
    }

    uint8_t mask[4] = {0, 0, 0, 0};
    if (masked) {
        if (buffer.size() < pos + 4) return FrameParse::Incomplete;
        for (int i = 0; i < 4; ++i) mask[i] = data[pos + i];
        pos += 4;
    }

    if (buffer.size() < pos + len) {
        return FrameParse::Incomplete;
    }

    frame.fin = fin;
    frame.opcode = opcode;
    frame.payload.assign(buffer, pos, static_cast<size_t>(len));
    if (masked) {
        for (size_t i = 0; i < frame.payload.size(); ++i) {
            frame.payload[i] = static_cast<char>(frame.payload[i] ^ mask[i % 4]);
        }
    }
    consumed = pos + static_cast<size_t>(len);
    return FrameParse::Complete;
}

bool WebSocketClient::connect(const std::string& url, const WebSocketOptions& options) {
    close();
    buffer_.clear();
    fragments_.clear();
    handshakeStatus_ = 0;
    closed_ = false;
    lastError_.clear();

    auto parsed = Url::parse(url);
    if (!parsed || (parsed->scheme != "ws" && parsed->scheme != "wss")) {
        lastError_ = "Invalid WebSocket URL: " + url;
        return false;
    }

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(options.connectTimeoutMs);

    auto socket = std::make_unique<TcpSocket>();
    if (!socket->connect(parsed->host, parsed->port, remainingMs(deadline))) {
        lastError_ = socket->lastError();
        return false;
    }

    if (parsed->isSecure()) {
        auto tls = std::make_unique<TlsStream>(std::move(socket), options.tls);
        if (!tls->handshake(parsed->host, remainingMs(deadline))) {
            lastError_ = tls->lastError();
            return false;
        }
        tls_ = tls.get();
        stream_ = std::move(tls);
    } else {
        stream_ = std::move(socket);
    }

    const std::string key = utils::base64Encode(utils::randomBytes(16));

    std::string request;
    request += "GET " + parsed->target + " HTTP/1.1\r\n";
    request += "Host: " + parsed->hostHeader() + "\r\n";
    request += "Upgrade: websocket\r\n";
    request += "Connection: Upgrade\r\n";
    request += "Sec-WebSocket-Key: " + key + "\r\n";
    request += "Sec-WebSocket-Version: 13\r\n";
    for (const auto& h : options.headers) {
        request += h.first + ": " + h.second + "\r\n";
    }
    request += "\r\n";

    if (!stream_->writeAll(request, remainingMs(deadline))) {
        lastError_ = stream_->lastError();
        close();
        return false;
    }

    // Read until the end of the response head
    std::string head;
    char chunk[2048];
    size_t headEnd = std::string::npos;
    while (headEnd == std::string::npos) {
        int left = remainingMs(deadline);
        if (left == 0) {
            lastError_ = "WebSocket handshake timed out";
            close();
            return false;
        }
        int n = stream_->read(chunk, sizeof(chunk), left);
        if (n < 0) {
            lastError_ = stream_->lastError();
            close();
            return false;
        }
        head.append(chunk, static_cast<size_t>(n));
        headEnd = head.find("\r\n\r\n");
        if (head.size() > kMaxHandshakeBytes) {
            lastError_ = "WebSocket handshake response too large";
            close();
            return false;
        }
    }

    buffer_ = head.substr(headEnd + 4);
    auto lines = utils::split_lines(head.substr(0, headEnd));
    if (lines.empty()) {
        lastError_ = "Empty handshake response";
        close();
        return false;
    }

    auto statusParts = utils::split(lines[0], ' ');
    if (statusParts.size() < 2 || !utils::starts_with(statusParts[0], "HTTP/")) {
        lastError_ = "Malformed status line: " + lines[0];
        close();
        return false;
    }
    handshakeStatus_ = std::atoi(statusParts[1].c_str());
    if (handshakeStatus_ != 101) {
        lastError_ = "Invalid status code: " + std::to_string(handshakeStatus_);
        close();
        return false;
    }

    std::string accept;
    for (size_t i = 1; i < lines.size(); ++i) {
        size_t colon = lines[i].find(':');
        if (colon == std::string::npos) continue;
        if (utils::to_lower(utils::trim(lines[i].substr(0, colon))) == "sec-websocket-accept") {
            accept = utils::trim(lines[i].substr(colon + 1));
        }
    }
    if (accept != computeAcceptKey(key)) {
        lastError_ = "Invalid Sec-WebSocket-Accept";
        close();
        return false;
    }

    LOG_TRACE("WebSocket", "Connected to {}", url);
    return true;
}

bool WebSocketClient::sendFrame(uint8_t opcode, const std::string& payload, int timeoutMs) {
    if (!isOpen()) {
        lastError_ = "WebSocket not connected";
        return false;
    }
    std::string frame = encodeFrame(opcode, payload, utils::randomBytes(4));
    if (!stream_->writeAll(frame, timeoutMs)) {
        lastError_ = stream_->lastError();
        return false;
    }
    return true;
}

bool WebSocketClient::sendText(const std::string& text, int timeoutMs) {
    return sendFrame(kOpText, text, timeoutMs);
}

WsReadStatus WebSocketClient::receive(std::string& message, int timeoutMs, bool* binary) {
    if (!stream_ || closed_) {
        return WsReadStatus::Closed;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    char chunk[8192];

    for (;;) {
        WsFrame frame;
        size_t consumed = 0;
        FrameParse parsed = decodeFrame(buffer_, frame, consumed);

        if (parsed == FrameParse::Invalid) {
            lastError_ = "Invalid WebSocket frame";
            close();
            return WsReadStatus::Error;
        }

        if (parsed == FrameParse::Complete) {
            buffer_.erase(0, consumed);
            switch (frame.opcode) {
                case kOpPing:
                    if (!sendFrame(kOpPong, frame.payload, 1000)) {
                        LOG_TRACE("WebSocket", "Pong failed: {}", lastError_);
                    }
                    continue;
                case kOpPong:
                    continue;
                case kOpClose:
                    if (!sendFrame(kOpClose, frame.payload.substr(0, 2), 1000)) {
                        LOG_TRACE("WebSocket", "Close reply failed: {}", lastError_);
                    }
                    closed_ = true;
                    lastError_ = "Connection closed by peer";
                    stream_->close();
                    return WsReadStatus::Closed;
                case kOpText:
                case kOpBinary:
                    if (frame.fin) {
                        message = std::move(frame.payload);
                        if (binary) *binary = frame.opcode == kOpBinary;
                        return WsReadStatus::Message;
                    }
                    fragmentOpcode_ = frame.opcode;
                    fragments_ = std::move(frame.payload);
                    continue;
                case kOpContinuation:
                    fragments_ += frame.payload;
                    if (frame.fin) {
                        message = std::move(fragments_);
                        fragments_.clear();
                        if (binary) *binary = fragmentOpcode_ == kOpBinary;
                        return WsReadStatus::Message;
                    }
                    continue;
                default:
                    lastError_ = "Unknown opcode " + std::to_string(frame.opcode);
                    close();
                    return WsReadStatus::Error;
            }
        }

        int left = remainingMs(deadline);
        if (left == 0) {
            return WsReadStatus::Timeout;
        }
        int n = stream_->read(chunk, sizeof(chunk), left);
        if (n == 0) {
            return WsReadStatus::Timeout;
        }
        if (n < 0) {
            lastError_ = stream_->lastError();
            closed_ = true;
            return WsReadStatus::Closed;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

void WebSocketClient::close() {
    if (stream_) {
        if (stream_->isOpen() && !closed_ && handshakeStatus_ == 101) {
            // 1000 = normal closure
            std::string code("\x03\xE8", 2);
            if (!stream_->writeAll(encodeFrame(kOpClose, code, utils::randomBytes(4)), 500)) {
                LOG_TRACE("WebSocket", "Close frame not sent: {}", stream_->lastError());
            }
        }
        stream_->close();
        stream_.reset();
    }
    tls_ = nullptr;
    closed_ = true;
}

std::string WebSocketClient::peerCertificatePem() const {
    return tls_ != nullptr ? tls_->peerCertificatePem() : std::string();
}

}  // namespace net
}  // namespace camfleet
