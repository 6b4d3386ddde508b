/**
 * @file endpoint_negotiator.cpp
 * @brief EndpointNegotiator implementation.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/core/endpoint_negotiator.hpp"
#include "camfleet/net/url.hpp"
#include "camfleet/net/websocket_client.hpp"
#include "camfleet/utils/bounded_pool.hpp"
#include "camfleet/utils/crypto.hpp"
#include "camfleet/utils/logger.hpp"
#include "camfleet/utils/string_utils.hpp"
#include "camfleet/utils/time_utils.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace camfleet {
namespace core {

namespace {

using Clock = std::chrono::steady_clock;

double millisSince(Clock::time_point start) {
    return std::chrono::duration<double, std::milli>(Clock::now() - start).count();
}

std::string valueText(const google::protobuf::Value& value) {
    switch (value.kind_case()) {
        case google::protobuf::Value::kStringValue:
            return value.string_value();
        case google::protobuf::Value::kNumberValue: {
            std::ostringstream oss;
            oss << value.number_value();
            return oss.str();
        }
        default:
            return "";
    }
}

/// Pull resolution/codec out of a JSON text message, if it is one.
void absorbStreamInfo(const std::string& text, QualityReport& report) {
    google::protobuf::Struct message;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    if (!google::protobuf::util::JsonStringToMessage(text, &message, options).ok()) {
        return;
    }
    const auto& fields = message.fields();
    auto resolution = fields.find("resolution");
    if (resolution != fields.end()) {
        report.resolution = valueText(resolution->second);
    }
    auto codec = fields.find("codec");
    if (codec != fields.end()) {
        report.codec = valueText(codec->second);
    }
}

}  // namespace

const char* authTypeToString(AuthType type) {
    switch (type) {
        case AuthType::Basic:  return "basic";
        case AuthType::Digest: return "digest";
        case AuthType::Token:  return "token";
    }
    return "basic";
}

std::optional<AuthType> authTypeFromString(const std::string& text) {
    std::string lower = utils::to_lower(text);
    if (lower == "basic") return AuthType::Basic;
    if (lower == "digest") return AuthType::Digest;
    if (lower == "token") return AuthType::Token;
    return std::nullopt;
}

EndpointNegotiator::EndpointNegotiator(NegotiatorConfig config,
                                       std::shared_ptr<DeviceRegistry> registry,
                                       Credentials credentials)
    : config_(std::move(config))
    , registry_(std::move(registry))
    , credentials_(std::move(credentials))
{
}

// =============================================================================
// Candidate enumeration
// =============================================================================

std::vector<CandidatePath> EndpointNegotiator::candidatePaths(const std::string& model) {
    std::vector<CandidatePath> paths = {
        {"/rtsp-over-websocket",
         {{"video", "h264"}, {"audio", "0"}, {"resolution", "1920x1080"}, {"fps", "30"}},
         AuthType::Digest},
        {"/ws", {}, AuthType::Basic},
        {"/websocket", {}, AuthType::Basic},
        {"/axis-cgi/websocket", {}, AuthType::Digest},
    };

    auto has = [&model](const char* token) { return model.find(token) != std::string::npos; };

    if (has("M30") || has("M31")) {
        paths.push_back({"/axis-media/media.amp/websocket", {{"video", "1"}}, AuthType::Digest});
    } else if (has("P32") || has("P33")) {
        paths.push_back({"/ptz/websocket", {}, AuthType::Digest});
    } else if (has("Q16")) {
        paths.push_back({"/thermal/websocket", {}, AuthType::Digest});
    }
    return paths;
}

std::string EndpointNegotiator::buildUrl(const std::string& protocol, const std::string& host,
                                         uint16_t port, const std::string& path,
                                         const QueryParams& params) {
    std::string url = protocol + "://" + host;
    if (port != net::Url::defaultPort(protocol)) {
        url += ":" + std::to_string(port);
    }
    url += path;

    if (!params.empty()) {
        std::vector<std::string> pairs;
        pairs.reserve(params.size());
        for (const auto& [key, value] : params) {
            pairs.push_back(key + "=" + value);
        }
        url += "?" + utils::join(pairs, "&");
    }
    return url;
}

std::string EndpointNegotiator::authorizationFor(AuthType type) const {
    if (type == AuthType::Token) {
        return "Bearer " + credentials_.password;
    }
    // A Digest round-trip cannot ride on the upgrade request, so digest
    // candidates present Basic credentials.
    return "Basic " + utils::base64Encode(credentials_.username + ":" + credentials_.password);
}

std::string EndpointNegotiator::pingMessage(double timestamp) {
    google::protobuf::Struct ping;
    (*ping.mutable_fields())["type"].set_string_value("ping");
    (*ping.mutable_fields())["timestamp"].set_number_value(timestamp);

    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(ping, &json);
    if (!status.ok()) {
        LOG_WARN("Negotiator", "Failed to encode ping: {}", status.ToString());
    }
    return json;
}

net::TlsOptions EndpointNegotiator::tlsFor(const EndpointCandidate& candidate) const {
    if (candidate.ssl_verify) {
        return config_.verified_tls;
    }
    return net::TlsOptions{};
}

// =============================================================================
// Validation
// =============================================================================

void EndpointNegotiator::validateCandidate(EndpointCandidate& candidate) {
    candidate.validated = false;
    candidate.error.reset();

    const auto start = Clock::now();

    net::WebSocketOptions options;
    options.headers.emplace_back("Authorization", authorizationFor(candidate.auth_type));
    options.tls = tlsFor(candidate);
    options.connectTimeoutMs = config_.connect_timeout_ms;

    net::WebSocketClient ws;
    if (!ws.connect(candidate.url, options)) {
        std::string error = ws.lastError();
        const int status = ws.handshakeStatus();
        if (status == 401) {
            error += " (Authentication required)";
        } else if (status == 403) {
            error += " (Forbidden - check credentials)";
        }
        candidate.error = error;
        return;
    }

    if (!ws.sendText(pingMessage(utils::unixSeconds()), config_.reply_timeout_ms)) {
        candidate.error = ws.lastError();
        ws.close();
        return;
    }

    std::string reply;
    net::WsReadStatus status = ws.receive(reply, config_.reply_timeout_ms);
    switch (status) {
        case net::WsReadStatus::Message:
        case net::WsReadStatus::Timeout:
            candidate.validated = true;
            candidate.latency_ms = millisSince(start);
            break;
        case net::WsReadStatus::Closed:
        case net::WsReadStatus::Error:
            candidate.error = ws.lastError();
            break;
    }

    ws.close();
}

std::vector<EndpointCandidate> EndpointNegotiator::probeCandidates(const Device& device) {
    std::vector<EndpointCandidate> candidates;
    const auto paths = candidatePaths(device.model);

    for (const char* protocol : {"ws", "wss"}) {
        const uint16_t port = std::string(protocol) == "wss" ? config_.wss_port : config_.ws_port;
        for (const auto& path : paths) {
            if (!running_.load()) {
                return candidates;
            }

            EndpointCandidate candidate;
            candidate.device_ip = device.ip;
            candidate.protocol = protocol;
            candidate.path = path.path;
            candidate.params = path.params;
            candidate.auth_type = path.auth;
            candidate.url = buildUrl(protocol, device.ip, port, path.path, path.params);

            validateCandidate(candidate);

            if (candidate.validated) {
                LOG_INFO("Negotiator", "Valid WebSocket endpoint: {} ({} ms)",
                         candidate.url, candidate.latency_ms);
            } else {
                LOG_DEBUG("Negotiator", "Invalid endpoint {}: {}", candidate.url,
                          candidate.error.value_or("unknown error"));
            }
            candidates.push_back(std::move(candidate));
        }
    }
    return candidates;
}

std::optional<EndpointCandidate> EndpointNegotiator::selectOptimal(
    const std::vector<EndpointCandidate>& candidates) {
    const EndpointCandidate* best = nullptr;

    for (const auto& candidate : candidates) {
        if (!candidate.validated) {
            continue;
        }
        if (best == nullptr) {
            best = &candidate;
            continue;
        }
        if (candidate.isSecure() != best->isSecure()) {
            if (candidate.isSecure()) {
                best = &candidate;
            }
            continue;
        }
        if (candidate.latency_ms < best->latency_ms) {
            best = &candidate;
        }
    }

    if (best == nullptr) {
        return std::nullopt;
    }
    return *best;
}

std::map<std::string, EndpointCandidate> EndpointNegotiator::negotiateEndpoints(
    const std::vector<Device>& devices) {
    if (!running_.load()) {
        LOG_INFO("Negotiator", "Negotiation cancelled, keeping previous results");
        return {};
    }

    std::vector<std::vector<EndpointCandidate>> perDevice(devices.size());
    std::vector<std::optional<EndpointCandidate>> selected(devices.size());

    utils::parallelFor(devices.size(), config_.max_in_flight, [&](size_t i) {
        const Device& device = devices[i];
        LOG_INFO("Negotiator", "Configuring WebSocket for {} ({})", device.ip, device.model);

        perDevice[i] = probeCandidates(device);
        selected[i] = selectOptimal(perDevice[i]);

        if (selected[i]) {
            registry_->setWebsocketUrl(device.ip, selected[i]->url);
        } else {
            registry_->setWebsocketUrl(device.ip, std::nullopt);
            LOG_WARN("Negotiator", "No valid WebSocket endpoint found for {}", device.ip);
        }
    }, "Negotiator", &running_);

    std::map<std::string, EndpointCandidate> result;
    std::vector<EndpointCandidate> validated;
    std::map<std::string, bool> outcomes;

    for (size_t i = 0; i < devices.size(); ++i) {
        for (const auto& candidate : perDevice[i]) {
            if (candidate.validated) {
                validated.push_back(candidate);
            }
        }
        outcomes[devices[i].ip] = selected[i].has_value();
        if (selected[i]) {
            result.emplace(devices[i].ip, *selected[i]);
        }
    }

    {
        std::lock_guard<std::mutex> lock(resultsMutex_);
        validated_ = std::move(validated);
        outcomes_ = std::move(outcomes);
    }

    LOG_INFO("Negotiator", "Configured {} of {} camera(s)", result.size(), devices.size());
    return result;
}

std::vector<EndpointCandidate> EndpointNegotiator::validatedEndpoints() const {
    std::lock_guard<std::mutex> lock(resultsMutex_);
    return validated_;
}

std::map<std::string, bool> EndpointNegotiator::lastOutcomes() const {
    std::lock_guard<std::mutex> lock(resultsMutex_);
    return outcomes_;
}

// =============================================================================
// Stream quality
// =============================================================================

QualityReport EndpointNegotiator::computeQuality(const std::vector<double>& arrivals,
                                                 size_t totalBytes, double durationSeconds) {
    QualityReport report;
    report.frames = static_cast<uint32_t>(arrivals.size());
    report.duration_s = durationSeconds;
    if (durationSeconds <= 0.0) {
        return report;
    }

    report.fps = static_cast<double>(arrivals.size()) / durationSeconds;
    report.bitrate_kbps = static_cast<double>(totalBytes) * 8.0 / durationSeconds / 1000.0;

    if (arrivals.size() > 1) {
        std::vector<double> intervals;
        intervals.reserve(arrivals.size() - 1);
        for (size_t i = 1; i < arrivals.size(); ++i) {
            intervals.push_back(arrivals[i] - arrivals[i - 1]);
        }
        double mean = 0.0;
        for (double v : intervals) mean += v;
        mean /= static_cast<double>(intervals.size());

        double deviation = 0.0;
        for (double v : intervals) deviation += std::fabs(v - mean);
        report.jitter_ms = deviation / static_cast<double>(intervals.size()) * 1000.0;
    }
    return report;
}

QualityReport EndpointNegotiator::testStreamQuality(const EndpointCandidate& candidate) {
    net::WebSocketOptions options;
    options.headers.emplace_back("Authorization", authorizationFor(candidate.auth_type));
    options.tls = tlsFor(candidate);
    options.connectTimeoutMs = config_.connect_timeout_ms;

    net::WebSocketClient ws;
    if (!ws.connect(candidate.url, options)) {
        LOG_ERROR("Negotiator", "Stream quality test failed for {}: {}",
                  candidate.url, ws.lastError());
        return QualityReport{};
    }

    const auto start = Clock::now();
    const double window = std::chrono::duration<double>(config_.quality_window).count();

    std::vector<double> arrivals;
    size_t totalBytes = 0;
    QualityReport info;

    for (;;) {
        const double elapsed = std::chrono::duration<double>(Clock::now() - start).count();
        if (elapsed >= window || !running_.load()) {
            break;
        }
        int timeoutMs = std::min(config_.quality_read_timeout_ms,
                                 static_cast<int>(std::ceil((window - elapsed) * 1000.0)));

        std::string message;
        bool binary = false;
        net::WsReadStatus status = ws.receive(message, timeoutMs, &binary);
        if (status != net::WsReadStatus::Message) {
            if (status != net::WsReadStatus::Timeout) {
                LOG_DEBUG("Negotiator", "Quality sample of {} ended: {}",
                          candidate.url, ws.lastError());
            }
            break;
        }

        arrivals.push_back(std::chrono::duration<double>(Clock::now() - start).count());
        totalBytes += message.size();
        if (!binary) {
            absorbStreamInfo(message, info);
        }
    }

    const double duration = std::chrono::duration<double>(Clock::now() - start).count();
    ws.close();

    QualityReport report = computeQuality(arrivals, totalBytes, duration);
    report.resolution = info.resolution;
    report.codec = info.codec;

    LOG_INFO("Negotiator", "Stream quality for {}: {} fps, {} kbps, jitter {} ms",
             candidate.device_ip, report.fps, report.bitrate_kbps, report.jitter_ms);
    return report;
}

}  // namespace core
}  // namespace camfleet
