/**
 * @file endpoint_negotiator.hpp
 * @brief WebSocket endpoint discovery, validation and selection per camera.
 *
 * For every device the negotiator enumerates model-aware candidate paths on
 * both ws and wss, performs the upgrade handshake with credentials, sends a
 * JSON ping and records latency. The optimal validated candidate becomes the
 * device's websocket_url in the registry.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/core/device.hpp"
#include "camfleet/core/device_registry.hpp"
#include "camfleet/core/export.hpp"
#include "camfleet/net/tls_stream.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace camfleet {
namespace core {

enum class AuthType {
    Basic,
    Digest,
    Token
};

CAMFLEET_CORE_API const char* authTypeToString(AuthType type);
CAMFLEET_CORE_API std::optional<AuthType> authTypeFromString(const std::string& text);

/// Ordered query parameters.
using QueryParams = std::vector<std::pair<std::string, std::string>>;

/**
 * @struct CandidatePath
 * @brief A path template to try on a device.
 */
struct CAMFLEET_CORE_API CandidatePath {
    std::string path;
    QueryParams params;
    AuthType auth = AuthType::Basic;
};

/**
 * @struct EndpointCandidate
 * @brief One (device, protocol, path) combination and its validation result.
 */
struct CAMFLEET_CORE_API EndpointCandidate {
    std::string device_ip;
    std::string url;
    std::string protocol;       ///< "ws" or "wss"
    std::string path;
    QueryParams params;
    AuthType auth_type = AuthType::Basic;
    bool ssl_verify = false;
    bool validated = false;
    double latency_ms = 0.0;
    std::optional<std::string> error;

    bool isSecure() const { return protocol == "wss"; }
};

/**
 * @struct QualityReport
 * @brief Stream statistics from a short sampling window.
 */
struct CAMFLEET_CORE_API QualityReport {
    double fps = 0.0;
    double bitrate_kbps = 0.0;
    double jitter_ms = 0.0;
    std::string resolution;
    std::string codec;
    double duration_s = 0.0;
    uint32_t frames = 0;
};

struct CAMFLEET_CORE_API NegotiatorConfig {
    uint16_t ws_port = 80;
    uint16_t wss_port = 443;
    int connect_timeout_ms = 5000;
    int reply_timeout_ms = 2000;
    std::chrono::milliseconds quality_window{5000};
    int quality_read_timeout_ms = 1000;
    size_t max_in_flight = 50;

    /// Verified-TLS settings applied to candidates with ssl_verify set.
    net::TlsOptions verified_tls;
};

/**
 * @class EndpointNegotiator
 * @brief Picks one WebSocket endpoint per camera.
 *
 * Usage:
 * @code
 * EndpointNegotiator negotiator(NegotiatorConfig{}, registry, creds);
 * auto selected = negotiator.negotiateEndpoints(registry->all());
 * for (const auto& [ip, ep] : selected) {
 *     auto quality = negotiator.testStreamQuality(ep);
 * }
 * @endcode
 */
class CAMFLEET_CORE_API EndpointNegotiator {
public:
    EndpointNegotiator(NegotiatorConfig config,
                       std::shared_ptr<DeviceRegistry> registry,
                       Credentials credentials);

    EndpointNegotiator(const EndpointNegotiator&) = delete;
    EndpointNegotiator& operator=(const EndpointNegotiator&) = delete;

    /**
     * @brief Negotiate every device concurrently and update the registry.
     * @return Selected candidate keyed by device IP. Devices without a
     *         validated candidate are absent.
     */
    std::map<std::string, EndpointCandidate> negotiateEndpoints(const std::vector<Device>& devices);

    /// Validate every candidate for one device, in enumeration order.
    std::vector<EndpointCandidate> probeCandidates(const Device& device);

    /// Handshake, ping and classify one candidate in place.
    void validateCandidate(EndpointCandidate& candidate);

    /**
     * @brief Reconnect and sample the stream.
     *
     * A read timeout ends the sample early; a failed connect yields an
     * all-zero report.
     */
    QualityReport testStreamQuality(const EndpointCandidate& candidate);

    /// Validated candidates from the most recent negotiation, by device.
    std::vector<EndpointCandidate> validatedEndpoints() const;

    /// Per-device outcome of the most recent negotiation (true = selected).
    std::map<std::string, bool> lastOutcomes() const;

    /// Permanent: later negotiateEndpoints() calls return an empty map.
    void cancel() { running_ = false; }
    bool cancelled() const { return !running_.load(); }

    /// Authorization header value for @p type.
    std::string authorizationFor(AuthType type) const;

    static std::vector<CandidatePath> candidatePaths(const std::string& model);

    static std::string buildUrl(const std::string& protocol, const std::string& host,
                                uint16_t port, const std::string& path,
                                const QueryParams& params);

    /**
     * @brief wss before ws, then lowest latency. Ties keep input order.
     */
    static std::optional<EndpointCandidate> selectOptimal(
        const std::vector<EndpointCandidate>& candidates);

    /**
     * @param arrivals Arrival times in seconds, ascending.
     */
    static QualityReport computeQuality(const std::vector<double>& arrivals,
                                        size_t totalBytes, double durationSeconds);

    /// Encoded `{"type":"ping","timestamp":<unix seconds>}`.
    static std::string pingMessage(double timestamp);

private:
    net::TlsOptions tlsFor(const EndpointCandidate& candidate) const;

    NegotiatorConfig config_;
    std::shared_ptr<DeviceRegistry> registry_;
    Credentials credentials_;
    std::atomic<bool> running_{true};

    mutable std::mutex resultsMutex_;
    std::vector<EndpointCandidate> validated_;
    std::map<std::string, bool> outcomes_;
};

}  // namespace core
}  // namespace camfleet
