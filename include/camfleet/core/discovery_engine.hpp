/**
 * @file discovery_engine.hpp
 * @brief Multi-protocol camera discovery (SSDP, WS-Discovery, mDNS, subnet scan).
 *
 * Each probe yields a set of candidate IPv4 addresses. The union is probed
 * for device information, capabilities and an RTSP URL, and every device
 * that answered its device-info request is upserted into the registry.
 *
 * Discovery is best-effort: a failing probe logs and contributes nothing.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/core/device.hpp"
#include "camfleet/core/device_registry.hpp"
#include "camfleet/core/export.hpp"
#include "camfleet/net/http_client.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace camfleet {
namespace core {

using IpSet = std::set<std::string>;

/**
 * @struct DiscoveryConfig
 * @brief Probe addresses, windows and limits.
 */
struct CAMFLEET_CORE_API DiscoveryConfig {
    std::string vendor_token = "axis";

    // SSDP
    bool enable_ssdp = true;
    std::string ssdp_address = "239.255.255.250";
    uint16_t ssdp_port = 1900;
    std::string ssdp_search_target = "urn:axis-com:service:BasicService:1";
    std::chrono::milliseconds ssdp_window{3000};

    // WS-Discovery
    bool enable_ws_discovery = true;
    std::string wsd_address = "<broadcast>";
    uint16_t wsd_port = 3702;
    std::chrono::milliseconds wsd_window{3000};

    // mDNS via external resolver
    bool enable_mdns = true;
    std::vector<std::string> mdns_command = {"dns-sd", "-B", "_axis-video._tcp", "local."};
    std::chrono::milliseconds mdns_window{3000};

    // Subnet scan
    std::vector<uint16_t> scan_ports = {80, 443, 554};
    int scan_connect_timeout_ms = 500;
    std::chrono::milliseconds verify_timeout{2000};

    // Per-device probing
    std::chrono::milliseconds device_info_timeout{5000};
    std::chrono::milliseconds capability_timeout{2000};
    uint16_t http_port = 80;
    uint16_t https_port = 443;
    uint16_t rtsp_port = 554;
    int rtsp_timeout_ms = 2000;
    std::vector<std::string> rtsp_paths = {
        "/axis-media/media.amp", "/mpeg4/media.amp", "/h264/media.amp",
        "/stream1", "/live/stream1", "/MediaInput/stream_1"};

    size_t max_in_flight = 50;
};

/**
 * @class DiscoveryEngine
 * @brief Finds cameras on the local network.
 *
 * Usage:
 * @code
 * auto registry = std::make_shared<DeviceRegistry>();
 * auto http = std::make_shared<net::CurlHttpClient>();
 * DiscoveryEngine engine(DiscoveryConfig{}, registry, http, creds);
 * auto devices = engine.discover("192.168.1.0/24");
 * @endcode
 */
class CAMFLEET_CORE_API DiscoveryEngine {
public:
    DiscoveryEngine(DiscoveryConfig config,
                    std::shared_ptr<DeviceRegistry> registry,
                    std::shared_ptr<net::HttpClient> http,
                    Credentials credentials);

    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    /**
     * @brief Run every probe, then probe the union of candidate IPs.
     * @param networkCidr Subnet to scan, empty to skip the scan.
     * @return Devices found in this pass, ordered by IP.
     * @throws DiscoveryError if @p networkCidr is not a valid IPv4 CIDR.
     */
    std::vector<Device> discover(const std::string& networkCidr);

    // Individual probes. Each returns the addresses that answered.
    IpSet probeSsdp();
    IpSet probeWsDiscovery();
    IpSet probeMdns();
    IpSet probeSubnet(const std::string& networkCidr);

    /**
     * @brief Full probe of one address.
     * @return nullopt if the device-info request failed on both schemes.
     */
    std::optional<Device> probeDevice(const std::string& ip);

    std::optional<Device> getDeviceInfo(const std::string& ip);
    Capabilities getCapabilities(const std::string& ip);
    std::optional<std::string> discoverRtspUrl(const std::string& ip);

    /// Abort long-running scans at the next work item. Permanent: later
    /// discover() calls return no devices.
    void cancel() { running_ = false; }
    bool cancelled() const { return !running_.load(); }

    const DiscoveryConfig& config() const { return config_; }

    // Wire helpers, exposed for tests.
    static std::string buildMSearch(const std::string& host, uint16_t port,
                                    const std::string& searchTarget);
    static std::string wsDiscoveryProbe();
    static std::string rtspOptionsRequest(const std::string& url);
    static bool payloadMatches(const std::string& payload, const std::string& token);
    static Device parseDeviceInfo(const std::string& body, const std::string& ip);
    static std::vector<std::string> extractIpv4Literals(const std::string& line);

private:
    /// GET that answers a 401 Digest challenge once.
    net::HttpResponse authorizedGet(const std::string& url, const std::string& uri,
                                    std::chrono::milliseconds timeout);
    bool verifyCandidate(const std::string& ip, uint16_t port);
    bool testRtspUrl(const std::string& ip, const std::string& url);
    IpSet collectUdpReplies(const std::string& probeName,
                            const std::string& destination, uint16_t port,
                            const std::string& payload, bool broadcast,
                            std::chrono::milliseconds window,
                            const std::vector<std::string>& markers);

    DiscoveryConfig config_;
    std::shared_ptr<DeviceRegistry> registry_;
    std::shared_ptr<net::HttpClient> http_;
    Credentials credentials_;
    std::atomic<bool> running_{true};
};

}  // namespace core
}  // namespace camfleet
