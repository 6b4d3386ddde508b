/**
 * @file discovery_engine.cpp
 * @brief DiscoveryEngine implementation.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/core/discovery_engine.hpp"
#include "camfleet/core/digest_auth.hpp"
#include "camfleet/core/errors.hpp"
#include "camfleet/net/ipv4_network.hpp"
#include "camfleet/net/tcp_socket.hpp"
#include "camfleet/net/udp_socket.hpp"
#include "camfleet/net/url.hpp"
#include "camfleet/utils/bounded_pool.hpp"
#include "camfleet/utils/logger.hpp"
#include "camfleet/utils/string_utils.hpp"
#include "camfleet/utils/subprocess.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <thread>
#include <utility>

namespace camfleet {
namespace core {

namespace {

constexpr const char* kDeviceInfoPath = "/axis-cgi/basicdeviceinfo.cgi";

struct CapabilityEndpoint {
    const char* path;
    bool Capabilities::*flag;
};

const CapabilityEndpoint kCapabilityEndpoints[] = {
    {"/axis-cgi/streamprofile.cgi", &Capabilities::rtsp},
    {"/onvif/device_service", &Capabilities::onvif},
    {"/axis-cgi/motion/motiondata.cgi", &Capabilities::motion_detection},
    {"/axis-cgi/audio/audiodata.cgi", &Capabilities::audio},
    {"/axis-cgi/com/ptz.cgi", &Capabilities::ptz},
    {"/axis-cgi/analytics/analytics.cgi", &Capabilities::analytics},
};

std::string makeUrl(const std::string& scheme, const std::string& host, uint16_t port,
                    const std::string& path) {
    std::string url = scheme + "://" + host;
    if (port != net::Url::defaultPort(scheme)) {
        url += ":" + std::to_string(port);
    }
    return url + path;
}

}  // namespace

DiscoveryEngine::DiscoveryEngine(DiscoveryConfig config,
                                 std::shared_ptr<DeviceRegistry> registry,
                                 std::shared_ptr<net::HttpClient> http,
                                 Credentials credentials)
    : config_(std::move(config))
    , registry_(std::move(registry))
    , http_(std::move(http))
    , credentials_(std::move(credentials))
{
}

// =============================================================================
// Wire helpers
// =============================================================================

std::string DiscoveryEngine::buildMSearch(const std::string& host, uint16_t port,
                                          const std::string& searchTarget) {
    return "M-SEARCH * HTTP/1.1\r\n"
           "HOST: " + host + ":" + std::to_string(port) + "\r\n"
           "MAN: \"ssdp:discover\"\r\n"
           "MX: 3\r\n"
           "ST: " + searchTarget + "\r\n"
           "\r\n";
}

std::string DiscoveryEngine::wsDiscoveryProbe() {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
           "<Envelope xmlns=\"http://www.w3.org/2003/05/soap-envelope\">\n"
           "    <Body>\n"
           "        <Probe xmlns=\"http://schemas.xmlsoap.org/ws/2005/04/discovery\">\n"
           "            <Types>tdn:NetworkVideoTransmitter</Types>\n"
           "        </Probe>\n"
           "    </Body>\n"
           "</Envelope>";
}

std::string DiscoveryEngine::rtspOptionsRequest(const std::string& url) {
    return "OPTIONS " + url + " RTSP/1.0\r\nCSeq: 1\r\n\r\n";
}

bool DiscoveryEngine::payloadMatches(const std::string& payload, const std::string& token) {
    return !token.empty() && utils::icontains(payload, token);
}

Device DiscoveryEngine::parseDeviceInfo(const std::string& body, const std::string& ip) {
    Device device(ip);

    for (const auto& line : utils::split_lines(body)) {
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string key = utils::to_lower(utils::trim(line.substr(0, eq)));
        std::string value = utils::trim(line.substr(eq + 1));

        if (key == "macaddress") {
            device.mac = value;
        } else if (key == "model") {
            device.model = value;
        } else if (key == "serialnumber") {
            device.serial = value;
        } else if (key == "version") {
            device.firmware = value;
        } else if (key == "hostname") {
            device.name = value;
        }
    }
    return device;
}

std::vector<std::string> DiscoveryEngine::extractIpv4Literals(const std::string& line) {
    std::vector<std::string> result;
    std::string token;

    auto flush = [&]() {
        if (std::count(token.begin(), token.end(), '.') == 3 && net::isIpv4Literal(token)) {
            result.push_back(token);
        }
        token.clear();
    };

    for (char c : line) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            flush();
        } else {
            token.push_back(c);
        }
    }
    flush();
    return result;
}

// =============================================================================
// Probes
// =============================================================================

IpSet DiscoveryEngine::collectUdpReplies(const std::string& probeName,
                                         const std::string& destination, uint16_t port,
                                         const std::string& payload, bool broadcast,
                                         std::chrono::milliseconds window,
                                         const std::vector<std::string>& markers) {
    IpSet found;

    net::UdpSocket socket;
    if (!socket.isValid()) {
        LOG_ERROR(probeName, "Failed to create socket: {}", socket.getLastErrorString());
        return found;
    }
    if (!socket.setReuseAddress(true)) {
        LOG_DEBUG(probeName, "SO_REUSEADDR failed: {}", socket.getLastErrorString());
    }
    if (broadcast && !socket.setBroadcast(true)) {
        LOG_ERROR(probeName, "Failed to enable broadcast: {}", socket.getLastErrorString());
        return found;
    }
    if (!broadcast && !socket.setMulticastTTL(2)) {
        LOG_DEBUG(probeName, "Failed to set multicast TTL: {}", socket.getLastErrorString());
    }

    net::SocketAddress dest(destination, port);
    if (socket.sendTo(dest, payload) < 0) {
        LOG_ERROR(probeName, "Send to {} failed: {}", dest.toString(), socket.getLastErrorString());
        return found;
    }

    auto deadline = std::chrono::steady_clock::now() + window;
    std::string reply;
    net::SocketAddress sender;

    while (running_.load()) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        int received = socket.receiveFrom(reply, static_cast<int>(remaining.count()), sender);
        if (received == net::UdpSocket::kTimedOut) {
            break;
        }
        if (received < 0) {
            LOG_DEBUG(probeName, "Receive failed: {}", socket.getLastErrorString());
            break;
        }

        for (const auto& marker : markers) {
            if (payloadMatches(reply, marker)) {
                if (found.insert(sender.ip).second) {
                    LOG_INFO(probeName, "Discovered camera at {}", sender.ip);
                }
                break;
            }
        }
    }

    return found;
}

IpSet DiscoveryEngine::probeSsdp() {
    return collectUdpReplies("SSDP", config_.ssdp_address, config_.ssdp_port,
                             buildMSearch(config_.ssdp_address, config_.ssdp_port,
                                          config_.ssdp_search_target),
                             false, config_.ssdp_window, {config_.vendor_token});
}

IpSet DiscoveryEngine::probeWsDiscovery() {
    return collectUdpReplies("WSDiscovery", config_.wsd_address, config_.wsd_port,
                             wsDiscoveryProbe(), true, config_.wsd_window,
                             {config_.vendor_token, "NetworkVideoTransmitter"});
}

IpSet DiscoveryEngine::probeMdns() {
    IpSet found;
    if (config_.mdns_command.empty()) {
        return found;
    }

    utils::ProcessResult result = utils::runWithTimeout(config_.mdns_command, config_.mdns_window);
    if (!result.started) {
        LOG_DEBUG("mDNS", "Resolver not available: {}", result.error);
        return found;
    }

    for (const auto& line : utils::split_lines(result.stdout_text)) {
        if (!payloadMatches(line, config_.vendor_token)) {
            continue;
        }
        for (const auto& ip : extractIpv4Literals(line)) {
            if (found.insert(ip).second) {
                LOG_INFO("mDNS", "Discovered camera at {}", ip);
            }
        }
    }
    return found;
}

bool DiscoveryEngine::verifyCandidate(const std::string& ip, uint16_t port) {
    const std::string scheme = port == 443 ? "https" : "http";
    std::string url = scheme + "://" + ip + ":" + std::to_string(port) + kDeviceInfoPath;

    net::HttpResponse response = http_->get(url, {}, config_.verify_timeout);
    return response.status == 200 || response.status == 401;
}

IpSet DiscoveryEngine::probeSubnet(const std::string& networkCidr) {
    auto network = net::Ipv4Network::parse(networkCidr);
    if (!network) {
        throw DiscoveryError("Invalid network range: " + networkCidr);
    }

    IpSet found;
    std::mutex foundMutex;
    const std::vector<std::string> hosts = network->hosts();

    LOG_INFO("Scan", "Scanning {} hosts in {}", hosts.size(), network->toString());

    utils::parallelFor(hosts.size(), config_.max_in_flight, [&](size_t i) {
        const std::string& host = hosts[i];
        for (uint16_t port : config_.scan_ports) {
            if (!net::TcpSocket::probe(host, port, config_.scan_connect_timeout_ms)) {
                continue;
            }
            if (verifyCandidate(host, port)) {
                LOG_INFO("Scan", "Network scan found camera at {}", host);
                std::lock_guard<std::mutex> lock(foundMutex);
                found.insert(host);
                return;
            }
        }
    }, "Scan", &running_);

    return found;
}

// =============================================================================
// Per-device probing
// =============================================================================

net::HttpResponse DiscoveryEngine::authorizedGet(const std::string& url, const std::string& uri,
                                                 std::chrono::milliseconds timeout) {
    net::HttpResponse response = http_->get(url, {}, timeout);
    if (response.status != 401) {
        return response;
    }

    std::string authorization;
    try {
        authorization = DigestAuthClient::buildAuthHeader(
            response.header("www-authenticate"), "GET", uri,
            credentials_.username, credentials_.password);
    } catch (const MalformedChallengeError& e) {
        LOG_DEBUG("Probe", "{}: {}", url, e.what());
        return response;
    }

    return http_->get(url, {{"Authorization", authorization}}, timeout);
}

std::optional<Device> DiscoveryEngine::getDeviceInfo(const std::string& ip) {
    const std::pair<std::string, uint16_t> schemes[] = {
        {"http", config_.http_port},
        {"https", config_.https_port},
    };

    for (const auto& [scheme, port] : schemes) {
        std::string url = makeUrl(scheme, ip, port, kDeviceInfoPath);
        net::HttpResponse response = authorizedGet(url, kDeviceInfoPath,
                                                   config_.device_info_timeout);
        if (response.status == 200) {
            return parseDeviceInfo(response.body, ip);
        }
        if (!response.transportOk()) {
            LOG_DEBUG("Probe", "Failed to get device info from {}: {}", url, response.error);
        } else {
            LOG_DEBUG("Probe", "Device info from {} returned HTTP {}", url, response.status);
        }
    }
    return std::nullopt;
}

Capabilities DiscoveryEngine::getCapabilities(const std::string& ip) {
    Capabilities caps;
    for (const auto& endpoint : kCapabilityEndpoints) {
        std::string url = makeUrl("http", ip, config_.http_port, endpoint.path);
        net::HttpResponse response = http_->get(url, {}, config_.capability_timeout);
        if (response.status == 200 || response.status == 401) {
            caps.*(endpoint.flag) = true;
        }
    }
    return caps;
}

bool DiscoveryEngine::testRtspUrl(const std::string& ip, const std::string& url) {
    net::TcpSocket socket;
    if (!socket.connect(ip, config_.rtsp_port, config_.rtsp_timeout_ms)) {
        return false;
    }
    if (!socket.writeAll(rtspOptionsRequest(url), config_.rtsp_timeout_ms)) {
        LOG_TRACE("RTSP", "OPTIONS to {} failed: {}", ip, socket.lastError());
        return false;
    }

    char buffer[1024];
    int n = socket.read(buffer, sizeof(buffer), config_.rtsp_timeout_ms);
    if (n <= 0) {
        return false;
    }
    return std::string(buffer, static_cast<size_t>(n)).find("RTSP/1.0 200") != std::string::npos;
}

std::optional<std::string> DiscoveryEngine::discoverRtspUrl(const std::string& ip) {
    std::string authority = ip;
    if (config_.rtsp_port != 554) {
        authority += ":" + std::to_string(config_.rtsp_port);
    }

    for (const auto& path : config_.rtsp_paths) {
        std::string url = "rtsp://" + credentials_.username + ":" + credentials_.password +
                          "@" + authority + path;
        if (testRtspUrl(ip, url)) {
            return url;
        }
    }
    return std::nullopt;
}

std::optional<Device> DiscoveryEngine::probeDevice(const std::string& ip) {
    auto device = getDeviceInfo(ip);
    if (!device) {
        return std::nullopt;
    }

    device->capabilities = getCapabilities(ip);
    device->rtsp_url = discoverRtspUrl(ip);
    return device;
}

// =============================================================================
// Orchestration
// =============================================================================

std::vector<Device> DiscoveryEngine::discover(const std::string& networkCidr) {
    if (!networkCidr.empty() && !net::Ipv4Network::parse(networkCidr)) {
        throw DiscoveryError("Invalid network range: " + networkCidr);
    }

    if (!running_.load()) {
        LOG_INFO("Discovery", "Discovery cancelled, skipping probes");
        return {};
    }

    IpSet ssdp, wsd, mdns, subnet;

    auto guarded = [](const char* name, IpSet& out, auto probe) {
        try {
            out = probe();
        } catch (const std::exception& e) {
            LOG_ERROR("Discovery", "{} probe failed: {}", name, e.what());
        }
    };

    std::vector<std::thread> probes;
    if (config_.enable_ssdp) {
        probes.emplace_back([&] { guarded("SSDP", ssdp, [this] { return probeSsdp(); }); });
    }
    if (config_.enable_ws_discovery) {
        probes.emplace_back([&] {
            guarded("WS-Discovery", wsd, [this] { return probeWsDiscovery(); });
        });
    }
    if (config_.enable_mdns) {
        probes.emplace_back([&] { guarded("mDNS", mdns, [this] { return probeMdns(); }); });
    }
    if (!networkCidr.empty()) {
        probes.emplace_back([&] {
            guarded("Subnet", subnet, [this, &networkCidr] { return probeSubnet(networkCidr); });
        });
    }
    for (auto& t : probes) {
        t.join();
    }

    IpSet candidates;
    for (const IpSet* set : {&ssdp, &wsd, &mdns, &subnet}) {
        candidates.insert(set->begin(), set->end());
    }

    LOG_INFO("Discovery", "Candidates: {} (ssdp={}, wsd={}, mdns={}, scan={})",
             candidates.size(), ssdp.size(), wsd.size(), mdns.size(), subnet.size());

    const std::vector<std::string> ips(candidates.begin(), candidates.end());
    std::vector<Device> devices;
    std::mutex devicesMutex;

    utils::parallelFor(ips.size(), config_.max_in_flight, [&](size_t i) {
        auto device = probeDevice(ips[i]);
        if (!device) {
            LOG_DEBUG("Discovery", "No device info from {}, dropping", ips[i]);
            return;
        }
        registry_->upsert(*device);
        std::lock_guard<std::mutex> lock(devicesMutex);
        devices.push_back(std::move(*device));
    }, "Discovery", &running_);

    std::sort(devices.begin(), devices.end(),
              [](const Device& a, const Device& b) { return ipLess(a.ip, b.ip); });

    LOG_INFO("Discovery", "Discovered {} camera(s)", devices.size());
    return devices;
}

}  // namespace core
}  // namespace camfleet
