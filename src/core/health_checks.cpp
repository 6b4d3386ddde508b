/**
 * @file health_checks.cpp
 * @brief Built-in health checks.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/core/health_checks.hpp"
#include "camfleet/core/errors.hpp"
#include "camfleet/utils/bounded_pool.hpp"
#include "camfleet/utils/logger.hpp"
#include "camfleet/utils/subprocess.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <atomic>
#include <fstream>
#include <thread>

#include <malloc.h>
#include <unistd.h>

namespace camfleet {
namespace core {

namespace {

constexpr const char* kComponent = "Checks";
constexpr const char* kDeviceInfoPath = "/axis-cgi/basicdeviceinfo.cgi";
constexpr size_t kConnectivityFanout = 50;
constexpr std::chrono::milliseconds kDeviceTimeout{5000};
constexpr std::chrono::milliseconds kCheckTimeout{10000};
constexpr int kRetries = 3;

HealthCheck baseCheck(const std::string& name, std::chrono::milliseconds interval) {
    HealthCheck check;
    check.name = name;
    check.interval = interval;
    check.timeout = kCheckTimeout;
    check.retries = kRetries;
    return check;
}

}  // namespace

// =============================================================================
// Classification
// =============================================================================

HealthStatus classifyResources(double cpu, double memory, double disk,
                               const ResourceThresholds& thresholds) {
    if (cpu > thresholds.cpu_percent || memory > thresholds.memory_percent ||
        disk > thresholds.disk_percent) {
        if (cpu > thresholds.critical_percent || memory > thresholds.critical_percent) {
            return HealthStatus::CRITICAL;
        }
        return HealthStatus::DEGRADED;
    }
    return HealthStatus::HEALTHY;
}

HealthStatus classifyConnectivity(size_t total, size_t failed) {
    if (total == 0) {
        return HealthStatus::UNKNOWN;
    }
    const double ratio = static_cast<double>(failed) / static_cast<double>(total);
    if (failed == 0) return HealthStatus::HEALTHY;
    if (ratio < 0.1) return HealthStatus::DEGRADED;
    if (ratio < 0.5) return HealthStatus::UNHEALTHY;
    return HealthStatus::CRITICAL;
}

HealthStatus classifyEndpoints(const std::map<std::string, bool>& outcomes) {
    if (outcomes.empty()) {
        return HealthStatus::UNKNOWN;
    }
    size_t valid = 0;
    for (const auto& [ip, ok] : outcomes) {
        if (ok) ++valid;
    }
    if (valid == outcomes.size()) return HealthStatus::HEALTHY;
    if (static_cast<double>(valid) > static_cast<double>(outcomes.size()) * 0.5) {
        return HealthStatus::DEGRADED;
    }
    return HealthStatus::UNHEALTHY;
}

HealthStatus classifyCertificates(const std::optional<CertificateSummary>& summary) {
    if (!summary) {
        return HealthStatus::UNKNOWN;
    }
    if (summary->expiring_soon > 0) {
        return HealthStatus::DEGRADED;
    }
    if (summary->total_certificates == 0) {
        return HealthStatus::UNKNOWN;
    }
    const double rate = static_cast<double>(summary->valid) /
                        static_cast<double>(summary->total_certificates);
    if (rate >= 0.9) return HealthStatus::HEALTHY;
    if (rate >= 0.7) return HealthStatus::DEGRADED;
    return HealthStatus::UNHEALTHY;
}

HealthStatus classifyNetwork(const std::vector<InterfaceState>& interfaces,
                             const NetIoCounters& io) {
    for (const auto& iface : interfaces) {
        if (!iface.up) {
            return HealthStatus::DEGRADED;
        }
    }

    const uint64_t packets = io.packets_sent + io.packets_recv;
    if (packets == 0) {
        return HealthStatus::HEALTHY;
    }
    const double rate = static_cast<double>(io.errin + io.errout) / static_cast<double>(packets);
    if (rate > 0.05) return HealthStatus::UNHEALTHY;
    if (rate > 0.01) return HealthStatus::DEGRADED;
    return HealthStatus::HEALTHY;
}

bool serviceReportsHealthy(const net::HttpResponse& response) {
    if (response.status != 200) {
        return false;
    }
    google::protobuf::Struct body;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    if (!google::protobuf::util::JsonStringToMessage(response.body, &body, options).ok()) {
        return false;
    }
    auto it = body.fields().find("status");
    return it != body.fields().end() &&
           it->second.kind_case() == google::protobuf::Value::kStringValue &&
           it->second.string_value() == "healthy";
}

// =============================================================================
// Recovery helpers
// =============================================================================

bool releaseSystemResources() {
    LOG_INFO(kComponent, "Attempting to free system resources...");

    ::sync();

    std::ofstream dropCaches("/proc/sys/vm/drop_caches");
    if (dropCaches.is_open()) {
        dropCaches << "1";
        if (!dropCaches.good()) {
            LOG_DEBUG(kComponent, "Page cache drop rejected");
        }
    } else {
        LOG_DEBUG(kComponent, "No permission to drop page cache");
    }

    int reaped = utils::reapZombies();
    if (reaped > 0) {
        LOG_INFO(kComponent, "Reaped {} zombie children", reaped);
    }

    malloc_trim(0);
    return true;
}

// =============================================================================
// Factories
// =============================================================================

HealthCheck makeSystemResourcesCheck(std::shared_ptr<SystemMetricsCollector> collector,
                                     ResourceThresholds thresholds) {
    HealthCheck check = baseCheck("system_resources", std::chrono::seconds(30));
    check.check = [collector, thresholds]() {
        const double cpu = collector->cpuPercent();
        const double memory = collector->memoryPercent();
        const double disk = collector->diskPercent();
        LOG_DEBUG(kComponent, "cpu={} mem={} disk={}", cpu, memory, disk);
        return classifyResources(cpu, memory, disk, thresholds);
    };
    check.recovery = releaseSystemResources;
    return check;
}

HealthCheck makeCameraConnectivityCheck(std::shared_ptr<DeviceRegistry> registry,
                                        std::shared_ptr<net::HttpClient> http,
                                        RecoveryHook rediscover) {
    HealthCheck check = baseCheck("camera_connectivity", std::chrono::seconds(60));
    check.check = [registry, http]() {
        const std::vector<Device> devices = registry->all();
        std::atomic<size_t> failed{0};

        utils::parallelFor(devices.size(), kConnectivityFanout, [&](size_t i) {
            const std::string url = "http://" + devices[i].ip + kDeviceInfoPath;
            net::HttpResponse response = http->get(url, {}, kDeviceTimeout);
            if (response.status != 200 && response.status != 401) {
                LOG_DEBUG(kComponent, "Camera {} unreachable: {}", devices[i].ip,
                          response.transportOk() ? std::to_string(response.status)
                                                 : response.error);
                failed.fetch_add(1);
            }
        }, kComponent);

        return classifyConnectivity(devices.size(), failed.load());
    };
    check.recovery = [rediscover]() {
        LOG_INFO(kComponent, "Attempting to recover camera connectivity...");
        return rediscover ? rediscover() : false;
    };
    return check;
}

HealthCheck makeWebsocketHealthCheck(std::function<std::map<std::string, bool>()> outcomes,
                                     RecoveryHook renegotiate) {
    HealthCheck check = baseCheck("websocket_health", std::chrono::seconds(30));
    check.check = [outcomes]() {
        return classifyEndpoints(outcomes());
    };
    check.recovery = [renegotiate]() {
        LOG_INFO(kComponent, "Attempting to recover WebSocket connections...");
        return renegotiate ? renegotiate() : false;
    };
    return check;
}

HealthCheck makeServiceCheck(const ServiceSpec& spec, std::shared_ptr<net::HttpClient> http) {
    HealthCheck check = baseCheck(spec.name, spec.interval);

    auto probe = [spec, http]() {
        net::HttpResponse response = http->get(spec.health_url, {}, spec.probe_timeout);
        if (!response.transportOk()) {
            LOG_DEBUG(kComponent, "Service {} unreachable: {}", spec.name, response.error);
        }
        return serviceReportsHealthy(response) ? HealthStatus::HEALTHY : HealthStatus::UNHEALTHY;
    };

    check.check = probe;
    check.recovery = [spec, probe]() {
        LOG_INFO(kComponent, "Attempting to restart service for '{}'", spec.name);
        if (spec.command.empty()) {
            throw RecoveryError("No restart command for " + spec.name);
        }

        int signalled = utils::terminateMatching(spec.process_pattern);
        if (signalled > 0) {
            LOG_INFO(kComponent, "Sent SIGTERM to {} '{}' processes", signalled,
                     spec.process_pattern);
            std::this_thread::sleep_for(std::chrono::seconds(2));
        }

        if (utils::spawnDetached(spec.command) < 0) {
            throw RecoveryError("Failed to launch " + spec.command.front());
        }
        std::this_thread::sleep_for(spec.restart_wait);
        return probe() == HealthStatus::HEALTHY;
    };
    return check;
}

HealthCheck makeCertificateValidityCheck(std::shared_ptr<SnapshotStore> store) {
    HealthCheck check = baseCheck("certificate_validity", std::chrono::hours(1));
    check.check = [store]() {
        return classifyCertificates(store->loadCertificateSummary());
    };
    return check;
}

HealthCheck makeNetworkHealthCheck(std::shared_ptr<SystemMetricsCollector> collector) {
    HealthCheck check = baseCheck("network_health", std::chrono::seconds(60));
    check.check = [collector]() {
        return classifyNetwork(collector->interfaces(), collector->netIo());
    };
    return check;
}

}  // namespace core
}  // namespace camfleet
