/**
 * @file health_checks.hpp
 * @brief Built-in fleet health checks and their recovery actions.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/core/certificate_manager.hpp"
#include "camfleet/core/device_registry.hpp"
#include "camfleet/core/export.hpp"
#include "camfleet/core/health_monitor.hpp"
#include "camfleet/core/snapshot_store.hpp"
#include "camfleet/core/system_metrics.hpp"
#include "camfleet/net/http_client.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace camfleet {
namespace core {

struct CAMFLEET_CORE_API ResourceThresholds {
    double cpu_percent = 80.0;
    double memory_percent = 85.0;
    double disk_percent = 90.0;
    double critical_percent = 95.0;   ///< cpu or memory above this is CRITICAL
};

/**
 * @struct ServiceSpec
 * @brief An external process probed over HTTP and restarted on failure.
 */
struct CAMFLEET_CORE_API ServiceSpec {
    std::string name = "pwa_config_service";
    std::string health_url = "http://localhost:8080/api/health";
    std::vector<std::string> command = {"python3", "dynamic_pwa_config.py"};
    std::string process_pattern = "dynamic_pwa_config.py";
    std::chrono::milliseconds interval{30000};
    std::chrono::milliseconds probe_timeout{5000};
    std::chrono::milliseconds restart_wait{5000};
};

using RecoveryHook = std::function<bool()>;

// -----------------------------------------------------------------------------
// Classification
// -----------------------------------------------------------------------------

CAMFLEET_CORE_API HealthStatus classifyResources(double cpu, double memory, double disk,
                                                 const ResourceThresholds& thresholds);

/// 0 failed HEALTHY, <10% DEGRADED, <50% UNHEALTHY, else CRITICAL; empty UNKNOWN.
CAMFLEET_CORE_API HealthStatus classifyConnectivity(size_t total, size_t failed);

/// All validated HEALTHY, more than half DEGRADED, else UNHEALTHY; empty UNKNOWN.
CAMFLEET_CORE_API HealthStatus classifyEndpoints(const std::map<std::string, bool>& outcomes);

CAMFLEET_CORE_API HealthStatus classifyCertificates(const std::optional<CertificateSummary>& summary);

CAMFLEET_CORE_API HealthStatus classifyNetwork(const std::vector<InterfaceState>& interfaces,
                                               const NetIoCounters& io);

/// HTTP 200 with a JSON body whose "status" is "healthy".
CAMFLEET_CORE_API bool serviceReportsHealthy(const net::HttpResponse& response);

// -----------------------------------------------------------------------------
// Check factories
// -----------------------------------------------------------------------------

CAMFLEET_CORE_API HealthCheck makeSystemResourcesCheck(
    std::shared_ptr<SystemMetricsCollector> collector, ResourceThresholds thresholds);

/**
 * @brief Device-info GET against every registered device; @p rediscover
 * is the recovery.
 */
CAMFLEET_CORE_API HealthCheck makeCameraConnectivityCheck(
    std::shared_ptr<DeviceRegistry> registry,
    std::shared_ptr<net::HttpClient> http,
    RecoveryHook rediscover);

/// Outcomes of the latest negotiation; @p renegotiate is the recovery.
CAMFLEET_CORE_API HealthCheck makeWebsocketHealthCheck(
    std::function<std::map<std::string, bool>()> outcomes,
    RecoveryHook renegotiate);

CAMFLEET_CORE_API HealthCheck makeServiceCheck(const ServiceSpec& spec,
                                               std::shared_ptr<net::HttpClient> http);

CAMFLEET_CORE_API HealthCheck makeCertificateValidityCheck(std::shared_ptr<SnapshotStore> store);

CAMFLEET_CORE_API HealthCheck makeNetworkHealthCheck(std::shared_ptr<SystemMetricsCollector> collector);

/// Free page cache (when permitted), reap zombie children and trim the heap.
CAMFLEET_CORE_API bool releaseSystemResources();

}  // namespace core
}  // namespace camfleet
