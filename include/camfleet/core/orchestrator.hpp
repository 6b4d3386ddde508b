/**
 * @file orchestrator.hpp
 * @brief Sequences discovery, endpoint negotiation, certificate scanning and
 * health monitoring for the whole fleet.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/core/certificate_manager.hpp"
#include "camfleet/core/device_registry.hpp"
#include "camfleet/core/discovery_engine.hpp"
#include "camfleet/core/endpoint_negotiator.hpp"
#include "camfleet/core/export.hpp"
#include "camfleet/core/health_checks.hpp"
#include "camfleet/core/health_monitor.hpp"
#include "camfleet/core/snapshot_store.hpp"
#include "camfleet/core/system_metrics.hpp"
#include "camfleet/net/http_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace camfleet {
namespace core {

struct CAMFLEET_CORE_API OrchestratorConfig {
    std::string network = "192.168.1.0/24";
    Credentials credentials;
    std::string output_dir = ".";
    std::chrono::seconds status_interval{60};
    std::chrono::seconds rediscovery_interval{3600};   ///< 0 disables
    bool monitor_without_devices = false;

    DiscoveryConfig discovery;
    NegotiatorConfig negotiator;
    CertificateConfig certificates;
    MonitorConfig monitor;
    ResourceThresholds thresholds;
    std::vector<ServiceSpec> services = {ServiceSpec{}};
};

/**
 * @class Orchestrator
 * @brief Owns every engine and drives the configuration phases.
 *
 * Usage:
 * @code
 * Orchestrator orchestrator(config, http, collector);
 * // signal handler calls orchestrator.requestStop()
 * bool ok = orchestrator.run();
 * @endcode
 */
class CAMFLEET_CORE_API Orchestrator {
public:
    Orchestrator(OrchestratorConfig config,
                 std::shared_ptr<net::HttpClient> http,
                 std::shared_ptr<SystemMetricsCollector> collector);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /**
     * @brief Run the configuration phases, then monitor until requestStop().
     * @return false if configuration was aborted (no devices found).
     * @throws DiscoveryError for an invalid network range.
     */
    bool run();

    /**
     * @brief Discovery, endpoint negotiation and certificate scan, once.
     * @return false when discovery found nothing and monitoring-only mode
     * is not enabled.
     * @throws DiscoveryError for an invalid network range.
     */
    bool configure();

    /// Register the built-in checks and start the monitor.
    void startMonitoring();

    /// Safe to call from any thread.
    void requestStop();

    /// @return Devices found by this discovery round.
    std::vector<Device> runDiscoveryPhase();
    void runEndpointPhase();
    void runCertificatePhase();

    std::shared_ptr<DeviceRegistry> registry() const { return registry_; }
    std::shared_ptr<HealthMonitor> monitor() const { return monitor_; }
    std::shared_ptr<SnapshotStore> store() const { return store_; }
    std::shared_ptr<EndpointNegotiator> negotiator() const { return negotiator_; }
    std::shared_ptr<CertificateTrustManager> certificates() const { return certificates_; }
    const OrchestratorConfig& config() const { return config_; }

private:
    void seedFromSnapshot();
    bool rediscover();
    bool renegotiate();
    void statusLoop();
    void rediscoveryLoop();
    void saveFinalReport();
    bool sleepFor(std::chrono::milliseconds duration);

    OrchestratorConfig config_;
    std::shared_ptr<net::HttpClient> http_;
    std::shared_ptr<SystemMetricsCollector> collector_;

    std::shared_ptr<DeviceRegistry> registry_;
    std::shared_ptr<SnapshotStore> store_;
    std::shared_ptr<DiscoveryEngine> discovery_;
    std::shared_ptr<EndpointNegotiator> negotiator_;
    std::shared_ptr<CertificateTrustManager> certificates_;
    std::shared_ptr<HealthMonitor> monitor_;

    std::mutex phaseMutex_;   ///< one discovery/negotiation round at a time

    std::atomic<bool> running_{true};
    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;
};

}  // namespace core
}  // namespace camfleet
