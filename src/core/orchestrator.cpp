/**
 * @file orchestrator.cpp
 * @brief Orchestrator implementation.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/core/orchestrator.hpp"
#include "camfleet/core/errors.hpp"
#include "camfleet/utils/logger.hpp"

#include <ctime>
#include <map>
#include <thread>

namespace camfleet {
namespace core {

namespace {
constexpr const char* kComponent = "Orchestrator";
}

Orchestrator::Orchestrator(OrchestratorConfig config,
                           std::shared_ptr<net::HttpClient> http,
                           std::shared_ptr<SystemMetricsCollector> collector)
    : config_(std::move(config))
    , http_(std::move(http))
    , collector_(std::move(collector))
    , registry_(std::make_shared<DeviceRegistry>())
    , store_(std::make_shared<SnapshotStore>(config_.output_dir))
{
    discovery_ = std::make_shared<DiscoveryEngine>(config_.discovery, registry_, http_,
                                                   config_.credentials);
    negotiator_ = std::make_shared<EndpointNegotiator>(config_.negotiator, registry_,
                                                       config_.credentials);
    certificates_ = std::make_shared<CertificateTrustManager>(config_.certificates);
    monitor_ = std::make_shared<HealthMonitor>(config_.monitor, collector_, http_);
}

Orchestrator::~Orchestrator() {
    requestStop();
    monitor_->stop();
}

void Orchestrator::requestStop() {
    running_ = false;
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
    }
    wakeCv_.notify_all();
    discovery_->cancel();
    negotiator_->cancel();
}

bool Orchestrator::sleepFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(wakeMutex_);
    wakeCv_.wait_for(lock, duration, [this] { return !running_.load(); });
    return running_.load();
}

// =============================================================================
// Phases
// =============================================================================

void Orchestrator::seedFromSnapshot() {
    try {
        auto previous = store_->loadDiscovery();
        if (!previous) {
            return;
        }
        for (const auto& device : *previous) {
            registry_->upsert(device);
        }
        LOG_INFO(kComponent, "Loaded {} camera(s) from previous snapshot", previous->size());
    } catch (const StorageError& e) {
        LOG_WARN(kComponent, "Ignoring previous snapshot: {}", e.what());
    }
}

std::vector<Device> Orchestrator::runDiscoveryPhase() {
    std::lock_guard<std::mutex> lock(phaseMutex_);
    LOG_INFO(kComponent, "Phase 1: camera discovery on {}", config_.network);

    std::vector<Device> devices = discovery_->discover(config_.network);
    if (!devices.empty()) {
        try {
            store_->saveDiscovery(registry_->all());
        } catch (const StorageError& e) {
            LOG_ERROR(kComponent, "Failed to save discovery snapshot: {}", e.what());
        }
    }
    return devices;
}

void Orchestrator::runEndpointPhase() {
    std::lock_guard<std::mutex> lock(phaseMutex_);
    if (!running_.load()) {
        return;
    }
    LOG_INFO(kComponent, "Phase 2: WebSocket endpoint negotiation");

    try {
        auto selected = negotiator_->negotiateEndpoints(registry_->all());

        std::map<std::string, QualityReport> quality;
        for (const auto& [ip, endpoint] : selected) {
            if (!running_.load()) {
                break;
            }
            QualityReport report = negotiator_->testStreamQuality(endpoint);
            LOG_INFO(kComponent, "{}: {} fps, {} kbps, jitter {} ms", ip, report.fps,
                     report.bitrate_kbps, report.jitter_ms);
            quality[endpoint.url] = report;
        }

        store_->saveEndpoints(negotiator_->validatedEndpoints(), quality);
        store_->saveDiscovery(registry_->all());
    } catch (const std::exception& e) {
        LOG_ERROR(kComponent, "Endpoint negotiation phase failed: {}", e.what());
    }
}

void Orchestrator::runCertificatePhase() {
    LOG_INFO(kComponent, "Phase 3: certificate scan");

    try {
        const std::vector<Device> devices = registry_->all();
        const auto records = certificates_->scanDevices(devices);
        const std::time_t now = std::time(nullptr);
        const CertificateSummary summary = CertificateTrustManager::summarize(
            records, now, config_.certificates.expiry_warning_days);

        store_->saveCertificateReport(records, summary, now);
        certificates_->buildCaBundle(true);

        auto expiring = certificates_->monitorExpiry(devices,
                                                     config_.certificates.expiry_warning_days);
        LOG_INFO(kComponent, "Certificates: {} total, {} self-signed, {} valid, {} expiring",
                 summary.total_certificates, summary.self_signed, summary.valid,
                 expiring.size());
    } catch (const std::exception& e) {
        LOG_ERROR(kComponent, "Certificate phase failed: {}", e.what());
    }
}

bool Orchestrator::configure() {
    seedFromSnapshot();

    std::vector<Device> devices = runDiscoveryPhase();
    if (devices.empty()) {
        if (!config_.monitor_without_devices) {
            LOG_ERROR(kComponent, "No cameras discovered. Check network settings.");
            return false;
        }
        LOG_WARN(kComponent, "No cameras discovered, continuing with monitoring only "
                 "({} known from snapshot)", registry_->size());
        return true;
    }

    if (running_.load()) {
        runEndpointPhase();
    }
    if (running_.load()) {
        runCertificatePhase();
    }
    return true;
}

// =============================================================================
// Monitoring
// =============================================================================

bool Orchestrator::rediscover() {
    if (!running_.load()) {
        return false;
    }
    try {
        auto devices = runDiscoveryPhase();
        LOG_INFO(kComponent, "Rediscovered {} camera(s)", devices.size());
        return !devices.empty();
    } catch (const DiscoveryError& e) {
        LOG_ERROR(kComponent, "Rediscovery failed: {}", e.what());
        return false;
    }
}

bool Orchestrator::renegotiate() {
    runEndpointPhase();
    return !negotiator_->validatedEndpoints().empty();
}

void Orchestrator::startMonitoring() {
    LOG_INFO(kComponent, "Phase 4: starting health monitoring");

    monitor_->registerCheck(makeSystemResourcesCheck(collector_, config_.thresholds));
    monitor_->registerCheck(makeCameraConnectivityCheck(registry_, http_,
                                                        [this] { return rediscover(); }));

    auto negotiator = negotiator_;
    monitor_->registerCheck(makeWebsocketHealthCheck(
        [negotiator] { return negotiator->lastOutcomes(); },
        [this] { return renegotiate(); }));

    for (const auto& service : config_.services) {
        monitor_->registerCheck(makeServiceCheck(service, http_));
    }
    monitor_->registerCheck(makeCertificateValidityCheck(store_));
    monitor_->registerCheck(makeNetworkHealthCheck(collector_));

    monitor_->start();
}

void Orchestrator::statusLoop() {
    while (sleepFor(config_.status_interval)) {
        AggregateHealth health = monitor_->status();
        LOG_INFO(kComponent, "Fleet status: {} ({} cameras, {} alerts pending, {} recovering)",
                 healthStatusToString(health.overall), registry_->size(),
                 health.alerts_pending, health.recovery_in_progress.size());
        for (const auto& [name, state] : health.checks) {
            LOG_DEBUG(kComponent, "  {}: {} (failures={})", name,
                      healthStatusToString(state.last_status), state.consecutive_failures);
        }
    }
}

void Orchestrator::rediscoveryLoop() {
    const auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(
        config_.rediscovery_interval);
    while (sleepFor(interval)) {
        LOG_INFO(kComponent, "Periodic rediscovery");
        if (rediscover() && running_.load()) {
            runEndpointPhase();
        }
    }
}

void Orchestrator::saveFinalReport() {
    const std::string path = store_->pathFor(SnapshotStore::kHealthFile);
    try {
        monitor_->saveReport(path);
    } catch (const StorageError& e) {
        LOG_ERROR(kComponent, "Failed to save final health report: {}", e.what());
    }
}

bool Orchestrator::run() {
    if (!configure()) {
        return false;
    }
    if (!running_.load()) {
        return true;
    }

    startMonitoring();

    std::thread rediscovery;
    if (config_.rediscovery_interval.count() > 0) {
        rediscovery = std::thread(&Orchestrator::rediscoveryLoop, this);
    }

    statusLoop();

    LOG_INFO(kComponent, "Shutting down...");
    if (rediscovery.joinable()) {
        rediscovery.join();
    }
    monitor_->stop();
    saveFinalReport();
    return true;
}

}  // namespace core
}  // namespace camfleet
