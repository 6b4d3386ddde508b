/**
 * @file test_orchestrator.cpp
 * @brief Unit tests for the configuration phases and monitor wiring
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <camfleet/core/errors.hpp>
#include <camfleet/core/orchestrator.hpp>

#include "mocks/mock_http_client.hpp"
#include "support/temp_dir.hpp"

#include <filesystem>
#include <fstream>

using namespace camfleet::core;
using camfleet::testing::MockHttpClient;
using camfleet::testing::TempDir;
using camfleet::testing::makeResponse;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

class FakeCollector : public SystemMetricsCollector {
public:
    double cpuPercent() override { return 5.0; }
    double memoryPercent() override { return 5.0; }
    double diskPercent() override { return 5.0; }
    NetIoCounters netIo() override { return {}; }
    std::vector<InterfaceState> interfaces() override { return {{"eth0", true}}; }
    int processCount() override { return 10; }
    int openFiles() override { return 10; }
};

}  // namespace

class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        http = std::make_shared<NiceMock<MockHttpClient>>();
        ON_CALL(*http, get(_, _, _)).WillByDefault(Return(makeResponse(404)));

        config.network.clear();
        config.output_dir = dir.str();
        config.discovery.enable_ssdp = false;
        config.discovery.enable_ws_discovery = false;
        config.discovery.enable_mdns = false;
        config.discovery.rtsp_paths.clear();

        // Nothing listens on port 1, so every connect fails fast.
        config.negotiator.ws_port = 1;
        config.negotiator.wss_port = 1;
        config.negotiator.connect_timeout_ms = 200;
        config.certificates.port = 1;
        config.certificates.timeout_ms = 200;
        config.certificates.cert_dir = dir.file("certificates");
        config.certificates.system_bundle = dir.file("system-bundle.crt");

        config.services.clear();
    }

    std::unique_ptr<Orchestrator> makeOrchestrator() {
        return std::make_unique<Orchestrator>(config, http, std::make_shared<FakeCollector>());
    }

    void enableLoopbackMdns() {
        config.discovery.enable_mdns = true;
        config.discovery.mdns_command = {
            "sh", "-c", "echo 'Add AXIS M3067 camera 127.0.0.1 local.'"};
        config.discovery.mdns_window = std::chrono::milliseconds(2000);
        ON_CALL(*http, get("http://127.0.0.1/axis-cgi/basicdeviceinfo.cgi", _, _))
            .WillByDefault(Return(makeResponse(200, "model=M3067\nmacaddress=AA:BB:CC:00:11:22\n")));
    }

    TempDir dir;
    OrchestratorConfig config;
    std::shared_ptr<NiceMock<MockHttpClient>> http;
};

TEST_F(OrchestratorTest, NoDevicesAbortsConfiguration) {
    auto orchestrator = makeOrchestrator();
    EXPECT_FALSE(orchestrator->configure());
    EXPECT_EQ(orchestrator->registry()->size(), 0u);
}

TEST_F(OrchestratorTest, RunReturnsFalseWithoutDevices) {
    auto orchestrator = makeOrchestrator();
    EXPECT_FALSE(orchestrator->run());
}

TEST_F(OrchestratorTest, InvalidNetworkThrows) {
    config.network = "10.0.0.0/33";
    auto orchestrator = makeOrchestrator();
    EXPECT_THROW(orchestrator->configure(), DiscoveryError);
}

TEST_F(OrchestratorTest, MonitoringOnlySeedsFromSnapshot) {
    Device known("10.0.0.5");
    known.model = "P3245";
    SnapshotStore(dir.str()).saveDiscovery({known});

    config.monitor_without_devices = true;
    auto orchestrator = makeOrchestrator();
    EXPECT_TRUE(orchestrator->configure());

    auto seeded = orchestrator->registry()->get("10.0.0.5");
    ASSERT_TRUE(seeded.has_value());
    EXPECT_EQ(seeded->model, "P3245");
}

TEST_F(OrchestratorTest, CorruptSnapshotIsIgnored) {
    std::ofstream(dir.file(SnapshotStore::kDiscoveryFile)) << "{ broken";
    config.monitor_without_devices = true;
    auto orchestrator = makeOrchestrator();
    EXPECT_TRUE(orchestrator->configure());
    EXPECT_EQ(orchestrator->registry()->size(), 0u);
}

TEST_F(OrchestratorTest, ConfigureWritesEveryPhaseSnapshot) {
    enableLoopbackMdns();
    auto orchestrator = makeOrchestrator();
    ASSERT_TRUE(orchestrator->configure());

    auto device = orchestrator->registry()->get("127.0.0.1");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->model, "M3067");
    EXPECT_FALSE(device->websocket_url.has_value());

    auto store = orchestrator->store();
    EXPECT_TRUE(std::filesystem::exists(store->pathFor(SnapshotStore::kDiscoveryFile)));
    EXPECT_TRUE(std::filesystem::exists(store->pathFor(SnapshotStore::kEndpointsFile)));
    EXPECT_TRUE(std::filesystem::exists(store->pathFor(SnapshotStore::kCertificatesFile)));
    EXPECT_TRUE(std::filesystem::exists(std::filesystem::path(config.certificates.cert_dir) /
                                        CertificateTrustManager::kBundleName));

    auto endpoints = store->loadEndpoints();
    ASSERT_TRUE(endpoints.has_value());
    EXPECT_TRUE(endpoints->empty());

    auto summary = store->loadCertificateSummary();
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary->total_certificates, 0);
}

TEST_F(OrchestratorTest, StopBeforeDiscoveryFindsNothing) {
    enableLoopbackMdns();
    auto orchestrator = makeOrchestrator();
    orchestrator->requestStop();

    EXPECT_TRUE(orchestrator->runDiscoveryPhase().empty());
    orchestrator->runEndpointPhase();
    EXPECT_FALSE(orchestrator->configure());

    EXPECT_EQ(orchestrator->registry()->size(), 0u);
    auto store = orchestrator->store();
    EXPECT_FALSE(std::filesystem::exists(store->pathFor(SnapshotStore::kDiscoveryFile)));
    EXPECT_FALSE(std::filesystem::exists(store->pathFor(SnapshotStore::kEndpointsFile)));
}

TEST_F(OrchestratorTest, StartMonitoringRegistersBuiltInChecks) {
    ServiceSpec service;
    service.name = "edge_service";
    service.health_url = "http://localhost:9/health";
    config.services = {service};

    auto orchestrator = makeOrchestrator();
    orchestrator->startMonitoring();

    AggregateHealth health = orchestrator->monitor()->status();
    for (const char* name : {"system_resources", "camera_connectivity", "websocket_health",
                             "edge_service", "certificate_validity", "network_health"}) {
        EXPECT_EQ(health.checks.count(name), 1u) << name;
    }
    EXPECT_EQ(health.checks.size(), 6u);

    orchestrator->requestStop();
    orchestrator->monitor()->stop();
}
