/**
 * @file test_endpoint_negotiator.cpp
 * @brief Unit tests for WebSocket endpoint enumeration, selection and quality math
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <camfleet/core/endpoint_negotiator.hpp>

#include <memory>

using namespace camfleet::core;
using ::testing::HasSubstr;

namespace {

EndpointCandidate candidate(const std::string& protocol, double latency, bool validated = true) {
    EndpointCandidate c;
    c.device_ip = "192.168.1.50";
    c.protocol = protocol;
    c.url = protocol + "://192.168.1.50/ws";
    c.latency_ms = latency;
    c.validated = validated;
    return c;
}

}  // namespace

TEST(EndpointSelectionTest, SecureFirstThenLowestLatency) {
    std::vector<EndpointCandidate> candidates = {
        candidate("wss", 100.0), candidate("ws", 10.0), candidate("wss", 50.0)};

    for (int i = 0; i < 5; ++i) {
        auto best = EndpointNegotiator::selectOptimal(candidates);
        ASSERT_TRUE(best.has_value());
        EXPECT_EQ(best->protocol, "wss");
        EXPECT_DOUBLE_EQ(best->latency_ms, 50.0);
    }
}

TEST(EndpointSelectionTest, IgnoresUnvalidated) {
    std::vector<EndpointCandidate> candidates = {
        candidate("wss", 1.0, false), candidate("ws", 30.0), candidate("ws", 20.0)};
    auto best = EndpointNegotiator::selectOptimal(candidates);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->protocol, "ws");
    EXPECT_DOUBLE_EQ(best->latency_ms, 20.0);

    EXPECT_FALSE(EndpointNegotiator::selectOptimal({candidate("wss", 1.0, false)}).has_value());
    EXPECT_FALSE(EndpointNegotiator::selectOptimal({}).has_value());
}

TEST(EndpointSelectionTest, TiesKeepInputOrder) {
    auto first = candidate("wss", 40.0);
    first.path = "/ws";
    auto second = candidate("wss", 40.0);
    second.path = "/websocket";

    auto best = EndpointNegotiator::selectOptimal({first, second});
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->path, "/ws");
}

TEST(EndpointCandidatesTest, BasePathsForEveryModel) {
    auto paths = EndpointNegotiator::candidatePaths("unknown");
    ASSERT_EQ(paths.size(), 4u);
    EXPECT_EQ(paths[0].path, "/rtsp-over-websocket");
    EXPECT_EQ(paths[0].auth, AuthType::Digest);
    EXPECT_EQ(paths[1].path, "/ws");
    EXPECT_EQ(paths[1].auth, AuthType::Basic);
    EXPECT_EQ(paths[2].path, "/websocket");
    EXPECT_EQ(paths[3].path, "/axis-cgi/websocket");
}

TEST(EndpointCandidatesTest, ModelSpecificPaths) {
    auto dome = EndpointNegotiator::candidatePaths("AXIS M3067-P");
    ASSERT_EQ(dome.size(), 5u);
    EXPECT_EQ(dome.back().path, "/axis-media/media.amp/websocket");

    auto ptz = EndpointNegotiator::candidatePaths("AXIS P3245");
    ASSERT_EQ(ptz.size(), 5u);
    EXPECT_EQ(ptz.back().path, "/ptz/websocket");

    auto thermal = EndpointNegotiator::candidatePaths("AXIS Q1659");
    ASSERT_EQ(thermal.size(), 5u);
    EXPECT_EQ(thermal.back().path, "/thermal/websocket");
}

TEST(EndpointCandidatesTest, BuildUrl) {
    EXPECT_EQ(EndpointNegotiator::buildUrl("wss", "10.0.0.5", 443, "/ws", {}),
              "wss://10.0.0.5/ws");
    EXPECT_EQ(EndpointNegotiator::buildUrl("ws", "10.0.0.5", 8080, "/ws", {}),
              "ws://10.0.0.5:8080/ws");
    EXPECT_EQ(EndpointNegotiator::buildUrl("ws", "10.0.0.5", 80, "/rtsp-over-websocket",
                                           {{"video", "h264"}, {"audio", "0"}}),
              "ws://10.0.0.5/rtsp-over-websocket?video=h264&audio=0");
}

TEST(EndpointCandidatesTest, AuthTypeNames) {
    EXPECT_STREQ(authTypeToString(AuthType::Digest), "digest");
    EXPECT_EQ(authTypeFromString("BASIC"), AuthType::Basic);
    EXPECT_EQ(authTypeFromString("token"), AuthType::Token);
    EXPECT_FALSE(authTypeFromString("kerberos").has_value());
}

TEST(EndpointQualityTest, ComputeQuality) {
    auto report = EndpointNegotiator::computeQuality({0.1, 0.2, 0.3, 0.5}, 1000, 2.0);
    EXPECT_EQ(report.frames, 4u);
    EXPECT_DOUBLE_EQ(report.fps, 2.0);
    EXPECT_DOUBLE_EQ(report.bitrate_kbps, 4.0);
    EXPECT_NEAR(report.jitter_ms, 44.444, 0.01);
}

TEST(EndpointQualityTest, SingleFrameHasNoJitter) {
    auto report = EndpointNegotiator::computeQuality({0.4}, 100, 1.0);
    EXPECT_DOUBLE_EQ(report.fps, 1.0);
    EXPECT_DOUBLE_EQ(report.jitter_ms, 0.0);
}

TEST(EndpointQualityTest, ZeroDurationYieldsZeros) {
    auto report = EndpointNegotiator::computeQuality({}, 0, 0.0);
    EXPECT_DOUBLE_EQ(report.fps, 0.0);
    EXPECT_DOUBLE_EQ(report.bitrate_kbps, 0.0);
}

TEST(EndpointNegotiatorTest, PingMessageIsJson) {
    std::string ping = EndpointNegotiator::pingMessage(1700000000.5);
    EXPECT_THAT(ping, HasSubstr("\"type\":\"ping\""));
    EXPECT_THAT(ping, HasSubstr("\"timestamp\""));
}

TEST(EndpointNegotiatorTest, AuthorizationHeaders) {
    auto registry = std::make_shared<DeviceRegistry>();
    EndpointNegotiator negotiator(NegotiatorConfig{}, registry, Credentials{});
    EXPECT_EQ(negotiator.authorizationFor(AuthType::Basic), "Basic cm9vdDphZG1pbg==");
    EXPECT_EQ(negotiator.authorizationFor(AuthType::Digest), "Basic cm9vdDphZG1pbg==");
    EXPECT_EQ(negotiator.authorizationFor(AuthType::Token), "Bearer admin");
}

TEST(EndpointNegotiatorTest, UnreachableDeviceHasNoEndpoint) {
    auto registry = std::make_shared<DeviceRegistry>();
    Device device("127.0.0.1");
    device.websocket_url = "ws://127.0.0.1/stale";
    registry->upsert(device);

    NegotiatorConfig config;
    config.ws_port = 1;
    config.wss_port = 1;
    config.connect_timeout_ms = 500;
    EndpointNegotiator negotiator(config, registry, Credentials{});

    auto selected = negotiator.negotiateEndpoints({device});
    EXPECT_TRUE(selected.empty());
    EXPECT_TRUE(negotiator.validatedEndpoints().empty());

    auto outcomes = negotiator.lastOutcomes();
    ASSERT_EQ(outcomes.count("127.0.0.1"), 1u);
    EXPECT_FALSE(outcomes["127.0.0.1"]);

    auto stored = registry->get("127.0.0.1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_FALSE(stored->websocket_url.has_value());
}

TEST(EndpointNegotiatorTest, CancelledNegotiationLeavesRegistryAlone) {
    auto registry = std::make_shared<DeviceRegistry>();
    Device device("127.0.0.1");
    device.websocket_url = "ws://127.0.0.1/ws";
    registry->upsert(device);

    NegotiatorConfig config;
    config.ws_port = 1;
    config.wss_port = 1;
    EndpointNegotiator negotiator(config, registry, Credentials{});
    negotiator.cancel();

    EXPECT_TRUE(negotiator.negotiateEndpoints({device}).empty());
    EXPECT_TRUE(negotiator.cancelled());
    EXPECT_TRUE(negotiator.lastOutcomes().empty());

    auto stored = registry->get("127.0.0.1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->websocket_url, std::optional<std::string>("ws://127.0.0.1/ws"));
}

TEST(EndpointNegotiatorTest, FailedQualityConnectIsAllZero) {
    auto registry = std::make_shared<DeviceRegistry>();
    NegotiatorConfig config;
    config.connect_timeout_ms = 500;
    EndpointNegotiator negotiator(config, registry, Credentials{});

    auto c = candidate("ws", 5.0);
    c.url = "ws://127.0.0.1:1/ws";
    auto report = negotiator.testStreamQuality(c);
    EXPECT_EQ(report.frames, 0u);
    EXPECT_DOUBLE_EQ(report.fps, 0.0);
}
