/**
 * @file test_ssdp_discovery.cpp
 * @brief Integration test: SSDP and WS-Discovery probes against a loopback responder
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <camfleet/core/discovery_engine.hpp>
#include <camfleet/net/udp_socket.hpp>
#include <camfleet/utils/logger.hpp>

#include "mocks/mock_http_client.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace camfleet;
using camfleet::testing::MockHttpClient;
using camfleet::testing::makeResponse;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

/**
 * @brief Answers one probe datagram on 127.0.0.1 with canned replies,
 *        sent 100 ms apart.
 */
class LoopbackResponder {
public:
    explicit LoopbackResponder(std::string reply)
        : LoopbackResponder(std::vector<std::string>{std::move(reply)}) {}

    explicit LoopbackResponder(std::vector<std::string> replies) : replies_(std::move(replies)) {
        socket_.bind(0, "127.0.0.1");
        port_ = socket_.getLocalPort();
        thread_ = std::thread([this] {
            std::string request;
            net::SocketAddress sender;
            if (socket_.receiveFrom(request, 3000, sender) > 0) {
                request_ = request;
                for (size_t i = 0; i < replies_.size(); ++i) {
                    if (i > 0) {
                        std::this_thread::sleep_for(std::chrono::milliseconds(100));
                    }
                    socket_.sendTo(sender, replies_[i]);
                }
            }
        });
    }

    ~LoopbackResponder() {
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    uint16_t port() const { return port_; }

    /// Valid once the probe has returned.
    std::string request() {
        if (thread_.joinable()) {
            thread_.join();
        }
        return request_;
    }

private:
    net::UdpSocket socket_;
    uint16_t port_ = 0;
    std::vector<std::string> replies_;
    std::string request_;
    std::thread thread_;
};

class SsdpDiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::instance().setLevel(utils::LogLevel::DEBUG);

        http = std::make_shared<NiceMock<MockHttpClient>>();
        registry = std::make_shared<core::DeviceRegistry>();
        ON_CALL(*http, get(_, _, _)).WillByDefault(Return(makeResponse(404)));

        config.ssdp_address = "127.0.0.1";
        config.wsd_address = "127.0.0.1";
        config.ssdp_window = std::chrono::milliseconds(1500);
        config.wsd_window = std::chrono::milliseconds(1500);
        config.enable_mdns = false;
        config.rtsp_paths.clear();
    }

    core::DiscoveryConfig config;
    std::shared_ptr<NiceMock<MockHttpClient>> http;
    std::shared_ptr<core::DeviceRegistry> registry;
};

TEST_F(SsdpDiscoveryTest, AxisReplyIsCollected) {
    LoopbackResponder responder(
        "HTTP/1.1 200 OK\r\n"
        "CACHE-CONTROL: max-age=1800\r\n"
        "SERVER: Linux/4.14 UPnP/1.0 AXIS/10.12.1\r\n"
        "ST: urn:axis-com:service:BasicService:1\r\n\r\n");
    config.ssdp_port = responder.port();

    core::DiscoveryEngine engine(config, registry, http, core::Credentials{});
    core::IpSet found = engine.probeSsdp();

    EXPECT_EQ(found.size(), 1u);
    EXPECT_EQ(found.count("127.0.0.1"), 1u);

    std::string request = responder.request();
    EXPECT_THAT(request, HasSubstr("M-SEARCH * HTTP/1.1\r\n"));
    EXPECT_THAT(request, HasSubstr("MAN: \"ssdp:discover\""));
    EXPECT_THAT(request, HasSubstr("ST: urn:axis-com:service:BasicService:1"));
}

TEST_F(SsdpDiscoveryTest, EmptyDatagramKeepsWindowOpen) {
    LoopbackResponder responder(std::vector<std::string>{
        "",
        "HTTP/1.1 200 OK\r\nSERVER: Linux/4.14 UPnP/1.0 AXIS/10.12.1\r\n\r\n"});
    config.ssdp_port = responder.port();

    core::DiscoveryEngine engine(config, registry, http, core::Credentials{});
    core::IpSet found = engine.probeSsdp();

    EXPECT_EQ(found.count("127.0.0.1"), 1u);
}

TEST_F(SsdpDiscoveryTest, ForeignReplyIsIgnored) {
    LoopbackResponder responder(
        "HTTP/1.1 200 OK\r\n"
        "SERVER: Linux UPnP/1.0 Generic-NAS/2.0\r\n\r\n");
    config.ssdp_port = responder.port();

    core::DiscoveryEngine engine(config, registry, http, core::Credentials{});
    EXPECT_TRUE(engine.probeSsdp().empty());
}

TEST_F(SsdpDiscoveryTest, WsDiscoveryMatchesVideoTransmitter) {
    LoopbackResponder responder(
        "<?xml version=\"1.0\"?><Envelope><Body><ProbeMatches><ProbeMatch>"
        "<Types>dn:NetworkVideoTransmitter</Types>"
        "</ProbeMatch></ProbeMatches></Body></Envelope>");
    config.wsd_port = responder.port();

    core::DiscoveryEngine engine(config, registry, http, core::Credentials{});
    core::IpSet found = engine.probeWsDiscovery();

    EXPECT_EQ(found.count("127.0.0.1"), 1u);
    EXPECT_THAT(responder.request(), HasSubstr("NetworkVideoTransmitter"));
}

TEST_F(SsdpDiscoveryTest, DiscoverRegistersRespondingCamera) {
    LoopbackResponder responder(
        "HTTP/1.1 200 OK\r\nSERVER: Linux/4.14 UPnP/1.0 AXIS/10.12.1\r\n\r\n");
    config.ssdp_port = responder.port();
    config.enable_ws_discovery = false;

    EXPECT_CALL(*http, get("http://127.0.0.1/axis-cgi/basicdeviceinfo.cgi", _, _))
        .WillRepeatedly(Return(makeResponse(200, "model=Q1656\nmacaddress=00:40:8C:AA:BB:CC\n")));

    core::DiscoveryEngine engine(config, registry, http, core::Credentials{});
    auto devices = engine.discover("");

    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].ip, "127.0.0.1");
    EXPECT_EQ(devices[0].model, "Q1656");

    auto stored = registry->get("127.0.0.1");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->mac, "00:40:8C:AA:BB:CC");
}
