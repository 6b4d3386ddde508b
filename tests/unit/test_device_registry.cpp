/**
 * @file test_device_registry.cpp
 * @brief Unit tests for the device registry
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <camfleet/core/device_registry.hpp>

#include <thread>
#include <vector>

using namespace camfleet::core;

class DeviceRegistryTest : public ::testing::Test {
protected:
    DeviceRegistry registry;
};

TEST_F(DeviceRegistryTest, DefaultsForUnprobedDevice) {
    Device device("192.168.1.50");
    EXPECT_EQ(device.mac, "unknown");
    EXPECT_EQ(device.model, "unknown");
    EXPECT_EQ(device.name, "axis-192.168.1.50");
    EXPECT_FALSE(device.capabilities.rtsp);
    EXPECT_FALSE(device.websocket_url.has_value());
}

TEST_F(DeviceRegistryTest, UpsertAndGet) {
    Device device("192.168.1.50");
    device.model = "M3067";

    EXPECT_TRUE(registry.upsert(device));
    auto stored = registry.get("192.168.1.50");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->model, "M3067");
    EXPECT_FALSE(registry.get("192.168.1.51").has_value());
}

TEST_F(DeviceRegistryTest, UnchangedUpsertReportsNoChange) {
    Device device("192.168.1.50");
    EXPECT_TRUE(registry.upsert(device));
    EXPECT_FALSE(registry.upsert(device));

    device.firmware = "10.12.1";
    EXPECT_TRUE(registry.upsert(device));
    EXPECT_EQ(registry.size(), 1u);
}

TEST_F(DeviceRegistryTest, ReprobeKeepsNegotiatedEndpoint) {
    Device device("10.0.0.5");
    registry.upsert(device);
    ASSERT_TRUE(registry.setWebsocketUrl("10.0.0.5", std::string("wss://10.0.0.5/ws")));

    EXPECT_FALSE(registry.upsert(Device("10.0.0.5")));
    auto stored = registry.get("10.0.0.5");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->websocket_url.value_or(""), "wss://10.0.0.5/ws");
}

TEST_F(DeviceRegistryTest, SetWebsocketUrlOnUnknownDevice) {
    EXPECT_FALSE(registry.setWebsocketUrl("10.0.0.9", std::string("ws://10.0.0.9/")));
}

TEST_F(DeviceRegistryTest, AllIsOrderedNumerically) {
    registry.upsert(Device("192.168.1.100"));
    registry.upsert(Device("192.168.1.9"));
    registry.upsert(Device("192.168.1.20"));

    std::vector<std::string> ips;
    for (const auto& device : registry.all()) {
        ips.push_back(device.ip);
    }
    EXPECT_THAT(ips, ::testing::ElementsAre("192.168.1.9", "192.168.1.20", "192.168.1.100"));
}

TEST_F(DeviceRegistryTest, Remove) {
    registry.upsert(Device("10.0.0.5"));
    EXPECT_TRUE(registry.remove("10.0.0.5"));
    EXPECT_FALSE(registry.remove("10.0.0.5"));
    EXPECT_EQ(registry.size(), 0u);
}

TEST_F(DeviceRegistryTest, ConcurrentUpserts) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < 32; ++i) {
                registry.upsert(Device("10.0." + std::to_string(t) + "." + std::to_string(i)));
                registry.all();
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(registry.size(), 256u);
}

TEST(IpLessTest, NumericThenTextual) {
    EXPECT_TRUE(ipLess("10.0.0.2", "10.0.0.10"));
    EXPECT_FALSE(ipLess("10.0.0.10", "10.0.0.2"));
    EXPECT_TRUE(ipLess("cam-a", "cam-b"));
}
