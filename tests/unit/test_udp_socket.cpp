/**
 * @file test_udp_socket.cpp
 * @brief Unit tests for UDP socket abstraction
 */

#include <gtest/gtest.h>
#include <camfleet/net/udp_socket.hpp>

#include <chrono>
#include <string>
#include <utility>

using namespace camfleet::net;

class UdpSocketTest : public ::testing::Test {};

TEST_F(UdpSocketTest, CreateAndClose) {
    UdpSocket socket;
    EXPECT_TRUE(socket.isValid());

    socket.close();
    EXPECT_FALSE(socket.isValid());
}

TEST_F(UdpSocketTest, BindToEphemeralPort) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));
    EXPECT_NE(socket.getLocalPort(), 0);
}

TEST_F(UdpSocketTest, RejectsInvalidBindAddress) {
    UdpSocket socket;
    EXPECT_FALSE(socket.bind(0, "not-an-address"));
}

TEST_F(UdpSocketTest, SendReceiveLoopback) {
    UdpSocket receiver;
    ASSERT_TRUE(receiver.bind(0, "127.0.0.1"));
    uint16_t port = receiver.getLocalPort();

    UdpSocket sender;
    ASSERT_TRUE(sender.bind(0, "127.0.0.1"));

    std::string message = "M-SEARCH * HTTP/1.1\r\n\r\n";
    ASSERT_EQ(sender.sendTo(SocketAddress("127.0.0.1", port), message),
              static_cast<int>(message.size()));

    std::string payload;
    SocketAddress from;
    int received = receiver.receiveFrom(payload, 1000, from);
    ASSERT_EQ(received, static_cast<int>(message.size()));
    EXPECT_EQ(payload, message);
    EXPECT_EQ(from.ip, "127.0.0.1");
    EXPECT_EQ(from.port, sender.getLocalPort());
}

TEST_F(UdpSocketTest, ReceiveTimesOut) {
    UdpSocket socket;
    ASSERT_TRUE(socket.bind(0, "127.0.0.1"));

    std::string payload;
    SocketAddress from;
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(socket.receiveFrom(payload, 100, from), UdpSocket::kTimedOut);
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, std::chrono::milliseconds(90));
}

TEST_F(UdpSocketTest, EmptyDatagramIsNotATimeout) {
    UdpSocket receiver;
    ASSERT_TRUE(receiver.bind(0, "127.0.0.1"));

    UdpSocket sender;
    ASSERT_TRUE(sender.bind(0, "127.0.0.1"));
    ASSERT_EQ(sender.sendTo(SocketAddress("127.0.0.1", receiver.getLocalPort()), std::string()), 0);

    std::string payload = "stale";
    SocketAddress from;
    EXPECT_EQ(receiver.receiveFrom(payload, 1000, from), 0);
    EXPECT_TRUE(payload.empty());
    EXPECT_EQ(from.port, sender.getLocalPort());
}

TEST_F(UdpSocketTest, MoveTransfersHandle) {
    UdpSocket original;
    ASSERT_TRUE(original.isValid());

    UdpSocket moved(std::move(original));
    EXPECT_TRUE(moved.isValid());
    EXPECT_FALSE(original.isValid());
}

TEST_F(UdpSocketTest, SocketOptions) {
    UdpSocket socket;
    EXPECT_TRUE(socket.setReuseAddress(true));
    EXPECT_TRUE(socket.setBroadcast(true));
    EXPECT_TRUE(socket.setMulticastTTL(2));
    EXPECT_TRUE(socket.setMulticastLoopback(false));
}
