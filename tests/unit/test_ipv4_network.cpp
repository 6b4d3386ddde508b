/**
 * @file test_ipv4_network.cpp
 * @brief Unit tests for CIDR parsing and host enumeration
 */

#include <gtest/gtest.h>
#include <camfleet/net/ipv4_network.hpp>

using namespace camfleet::net;

TEST(Ipv4NetworkTest, ParsesSlash24) {
    auto net = Ipv4Network::parse("192.168.1.0/24");
    ASSERT_TRUE(net.has_value());
    EXPECT_EQ(net->prefixLength(), 24);
    EXPECT_EQ(net->hostCount(), 254u);
    EXPECT_EQ(net->toString(), "192.168.1.0/24");

    auto hosts = net->hosts();
    ASSERT_EQ(hosts.size(), 254u);
    EXPECT_EQ(hosts.front(), "192.168.1.1");
    EXPECT_EQ(hosts.back(), "192.168.1.254");
}

TEST(Ipv4NetworkTest, SmallPrefixesKeepEveryAddress) {
    auto net31 = Ipv4Network::parse("10.0.0.0/31");
    ASSERT_TRUE(net31.has_value());
    EXPECT_EQ(net31->hosts(), (std::vector<std::string>{"10.0.0.0", "10.0.0.1"}));

    auto single = Ipv4Network::parse("10.0.0.9");
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(single->prefixLength(), 32);
    EXPECT_EQ(single->hosts(), (std::vector<std::string>{"10.0.0.9"}));
}

TEST(Ipv4NetworkTest, RejectsHostBitsAndGarbage) {
    EXPECT_FALSE(Ipv4Network::parse("192.168.1.7/24").has_value());
    EXPECT_FALSE(Ipv4Network::parse("192.168.1.0/33").has_value());
    EXPECT_FALSE(Ipv4Network::parse("192.168.1.0/").has_value());
    EXPECT_FALSE(Ipv4Network::parse("192.168.1/24").has_value());
    EXPECT_FALSE(Ipv4Network::parse("not-a-network").has_value());
}

TEST(Ipv4NetworkTest, Contains) {
    auto net = Ipv4Network::parse("172.16.0.0/12");
    ASSERT_TRUE(net.has_value());
    EXPECT_TRUE(net->contains("172.31.255.254"));
    EXPECT_FALSE(net->contains("172.32.0.1"));
    EXPECT_FALSE(net->contains("bogus"));
}

TEST(Ipv4NetworkTest, Literals) {
    EXPECT_TRUE(isIpv4Literal("192.168.1.50"));
    EXPECT_FALSE(isIpv4Literal("192.168.1"));
    EXPECT_FALSE(isIpv4Literal("cam.local"));
    EXPECT_EQ(ipv4FromString("0.0.1.2").value_or(0), 258u);
    EXPECT_EQ(ipv4ToString(0xC0A80132u), "192.168.1.50");
}
