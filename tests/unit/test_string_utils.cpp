/**
 * @file test_string_utils.cpp
 * @brief Unit tests for string, hashing and time helpers
 */

#include <gtest/gtest.h>
#include <camfleet/utils/crypto.hpp>
#include <camfleet/utils/string_utils.hpp>
#include <camfleet/utils/time_utils.hpp>

#include <set>
#include <string>
#include <vector>

using namespace camfleet::utils;

// =============================================================================
// String helpers
// =============================================================================

TEST(StringUtilsTest, TrimStripsWhitespaceAndLineEndings) {
    EXPECT_EQ(trim("  model=M3067\r\n"), "model=M3067");
    EXPECT_EQ(trim(" \t\r\n"), "");
    EXPECT_EQ(trim("x"), "x");
}

TEST(StringUtilsTest, SplitDropsEmptyTokens) {
    std::vector<std::string> expected = {"a", "b", "c"};
    EXPECT_EQ(split("a,,b,c,", ','), expected);
    EXPECT_TRUE(split("", ',').empty());
}

TEST(StringUtilsTest, SplitLinesAcceptsCrlf) {
    std::vector<std::string> expected = {"HTTP/1.1 200 OK", "ST: upnp:rootdevice", ""};
    EXPECT_EQ(split_lines("HTTP/1.1 200 OK\r\nST: upnp:rootdevice\r\n\r\n"), expected);
}

TEST(StringUtilsTest, CaseHelpers) {
    EXPECT_EQ(to_upper("axis"), "AXIS");
    EXPECT_EQ(to_lower("AXIS M3067"), "axis m3067");
    EXPECT_TRUE(icontains("SERVER: Linux UPnP/1.0 AXIS", "axis"));
    EXPECT_FALSE(icontains("SERVER: Linux UPnP/1.0", "axis"));
}

TEST(StringUtilsTest, PrefixSuffixAndJoin) {
    EXPECT_TRUE(starts_with("rtsp://cam/stream1", "rtsp://"));
    EXPECT_FALSE(starts_with("rt", "rtsp://"));
    EXPECT_TRUE(ends_with("camera.crt", ".crt"));
    EXPECT_EQ(join({"DNS:cam", "IP:10.0.0.5"}, ","), "DNS:cam,IP:10.0.0.5");
    EXPECT_EQ(join({}, ","), "");
}

// =============================================================================
// Hashing & encoding
// =============================================================================

TEST(CryptoTest, KnownDigests) {
    EXPECT_EQ(md5Hex(""), "d41d8cd98f00b204e9800998ecf8427e");
    EXPECT_EQ(md5Hex("abc"), "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(sha256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha1Raw("abc").size(), 20u);
}

TEST(CryptoTest, Base64) {
    EXPECT_EQ(base64Encode(""), "");
    EXPECT_EQ(base64Encode("hello"), "aGVsbG8=");
    EXPECT_EQ(base64Encode("root:admin"), "cm9vdDphZG1pbg==");
}

TEST(CryptoTest, RandomHexIsFreshAndSized) {
    std::set<std::string> seen;
    for (int i = 0; i < 20; ++i) {
        std::string value = randomHex(8);
        EXPECT_EQ(value.size(), 16u);
        EXPECT_EQ(value.find_first_not_of("0123456789abcdef"), std::string::npos);
        seen.insert(value);
    }
    EXPECT_EQ(seen.size(), 20u);
}

// =============================================================================
// Time
// =============================================================================

TEST(TimeUtilsTest, IsoUtc) {
    EXPECT_EQ(isoUtc(0), "1970-01-01T00:00:00");
    EXPECT_EQ(isoUtc(1735689600), "2025-01-01T00:00:00");
}

TEST(TimeUtilsTest, UnixSecondsKeepsFraction) {
    auto tp = SystemClock::time_point(std::chrono::milliseconds(1500));
    EXPECT_DOUBLE_EQ(unixSeconds(tp), 1.5);
}
