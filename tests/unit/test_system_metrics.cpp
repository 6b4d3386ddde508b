/**
 * @file test_system_metrics.cpp
 * @brief Unit tests for /proc parsing and the metrics history window
 */

#include <gtest/gtest.h>
#include <camfleet/core/system_metrics.hpp>

#include "support/temp_dir.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

using namespace camfleet::core;
using camfleet::testing::TempDir;

namespace {

const char* kNetDev =
    "Inter-|   Receive                                                |  Transmit\n"
    " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n"
    "    lo:    1000      10    0    0    0     0          0         0     1000      10    0    0    0     0       0          0\n"
    "  eth0:  500000     400    2    0    0     0          0         0   200000     300    1    0    0     0       0          0\n";

const char* kMeminfo =
    "MemTotal:        8000000 kB\n"
    "MemFree:         1000000 kB\n"
    "MemAvailable:    2000000 kB\n"
    "Buffers:          100000 kB\n";

void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream(path) << content;
}

MetricsSample sampleAt(long seconds, double cpu = 0.0) {
    MetricsSample sample;
    sample.timestamp = camfleet::utils::SystemClock::time_point(std::chrono::seconds(seconds));
    sample.cpu_percent = cpu;
    return sample;
}

}  // namespace

TEST(ProcParsingTest, CpuTimesFoldIowaitIntoIdle) {
    auto times = LinuxMetricsCollector::parseCpuTimes(
        "cpu  100 20 30 400 50 5 5 0 0 0\ncpu0 50 10 15 200 25 2 2 0 0 0\n");
    ASSERT_TRUE(times.has_value());
    EXPECT_EQ(times->first, 610u);
    EXPECT_EQ(times->second, 450u);
}

TEST(ProcParsingTest, CpuTimesRejectsGarbage) {
    EXPECT_FALSE(LinuxMetricsCollector::parseCpuTimes("intr 1 2 3\n").has_value());
    EXPECT_FALSE(LinuxMetricsCollector::parseCpuTimes("cpu x y\n").has_value());
}

TEST(ProcParsingTest, MemoryPercent) {
    auto percent = LinuxMetricsCollector::parseMemoryPercent(kMeminfo);
    ASSERT_TRUE(percent.has_value());
    EXPECT_DOUBLE_EQ(*percent, 75.0);

    EXPECT_FALSE(LinuxMetricsCollector::parseMemoryPercent("MemTotal: 100 kB\n").has_value());
}

TEST(ProcParsingTest, NetDevSumsAllInterfaces) {
    NetIoCounters counters = LinuxMetricsCollector::parseNetDev(kNetDev);
    EXPECT_EQ(counters.bytes_recv, 501000u);
    EXPECT_EQ(counters.packets_recv, 410u);
    EXPECT_EQ(counters.errin, 2u);
    EXPECT_EQ(counters.bytes_sent, 201000u);
    EXPECT_EQ(counters.packets_sent, 310u);
    EXPECT_EQ(counters.errout, 1u);
}

class FakeProcTest : public ::testing::Test {
protected:
    void SetUp() override {
        proc = dir.path() / "proc";
        sys = dir.path() / "sys";
        writeFile(proc / "stat", "cpu  100 0 100 800 0 0 0 0\n");
        writeFile(proc / "meminfo", kMeminfo);
        writeFile(proc / "net" / "dev", kNetDev);
        writeFile(proc / "sys" / "fs" / "file-nr", "1824\t0\t9223372036854775807\n");
        std::filesystem::create_directories(proc / "1");
        std::filesystem::create_directories(proc / "42");
        std::filesystem::create_directories(proc / "self");
        writeFile(sys / "class" / "net" / "eth0" / "flags", "0x1003\n");
        writeFile(sys / "class" / "net" / "wlan0" / "flags", "0x1002\n");
    }

    /// Readers never see a half-written file.
    void replaceStat(const std::string& content) {
        const auto staging = proc / "stat.tmp";
        writeFile(staging, content);
        std::filesystem::rename(staging, proc / "stat");
    }

    TempDir dir;
    std::filesystem::path proc;
    std::filesystem::path sys;
};

TEST_F(FakeProcTest, ReadsEveryMetric) {
    LinuxMetricsCollector collector(proc.string(), sys.string(), dir.str(),
                                    std::chrono::milliseconds(10));

    EXPECT_DOUBLE_EQ(collector.memoryPercent(), 75.0);
    EXPECT_EQ(collector.netIo().bytes_recv, 501000u);
    EXPECT_EQ(collector.processCount(), 2);
    EXPECT_EQ(collector.openFiles(), 1824);

    auto interfaces = collector.interfaces();
    ASSERT_EQ(interfaces.size(), 2u);
    EXPECT_EQ(interfaces[0].name, "eth0");
    EXPECT_TRUE(interfaces[0].up);
    EXPECT_EQ(interfaces[1].name, "wlan0");
    EXPECT_FALSE(interfaces[1].up);

    double disk = collector.diskPercent();
    EXPECT_GE(disk, 0.0);
    EXPECT_LE(disk, 100.0);
}

TEST_F(FakeProcTest, CpuPercentFromDelta) {
    LinuxMetricsCollector collector(proc.string(), sys.string(), dir.str(),
                                    std::chrono::milliseconds(400));

    // No movement inside the window.
    EXPECT_DOUBLE_EQ(collector.cpuPercent(), 0.0);

    // 100 busy of 400 total jiffies while the window is open.
    std::thread writer([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(150));
        replaceStat("cpu  150 0 150 1100 0 0 0 0\n");
    });
    EXPECT_DOUBLE_EQ(collector.cpuPercent(), 25.0);
    writer.join();
}

TEST_F(FakeProcTest, BackToBackCallsEachMeasureTheirOwnWindow) {
    LinuxMetricsCollector collector(proc.string(), sys.string(), dir.str(),
                                    std::chrono::milliseconds(100));

    // Every jiffy is busy while the writer runs.
    std::atomic<bool> loaded{true};
    std::thread writer([this, &loaded] {
        uint64_t busy = 200;
        while (loaded.load()) {
            busy += 10;
            replaceStat("cpu  " + std::to_string(busy) + " 0 0 800 0 0 0 0\n");
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    });

    const double first = collector.cpuPercent();
    const double second = collector.cpuPercent();
    const double third = collector.cpuPercent();
    loaded = false;
    writer.join();

    EXPECT_DOUBLE_EQ(first, 100.0);
    EXPECT_DOUBLE_EQ(second, 100.0);
    EXPECT_DOUBLE_EQ(third, 100.0);
}

TEST_F(FakeProcTest, CollectStampsSample) {
    LinuxMetricsCollector collector(proc.string(), sys.string(), dir.str(),
                                    std::chrono::milliseconds(10));
    auto before = camfleet::utils::SystemClock::now();
    MetricsSample sample = collector.collect();
    EXPECT_GE(sample.timestamp, before);
    EXPECT_EQ(sample.process_count, 2);
    EXPECT_EQ(sample.open_files, 1824);
    EXPECT_DOUBLE_EQ(sample.memory_percent, 75.0);
}

TEST_F(FakeProcTest, MissingFilesYieldZeros) {
    LinuxMetricsCollector collector((dir.path() / "absent").string(),
                                    (dir.path() / "absent").string(), "/nonexistent/path",
                                    std::chrono::milliseconds(1));
    EXPECT_DOUBLE_EQ(collector.cpuPercent(), 0.0);
    EXPECT_DOUBLE_EQ(collector.memoryPercent(), 0.0);
    EXPECT_DOUBLE_EQ(collector.diskPercent(), 0.0);
    EXPECT_EQ(collector.processCount(), 0);
    EXPECT_EQ(collector.openFiles(), 0);
    EXPECT_TRUE(collector.interfaces().empty());
}

TEST(MetricsHistoryTest, PrunesOutsideWindow) {
    MetricsHistory history(std::chrono::seconds(3600));
    history.append(sampleAt(1000, 1.0));
    history.append(sampleAt(2000, 2.0));
    history.append(sampleAt(4600, 3.0));

    // 1000 is exactly one window before 4600 and is dropped.
    EXPECT_EQ(history.size(), 2u);
    auto latest = history.latest();
    ASSERT_TRUE(latest.has_value());
    EXPECT_DOUBLE_EQ(latest->cpu_percent, 3.0);
}

TEST(MetricsHistoryTest, LastReturnsOldestFirst) {
    MetricsHistory history;
    EXPECT_FALSE(history.latest().has_value());
    EXPECT_TRUE(history.last(5).empty());

    for (int i = 0; i < 5; ++i) {
        history.append(sampleAt(100 + i, static_cast<double>(i)));
    }
    auto tail = history.last(3);
    ASSERT_EQ(tail.size(), 3u);
    EXPECT_DOUBLE_EQ(tail[0].cpu_percent, 2.0);
    EXPECT_DOUBLE_EQ(tail[2].cpu_percent, 4.0);
    EXPECT_EQ(history.last(50).size(), 5u);
}
