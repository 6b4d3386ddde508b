/**
 * @file system_metrics.hpp
 * @brief Host resource sampling and the rolling metrics window.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/core/export.hpp"
#include "camfleet/utils/time_utils.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace camfleet {
namespace core {

struct CAMFLEET_CORE_API NetIoCounters {
    uint64_t bytes_sent = 0;
    uint64_t bytes_recv = 0;
    uint64_t packets_sent = 0;
    uint64_t packets_recv = 0;
    uint64_t errin = 0;
    uint64_t errout = 0;
};

/**
 * @struct MetricsSample
 * @brief One point-in-time reading of host resources.
 */
struct CAMFLEET_CORE_API MetricsSample {
    utils::SystemClock::time_point timestamp;
    double cpu_percent = 0.0;
    double memory_percent = 0.0;
    double disk_percent = 0.0;
    NetIoCounters network_io;
    int process_count = 0;
    int open_files = 0;
};

struct CAMFLEET_CORE_API InterfaceState {
    std::string name;
    bool up = false;
};

/**
 * @class SystemMetricsCollector
 * @brief Source of host metrics. Mocked in tests.
 */
class CAMFLEET_CORE_API SystemMetricsCollector {
public:
    virtual ~SystemMetricsCollector() = default;

    virtual double cpuPercent() = 0;
    virtual double memoryPercent() = 0;
    virtual double diskPercent() = 0;
    virtual NetIoCounters netIo() = 0;
    virtual std::vector<InterfaceState> interfaces() = 0;
    virtual int processCount() = 0;
    virtual int openFiles() = 0;

    /// Gather every metric into one sample stamped now.
    MetricsSample collect();
};

/**
 * @class LinuxMetricsCollector
 * @brief Reads /proc and /sys. CPU usage is the busy share between two
 * /proc/stat readings one sample window apart, taken inside each call, so
 * concurrent callers never share a baseline.
 */
class CAMFLEET_CORE_API LinuxMetricsCollector : public SystemMetricsCollector {
public:
    explicit LinuxMetricsCollector(std::string procRoot = "/proc",
                                   std::string sysRoot = "/sys",
                                   std::string diskPath = "/",
                                   std::chrono::milliseconds cpuWindow = std::chrono::milliseconds(1000));

    double cpuPercent() override;
    double memoryPercent() override;
    double diskPercent() override;
    NetIoCounters netIo() override;
    std::vector<InterfaceState> interfaces() override;
    int processCount() override;
    int openFiles() override;

    /// (total, idle) jiffies from the aggregate "cpu" line.
    static std::optional<std::pair<uint64_t, uint64_t>> parseCpuTimes(const std::string& statText);

    /// (MemTotal - MemAvailable) / MemTotal * 100.
    static std::optional<double> parseMemoryPercent(const std::string& meminfoText);

    /// Sum of every interface in /proc/net/dev format.
    static NetIoCounters parseNetDev(const std::string& netDevText);

private:
    std::string readProc(const std::string& relative) const;

    std::string procRoot_;
    std::string sysRoot_;
    std::string diskPath_;
    std::chrono::milliseconds cpuWindow_;
};

/**
 * @class MetricsHistory
 * @brief Thread-safe time window of samples, pruned on append.
 */
class CAMFLEET_CORE_API MetricsHistory {
public:
    explicit MetricsHistory(std::chrono::seconds window = std::chrono::hours(1));

    /// Append and drop samples older than the window relative to @p sample.
    void append(const MetricsSample& sample);

    std::optional<MetricsSample> latest() const;

    /// Up to @p count most recent samples, oldest first.
    std::vector<MetricsSample> last(size_t count) const;

    size_t size() const;

private:
    std::chrono::seconds window_;
    mutable std::mutex mutex_;
    std::deque<MetricsSample> samples_;
};

}  // namespace core
}  // namespace camfleet
