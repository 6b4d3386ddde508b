/**
 * @file system_metrics.cpp
 * @brief Linux metrics collector and MetricsHistory.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/core/system_metrics.hpp"
#include "camfleet/utils/logger.hpp"
#include "camfleet/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include <sys/statvfs.h>

namespace fs = std::filesystem;

namespace camfleet {
namespace core {

namespace {

bool isNumeric(const std::string& text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::string readWhole(const fs::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return "";
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

}  // namespace

MetricsSample SystemMetricsCollector::collect() {
    MetricsSample sample;
    sample.timestamp = utils::SystemClock::now();
    sample.cpu_percent = cpuPercent();
    sample.memory_percent = memoryPercent();
    sample.disk_percent = diskPercent();
    sample.network_io = netIo();
    sample.process_count = processCount();
    sample.open_files = openFiles();
    return sample;
}

// =============================================================================
// LinuxMetricsCollector
// =============================================================================

LinuxMetricsCollector::LinuxMetricsCollector(std::string procRoot, std::string sysRoot,
                                             std::string diskPath,
                                             std::chrono::milliseconds cpuWindow)
    : procRoot_(std::move(procRoot))
    , sysRoot_(std::move(sysRoot))
    , diskPath_(std::move(diskPath))
    , cpuWindow_(cpuWindow)
{
}

std::string LinuxMetricsCollector::readProc(const std::string& relative) const {
    return readWhole(fs::path(procRoot_) / relative);
}

std::optional<std::pair<uint64_t, uint64_t>> LinuxMetricsCollector::parseCpuTimes(
    const std::string& statText) {
    std::istringstream stream(statText);
    std::string line;
    while (std::getline(stream, line)) {
        std::istringstream ss(line);
        std::string label;
        ss >> label;
        if (label != "cpu") {
            continue;
        }
        uint64_t user = 0, nice = 0, system = 0, idle = 0;
        uint64_t iowait = 0, irq = 0, softirq = 0, steal = 0;
        ss >> user >> nice >> system >> idle;
        if (!ss) {
            return std::nullopt;
        }
        ss >> iowait >> irq >> softirq >> steal;
        uint64_t idleTime = idle + iowait;
        uint64_t total = user + nice + system + idle + iowait + irq + softirq + steal;
        return std::make_pair(total, idleTime);
    }
    return std::nullopt;
}

double LinuxMetricsCollector::cpuPercent() {
    const auto before = parseCpuTimes(readProc("stat"));
    std::this_thread::sleep_for(cpuWindow_);
    const auto after = parseCpuTimes(readProc("stat"));
    if (!before || !after) {
        LOG_DEBUG("Metrics", "CPU times unavailable");
        return 0.0;
    }
    if (after->first < before->first || after->second < before->second) {
        return 0.0;
    }

    const uint64_t totalDiff = after->first - before->first;
    const uint64_t idleDiff = after->second - before->second;
    if (totalDiff == 0 || idleDiff > totalDiff) {
        return 0.0;
    }
    return static_cast<double>(totalDiff - idleDiff) * 100.0 / static_cast<double>(totalDiff);
}

std::optional<double> LinuxMetricsCollector::parseMemoryPercent(const std::string& meminfoText) {
    std::optional<double> total;
    std::optional<double> available;

    std::istringstream stream(meminfoText);
    std::string key;
    double value = 0;
    std::string unit;
    std::string line;
    while (std::getline(stream, line)) {
        std::istringstream ss(line);
        if (!(ss >> key >> value)) {
            continue;
        }
        if (key == "MemTotal:") {
            total = value;
        } else if (key == "MemAvailable:") {
            available = value;
        }
    }

    if (!total || !available || *total <= 0) {
        return std::nullopt;
    }
    return (*total - *available) * 100.0 / *total;
}

double LinuxMetricsCollector::memoryPercent() {
    return parseMemoryPercent(readProc("meminfo")).value_or(0.0);
}

double LinuxMetricsCollector::diskPercent() {
    struct statvfs buf {};
    if (statvfs(diskPath_.c_str(), &buf) != 0) {
        LOG_DEBUG("Metrics", "statvfs({}) failed", diskPath_);
        return 0.0;
    }
    const double used = static_cast<double>(buf.f_blocks - buf.f_bfree) * buf.f_frsize;
    const double avail = static_cast<double>(buf.f_bavail) * buf.f_frsize;
    if (used + avail <= 0) {
        return 0.0;
    }
    return used * 100.0 / (used + avail);
}

NetIoCounters LinuxMetricsCollector::parseNetDev(const std::string& netDevText) {
    NetIoCounters counters;
    std::istringstream stream(netDevText);
    std::string line;

    while (std::getline(stream, line)) {
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            continue;  // header lines
        }
        std::istringstream ss(line.substr(colon + 1));
        uint64_t rxBytes = 0, rxPackets = 0, rxErrs = 0, rxDrop = 0, rxFifo = 0, rxFrame = 0,
                 rxCompressed = 0, rxMulticast = 0;
        uint64_t txBytes = 0, txPackets = 0, txErrs = 0;
        ss >> rxBytes >> rxPackets >> rxErrs >> rxDrop >> rxFifo >> rxFrame >> rxCompressed >>
            rxMulticast >> txBytes >> txPackets >> txErrs;
        if (!ss) {
            continue;
        }
        counters.bytes_recv += rxBytes;
        counters.packets_recv += rxPackets;
        counters.errin += rxErrs;
        counters.bytes_sent += txBytes;
        counters.packets_sent += txPackets;
        counters.errout += txErrs;
    }
    return counters;
}

NetIoCounters LinuxMetricsCollector::netIo() {
    return parseNetDev(readProc("net/dev"));
}

std::vector<InterfaceState> LinuxMetricsCollector::interfaces() {
    std::vector<InterfaceState> result;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(fs::path(sysRoot_) / "class" / "net", ec)) {
        InterfaceState state;
        state.name = entry.path().filename().string();

        // IFF_UP is bit 0 of the hex flags word.
        std::string flags = utils::trim(readWhole(entry.path() / "flags"));
        try {
            state.up = !flags.empty() && (std::stoul(flags, nullptr, 16) & 0x1) != 0;
        } catch (const std::exception& e) {
            LOG_DEBUG("Metrics", "Bad flags for {}: {}", state.name, e.what());
        }
        result.push_back(std::move(state));
    }
    if (ec) {
        LOG_DEBUG("Metrics", "Cannot list interfaces: {}", ec.message());
    }
    std::sort(result.begin(), result.end(),
              [](const InterfaceState& a, const InterfaceState& b) { return a.name < b.name; });
    return result;
}

int LinuxMetricsCollector::processCount() {
    int count = 0;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(procRoot_, ec)) {
        if (isNumeric(entry.path().filename().string())) {
            ++count;
        }
    }
    return count;
}

int LinuxMetricsCollector::openFiles() {
    // First field of file-nr: allocated file handles system-wide.
    std::istringstream ss(readProc("sys/fs/file-nr"));
    long allocated = 0;
    if (!(ss >> allocated)) {
        return 0;
    }
    return static_cast<int>(allocated);
}

// =============================================================================
// MetricsHistory
// =============================================================================

MetricsHistory::MetricsHistory(std::chrono::seconds window)
    : window_(window)
{
}

void MetricsHistory::append(const MetricsSample& sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.push_back(sample);

    const auto cutoff = sample.timestamp - window_;
    while (!samples_.empty() && samples_.front().timestamp <= cutoff) {
        samples_.pop_front();
    }
}

std::optional<MetricsSample> MetricsHistory::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (samples_.empty()) {
        return std::nullopt;
    }
    return samples_.back();
}

std::vector<MetricsSample> MetricsHistory::last(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t n = std::min(count, samples_.size());
    return std::vector<MetricsSample>(samples_.end() - static_cast<std::ptrdiff_t>(n),
                                      samples_.end());
}

size_t MetricsHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

}  // namespace core
}  // namespace camfleet
