/**
 * @file health_monitor.hpp
 * @brief Scheduled health checks with single-flight recovery and alerting.
 *
 * Each registered check runs on its own thread. Non-healthy results
 * accumulate consecutive failures; once a check reaches its retry count its
 * recovery function runs on a supervised thread, never more than once at a
 * time per check. A metrics thread samples host resources and an alert
 * thread drains queued alerts to the log and an optional webhook.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/core/export.hpp"
#include "camfleet/core/system_metrics.hpp"
#include "camfleet/net/http_client.hpp"
#include "camfleet/utils/time_utils.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace camfleet {
namespace core {

enum class HealthStatus : int {
    UNKNOWN = 0,
    HEALTHY = 1,
    DEGRADED = 2,
    UNHEALTHY = 3,
    CRITICAL = 4
};

CAMFLEET_CORE_API const char* healthStatusToString(HealthStatus status);
CAMFLEET_CORE_API std::optional<HealthStatus> healthStatusFromString(const std::string& text);

using CheckFn = std::function<HealthStatus()>;
using RecoveryFn = std::function<bool()>;

/**
 * @struct HealthCheck
 * @brief Declarative check definition. A throwing check counts as UNHEALTHY.
 */
struct CAMFLEET_CORE_API HealthCheck {
    std::string name;
    CheckFn check;
    std::chrono::milliseconds interval{30000};
    std::chrono::milliseconds timeout{10000};
    int retries = 3;
    RecoveryFn recovery;    ///< empty = no automatic recovery
};

/**
 * @struct CheckState
 * @brief Mutable per-check result, updated on every run.
 */
struct CAMFLEET_CORE_API CheckState {
    HealthStatus last_status = HealthStatus::UNKNOWN;
    int consecutive_failures = 0;
    std::optional<utils::SystemClock::time_point> last_check;
    std::string error_message;
};

enum class AlertAction {
    RecoveryStarted,
    RecoverySucceeded,
    RecoveryFailed,
    StatusChanged
};

CAMFLEET_CORE_API const char* alertActionToString(AlertAction action);

struct CAMFLEET_CORE_API Alert {
    utils::SystemClock::time_point timestamp;
    std::string check_name;
    HealthStatus status = HealthStatus::UNKNOWN;
    std::string error;
    AlertAction action = AlertAction::StatusChanged;
};

/**
 * @struct AggregateHealth
 * @brief Point-in-time view of the whole monitor.
 */
struct CAMFLEET_CORE_API AggregateHealth {
    HealthStatus overall = HealthStatus::UNKNOWN;
    std::map<std::string, CheckState> checks;
    std::optional<MetricsSample> metrics;
    size_t alerts_pending = 0;
    std::vector<std::string> recovery_in_progress;
    utils::SystemClock::time_point timestamp;
};

struct CAMFLEET_CORE_API MonitorConfig {
    std::string webhook_url;                          ///< empty = log only
    std::chrono::milliseconds metrics_interval{30000};
    std::chrono::milliseconds alert_interval{10000};
    size_t alert_batch = 10;
    std::chrono::milliseconds webhook_timeout{5000};
    std::chrono::seconds history_window{3600};
    size_t report_metrics = 20;
};

/**
 * @class HealthMonitor
 * @brief Owns the check table, metrics window and alert queue.
 *
 * Usage:
 * @code
 * HealthMonitor monitor(MonitorConfig{}, collector, http);
 * monitor.registerCheck(makeNetworkHealthCheck(collector));
 * monitor.start();
 * ...
 * monitor.saveReport("health_report.json");
 * monitor.stop();
 * @endcode
 */
class CAMFLEET_CORE_API HealthMonitor {
public:
    HealthMonitor(MonitorConfig config,
                  std::shared_ptr<SystemMetricsCollector> collector,
                  std::shared_ptr<net::HttpClient> http);
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /**
     * @brief Add or replace a check. Registered while running, it starts
     * its own loop immediately.
     */
    void registerCheck(HealthCheck check);

    /// Launch check, metrics and alert threads.
    void start();

    /// Stop all loops and join every thread, including recoveries.
    void stop();

    bool isRunning() const { return running_.load(); }

    /**
     * @brief Run one check now: execute with timeout, classify, maybe recover.
     * @return The classified status, or UNKNOWN for an unregistered name.
     */
    HealthStatus runCheck(const std::string& name);

    /// Sample the collector once into the history window.
    void collectMetrics();

    /// Remove up to @p max alerts from the queue, oldest first.
    std::vector<Alert> drainAlerts(size_t max);

    /// Log and deliver one alert to the webhook.
    void dispatchAlert(const Alert& alert);

    AggregateHealth status() const;

    /**
     * @brief Write the aggregate plus recent metrics as JSON.
     * @throws StorageError if the file cannot be written.
     */
    void saveReport(const std::string& path) const;

    const MetricsHistory& history() const { return history_; }

    /// Worst known status; UNKNOWN only when nothing else is present.
    static HealthStatus aggregateStatus(const std::vector<HealthStatus>& statuses);

private:
    struct Supervised {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
        std::string check;  ///< empty for recoveries
    };

    void checkLoop(const std::string& name);
    void metricsLoop();
    void alertLoop();

    HealthStatus execute(const HealthCheck& check, std::string& error);
    void maybeRecover(const HealthCheck& check, HealthStatus status, const std::string& error);
    void enqueueAlert(const std::string& name, HealthStatus status, const std::string& error,
                      AlertAction action);

    /// Interruptible sleep; returns false once stop() was requested.
    bool sleepFor(std::chrono::milliseconds duration);

    void supervise(std::thread thread, std::shared_ptr<std::atomic<bool>> done,
                   const std::string& check = "");
    void reapFinished();

    /// True while an abandoned run of @p check has not returned.
    bool abandonedRunPending(const std::string& check);

    MonitorConfig config_;
    std::shared_ptr<SystemMetricsCollector> collector_;
    std::shared_ptr<net::HttpClient> http_;

    mutable std::mutex checksMutex_;
    std::map<std::string, HealthCheck> checks_;
    std::map<std::string, CheckState> states_;

    mutable std::mutex recoveringMutex_;
    std::set<std::string> recovering_;

    mutable std::mutex alertsMutex_;
    std::deque<Alert> alerts_;

    MetricsHistory history_;

    std::atomic<bool> running_{false};
    std::mutex wakeMutex_;
    std::condition_variable wakeCv_;

    std::mutex threadsMutex_;
    std::vector<std::thread> loops_;
    std::vector<Supervised> supervised_;
};

}  // namespace core
}  // namespace camfleet
