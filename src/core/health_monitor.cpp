/**
 * @file health_monitor.cpp
 * @brief HealthMonitor implementation.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/core/health_monitor.hpp"
#include "camfleet/core/snapshot_store.hpp"
#include "camfleet/utils/logger.hpp"
#include "camfleet/utils/string_utils.hpp"

#include <algorithm>

namespace camfleet {
namespace core {

namespace {
constexpr const char* kComponent = "Health";
}

const char* healthStatusToString(HealthStatus status) {
    switch (status) {
        case HealthStatus::HEALTHY:   return "healthy";
        case HealthStatus::DEGRADED:  return "degraded";
        case HealthStatus::UNHEALTHY: return "unhealthy";
        case HealthStatus::CRITICAL:  return "critical";
        case HealthStatus::UNKNOWN:
        default:                      return "unknown";
    }
}

std::optional<HealthStatus> healthStatusFromString(const std::string& text) {
    const std::string lower = utils::to_lower(text);
    if (lower == "healthy") return HealthStatus::HEALTHY;
    if (lower == "degraded") return HealthStatus::DEGRADED;
    if (lower == "unhealthy") return HealthStatus::UNHEALTHY;
    if (lower == "critical") return HealthStatus::CRITICAL;
    if (lower == "unknown") return HealthStatus::UNKNOWN;
    return std::nullopt;
}

const char* alertActionToString(AlertAction action) {
    switch (action) {
        case AlertAction::RecoveryStarted:   return "recovery_started";
        case AlertAction::RecoverySucceeded: return "recovery_succeeded";
        case AlertAction::RecoveryFailed:    return "recovery_failed";
        case AlertAction::StatusChanged:
        default:                             return "status_changed";
    }
}

HealthMonitor::HealthMonitor(MonitorConfig config,
                             std::shared_ptr<SystemMetricsCollector> collector,
                             std::shared_ptr<net::HttpClient> http)
    : config_(std::move(config))
    , collector_(std::move(collector))
    , http_(std::move(http))
    , history_(config_.history_window)
{
}

HealthMonitor::~HealthMonitor() {
    stop();
}

void HealthMonitor::registerCheck(HealthCheck check) {
    const std::string name = check.name;
    bool added = false;
    {
        std::lock_guard<std::mutex> lock(checksMutex_);
        added = checks_.find(name) == checks_.end();
        checks_[name] = std::move(check);
        states_[name] = CheckState{};
    }
    LOG_INFO(kComponent, "Added health check: {}", name);

    if (added && running_.load()) {
        std::lock_guard<std::mutex> lock(threadsMutex_);
        loops_.emplace_back(&HealthMonitor::checkLoop, this, name);
    }
}

void HealthMonitor::start() {
    if (running_.exchange(true)) {
        return;
    }

    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(checksMutex_);
        for (const auto& [name, check] : checks_) {
            names.push_back(name);
        }
    }
    LOG_INFO(kComponent, "Starting health monitoring ({} checks)", names.size());

    std::lock_guard<std::mutex> lock(threadsMutex_);
    for (const auto& name : names) {
        loops_.emplace_back(&HealthMonitor::checkLoop, this, name);
    }
    loops_.emplace_back(&HealthMonitor::metricsLoop, this);
    loops_.emplace_back(&HealthMonitor::alertLoop, this);
}

void HealthMonitor::stop() {
    const bool wasRunning = running_.exchange(false);
    {
        std::lock_guard<std::mutex> lock(wakeMutex_);
    }
    wakeCv_.notify_all();

    // Loops may still hand off timed-out checks or recoveries, so they go first.
    std::vector<std::thread> loops;
    {
        std::lock_guard<std::mutex> lock(threadsMutex_);
        loops.swap(loops_);
    }
    for (auto& t : loops) {
        if (t.joinable()) {
            t.join();
        }
    }

    std::vector<Supervised> supervised;
    {
        std::lock_guard<std::mutex> lock(threadsMutex_);
        supervised.swap(supervised_);
    }
    for (auto& s : supervised) {
        if (s.thread.joinable()) {
            s.thread.join();
        }
    }

    if (wasRunning) {
        LOG_INFO(kComponent, "Health monitoring stopped");
    }
}

bool HealthMonitor::sleepFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(wakeMutex_);
    wakeCv_.wait_for(lock, duration, [this] { return !running_.load(); });
    return running_.load();
}

void HealthMonitor::supervise(std::thread thread, std::shared_ptr<std::atomic<bool>> done,
                              const std::string& check) {
    std::lock_guard<std::mutex> lock(threadsMutex_);
    reapFinished();
    supervised_.push_back(Supervised{std::move(thread), std::move(done), check});
}

bool HealthMonitor::abandonedRunPending(const std::string& check) {
    std::lock_guard<std::mutex> lock(threadsMutex_);
    reapFinished();
    return std::any_of(supervised_.begin(), supervised_.end(),
                       [&check](const Supervised& s) { return s.check == check; });
}

// Caller holds threadsMutex_.
void HealthMonitor::reapFinished() {
    auto it = supervised_.begin();
    while (it != supervised_.end()) {
        if (it->done->load()) {
            if (it->thread.joinable()) {
                it->thread.join();
            }
            it = supervised_.erase(it);
        } else {
            ++it;
        }
    }
}

// =============================================================================
// Checks
// =============================================================================

void HealthMonitor::checkLoop(const std::string& name) {
    while (running_.load()) {
        runCheck(name);

        std::chrono::milliseconds interval{30000};
        {
            std::lock_guard<std::mutex> lock(checksMutex_);
            auto it = checks_.find(name);
            if (it == checks_.end()) {
                return;
            }
            interval = it->second.interval;
        }
        if (!sleepFor(interval)) {
            break;
        }
    }
}

HealthStatus HealthMonitor::execute(const HealthCheck& check, std::string& error) {
    // At most one stuck worker per check.
    if (abandonedRunPending(check.name)) {
        error = "Previous run still in progress";
        return HealthStatus::UNHEALTHY;
    }

    struct Outcome {
        std::mutex mutex;
        std::condition_variable cv;
        bool finished = false;
        HealthStatus status = HealthStatus::UNHEALTHY;
        std::string error;
    };

    auto outcome = std::make_shared<Outcome>();
    auto done = std::make_shared<std::atomic<bool>>(false);
    CheckFn fn = check.check;

    std::thread worker([outcome, done, fn]() {
        HealthStatus status = HealthStatus::UNHEALTHY;
        std::string failure;
        try {
            status = fn();
        } catch (const std::exception& e) {
            failure = e.what();
        }
        {
            std::lock_guard<std::mutex> lock(outcome->mutex);
            outcome->status = status;
            outcome->error = failure;
            outcome->finished = true;
        }
        outcome->cv.notify_all();
        done->store(true);
    });

    {
        std::unique_lock<std::mutex> lock(outcome->mutex);
        if (outcome->cv.wait_for(lock, check.timeout, [&] { return outcome->finished; })) {
            HealthStatus status = outcome->status;
            error = outcome->error;
            lock.unlock();
            worker.join();
            return status;
        }
    }

    // Abandoned: the worker finishes on its own and is joined later.
    supervise(std::move(worker), done, check.name);
    error = "Health check timed out";
    return HealthStatus::UNHEALTHY;
}

HealthStatus HealthMonitor::runCheck(const std::string& name) {
    HealthCheck check;
    {
        std::lock_guard<std::mutex> lock(checksMutex_);
        auto it = checks_.find(name);
        if (it == checks_.end()) {
            LOG_WARN(kComponent, "Unknown health check: {}", name);
            return HealthStatus::UNKNOWN;
        }
        check = it->second;
    }

    std::string error;
    HealthStatus status = HealthStatus::UNHEALTHY;
    if (check.check) {
        status = execute(check, error);
    } else {
        error = "No check function";
    }

    HealthStatus previous = HealthStatus::UNKNOWN;
    int failures = 0;
    std::string currentError;
    {
        std::lock_guard<std::mutex> lock(checksMutex_);
        CheckState& state = states_[name];
        previous = state.last_status;
        state.last_status = status;
        state.last_check = utils::SystemClock::now();
        if (status == HealthStatus::HEALTHY) {
            state.consecutive_failures = 0;
            state.error_message.clear();
        } else {
            ++state.consecutive_failures;
            if (!error.empty()) {
                state.error_message = error;
            }
        }
        failures = state.consecutive_failures;
        currentError = state.error_message;
    }

    LOG_DEBUG(kComponent, "Health check '{}': {}", name, healthStatusToString(status));
    if (!error.empty()) {
        LOG_ERROR(kComponent, "Error in health check '{}': {}", name, error);
    }

    if (previous != HealthStatus::UNKNOWN && previous != status) {
        enqueueAlert(name, status, currentError, AlertAction::StatusChanged);
    }

    if (status != HealthStatus::HEALTHY && check.recovery && failures >= check.retries) {
        maybeRecover(check, status, currentError);
    }
    return status;
}

void HealthMonitor::maybeRecover(const HealthCheck& check, HealthStatus status,
                                 const std::string& error) {
    {
        std::lock_guard<std::mutex> lock(recoveringMutex_);
        if (!recovering_.insert(check.name).second) {
            LOG_DEBUG(kComponent, "Recovery already in progress for '{}'", check.name);
            return;
        }
    }

    LOG_WARN(kComponent, "Performing recovery for '{}'", check.name);
    enqueueAlert(check.name, status, error, AlertAction::RecoveryStarted);

    auto done = std::make_shared<std::atomic<bool>>(false);
    RecoveryFn fn = check.recovery;
    const std::string name = check.name;

    std::thread worker([this, fn, name, status, error, done]() {
        bool ok = false;
        std::string failure = error;
        try {
            ok = fn();
        } catch (const std::exception& e) {
            LOG_ERROR(kComponent, "Recovery error for '{}': {}", name, e.what());
            failure = e.what();
        }

        if (ok) {
            LOG_INFO(kComponent, "Recovery successful for '{}'", name);
            enqueueAlert(name, status, failure, AlertAction::RecoverySucceeded);
        } else {
            LOG_ERROR(kComponent, "Recovery failed for '{}'", name);
            enqueueAlert(name, status, failure, AlertAction::RecoveryFailed);
        }

        {
            std::lock_guard<std::mutex> lock(recoveringMutex_);
            recovering_.erase(name);
        }
        done->store(true);
    });
    supervise(std::move(worker), done);
}

// =============================================================================
// Alerts
// =============================================================================

void HealthMonitor::enqueueAlert(const std::string& name, HealthStatus status,
                                 const std::string& error, AlertAction action) {
    Alert alert;
    alert.timestamp = utils::SystemClock::now();
    alert.check_name = name;
    alert.status = status;
    alert.error = error;
    alert.action = action;

    std::lock_guard<std::mutex> lock(alertsMutex_);
    alerts_.push_back(std::move(alert));
}

std::vector<Alert> HealthMonitor::drainAlerts(size_t max) {
    std::lock_guard<std::mutex> lock(alertsMutex_);
    const size_t n = std::min(max, alerts_.size());
    std::vector<Alert> batch(alerts_.begin(), alerts_.begin() + static_cast<std::ptrdiff_t>(n));
    alerts_.erase(alerts_.begin(), alerts_.begin() + static_cast<std::ptrdiff_t>(n));
    return batch;
}

void HealthMonitor::dispatchAlert(const Alert& alert) {
    LOG_WARN("Alert", "{} [{}] {} {}", alert.check_name, healthStatusToString(alert.status),
             alertActionToString(alert.action), alert.error);

    if (config_.webhook_url.empty() || !http_) {
        return;
    }

    net::HttpResponse response = http_->post(config_.webhook_url,
                                             SnapshotStore::alertToJson(alert),
                                             {{"Content-Type", "application/json"}},
                                             config_.webhook_timeout);
    if (!response.transportOk()) {
        LOG_ERROR("Alert", "Webhook delivery failed: {}", response.error);
    } else if (response.status >= 400) {
        LOG_ERROR("Alert", "Webhook rejected alert: HTTP {}", response.status);
    }
}

void HealthMonitor::alertLoop() {
    while (running_.load()) {
        for (const auto& alert : drainAlerts(config_.alert_batch)) {
            dispatchAlert(alert);
        }
        if (!sleepFor(config_.alert_interval)) {
            break;
        }
    }
}

// =============================================================================
// Metrics & status
// =============================================================================

void HealthMonitor::collectMetrics() {
    if (!collector_) {
        return;
    }
    try {
        history_.append(collector_->collect());
    } catch (const std::exception& e) {
        LOG_ERROR(kComponent, "Metrics collection failed: {}", e.what());
    }
}

void HealthMonitor::metricsLoop() {
    while (running_.load()) {
        collectMetrics();
        if (!sleepFor(config_.metrics_interval)) {
            break;
        }
    }
}

HealthStatus HealthMonitor::aggregateStatus(const std::vector<HealthStatus>& statuses) {
    HealthStatus overall = HealthStatus::HEALTHY;
    bool anyKnown = false;
    for (HealthStatus status : statuses) {
        if (status == HealthStatus::UNKNOWN) {
            continue;
        }
        anyKnown = true;
        if (static_cast<int>(status) > static_cast<int>(overall)) {
            overall = status;
        }
    }
    return anyKnown ? overall : HealthStatus::UNKNOWN;
}

AggregateHealth HealthMonitor::status() const {
    AggregateHealth health;
    health.timestamp = utils::SystemClock::now();

    std::vector<HealthStatus> statuses;
    {
        std::lock_guard<std::mutex> lock(checksMutex_);
        health.checks = states_;
    }
    for (const auto& [name, state] : health.checks) {
        statuses.push_back(state.last_status);
    }
    health.overall = aggregateStatus(statuses);
    health.metrics = history_.latest();

    {
        std::lock_guard<std::mutex> lock(alertsMutex_);
        health.alerts_pending = alerts_.size();
    }
    {
        std::lock_guard<std::mutex> lock(recoveringMutex_);
        health.recovery_in_progress.assign(recovering_.begin(), recovering_.end());
    }
    return health;
}

void HealthMonitor::saveReport(const std::string& path) const {
    SnapshotStore::writeHealthReport(path, status(), history_.last(config_.report_metrics));
    LOG_INFO(kComponent, "Health report saved to {}", path);
}

}  // namespace core
}  // namespace camfleet
