/**
 * @file test_health_monitor.cpp
 * @brief Unit tests for check scheduling, recovery and alerting
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <camfleet/core/health_monitor.hpp>

#include "mocks/mock_http_client.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

using namespace camfleet::core;
using camfleet::testing::MockHttpClient;
using camfleet::testing::makeResponse;
using ::testing::_;
using ::testing::AllOf;
using ::testing::HasSubstr;
using ::testing::Return;

namespace {

size_t countAction(const std::vector<Alert>& alerts, AlertAction action) {
    size_t n = 0;
    for (const auto& alert : alerts) {
        if (alert.action == action) ++n;
    }
    return n;
}

/// One-shot gate a recovery can block on.
class Gate {
public:
    void open() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }
    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return open_; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
};

}  // namespace

class HealthMonitorTest : public ::testing::Test {
protected:
    HealthCheck makeCheck(const std::string& name, CheckFn fn, int retries = 3,
                          RecoveryFn recovery = nullptr) {
        HealthCheck check;
        check.name = name;
        check.check = std::move(fn);
        check.retries = retries;
        check.timeout = std::chrono::milliseconds(1000);
        check.recovery = std::move(recovery);
        return check;
    }

    MonitorConfig config;
};

TEST_F(HealthMonitorTest, AggregatePrecedence) {
    using S = HealthStatus;
    EXPECT_EQ(HealthMonitor::aggregateStatus({S::HEALTHY, S::DEGRADED, S::CRITICAL}), S::CRITICAL);
    EXPECT_EQ(HealthMonitor::aggregateStatus({S::HEALTHY, S::DEGRADED}), S::DEGRADED);
    EXPECT_EQ(HealthMonitor::aggregateStatus({S::HEALTHY, S::UNKNOWN}), S::HEALTHY);
    EXPECT_EQ(HealthMonitor::aggregateStatus({S::UNKNOWN, S::UNKNOWN}), S::UNKNOWN);
    EXPECT_EQ(HealthMonitor::aggregateStatus({}), S::UNKNOWN);
}

TEST_F(HealthMonitorTest, OverallStatusFromChecks) {
    HealthMonitor monitor(config, nullptr, nullptr);
    monitor.registerCheck(makeCheck("a", [] { return HealthStatus::HEALTHY; }));
    monitor.registerCheck(makeCheck("b", [] { return HealthStatus::DEGRADED; }));
    monitor.registerCheck(makeCheck("c", [] { return HealthStatus::CRITICAL; }));

    EXPECT_EQ(monitor.status().overall, HealthStatus::UNKNOWN);

    monitor.runCheck("a");
    monitor.runCheck("b");
    EXPECT_EQ(monitor.status().overall, HealthStatus::DEGRADED);

    monitor.runCheck("c");
    auto health = monitor.status();
    EXPECT_EQ(health.overall, HealthStatus::CRITICAL);
    ASSERT_EQ(health.checks.size(), 3u);
    EXPECT_TRUE(health.checks.at("a").last_check.has_value());
}

TEST_F(HealthMonitorTest, StatusNames) {
    EXPECT_STREQ(healthStatusToString(HealthStatus::UNHEALTHY), "unhealthy");
    EXPECT_EQ(healthStatusFromString("CRITICAL"), HealthStatus::CRITICAL);
    EXPECT_FALSE(healthStatusFromString("fine").has_value());
    EXPECT_STREQ(alertActionToString(AlertAction::RecoveryStarted), "recovery_started");
}

TEST_F(HealthMonitorTest, UnknownCheckName) {
    HealthMonitor monitor(config, nullptr, nullptr);
    EXPECT_EQ(monitor.runCheck("missing"), HealthStatus::UNKNOWN);
}

TEST_F(HealthMonitorTest, RecoveryAfterRetriesAndResetOnHealthy) {
    std::atomic<int> recoveries{0};
    std::atomic<bool> healthy{false};

    HealthMonitor monitor(config, nullptr, nullptr);
    monitor.registerCheck(makeCheck(
        "camera_connectivity",
        [&] { return healthy ? HealthStatus::HEALTHY : HealthStatus::UNHEALTHY; },
        3,
        [&] { ++recoveries; return true; }));

    monitor.runCheck("camera_connectivity");
    monitor.runCheck("camera_connectivity");
    EXPECT_EQ(monitor.status().checks.at("camera_connectivity").consecutive_failures, 2);
    monitor.runCheck("camera_connectivity");
    monitor.stop();  // joins the recovery worker

    EXPECT_EQ(recoveries.load(), 1);
    EXPECT_EQ(monitor.status().checks.at("camera_connectivity").consecutive_failures, 3);

    healthy = true;
    EXPECT_EQ(monitor.runCheck("camera_connectivity"), HealthStatus::HEALTHY);
    auto state = monitor.status().checks.at("camera_connectivity");
    EXPECT_EQ(state.consecutive_failures, 0);
    EXPECT_TRUE(state.error_message.empty());
    EXPECT_EQ(recoveries.load(), 1);

    auto alerts = monitor.drainAlerts(100);
    EXPECT_EQ(countAction(alerts, AlertAction::RecoveryStarted), 1u);
    EXPECT_EQ(countAction(alerts, AlertAction::RecoverySucceeded), 1u);
    EXPECT_EQ(countAction(alerts, AlertAction::StatusChanged), 1u);
}

TEST_F(HealthMonitorTest, SingleFlightRecovery) {
    std::atomic<int> recoveries{0};
    Gate gate;

    HealthMonitor monitor(config, nullptr, nullptr);
    monitor.registerCheck(makeCheck(
        "websocket_health", [] { return HealthStatus::UNHEALTHY; }, 1,
        [&] { ++recoveries; gate.wait(); return true; }));

    std::thread first([&] { monitor.runCheck("websocket_health"); });
    std::thread second([&] { monitor.runCheck("websocket_health"); });
    first.join();
    second.join();

    auto inFlight = monitor.status().recovery_in_progress;
    EXPECT_EQ(inFlight, std::vector<std::string>{"websocket_health"});

    gate.open();
    monitor.stop();

    EXPECT_EQ(recoveries.load(), 1);
    auto alerts = monitor.drainAlerts(100);
    EXPECT_EQ(countAction(alerts, AlertAction::RecoveryStarted), 1u);
    EXPECT_TRUE(monitor.status().recovery_in_progress.empty());
}

TEST_F(HealthMonitorTest, FailedRecoveryRaisesAlert) {
    HealthMonitor monitor(config, nullptr, nullptr);
    monitor.registerCheck(makeCheck(
        "pwa_config_service", [] { return HealthStatus::CRITICAL; }, 1,
        []() -> bool { throw std::runtime_error("spawn failed"); }));

    monitor.runCheck("pwa_config_service");
    monitor.stop();

    auto alerts = monitor.drainAlerts(100);
    ASSERT_EQ(countAction(alerts, AlertAction::RecoveryFailed), 1u);
    for (const auto& alert : alerts) {
        if (alert.action == AlertAction::RecoveryFailed) {
            EXPECT_EQ(alert.error, "spawn failed");
            EXPECT_EQ(alert.status, HealthStatus::CRITICAL);
        }
    }
}

TEST_F(HealthMonitorTest, NoRecoveryWithoutFunction) {
    HealthMonitor monitor(config, nullptr, nullptr);
    monitor.registerCheck(makeCheck("certificate_validity",
                                    [] { return HealthStatus::UNHEALTHY; }, 1));
    monitor.runCheck("certificate_validity");
    monitor.runCheck("certificate_validity");
    EXPECT_EQ(countAction(monitor.drainAlerts(100), AlertAction::RecoveryStarted), 0u);
}

TEST_F(HealthMonitorTest, TimedOutCheck) {
    HealthMonitor monitor(config, nullptr, nullptr);
    HealthCheck check = makeCheck("slow", [] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return HealthStatus::HEALTHY;
    });
    check.timeout = std::chrono::milliseconds(50);
    monitor.registerCheck(check);

    EXPECT_EQ(monitor.runCheck("slow"), HealthStatus::UNHEALTHY);
    auto state = monitor.status().checks.at("slow");
    EXPECT_EQ(state.error_message, "Health check timed out");
    EXPECT_EQ(state.consecutive_failures, 1);
    monitor.stop();
}

TEST_F(HealthMonitorTest, HungCheckIsNotStartedAgain) {
    std::atomic<int> started{0};
    HealthMonitor monitor(config, nullptr, nullptr);
    HealthCheck check = makeCheck("hung", [&started] {
        ++started;
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return HealthStatus::HEALTHY;
    });
    check.timeout = std::chrono::milliseconds(50);
    monitor.registerCheck(check);

    EXPECT_EQ(monitor.runCheck("hung"), HealthStatus::UNHEALTHY);
    EXPECT_EQ(monitor.runCheck("hung"), HealthStatus::UNHEALTHY);
    EXPECT_EQ(monitor.runCheck("hung"), HealthStatus::UNHEALTHY);
    EXPECT_EQ(started.load(), 1);

    auto state = monitor.status().checks.at("hung");
    EXPECT_EQ(state.error_message, "Previous run still in progress");
    EXPECT_EQ(state.consecutive_failures, 3);

    // Once the stuck run returns, the next one starts normally.
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    EXPECT_EQ(monitor.runCheck("hung"), HealthStatus::UNHEALTHY);
    EXPECT_EQ(started.load(), 2);
    EXPECT_EQ(monitor.status().checks.at("hung").error_message, "Health check timed out");
    monitor.stop();
}

TEST_F(HealthMonitorTest, ThrowingCheckIsUnhealthy) {
    HealthMonitor monitor(config, nullptr, nullptr);
    monitor.registerCheck(makeCheck("boom", []() -> HealthStatus {
        throw std::runtime_error("probe exploded");
    }));

    EXPECT_EQ(monitor.runCheck("boom"), HealthStatus::UNHEALTHY);
    EXPECT_EQ(monitor.status().checks.at("boom").error_message, "probe exploded");
}

TEST_F(HealthMonitorTest, StatusChangeAlert) {
    std::atomic<int> calls{0};
    HealthMonitor monitor(config, nullptr, nullptr);
    monitor.registerCheck(makeCheck("flappy", [&] {
        return ++calls == 1 ? HealthStatus::HEALTHY : HealthStatus::DEGRADED;
    }));

    monitor.runCheck("flappy");
    EXPECT_TRUE(monitor.drainAlerts(10).empty());

    monitor.runCheck("flappy");
    auto alerts = monitor.drainAlerts(10);
    ASSERT_EQ(alerts.size(), 1u);
    EXPECT_EQ(alerts[0].action, AlertAction::StatusChanged);
    EXPECT_EQ(alerts[0].status, HealthStatus::DEGRADED);
    EXPECT_EQ(alerts[0].check_name, "flappy");
}

TEST_F(HealthMonitorTest, DrainRespectsBatchSize) {
    HealthMonitor monitor(config, nullptr, nullptr);
    std::atomic<int> calls{0};
    monitor.registerCheck(makeCheck("toggle", [&] {
        return (++calls % 2) ? HealthStatus::HEALTHY : HealthStatus::DEGRADED;
    }));
    for (int i = 0; i < 6; ++i) {
        monitor.runCheck("toggle");
    }
    EXPECT_EQ(monitor.drainAlerts(3).size(), 3u);
    EXPECT_EQ(monitor.drainAlerts(10).size(), 2u);
    EXPECT_TRUE(monitor.drainAlerts(10).empty());
}

TEST_F(HealthMonitorTest, WebhookDelivery) {
    auto http = std::make_shared<MockHttpClient>();
    config.webhook_url = "http://hooks.local/alerts";
    HealthMonitor monitor(config, nullptr, http);

    EXPECT_CALL(*http, post("http://hooks.local/alerts",
                            AllOf(HasSubstr("\"check_name\":\"system_resources\""),
                                  HasSubstr("\"status\":\"critical\""),
                                  HasSubstr("\"action\":\"recovery_started\"")),
                            _, _))
        .WillOnce(Return(makeResponse(200)));

    Alert alert;
    alert.timestamp = camfleet::utils::SystemClock::now();
    alert.check_name = "system_resources";
    alert.status = HealthStatus::CRITICAL;
    alert.action = AlertAction::RecoveryStarted;
    monitor.dispatchAlert(alert);
}

TEST_F(HealthMonitorTest, NoWebhookMeansNoPost) {
    auto http = std::make_shared<MockHttpClient>();
    HealthMonitor monitor(config, nullptr, http);
    EXPECT_CALL(*http, post(_, _, _, _)).Times(0);
    monitor.dispatchAlert(Alert{});
}

TEST_F(HealthMonitorTest, LoopsRunChecksUntilStopped) {
    std::atomic<int> runs{0};
    config.metrics_interval = std::chrono::milliseconds(20);
    config.alert_interval = std::chrono::milliseconds(20);
    HealthMonitor monitor(config, nullptr, nullptr);

    HealthCheck check = makeCheck("tick", [&] { ++runs; return HealthStatus::HEALTHY; });
    check.interval = std::chrono::milliseconds(20);
    monitor.registerCheck(check);

    monitor.start();
    EXPECT_TRUE(monitor.isRunning());
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    monitor.stop();
    EXPECT_FALSE(monitor.isRunning());

    int seen = runs.load();
    EXPECT_GE(seen, 2);
    std::this_thread::sleep_for(std::chrono::milliseconds(60));
    EXPECT_EQ(runs.load(), seen);
}
