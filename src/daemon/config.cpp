/**
 * @file config.cpp
 * @brief JSON config-file overlay for camfleetd.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/daemon/config.hpp"
#include "camfleet/core/errors.hpp"
#include "camfleet/core/snapshot_store.hpp"
#include "camfleet/proto/fleet.pb.h"

namespace camfleet {
namespace daemon {

void applyConfigFile(Config& config, const std::string& path) {
    proto::ConfigFile file;
    if (!core::SnapshotStore::readJson(path, &file)) {
        throw core::StorageError("Config file not found: " + path);
    }

    if (file.has_username()) config.username = file.username();
    if (file.has_password()) config.password = file.password();
    if (file.has_network()) config.network = file.network();
    if (file.has_webhook_url()) config.webhook_url = file.webhook_url();
    if (file.has_log_level()) config.log_level = file.log_level();
    if (file.has_output_dir()) config.output_dir = file.output_dir();
    if (file.has_cert_dir()) config.cert_dir = file.cert_dir();
    if (file.has_status_interval()) config.status_interval_s = file.status_interval();
    if (file.has_rediscovery_interval()) {
        config.rediscovery_interval_s = file.rediscovery_interval();
    }
    if (file.has_monitor_without_devices()) {
        config.monitor_without_devices = file.monitor_without_devices();
    }

    if (file.has_thresholds()) {
        const auto& t = file.thresholds();
        if (t.has_cpu_percent()) config.thresholds.cpu_percent = t.cpu_percent();
        if (t.has_memory_percent()) config.thresholds.memory_percent = t.memory_percent();
        if (t.has_disk_percent()) config.thresholds.disk_percent = t.disk_percent();
    }

    if (file.services_size() > 0) {
        config.services.clear();
        for (const auto& entry : file.services()) {
            if (entry.name().empty()) {
                throw core::StorageError("Service entry without name in " + path);
            }
            core::ServiceSpec spec;
            spec.name = entry.name();
            if (!entry.health_url().empty()) spec.health_url = entry.health_url();
            if (entry.command_size() > 0) {
                spec.command.assign(entry.command().begin(), entry.command().end());
            }
            if (!entry.process_pattern().empty()) spec.process_pattern = entry.process_pattern();
            if (entry.interval() > 0) spec.interval = std::chrono::seconds(entry.interval());
            config.services.push_back(std::move(spec));
        }
    }
}

core::OrchestratorConfig toOrchestratorConfig(const Config& config) {
    core::OrchestratorConfig out;
    out.network = config.network;
    out.credentials.username = config.username;
    out.credentials.password = config.password;
    out.output_dir = config.output_dir;
    out.status_interval = std::chrono::seconds(config.status_interval_s > 0
                                                   ? config.status_interval_s : 60);
    out.rediscovery_interval = std::chrono::seconds(config.rediscovery_interval_s > 0
                                                        ? config.rediscovery_interval_s : 0);
    out.monitor_without_devices = config.monitor_without_devices;
    out.certificates.cert_dir = config.cert_dir;
    out.monitor.webhook_url = config.webhook_url;
    out.thresholds = config.thresholds;
    out.services = config.services;
    return out;
}

} // namespace daemon
} // namespace camfleet
