/**
 * @file snapshot_store.cpp
 * @brief SnapshotStore implementation.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/core/snapshot_store.hpp"
#include "camfleet/core/errors.hpp"
#include "camfleet/net/url.hpp"
#include "camfleet/utils/logger.hpp"
#include "camfleet/utils/time_utils.hpp"

#include <google/protobuf/util/json_util.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace camfleet {
namespace core {

namespace {

constexpr const char* kComponent = "Store";

std::string utcText(utils::SystemClock::time_point tp) {
    return utils::isoUtc(utils::SystemClock::to_time_t(tp));
}

}  // namespace

SnapshotStore::SnapshotStore(std::string outputDir)
    : outputDir_(std::move(outputDir))
{
}

std::string SnapshotStore::pathFor(const char* file) const {
    return (fs::path(outputDir_) / file).string();
}

// =============================================================================
// JSON file I/O
// =============================================================================

void SnapshotStore::writeJson(const std::string& path, const google::protobuf::Message& message) {
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    options.always_print_primitive_fields = true;
    options.preserve_proto_field_names = true;

    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(message, &json, options);
    if (!status.ok()) {
        throw StorageError("Cannot serialize " + path + ": " + status.ToString());
    }

    const fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw StorageError("Cannot create " + target.parent_path().string() + ": " +
                               ec.message());
        }
    }

    const fs::path tmp = target.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw StorageError("Cannot open " + tmp.string() + " for writing");
        }
        out << json;
        if (!out.good()) {
            throw StorageError("Write to " + tmp.string() + " failed");
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw StorageError("Cannot replace " + path);
    }
}

bool SnapshotStore::readJson(const std::string& path, google::protobuf::Message* message) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return false;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        throw StorageError("Cannot open " + path);
    }
    std::ostringstream oss;
    oss << in.rdbuf();

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    auto status = google::protobuf::util::JsonStringToMessage(oss.str(), message, options);
    if (!status.ok()) {
        throw StorageError("Malformed " + path + ": " + status.ToString());
    }
    return true;
}

// =============================================================================
// Conversions
// =============================================================================

proto::CameraRecord SnapshotStore::toProto(const Device& device) {
    proto::CameraRecord record;
    record.set_ip(device.ip);
    record.set_mac(device.mac);
    record.set_model(device.model);
    record.set_serial(device.serial);
    record.set_firmware(device.firmware);
    record.set_name(device.name);

    auto* caps = record.mutable_capabilities();
    caps->set_rtsp(device.capabilities.rtsp);
    caps->set_onvif(device.capabilities.onvif);
    caps->set_motion_detection(device.capabilities.motion_detection);
    caps->set_audio(device.capabilities.audio);
    caps->set_ptz(device.capabilities.ptz);
    caps->set_analytics(device.capabilities.analytics);

    if (device.rtsp_url) {
        record.set_rtsp_url(*device.rtsp_url);
    }
    if (device.websocket_url) {
        record.set_websocket_url(*device.websocket_url);
    }
    return record;
}

Device SnapshotStore::fromProto(const proto::CameraRecord& record) {
    Device device(record.ip());
    if (!record.mac().empty()) device.mac = record.mac();
    if (!record.model().empty()) device.model = record.model();
    if (!record.serial().empty()) device.serial = record.serial();
    if (!record.firmware().empty()) device.firmware = record.firmware();
    if (!record.name().empty()) device.name = record.name();

    const auto& caps = record.capabilities();
    device.capabilities.rtsp = caps.rtsp();
    device.capabilities.onvif = caps.onvif();
    device.capabilities.motion_detection = caps.motion_detection();
    device.capabilities.audio = caps.audio();
    device.capabilities.ptz = caps.ptz();
    device.capabilities.analytics = caps.analytics();

    if (record.has_rtsp_url()) {
        device.rtsp_url = record.rtsp_url();
    }
    if (record.has_websocket_url()) {
        device.websocket_url = record.websocket_url();
    }
    return device;
}

proto::EndpointRecord SnapshotStore::toProto(const EndpointCandidate& endpoint) {
    proto::EndpointRecord record;
    record.set_url(endpoint.url);
    record.set_protocol(endpoint.protocol);
    record.set_path(endpoint.path);
    for (const auto& [key, value] : endpoint.params) {
        (*record.mutable_params())[key] = value;
    }
    record.set_auth_type(authTypeToString(endpoint.auth_type));
    record.set_ssl_verify(endpoint.ssl_verify);
    record.set_validated(endpoint.validated);
    record.set_latency(endpoint.latency_ms);
    if (endpoint.error) {
        record.set_error(*endpoint.error);
    }
    return record;
}

EndpointCandidate SnapshotStore::fromProto(const proto::EndpointRecord& record) {
    EndpointCandidate endpoint;
    endpoint.url = record.url();
    if (auto parsed = net::Url::parse(record.url())) {
        endpoint.device_ip = parsed->host;
    }
    endpoint.protocol = record.protocol();
    endpoint.path = record.path();
    for (const auto& entry : record.params()) {
        endpoint.params.emplace_back(entry.first, entry.second);
    }
    endpoint.auth_type = authTypeFromString(record.auth_type()).value_or(AuthType::Basic);
    endpoint.ssl_verify = record.ssl_verify();
    endpoint.validated = record.validated();
    endpoint.latency_ms = record.latency();
    if (record.has_error()) {
        endpoint.error = record.error();
    }
    return endpoint;
}

proto::MetricsRecord SnapshotStore::toProto(const MetricsSample& sample) {
    proto::MetricsRecord record;
    record.set_timestamp(utcText(sample.timestamp));
    record.set_cpu_percent(sample.cpu_percent);
    record.set_memory_percent(sample.memory_percent);
    record.set_disk_percent(sample.disk_percent);

    auto* io = record.mutable_network_io();
    io->set_bytes_sent(static_cast<double>(sample.network_io.bytes_sent));
    io->set_bytes_recv(static_cast<double>(sample.network_io.bytes_recv));
    io->set_packets_sent(static_cast<double>(sample.network_io.packets_sent));
    io->set_packets_recv(static_cast<double>(sample.network_io.packets_recv));
    io->set_errin(static_cast<double>(sample.network_io.errin));
    io->set_errout(static_cast<double>(sample.network_io.errout));

    record.set_process_count(sample.process_count);
    record.set_open_files(sample.open_files);
    return record;
}

proto::CertificateRecord SnapshotStore::toProto(const CertificateRecord& cert, std::time_t now) {
    proto::CertificateRecord record;
    record.set_subject(cert.subject);
    record.set_issuer(cert.issuer);
    record.set_serial_number(cert.serial_number);
    record.set_not_before(utils::isoUtc(cert.not_before));
    record.set_not_after(utils::isoUtc(cert.not_after));
    record.set_fingerprint(cert.fingerprint);
    record.set_is_self_signed(cert.is_self_signed);
    record.set_is_valid(cert.is_valid);
    for (const auto& e : cert.validation_errors) {
        record.add_validation_errors(e);
    }
    for (const auto& name : cert.san_names) {
        record.add_san_names(name);
    }
    for (const auto& usage : cert.key_usage) {
        record.add_key_usage(usage);
    }
    record.set_days_until_expiry(cert.daysUntilExpiry(now));
    return record;
}

// =============================================================================
// Snapshots
// =============================================================================

void SnapshotStore::saveDiscovery(const std::vector<Device>& devices) const {
    proto::DiscoverySnapshot snapshot;
    snapshot.set_timestamp(utils::unixSeconds());
    for (const auto& device : devices) {
        *snapshot.add_cameras() = toProto(device);
    }

    const std::string path = pathFor(kDiscoveryFile);
    writeJson(path, snapshot);
    LOG_INFO(kComponent, "Saved {} cameras to {}", devices.size(), path);
}

std::optional<std::vector<Device>> SnapshotStore::loadDiscovery() const {
    proto::DiscoverySnapshot snapshot;
    if (!readJson(pathFor(kDiscoveryFile), &snapshot)) {
        return std::nullopt;
    }

    std::vector<Device> devices;
    devices.reserve(static_cast<size_t>(snapshot.cameras_size()));
    for (const auto& record : snapshot.cameras()) {
        if (record.ip().empty()) {
            LOG_WARN(kComponent, "Skipping camera record without ip");
            continue;
        }
        devices.push_back(fromProto(record));
    }
    return devices;
}

void SnapshotStore::saveEndpoints(const std::vector<EndpointCandidate>& endpoints,
                                  const std::map<std::string, QualityReport>& quality) const {
    proto::EndpointSnapshot snapshot;
    snapshot.set_timestamp(utils::unixSeconds());
    for (const auto& endpoint : endpoints) {
        *snapshot.add_endpoints() = toProto(endpoint);
    }
    for (const auto& [url, report] : quality) {
        proto::QualityRecord& record = (*snapshot.mutable_quality())[url];
        record.set_fps(report.fps);
        record.set_bitrate_kbps(report.bitrate_kbps);
        record.set_jitter_ms(report.jitter_ms);
        record.set_resolution(report.resolution);
        record.set_codec(report.codec);
        record.set_duration_s(report.duration_s);
        record.set_frames(report.frames);
    }

    const std::string path = pathFor(kEndpointsFile);
    writeJson(path, snapshot);
    LOG_INFO(kComponent, "Saved {} endpoints to {}", endpoints.size(), path);
}

std::optional<std::vector<EndpointCandidate>> SnapshotStore::loadEndpoints() const {
    proto::EndpointSnapshot snapshot;
    if (!readJson(pathFor(kEndpointsFile), &snapshot)) {
        return std::nullopt;
    }

    std::vector<EndpointCandidate> endpoints;
    for (const auto& record : snapshot.endpoints()) {
        endpoints.push_back(fromProto(record));
    }
    return endpoints;
}

void SnapshotStore::saveCertificateReport(const std::map<std::string, CertificateRecord>& records,
                                          const CertificateSummary& summary,
                                          std::time_t now) const {
    proto::CertificateReport report;
    report.set_timestamp(static_cast<double>(now));
    report.set_scan_date(utils::isoUtc(now));
    for (const auto& [host, record] : records) {
        (*report.mutable_certificates())[host] = toProto(record, now);
    }

    auto* s = report.mutable_summary();
    s->set_total_certificates(summary.total_certificates);
    s->set_self_signed(summary.self_signed);
    s->set_valid(summary.valid);
    s->set_expiring_soon(summary.expiring_soon);

    const std::string path = pathFor(kCertificatesFile);
    writeJson(path, report);
    LOG_INFO(kComponent, "Certificate report saved to {}", path);
}

std::optional<CertificateSummary> SnapshotStore::loadCertificateSummary() const {
    proto::CertificateReport report;
    if (!readJson(pathFor(kCertificatesFile), &report)) {
        return std::nullopt;
    }

    CertificateSummary summary;
    summary.total_certificates = report.summary().total_certificates();
    summary.self_signed = report.summary().self_signed();
    summary.valid = report.summary().valid();
    summary.expiring_soon = report.summary().expiring_soon();
    return summary;
}

void SnapshotStore::writeHealthReport(const std::string& path,
                                      const AggregateHealth& health,
                                      const std::vector<MetricsSample>& metrics) {
    proto::HealthReport report;
    report.set_overall_status(healthStatusToString(health.overall));

    for (const auto& [name, state] : health.checks) {
        proto::CheckRecord& record = (*report.mutable_checks())[name];
        record.set_status(healthStatusToString(state.last_status));
        if (state.last_check) {
            record.set_last_check(utcText(*state.last_check));
        }
        record.set_consecutive_failures(state.consecutive_failures);
        record.set_error(state.error_message);
    }

    if (health.metrics) {
        *report.mutable_metrics() = toProto(*health.metrics);
    }
    report.set_alerts_pending(static_cast<int32_t>(health.alerts_pending));
    for (const auto& name : health.recovery_in_progress) {
        report.add_recovery_in_progress(name);
    }
    report.set_timestamp(utcText(health.timestamp));
    for (const auto& sample : metrics) {
        *report.add_metrics_history() = toProto(sample);
    }

    writeJson(path, report);
}

std::string SnapshotStore::alertToJson(const Alert& alert) {
    proto::AlertRecord record;
    record.set_timestamp(utcText(alert.timestamp));
    record.set_check_name(alert.check_name);
    record.set_status(healthStatusToString(alert.status));
    record.set_error(alert.error);
    record.set_action(alertActionToString(alert.action));

    google::protobuf::util::JsonPrintOptions options;
    options.always_print_primitive_fields = true;
    options.preserve_proto_field_names = true;

    std::string json;
    auto status = google::protobuf::util::MessageToJsonString(record, &json, options);
    if (!status.ok()) {
        LOG_WARN(kComponent, "Cannot encode alert: {}", status.ToString());
        return "{}";
    }
    return json;
}

}  // namespace core
}  // namespace camfleet
