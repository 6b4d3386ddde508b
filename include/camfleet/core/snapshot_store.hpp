/**
 * @file snapshot_store.hpp
 * @brief JSON persistence of discovery, endpoint, certificate and health state.
 *
 * Files are written through the protobuf JSON mapping of the messages in
 * fleet.proto and replaced atomically (temp file + rename).
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/core/certificate_manager.hpp"
#include "camfleet/core/device.hpp"
#include "camfleet/core/endpoint_negotiator.hpp"
#include "camfleet/core/export.hpp"
#include "camfleet/core/health_monitor.hpp"
#include "camfleet/core/system_metrics.hpp"
#include "camfleet/proto/fleet.pb.h"

#include <ctime>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace google {
namespace protobuf {
class Message;
}
}

namespace camfleet {
namespace core {

class CAMFLEET_CORE_API SnapshotStore {
public:
    static constexpr const char* kDiscoveryFile = "discovered_cameras.json";
    static constexpr const char* kEndpointsFile = "websocket_config.json";
    static constexpr const char* kCertificatesFile = "certificate_report.json";
    static constexpr const char* kHealthFile = "health_report.json";

    explicit SnapshotStore(std::string outputDir = ".");

    std::string pathFor(const char* file) const;
    const std::string& outputDir() const { return outputDir_; }

    /// @throws StorageError
    void saveDiscovery(const std::vector<Device>& devices) const;

    /**
     * @brief Read the last discovery snapshot.
     * @return nullopt when no snapshot exists.
     * @throws StorageError if the file exists but does not parse.
     */
    std::optional<std::vector<Device>> loadDiscovery() const;

    /// @throws StorageError
    void saveEndpoints(const std::vector<EndpointCandidate>& endpoints,
                       const std::map<std::string, QualityReport>& quality) const;

    /// @throws StorageError if the file exists but does not parse.
    std::optional<std::vector<EndpointCandidate>> loadEndpoints() const;

    /// @throws StorageError
    void saveCertificateReport(const std::map<std::string, CertificateRecord>& records,
                               const CertificateSummary& summary,
                               std::time_t now) const;

    /// @throws StorageError if the file exists but does not parse.
    std::optional<CertificateSummary> loadCertificateSummary() const;

    /// @throws StorageError
    static void writeHealthReport(const std::string& path,
                                  const AggregateHealth& health,
                                  const std::vector<MetricsSample>& metrics);

    /// Webhook body for one alert.
    static std::string alertToJson(const Alert& alert);

    static proto::CameraRecord toProto(const Device& device);
    static Device fromProto(const proto::CameraRecord& record);
    static proto::EndpointRecord toProto(const EndpointCandidate& endpoint);
    static EndpointCandidate fromProto(const proto::EndpointRecord& record);
    static proto::MetricsRecord toProto(const MetricsSample& sample);
    static proto::CertificateRecord toProto(const CertificateRecord& record, std::time_t now);

    /// @throws StorageError
    static void writeJson(const std::string& path, const google::protobuf::Message& message);

    /**
     * @return false when @p path does not exist.
     * @throws StorageError on read or parse failure.
     */
    static bool readJson(const std::string& path, google::protobuf::Message* message);

private:
    std::string outputDir_;
};

}  // namespace core
}  // namespace camfleet
