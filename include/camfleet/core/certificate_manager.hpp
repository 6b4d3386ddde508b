/**
 * @file certificate_manager.hpp
 * @brief TLS trust management: certificate scanning, minting and CA bundles.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/core/device.hpp"
#include "camfleet/core/export.hpp"
#include "camfleet/net/tls_stream.hpp"

#include <cstdint>
#include <ctime>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace camfleet {
namespace core {

/**
 * @struct CertificateRecord
 * @brief Decoded leaf certificate of one host plus validation outcome.
 */
struct CAMFLEET_CORE_API CertificateRecord {
    std::string host;
    std::string subject;          ///< subject CN
    std::string issuer;           ///< issuer CN
    std::string serial_number;    ///< decimal
    std::time_t not_before = 0;
    std::time_t not_after = 0;
    std::string fingerprint;      ///< SHA-256, lower-case hex
    bool is_self_signed = false;
    bool is_valid = false;
    std::vector<std::string> validation_errors;
    std::vector<std::string> san_names;
    std::vector<std::string> key_usage;
    std::string pem;

    /// Whole days until not_after, rounded toward negative infinity.
    int daysUntilExpiry(std::time_t now) const;
};

struct CAMFLEET_CORE_API CertificateSummary {
    int total_certificates = 0;
    int self_signed = 0;
    int valid = 0;
    int expiring_soon = 0;
};

struct CAMFLEET_CORE_API ExpiringCertificate {
    std::string camera;
    std::string ip;
    int days_until_expiry = 0;
    std::string expires;          ///< UTC ISO-8601
    std::string subject;
};

struct CAMFLEET_CORE_API GeneratedCertificate {
    std::string cert_path;
    std::string key_path;
};

/**
 * @struct MintOptions
 * @brief Parameters for an RSA-2048 / SHA-256 self-signed certificate.
 */
struct CAMFLEET_CORE_API MintOptions {
    std::string common_name;
    std::string organization = "Anava Vision";
    std::vector<std::string> dns_names;
    std::vector<std::string> ip_addresses;
    long not_before_offset_s = 0;            ///< relative to now
    long validity_s = 365L * 24 * 3600;
};

struct CAMFLEET_CORE_API MintedCertificate {
    std::string cert_pem;
    std::string key_pem;                     ///< PKCS#8, unencrypted
};

struct CAMFLEET_CORE_API CertificateConfig {
    std::string cert_dir = "./certificates";
    std::string system_bundle = "/etc/ssl/certs/ca-certificates.crt";
    std::string organization = "Anava Vision";
    uint16_t port = 443;
    int timeout_ms = 5000;
    size_t max_in_flight = 50;
    int expiry_warning_days = 30;
};

/**
 * @class CertificateTrustManager
 * @brief Scans camera certificates and maintains the local trust store.
 *
 * Self-signed camera certificates are persisted as `<cert_dir>/<host>.crt`
 * and folded into `<cert_dir>/ca-bundle.crt` by buildCaBundle().
 */
class CAMFLEET_CORE_API CertificateTrustManager {
public:
    using Scanner = std::function<std::optional<CertificateRecord>(const std::string& host,
                                                                    uint16_t port)>;

    static constexpr const char* kBundleName = "ca-bundle.crt";

    explicit CertificateTrustManager(CertificateConfig config);

    CertificateTrustManager(const CertificateTrustManager&) = delete;
    CertificateTrustManager& operator=(const CertificateTrustManager&) = delete;

    /// Replace the network scanner used by scanDevices() and monitorExpiry().
    void setScanner(Scanner scanner) { scanner_ = std::move(scanner); }

    /**
     * @brief Fetch and decode the leaf certificate of host:port.
     *
     * Verification is disabled for the fetch; validity is judged afterwards.
     * @param port 0 selects the configured port.
     */
    std::optional<CertificateRecord> scanCertificate(const std::string& host, uint16_t port = 0);

    /**
     * @brief Scan every device concurrently, persisting self-signed certificates.
     * @return Records keyed by device IP.
     */
    std::map<std::string, CertificateRecord> scanDevices(const std::vector<Device>& devices);

    /// Write record.pem to `<cert_dir>/<host>.crt`.
    bool saveCertificate(const CertificateRecord& record);

    /**
     * @brief Mint a certificate for @p hostname and write `<hostname>.crt/.key`.
     * @throws CryptoError on OpenSSL failure, StorageError on write failure.
     */
    GeneratedCertificate generateSelfSigned(const std::string& hostname,
                                            const std::vector<std::string>& ips);

    /**
     * @brief Write `<cert_dir>/ca-bundle.crt`.
     * @throws StorageError if the bundle cannot be written.
     */
    std::string buildCaBundle(bool includeSelfSigned = true);

    /**
     * @brief Re-scan devices and list those expiring within @p warningDays.
     */
    std::vector<ExpiringCertificate> monitorExpiry(const std::vector<Device>& devices,
                                                   int warningDays);

    /// Options for verified TLS against the given bundle.
    net::TlsOptions verifiedTlsOptions(const std::string& caBundlePath) const;

    const CertificateConfig& config() const { return config_; }

    /**
     * @brief Decode PEM and validate it against @p host at time @p now.
     * @throws CertificateParseError if the PEM does not decode.
     */
    static CertificateRecord parseCertificatePem(const std::string& pem,
                                                 const std::string& host,
                                                 std::time_t now);

    /// @throws CryptoError
    static MintedCertificate mintCertificate(const MintOptions& options);

    static CertificateSummary summarize(const std::map<std::string, CertificateRecord>& records,
                                        std::time_t now, int warningDays = 30);

private:
    std::optional<CertificateRecord> scan(const std::string& host);
    void ensureCertDir() const;

    CertificateConfig config_;
    Scanner scanner_;
};

}  // namespace core
}  // namespace camfleet
