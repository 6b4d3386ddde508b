/**
 * @file certificate_manager.cpp
 * @brief CertificateTrustManager implementation (OpenSSL X.509).
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/core/certificate_manager.hpp"
#include "camfleet/core/errors.hpp"
#include "camfleet/net/tcp_socket.hpp"
#include "camfleet/utils/bounded_pool.hpp"
#include "camfleet/utils/crypto.hpp"
#include "camfleet/utils/logger.hpp"
#include "camfleet/utils/time_utils.hpp"

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>

#include <arpa/inet.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace camfleet {
namespace core {

namespace {

using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using BnPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

std::string opensslError(const std::string& prefix) {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return prefix;
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return prefix + ": " + buf;
}

std::string commonName(X509_NAME* name) {
    int index = X509_NAME_get_index_by_NID(name, NID_commonName, -1);
    if (index < 0) {
        return "";
    }
    ASN1_STRING* data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(name, index));
    unsigned char* utf8 = nullptr;
    int length = ASN1_STRING_to_UTF8(&utf8, data);
    if (length < 0) {
        return "";
    }
    std::string value(reinterpret_cast<char*>(utf8), static_cast<size_t>(length));
    OPENSSL_free(utf8);
    return value;
}

std::time_t asn1TimeToUnix(const ASN1_TIME* time) {
    std::tm tm{};
    if (ASN1_TIME_to_tm(time, &tm) != 1) {
        throw CertificateParseError("Unreadable validity date");
    }
    return timegm(&tm);
}

std::vector<std::string> subjectAltNames(X509* cert) {
    std::vector<std::string> names;
    auto* sans = static_cast<GENERAL_NAMES*>(
        X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr));
    if (sans == nullptr) {
        return names;
    }

    for (int i = 0; i < sk_GENERAL_NAME_num(sans); ++i) {
        const GENERAL_NAME* entry = sk_GENERAL_NAME_value(sans, i);
        if (entry->type == GEN_DNS) {
            const ASN1_IA5STRING* dns = entry->d.dNSName;
            names.emplace_back(reinterpret_cast<const char*>(ASN1_STRING_get0_data(dns)),
                               static_cast<size_t>(ASN1_STRING_length(dns)));
        } else if (entry->type == GEN_IPADD) {
            const ASN1_OCTET_STRING* ip = entry->d.iPAddress;
            const int length = ASN1_STRING_length(ip);
            char text[INET6_ADDRSTRLEN] = {};
            int family = length == 4 ? AF_INET : (length == 16 ? AF_INET6 : 0);
            if (family != 0 &&
                inet_ntop(family, ASN1_STRING_get0_data(ip), text, sizeof(text)) != nullptr) {
                names.emplace_back(text);
            }
        }
    }
    GENERAL_NAMES_free(sans);
    return names;
}

std::vector<std::string> keyUsage(X509* cert) {
    std::vector<std::string> usage;
    const uint32_t bits = X509_get_key_usage(cert);
    if (bits == UINT32_MAX) {
        return usage;
    }
    if (bits & KU_DIGITAL_SIGNATURE) usage.emplace_back("Digital Signature");
    if (bits & KU_KEY_ENCIPHERMENT) usage.emplace_back("Key Encipherment");
    if (bits & KU_KEY_AGREEMENT) usage.emplace_back("Key Agreement");
    return usage;
}

std::string decimalSerial(X509* cert) {
    BnPtr bn(ASN1_INTEGER_to_BN(X509_get_serialNumber(cert), nullptr), BN_free);
    if (!bn) {
        return "";
    }
    char* dec = BN_bn2dec(bn.get());
    if (dec == nullptr) {
        return "";
    }
    std::string value(dec);
    OPENSSL_free(dec);
    return value;
}

std::string bioToString(BIO* bio) {
    char* data = nullptr;
    long length = BIO_get_mem_data(bio, &data);
    return length > 0 ? std::string(data, static_cast<size_t>(length)) : std::string();
}

void addExtension(X509* cert, int nid, const std::string& value) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_nconf_nid(nullptr, &ctx, nid, value.c_str());
    if (ext == nullptr) {
        throw CryptoError(opensslError("Invalid extension " + value));
    }
    int added = X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
    if (added != 1) {
        throw CryptoError(opensslError("X509_add_ext"));
    }
}

void addNameEntry(X509_NAME* name, const char* field, const std::string& value) {
    if (value.empty()) {
        return;
    }
    if (X509_NAME_add_entry_by_txt(name, field, MBSTRING_UTF8,
                                   reinterpret_cast<const unsigned char*>(value.c_str()),
                                   -1, -1, 0) != 1) {
        throw CryptoError(opensslError(std::string("Invalid subject field ") + field));
    }
}

void writeFile(const fs::path& path, const std::string& content, mode_t mode) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, mode);
    if (fd < 0) {
        throw StorageError("Cannot open " + path.string() + ": " + std::strerror(errno));
    }
    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            std::string error = std::strerror(errno);
            ::close(fd);
            throw StorageError("Cannot write " + path.string() + ": " + error);
        }
        written += static_cast<size_t>(n);
    }
    // An existing file keeps its old mode through O_CREAT.
    if (::fchmod(fd, mode) != 0) {
        LOG_WARN("Certificates", "chmod {} failed: {}", path.string(), std::strerror(errno));
    }
    ::close(fd);
}

bool readFile(const fs::path& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return false;
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    out = oss.str();
    return true;
}

}  // namespace

int CertificateRecord::daysUntilExpiry(std::time_t now) const {
    double seconds = std::difftime(not_after, now);
    return static_cast<int>(std::floor(seconds / 86400.0));
}

CertificateTrustManager::CertificateTrustManager(CertificateConfig config)
    : config_(std::move(config))
{
}

void CertificateTrustManager::ensureCertDir() const {
    std::error_code ec;
    fs::create_directories(config_.cert_dir, ec);
    if (ec) {
        throw StorageError("Cannot create " + config_.cert_dir + ": " + ec.message());
    }
}

// =============================================================================
// Parsing
// =============================================================================

CertificateRecord CertificateTrustManager::parseCertificatePem(const std::string& pem,
                                                               const std::string& host,
                                                               std::time_t now) {
    BioPtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), BIO_free);
    if (!bio) {
        throw CertificateParseError("BIO allocation failed");
    }
    X509Ptr cert(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr), X509_free);
    if (!cert) {
        throw CertificateParseError(opensslError("Cannot decode certificate from " + host));
    }

    CertificateRecord record;
    record.host = host;
    record.pem = pem;

    X509_NAME* subject = X509_get_subject_name(cert.get());
    X509_NAME* issuer = X509_get_issuer_name(cert.get());
    record.subject = commonName(subject);
    record.issuer = commonName(issuer);
    record.is_self_signed = X509_NAME_cmp(subject, issuer) == 0;
    record.serial_number = decimalSerial(cert.get());
    record.not_before = asn1TimeToUnix(X509_get0_notBefore(cert.get()));
    record.not_after = asn1TimeToUnix(X509_get0_notAfter(cert.get()));

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLength = 0;
    if (X509_digest(cert.get(), EVP_sha256(), md, &mdLength) != 1) {
        throw CertificateParseError(opensslError("Fingerprint failed"));
    }
    record.fingerprint = utils::toHex(md, mdLength);

    record.san_names = subjectAltNames(cert.get());
    record.key_usage = keyUsage(cert.get());

    if (now < record.not_before) {
        record.validation_errors.emplace_back("Certificate not yet valid");
    }
    if (now > record.not_after) {
        record.validation_errors.emplace_back("Certificate expired");
    }
    bool hostListed = std::find(record.san_names.begin(), record.san_names.end(), host) !=
                      record.san_names.end();
    if (!hostListed && host != record.subject) {
        record.validation_errors.emplace_back("Hostname " + host + " not in certificate");
    }
    record.is_valid = record.validation_errors.empty();
    return record;
}

// =============================================================================
// Scanning
// =============================================================================

std::optional<CertificateRecord> CertificateTrustManager::scanCertificate(const std::string& host,
                                                                          uint16_t port) {
    if (port == 0) {
        port = config_.port;
    }

    auto socket = std::make_unique<net::TcpSocket>();
    if (!socket->connect(host, port, config_.timeout_ms)) {
        LOG_ERROR("Certificates", "Failed to get certificate from {}:{}: {}",
                  host, port, socket->lastError());
        return std::nullopt;
    }

    net::TlsStream tls(std::move(socket), net::TlsOptions{});
    if (!tls.handshake(host, config_.timeout_ms)) {
        LOG_ERROR("Certificates", "Failed to get certificate from {}:{}: {}",
                  host, port, tls.lastError());
        return std::nullopt;
    }
    std::string pem = tls.peerCertificatePem();
    tls.close();

    if (pem.empty()) {
        LOG_ERROR("Certificates", "{}:{} presented no certificate", host, port);
        return std::nullopt;
    }

    try {
        return parseCertificatePem(pem, host, std::time(nullptr));
    } catch (const CertificateParseError& e) {
        LOG_ERROR("Certificates", "Skipping {}: {}", host, e.what());
        return std::nullopt;
    }
}

std::optional<CertificateRecord> CertificateTrustManager::scan(const std::string& host) {
    if (scanner_) {
        return scanner_(host, config_.port);
    }
    return scanCertificate(host, config_.port);
}

bool CertificateTrustManager::saveCertificate(const CertificateRecord& record) {
    try {
        ensureCertDir();
        fs::path path = fs::path(config_.cert_dir) / (record.host + ".crt");
        writeFile(path, record.pem, 0644);
        LOG_INFO("Certificates", "Saved certificate for {} to {}", record.host, path.string());
        return true;
    } catch (const StorageError& e) {
        LOG_ERROR("Certificates", "Failed to save certificate for {}: {}", record.host, e.what());
        return false;
    }
}

std::map<std::string, CertificateRecord> CertificateTrustManager::scanDevices(
    const std::vector<Device>& devices) {
    std::map<std::string, CertificateRecord> records;
    std::mutex recordsMutex;

    utils::parallelFor(devices.size(), config_.max_in_flight, [&](size_t i) {
        const std::string& ip = devices[i].ip;
        LOG_INFO("Certificates", "Scanning certificate for {}", ip);

        auto record = scan(ip);
        if (!record) {
            return;
        }
        if (record->is_self_signed) {
            saveCertificate(*record);
        }
        std::lock_guard<std::mutex> lock(recordsMutex);
        records.emplace(ip, std::move(*record));
    }, "Certificates");

    return records;
}

// =============================================================================
// Minting
// =============================================================================

MintedCertificate CertificateTrustManager::mintCertificate(const MintOptions& options) {
    PkeyPtr key(EVP_RSA_gen(2048), EVP_PKEY_free);
    if (!key) {
        throw CryptoError(opensslError("RSA key generation failed"));
    }

    X509Ptr cert(X509_new(), X509_free);
    if (!cert || X509_set_version(cert.get(), 2) != 1) {
        throw CryptoError(opensslError("X509_new"));
    }

    BnPtr serial(BN_new(), BN_free);
    if (!serial || BN_rand(serial.get(), 159, BN_RAND_TOP_ANY, BN_RAND_BOTTOM_ANY) != 1 ||
        BN_to_ASN1_INTEGER(serial.get(), X509_get_serialNumber(cert.get())) == nullptr) {
        throw CryptoError(opensslError("Serial generation failed"));
    }

    if (X509_gmtime_adj(X509_getm_notBefore(cert.get()), options.not_before_offset_s) == nullptr ||
        X509_gmtime_adj(X509_getm_notAfter(cert.get()),
                        options.not_before_offset_s + options.validity_s) == nullptr) {
        throw CryptoError(opensslError("Validity window"));
    }

    X509_NAME* name = X509_get_subject_name(cert.get());
    addNameEntry(name, "C", "US");
    addNameEntry(name, "ST", "California");
    addNameEntry(name, "L", "San Francisco");
    addNameEntry(name, "O", options.organization);
    addNameEntry(name, "CN", options.common_name);
    if (X509_set_issuer_name(cert.get(), name) != 1 ||
        X509_set_pubkey(cert.get(), key.get()) != 1) {
        throw CryptoError(opensslError("Certificate identity"));
    }

    std::vector<std::string> sans;
    for (const auto& dns : options.dns_names) sans.push_back("DNS:" + dns);
    for (const auto& ip : options.ip_addresses) sans.push_back("IP:" + ip);
    if (!sans.empty()) {
        std::string value;
        for (size_t i = 0; i < sans.size(); ++i) {
            if (i > 0) value += ",";
            value += sans[i];
        }
        addExtension(cert.get(), NID_subject_alt_name, value);
    }
    addExtension(cert.get(), NID_basic_constraints, "critical,CA:FALSE");
    addExtension(cert.get(), NID_key_usage, "critical,digitalSignature,keyEncipherment");

    if (X509_sign(cert.get(), key.get(), EVP_sha256()) <= 0) {
        throw CryptoError(opensslError("X509_sign"));
    }

    MintedCertificate minted;

    BioPtr certBio(BIO_new(BIO_s_mem()), BIO_free);
    if (!certBio || PEM_write_bio_X509(certBio.get(), cert.get()) != 1) {
        throw CryptoError(opensslError("PEM_write_bio_X509"));
    }
    minted.cert_pem = bioToString(certBio.get());

    BioPtr keyBio(BIO_new(BIO_s_mem()), BIO_free);
    if (!keyBio || PEM_write_bio_PrivateKey(keyBio.get(), key.get(), nullptr, nullptr, 0,
                                            nullptr, nullptr) != 1) {
        throw CryptoError(opensslError("PEM_write_bio_PrivateKey"));
    }
    minted.key_pem = bioToString(keyBio.get());
    return minted;
}

GeneratedCertificate CertificateTrustManager::generateSelfSigned(
    const std::string& hostname, const std::vector<std::string>& ips) {
    MintOptions options;
    options.common_name = hostname;
    options.organization = config_.organization;
    options.dns_names = {hostname};
    options.ip_addresses = ips;

    MintedCertificate minted = mintCertificate(options);

    ensureCertDir();
    GeneratedCertificate paths;
    paths.cert_path = (fs::path(config_.cert_dir) / (hostname + ".crt")).string();
    paths.key_path = (fs::path(config_.cert_dir) / (hostname + ".key")).string();

    writeFile(paths.cert_path, minted.cert_pem, 0644);
    writeFile(paths.key_path, minted.key_pem, 0600);

    LOG_INFO("Certificates", "Generated self-signed certificate for {}", hostname);
    return paths;
}

// =============================================================================
// Trust store
// =============================================================================

std::string CertificateTrustManager::buildCaBundle(bool includeSelfSigned) {
    ensureCertDir();
    const fs::path bundlePath = fs::path(config_.cert_dir) / kBundleName;

    std::string bundle;
    if (!readFile(config_.system_bundle, bundle)) {
        LOG_WARN("Certificates", "System CA bundle {} not readable", config_.system_bundle);
    }

    if (includeSelfSigned) {
        bundle += "\n# " + config_.organization + " Self-Signed Certificates\n";

        std::vector<fs::path> certs;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(config_.cert_dir, ec)) {
            const fs::path& path = entry.path();
            if (entry.is_regular_file() && path.extension() == ".crt" &&
                path.filename().string() != kBundleName) {
                certs.push_back(path);
            }
        }
        if (ec) {
            throw StorageError("Cannot list " + config_.cert_dir + ": " + ec.message());
        }
        std::sort(certs.begin(), certs.end());

        for (const auto& path : certs) {
            std::string content;
            if (!readFile(path, content)) {
                LOG_WARN("Certificates", "Skipping unreadable {}", path.string());
                continue;
            }
            bundle += "\n# " + path.filename().string() + "\n";
            bundle += content;
        }
    }

    writeFile(bundlePath, bundle, 0644);
    LOG_INFO("Certificates", "Created CA bundle at {}", bundlePath.string());
    return bundlePath.string();
}

std::vector<ExpiringCertificate> CertificateTrustManager::monitorExpiry(
    const std::vector<Device>& devices, int warningDays) {
    std::vector<ExpiringCertificate> expiring;
    const std::time_t now = std::time(nullptr);

    for (const auto& device : devices) {
        auto record = scan(device.ip);
        if (!record) {
            continue;
        }
        int days = record->daysUntilExpiry(now);
        if (days >= warningDays) {
            continue;
        }

        ExpiringCertificate entry;
        entry.camera = device.name;
        entry.ip = device.ip;
        entry.days_until_expiry = days;
        entry.expires = utils::isoUtc(record->not_after);
        entry.subject = record->subject;
        expiring.push_back(std::move(entry));

        LOG_WARN("Certificates", "Certificate for {} ({}) expires in {} days",
                 device.name, device.ip, days);
    }
    return expiring;
}

CertificateSummary CertificateTrustManager::summarize(
    const std::map<std::string, CertificateRecord>& records, std::time_t now, int warningDays) {
    CertificateSummary summary;
    summary.total_certificates = static_cast<int>(records.size());
    for (const auto& [host, record] : records) {
        if (record.is_self_signed) ++summary.self_signed;
        if (record.is_valid) ++summary.valid;
        if (record.daysUntilExpiry(now) < warningDays) ++summary.expiring_soon;
    }
    return summary;
}

net::TlsOptions CertificateTrustManager::verifiedTlsOptions(const std::string& caBundlePath) const {
    net::TlsOptions options;
    options.verifyPeer = true;
    options.caBundlePath = caBundlePath;
    options.restrictCiphers = true;
    return options;
}

}  // namespace core
}  // namespace camfleet
