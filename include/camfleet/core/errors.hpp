/**
 * @file errors.hpp
 * @brief Exception types raised by camfleet core components.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include <stdexcept>
#include <string>

namespace camfleet {
namespace core {

/// Transport-level failure (connect, read, handshake).
class NetworkError : public std::runtime_error {
public:
    explicit NetworkError(const std::string& what) : std::runtime_error(what) {}
};

/// WWW-Authenticate value that is not a usable Digest challenge.
class MalformedChallengeError : public std::runtime_error {
public:
    explicit MalformedChallengeError(const std::string& what) : std::runtime_error(what) {}
};

/// Certificate bytes that OpenSSL cannot decode.
class CertificateParseError : public std::runtime_error {
public:
    explicit CertificateParseError(const std::string& what) : std::runtime_error(what) {}
};

/// OpenSSL failure while minting keys or certificates.
class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& what) : std::runtime_error(what) {}
};

/// Unusable discovery input, e.g. an invalid CIDR.
class DiscoveryError : public std::runtime_error {
public:
    explicit DiscoveryError(const std::string& what) : std::runtime_error(what) {}
};

/// A recovery action that could not be carried out.
class RecoveryError : public std::runtime_error {
public:
    explicit RecoveryError(const std::string& what) : std::runtime_error(what) {}
};

/// Unreadable or unwritable snapshot/config file.
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace core
}  // namespace camfleet
