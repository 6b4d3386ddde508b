/**
 * @file crypto.hpp
 * @brief Hashing, encoding and random helpers backed by OpenSSL.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/utils/export.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace camfleet {
namespace utils {

/**
 * @brief Lower-case hex encoding of a byte buffer.
 */
CAMFLEET_UTILS_API std::string toHex(const uint8_t* data, size_t length);

/// MD5 digest of @p input as 32 lower-case hex characters.
CAMFLEET_UTILS_API std::string md5Hex(const std::string& input);

/// SHA-256 digest of @p input as 64 lower-case hex characters.
CAMFLEET_UTILS_API std::string sha256Hex(const std::string& input);

/// Raw 20-byte SHA-1 digest of @p input.
CAMFLEET_UTILS_API std::string sha1Raw(const std::string& input);

/// Standard base64 (RFC 4648, padded).
CAMFLEET_UTILS_API std::string base64Encode(const std::string& input);

/**
 * @brief Cryptographically secure random bytes.
 * @throws std::runtime_error if the CSPRNG cannot be seeded.
 */
CAMFLEET_UTILS_API std::string randomBytes(size_t count);

/**
 * @brief Hex encoding of @p byteCount random bytes (2 * byteCount characters).
 */
CAMFLEET_UTILS_API std::string randomHex(size_t byteCount);

}  // namespace utils
}  // namespace camfleet
