/**
 * @file crypto.cpp
 * @brief OpenSSL-backed hashing, encoding and random helpers.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/utils/crypto.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <stdexcept>
#include <vector>

namespace camfleet {
namespace utils {

namespace {

std::string digest(const EVP_MD* md, const std::string& input) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;
    if (EVP_Digest(input.data(), input.size(), out, &outLen, md, nullptr) != 1) {
        throw std::runtime_error("EVP_Digest failed: " + std::to_string(ERR_get_error()));
    }
    return std::string(reinterpret_cast<const char*>(out), outLen);
}

}  // namespace

std::string toHex(const uint8_t* data, size_t length) {
    static const char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(length * 2);
    for (size_t i = 0; i < length; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0f]);
    }
    return out;
}

std::string md5Hex(const std::string& input) {
    std::string raw = digest(EVP_md5(), input);
    return toHex(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
}

std::string sha256Hex(const std::string& input) {
    std::string raw = digest(EVP_sha256(), input);
    return toHex(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
}

std::string sha1Raw(const std::string& input) {
    return digest(EVP_sha1(), input);
}

std::string base64Encode(const std::string& input) {
    if (input.empty()) {
        return std::string();
    }
    // EVP_EncodeBlock writes 4 bytes per 3-byte group plus a trailing NUL
    std::vector<unsigned char> out(4 * ((input.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(input.data()),
                                  static_cast<int>(input.size()));
    return std::string(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(written));
}

std::string randomBytes(size_t count) {
    std::string out(count, '\0');
    if (count == 0) {
        return out;
    }
    if (RAND_bytes(reinterpret_cast<unsigned char*>(&out[0]), static_cast<int>(count)) != 1) {
        throw std::runtime_error("RAND_bytes failed: " + std::to_string(ERR_get_error()));
    }
    return out;
}

std::string randomHex(size_t byteCount) {
    std::string raw = randomBytes(byteCount);
    return toHex(reinterpret_cast<const uint8_t*>(raw.data()), raw.size());
}

}  // namespace utils
}  // namespace camfleet
