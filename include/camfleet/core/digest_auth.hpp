/**
 * @file digest_auth.hpp
 * @brief RFC 2617 HTTP Digest authorization header construction.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/core/export.hpp"

#include <optional>
#include <string>

namespace camfleet {
namespace core {

/**
 * @struct DigestChallenge
 * @brief Parameters of a `WWW-Authenticate: Digest ...` challenge.
 */
struct CAMFLEET_CORE_API DigestChallenge {
    std::string realm;
    std::string nonce;
    std::optional<std::string> qop;        ///< selected token, "auth" preferred
    std::optional<std::string> opaque;
    std::optional<std::string> algorithm;

    /**
     * @brief Parse a challenge header value.
     * @throws MalformedChallengeError if it is not a Digest challenge or lacks realm/nonce.
     */
    static DigestChallenge parse(const std::string& header);
};

/**
 * @class DigestAuthClient
 * @brief Stateless builder for Digest `Authorization` values.
 *
 * HA1 = MD5(username:realm:password), HA2 = MD5(method:uri). With qop the
 * response is MD5(HA1:nonce:00000001:cnonce:qop:HA2), otherwise
 * MD5(HA1:nonce:HA2). The cnonce is 16 bytes from the OpenSSL CSPRNG.
 *
 * @code
 * auto value = DigestAuthClient::buildAuthHeader(
 *     resp.header("www-authenticate"), "GET", "/axis-cgi/basicdeviceinfo.cgi",
 *     creds.username, creds.password);
 * @endcode
 */
class CAMFLEET_CORE_API DigestAuthClient {
public:
    static std::string buildAuthHeader(const std::string& challenge,
                                       const std::string& method,
                                       const std::string& uri,
                                       const std::string& username,
                                       const std::string& password);

    /// Deterministic variant with a caller-supplied client nonce.
    static std::string buildAuthHeader(const std::string& challenge,
                                       const std::string& method,
                                       const std::string& uri,
                                       const std::string& username,
                                       const std::string& password,
                                       const std::string& cnonce);

    /// The bare response digest.
    static std::string computeResponse(const DigestChallenge& challenge,
                                       const std::string& method,
                                       const std::string& uri,
                                       const std::string& username,
                                       const std::string& password,
                                       const std::string& nc,
                                       const std::string& cnonce);
};

}  // namespace core
}  // namespace camfleet
