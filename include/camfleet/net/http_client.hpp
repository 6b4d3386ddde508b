/**
 * @file http_client.hpp
 * @brief Blocking HTTP(S) client interface and its libcurl implementation.
 *
 * Devices present self-signed certificates, so TLS verification is disabled.
 * Transport failures never throw: they come back as status 0 with @c error set.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#pragma once

#include "camfleet/net/export.hpp"

#include <chrono>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace camfleet {
namespace net {

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

/**
 * @struct HttpResponse
 * @brief Final response of one request (interim 1xx responses are dropped).
 */
struct CAMFLEET_NET_API HttpResponse {
    long status = 0;                               ///< 0 when no response arrived
    std::string body;
    std::map<std::string, std::string> headers;    ///< names lower-cased
    std::string error;                             ///< transport failure text

    bool transportOk() const { return status > 0; }

    /// Header value by case-insensitive name, empty if absent.
    std::string header(const std::string& name) const;
};

/**
 * @class HttpClient
 * @brief Abstract client, mocked in tests.
 */
class CAMFLEET_NET_API HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url,
                             const HttpHeaders& headers,
                             std::chrono::milliseconds timeout) = 0;

    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const HttpHeaders& headers,
                              std::chrono::milliseconds timeout) = 0;
};

/**
 * @class CurlHttpClient
 * @brief libcurl easy-handle client. Safe to share across threads; each
 * request uses its own handle.
 */
class CAMFLEET_NET_API CurlHttpClient : public HttpClient {
public:
    explicit CurlHttpClient(std::string userAgent = "camfleet/1.0");

    HttpResponse get(const std::string& url,
                     const HttpHeaders& headers,
                     std::chrono::milliseconds timeout) override;

    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const HttpHeaders& headers,
                      std::chrono::milliseconds timeout) override;

private:
    HttpResponse perform(const std::string& method,
                         const std::string& url,
                         const std::string* body,
                         const HttpHeaders& headers,
                         std::chrono::milliseconds timeout);

    std::string userAgent_;
};

}  // namespace net
}  // namespace camfleet
