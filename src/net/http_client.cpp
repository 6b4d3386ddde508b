/**
 * @file http_client.cpp
 * @brief libcurl-backed HttpClient.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/net/http_client.hpp"
#include "camfleet/utils/logger.hpp"
#include "camfleet/utils/string_utils.hpp"

#include <curl/curl.h>

#include <mutex>

namespace camfleet {
namespace net {

namespace {

std::once_flag g_curlInit;

size_t writeCallback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    std::string line(buffer, size * nitems);

    // A new status line starts a new response (100-continue, auth round trips)
    if (utils::starts_with(line, "HTTP/")) {
        headers->clear();
        return size * nitems;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = utils::to_lower(utils::trim(line.substr(0, colon)));
        std::string value = utils::trim(line.substr(colon + 1));
        (*headers)[name] = value;
    }
    return size * nitems;
}

}  // namespace

std::string HttpResponse::header(const std::string& name) const {
    auto it = headers.find(utils::to_lower(name));
    return it == headers.end() ? std::string() : it->second;
}

CurlHttpClient::CurlHttpClient(std::string userAgent)
    : userAgent_(std::move(userAgent))
{
    std::call_once(g_curlInit, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

HttpResponse CurlHttpClient::get(const std::string& url,
                                 const HttpHeaders& headers,
                                 std::chrono::milliseconds timeout) {
    return perform("GET", url, nullptr, headers, timeout);
}

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const std::string& body,
                                  const HttpHeaders& headers,
                                  std::chrono::milliseconds timeout) {
    return perform("POST", url, &body, headers, timeout);
}

HttpResponse CurlHttpClient::perform(const std::string& method,
                                     const std::string& url,
                                     const std::string* body,
                                     const HttpHeaders& headers,
                                     std::chrono::milliseconds timeout) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "curl_easy_init failed";
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);

    if (method == "POST" && body != nullptr) {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    }

    struct curl_slist* headerList = nullptr;
    for (const auto& h : headers) {
        std::string line = h.first + ": " + h.second;
        headerList = curl_slist_append(headerList, line.c_str());
    }
    if (headerList != nullptr) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headerList);
    }

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    } else {
        response.status = 0;
        response.error = curl_easy_strerror(res);
        LOG_TRACE("Http", "{} {} failed: {}", method, url, response.error);
    }

    curl_slist_free_all(headerList);
    curl_easy_cleanup(curl);
    return response;
}

}  // namespace net
}  // namespace camfleet
