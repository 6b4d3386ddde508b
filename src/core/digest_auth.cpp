/**
 * @file digest_auth.cpp
 * @brief Digest challenge parsing and response computation.
 *
 * @copyright Copyright (c) 2024 camfleet Contributors
 * @license MIT License
 */

#include "camfleet/core/digest_auth.hpp"
#include "camfleet/core/errors.hpp"
#include "camfleet/utils/crypto.hpp"
#include "camfleet/utils/string_utils.hpp"

#include <map>

namespace camfleet {
namespace core {

namespace {

constexpr const char* kNonceCount = "00000001";

/**
 * Split `k1="v1", k2=v2, ...` honoring quotes, so commas inside quoted
 * values (qop="auth,auth-int") do not break the parse.
 */
std::map<std::string, std::string> parseParams(const std::string& text) {
    std::map<std::string, std::string> params;
    size_t i = 0;
    const size_t n = text.size();

    while (i < n) {
        while (i < n && (text[i] == ' ' || text[i] == ',' || text[i] == '\t')) ++i;
        size_t keyStart = i;
        while (i < n && text[i] != '=' && text[i] != ',') ++i;
        std::string key = utils::to_lower(utils::trim(text.substr(keyStart, i - keyStart)));
        if (i >= n || text[i] != '=') {
            continue;
        }
        ++i;  // '='

        std::string value;
        if (i < n && text[i] == '"') {
            ++i;
            while (i < n && text[i] != '"') {
                if (text[i] == '\\' && i + 1 < n) ++i;
                value.push_back(text[i++]);
            }
            ++i;  // closing quote
        } else {
            size_t valueStart = i;
            while (i < n && text[i] != ',') ++i;
            value = utils::trim(text.substr(valueStart, i - valueStart));
        }
        if (!key.empty()) {
            params[key] = value;
        }
    }
    return params;
}

}  // namespace

DigestChallenge DigestChallenge::parse(const std::string& header) {
    std::string text = utils::trim(header);
    if (!utils::starts_with(utils::to_lower(text), "digest")) {
        throw MalformedChallengeError("Not a Digest challenge: " + text.substr(0, 32));
    }

    auto params = parseParams(text.substr(6));

    DigestChallenge challenge;
    auto realm = params.find("realm");
    auto nonce = params.find("nonce");
    if (realm == params.end() || nonce == params.end()) {
        throw MalformedChallengeError("Digest challenge missing realm or nonce");
    }
    challenge.realm = realm->second;
    challenge.nonce = nonce->second;

    auto qop = params.find("qop");
    if (qop != params.end()) {
        auto tokens = utils::split(qop->second, ',');
        for (const auto& token : tokens) {
            if (utils::trim(token) == "auth") {
                challenge.qop = "auth";
                break;
            }
        }
        if (!challenge.qop && !tokens.empty()) {
            challenge.qop = utils::trim(tokens.front());
        }
    }

    auto opaque = params.find("opaque");
    if (opaque != params.end()) {
        challenge.opaque = opaque->second;
    }
    auto algorithm = params.find("algorithm");
    if (algorithm != params.end()) {
        challenge.algorithm = algorithm->second;
    }
    return challenge;
}

std::string DigestAuthClient::computeResponse(const DigestChallenge& challenge,
                                              const std::string& method,
                                              const std::string& uri,
                                              const std::string& username,
                                              const std::string& password,
                                              const std::string& nc,
                                              const std::string& cnonce) {
    const std::string ha1 = utils::md5Hex(username + ":" + challenge.realm + ":" + password);
    const std::string ha2 = utils::md5Hex(method + ":" + uri);

    if (challenge.qop) {
        return utils::md5Hex(ha1 + ":" + challenge.nonce + ":" + nc + ":" + cnonce + ":" +
                             *challenge.qop + ":" + ha2);
    }
    return utils::md5Hex(ha1 + ":" + challenge.nonce + ":" + ha2);
}

std::string DigestAuthClient::buildAuthHeader(const std::string& challenge,
                                              const std::string& method,
                                              const std::string& uri,
                                              const std::string& username,
                                              const std::string& password) {
    return buildAuthHeader(challenge, method, uri, username, password, utils::randomHex(16));
}

std::string DigestAuthClient::buildAuthHeader(const std::string& challengeHeader,
                                              const std::string& method,
                                              const std::string& uri,
                                              const std::string& username,
                                              const std::string& password,
                                              const std::string& cnonce) {
    DigestChallenge challenge = DigestChallenge::parse(challengeHeader);

    std::string header = "Digest username=\"" + username + "\", realm=\"" + challenge.realm +
                         "\", nonce=\"" + challenge.nonce + "\", uri=\"" + uri + "\"";

    if (challenge.qop) {
        std::string response = computeResponse(challenge, method, uri, username, password,
                                               kNonceCount, cnonce);
        header += ", qop=" + *challenge.qop + ", nc=" + kNonceCount + ", cnonce=\"" + cnonce +
                  "\", response=\"" + response + "\"";
    } else {
        std::string response = computeResponse(challenge, method, uri, username, password,
                                               "", "");
        header += ", response=\"" + response + "\"";
    }

    if (challenge.opaque) {
        header += ", opaque=\"" + *challenge.opaque + "\"";
    }
    return header;
}

}  // namespace core
}  // namespace camfleet
