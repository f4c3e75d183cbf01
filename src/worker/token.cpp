/*
 * Access token minting implementation - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <agent-worker/worker/token.hpp>
#include <agent-worker/errors.hpp>
#include <agent-worker/util/json.hpp>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace agentworker {

std::string base64url_encode(const std::string& data) {
    static const char* tbl = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    std::string out;
    out.reserve((data.size() + 2) / 3 * 4);
    size_t i = 0;
    auto byte = [&](size_t k) { return static_cast<unsigned char>(data[k]); };
    for (; i + 2 < data.size(); i += 3) {
        std::uint32_t n = (byte(i) << 16) | (byte(i + 1) << 8) | byte(i + 2);
        out.push_back(tbl[(n >> 18) & 63]);
        out.push_back(tbl[(n >> 12) & 63]);
        out.push_back(tbl[(n >> 6) & 63]);
        out.push_back(tbl[n & 63]);
    }
    if (i + 1 == data.size()) {
        std::uint32_t n = byte(i) << 16;
        out.push_back(tbl[(n >> 18) & 63]);
        out.push_back(tbl[(n >> 12) & 63]);
    } else if (i + 2 == data.size()) {
        std::uint32_t n = (byte(i) << 16) | (byte(i + 1) << 8);
        out.push_back(tbl[(n >> 18) & 63]);
        out.push_back(tbl[(n >> 12) & 63]);
        out.push_back(tbl[(n >> 6) & 63]);
    }
    return out; // unpadded
}

std::string mint_access_token_at(const std::string& api_key, const std::string& api_secret,
                                 std::int64_t now_s, std::chrono::seconds ttl) {
    Json header = Json::object();
    header.set("alg", "HS256");
    header.set("typ", "JWT");

    Json claims = Json::object();
    claims.set("iss", api_key);
    claims.set("nbf", Json(static_cast<long long>(now_s)));
    claims.set("exp", Json(static_cast<long long>(now_s + ttl.count())));
    claims.set("video", Json::object().set("agent", true));

    std::string signing_input = base64url_encode(header.dump()) + "." + base64url_encode(claims.dump());
    unsigned char mac[EVP_MAX_MD_SIZE];
    unsigned int mac_len = 0;
    if (!HMAC(EVP_sha256(), api_secret.data(), static_cast<int>(api_secret.size()),
              reinterpret_cast<const unsigned char*>(signing_input.data()), signing_input.size(), mac, &mac_len))
        throw CredentialsError("failed to sign access token");
    return signing_input + "." + base64url_encode(std::string(reinterpret_cast<char*>(mac), mac_len));
}

std::string mint_access_token(const std::string& api_key, const std::string& api_secret, std::chrono::seconds ttl) {
    auto now = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    return mint_access_token_at(api_key, api_secret, now, ttl);
}

} // namespace agentworker
