/*
 * Access token minting - Agent-Worker
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#pragma once
#include <chrono>
#include <cstdint>
#include <string>

namespace agentworker {

std::string base64url_encode(const std::string& data);

// HS256 JWT presented at registration: iss = api key, video grant {agent: true}.
std::string mint_access_token(const std::string& api_key, const std::string& api_secret,
                              std::chrono::seconds ttl = std::chrono::minutes(10));

// Same, with an explicit issue time (seconds since epoch).
std::string mint_access_token_at(const std::string& api_key, const std::string& api_secret,
                                 std::int64_t now_s, std::chrono::seconds ttl);

} // namespace agentworker
