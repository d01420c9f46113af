/*
 * Copyright 2025 Bastion Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Bastion Token Codec - Implementation

#include "token_codec.hpp"

#include <array>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "../core/crypto.hpp"
#include "../core/logging.hpp"

namespace bastion::auth {

namespace {

constexpr std::string_view kRefreshDerivationLabel = "bastion.refresh-token.v1";

/// Header is fixed; encode once
const std::string& encoded_header() {
    static const std::string header = core::base64url_encode(R"({"alg":"HS256","typ":"JWT"})");
    return header;
}

/// Split into exactly three non-empty segments
std::optional<std::array<std::string_view, 3>> split_token(std::string_view token) {
    std::array<std::string_view, 3> parts;
    size_t start = 0;
    for (size_t i = 0; i < 3; ++i) {
        size_t dot = token.find('.', start);
        if (i < 2) {
            if (dot == std::string_view::npos) {
                return std::nullopt;
            }
            parts[i] = token.substr(start, dot - start);
            start = dot + 1;
        } else {
            if (dot != std::string_view::npos) {
                return std::nullopt;
            }
            parts[i] = token.substr(start);
        }
        if (parts[i].empty()) {
            return std::nullopt;
        }
    }
    return parts;
}

bool audience_matches(const nlohmann::json& aud, const std::string& expected) {
    if (aud.is_string()) {
        return aud.get_ref<const std::string&>() == expected;
    }
    if (aud.is_array()) {
        for (const auto& entry : aud) {
            if (entry.is_string() && entry.get_ref<const std::string&>() == expected) {
                return true;
            }
        }
    }
    return false;
}

}  // namespace

std::string_view to_string(TokenType type) noexcept {
    switch (type) {
        case TokenType::Access:
            return "access";
        case TokenType::Refresh:
            return "refresh";
    }
    return "unknown";
}

std::optional<TokenType> parse_token_type(std::string_view str) noexcept {
    if (str == "access") {
        return TokenType::Access;
    }
    if (str == "refresh") {
        return TokenType::Refresh;
    }
    return std::nullopt;
}

// ============================================================================
// TokenCodec
// ============================================================================

TokenCodec::TokenCodec(TokenCodecConfig config, core::Clock clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
    if (config_.access_secret.empty()) {
        throw std::invalid_argument("token access secret must not be empty");
    }

    if (config_.refresh_secret.empty()) {
        refresh_key_ = core::hmac_sha256(config_.access_secret, kRefreshDerivationLabel);
        derived_refresh_ = true;
        if (auto* logger = logging::get_logger()) {
            LOG_WARNING(logger,
                        "Refresh token secret not configured; deriving it from the access "
                        "secret (configure a distinct refresh secret)");
        }
    } else {
        refresh_key_ = config_.refresh_secret;
    }
}

const std::string& TokenCodec::secret_for(TokenType type) const noexcept {
    return type == TokenType::Refresh ? refresh_key_ : config_.access_secret;
}

std::string TokenCodec::issue(std::string_view subject, const ExtraClaims& extra,
                              std::chrono::seconds ttl, TokenType type) const {
    int64_t issued_at = now();

    nlohmann::json payload = {
        {"sub", std::string(subject)},
        {"email", extra.email},
        {"role", extra.role},
        {"iat", issued_at},
        {"exp", issued_at + ttl.count()},
        {"iss", config_.issuer},
        {"aud", config_.audience},
        {"token_type", std::string(to_string(type))},
        {"jti", core::random_hex(16)},
    };

    std::string signing_input = encoded_header() + "." + core::base64url_encode(payload.dump());
    std::string signature = core::hmac_sha256(secret_for(type), signing_input);

    return signing_input + "." + core::base64url_encode(signature);
}

TokenPair TokenCodec::issue_pair(std::string_view subject, const ExtraClaims& extra) const {
    TokenPair pair;
    int64_t issued_at = now();
    pair.access_token = issue(subject, extra, config_.access_ttl, TokenType::Access);
    pair.refresh_token = issue(subject, extra, config_.refresh_ttl, TokenType::Refresh);
    pair.access_expires_at = issued_at + config_.access_ttl.count();
    pair.refresh_expires_at = issued_at + config_.refresh_ttl.count();
    return pair;
}

TokenVerifyResult TokenCodec::verify(std::string_view token, TokenType expected) const {
    return verify_at(token, expected, now());
}

TokenVerifyResult TokenCodec::verify_at(std::string_view token, TokenType expected,
                                        int64_t now_unix) const {
    // STEP 1: Split header.payload.signature
    auto parts = split_token(token);
    if (!parts) {
        return TokenVerifyResult::failure(AuthError::Malformed);
    }
    const auto& [header_b64, payload_b64, signature_b64] = *parts;

    // STEP 2: Header must decode and declare HS256 (rejects "none" and algorithm swaps)
    auto header_json = core::base64url_decode(header_b64);
    if (!header_json) {
        return TokenVerifyResult::failure(AuthError::Malformed);
    }
    try {
        auto header = nlohmann::json::parse(*header_json);
        if (!header.is_object() || !header.contains("alg") || !header["alg"].is_string() ||
            header["alg"].get_ref<const std::string&>() != "HS256") {
            return TokenVerifyResult::failure(AuthError::Malformed);
        }
    } catch (const nlohmann::json::exception&) {
        return TokenVerifyResult::failure(AuthError::Malformed);
    }

    // STEP 3: Signature over "header.payload" with the expected type's secret
    // Canonical base64url only, so a verified token has one spelling (one revocation key)
    auto signature = core::base64url_decode(signature_b64);
    if (!signature) {
        return TokenVerifyResult::failure(AuthError::InvalidSignature);
    }
    std::string_view signing_input = token.substr(0, header_b64.size() + 1 + payload_b64.size());
    std::string expected_signature = core::hmac_sha256(secret_for(expected), signing_input);
    if (!core::constant_time_equals(expected_signature, *signature)) {
        return TokenVerifyResult::failure(AuthError::InvalidSignature);
    }

    // STEP 4: Decode claims (signature established, content may now be read)
    auto payload_json = core::base64url_decode(payload_b64);
    if (!payload_json) {
        return TokenVerifyResult::failure(AuthError::Malformed);
    }

    TokenClaims claims;
    nlohmann::json audience;
    std::string token_type;
    try {
        auto j = nlohmann::json::parse(*payload_json);
        if (!j.is_object() || !j.contains("sub") || !j["sub"].is_string() ||
            !j.contains("exp") || !j["exp"].is_number_integer() || !j.contains("token_type") ||
            !j["token_type"].is_string()) {
            return TokenVerifyResult::failure(AuthError::Malformed);
        }

        claims.sub = j["sub"].get<std::string>();
        claims.exp = j["exp"].get<int64_t>();
        claims.iat = j.value("iat", int64_t(0));
        claims.email = j.value("email", "");
        claims.role = j.value("role", "");
        claims.iss = j.value("iss", "");
        claims.jti = j.value("jti", "");
        audience = j.value("aud", nlohmann::json());
        if (audience.is_string()) {
            claims.aud = audience.get<std::string>();
        }
        token_type = j["token_type"].get<std::string>();
    } catch (const nlohmann::json::exception&) {
        return TokenVerifyResult::failure(AuthError::Malformed);
    }

    // STEP 5: Claims, fixed order
    if (claims.exp < now_unix) {
        return TokenVerifyResult::failure(AuthError::Expired);
    }

    if (claims.iss != config_.issuer) {
        return TokenVerifyResult::failure(AuthError::IssuerMismatch);
    }

    if (!audience_matches(audience, config_.audience)) {
        return TokenVerifyResult::failure(AuthError::AudienceMismatch);
    }
    claims.aud = config_.audience;

    auto type = parse_token_type(token_type);
    if (!type || *type != expected) {
        return TokenVerifyResult::failure(AuthError::WrongTokenType);
    }
    claims.token_type = *type;

    return TokenVerifyResult::success(std::move(claims));
}

}  // namespace bastion::auth
