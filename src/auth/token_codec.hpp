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

// Bastion Token Codec - Header
// HS256 compact bearer tokens (header.payload.signature) for access and refresh

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "../core/clock.hpp"
#include "auth_error.hpp"

namespace bastion::auth {

enum class TokenType : uint8_t {
    Access,
    Refresh
};

[[nodiscard]] std::string_view to_string(TokenType type) noexcept;
[[nodiscard]] std::optional<TokenType> parse_token_type(std::string_view str) noexcept;

/// Application claims carried next to the subject
struct ExtraClaims {
    std::string email;
    std::string role;
};

/// Decoded token payload
struct TokenClaims {
    std::string sub;    // Principal ID
    std::string email;
    std::string role;
    int64_t iat = 0;    // Issued at (Unix seconds)
    int64_t exp = 0;    // Expires at (Unix seconds)
    std::string iss;
    std::string aud;
    TokenType token_type = TokenType::Access;
    std::string jti;    // Random token ID (distinguishes tokens minted in the same second)

    /// Seconds until expiry (0 if already expired)
    [[nodiscard]] std::chrono::seconds remaining_ttl(int64_t now) const noexcept {
        return std::chrono::seconds{exp > now ? exp - now : 0};
    }
};

/// Token verification result
struct TokenVerifyResult {
    bool valid = false;
    TokenClaims claims;
    AuthError error = AuthError::Malformed;

    [[nodiscard]] static TokenVerifyResult success(TokenClaims claims) {
        return {true, std::move(claims), AuthError::Malformed};
    }

    [[nodiscard]] static TokenVerifyResult failure(AuthError error) {
        return {false, {}, error};
    }

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }
};

/// Freshly minted access + refresh tokens
struct TokenPair {
    std::string access_token;
    std::string refresh_token;
    int64_t access_expires_at = 0;
    int64_t refresh_expires_at = 0;
};

struct TokenCodecConfig {
    std::string access_secret;
    std::string refresh_secret;  // Empty = derived from access_secret (degraded fallback)
    std::string issuer = "bastion";
    std::string audience = "bastion-api";
    std::chrono::seconds access_ttl{900};
    std::chrono::seconds refresh_ttl{7 * 24 * 3600};
};

/// Token codec (immutable after construction, safe to share across threads)
class TokenCodec {
public:
    /// Throws std::invalid_argument if access_secret is empty
    explicit TokenCodec(TokenCodecConfig config, core::Clock clock = core::system_clock());

    /// Sign a token of the given type
    [[nodiscard]] std::string issue(std::string_view subject, const ExtraClaims& extra,
                                    std::chrono::seconds ttl, TokenType type) const;

    /// Mint an access + refresh pair with the configured TTLs
    [[nodiscard]] TokenPair issue_pair(std::string_view subject, const ExtraClaims& extra) const;

    /// Verify against the current clock
    [[nodiscard]] TokenVerifyResult verify(std::string_view token, TokenType expected) const;

    /// Verify at a fixed Unix time
    /// Check order: Malformed -> InvalidSignature -> Expired -> IssuerMismatch ->
    /// AudienceMismatch -> WrongTokenType. No claim is trusted before the signature.
    [[nodiscard]] TokenVerifyResult verify_at(std::string_view token, TokenType expected,
                                              int64_t now_unix) const;

    /// Current Unix time from the injected clock
    [[nodiscard]] int64_t now() const { return core::to_unix_seconds(clock_()); }

    /// True when refresh tokens are signed with a secret derived from the access secret
    [[nodiscard]] bool uses_derived_refresh_secret() const noexcept { return derived_refresh_; }

    [[nodiscard]] const TokenCodecConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] const std::string& secret_for(TokenType type) const noexcept;

    TokenCodecConfig config_;
    core::Clock clock_;
    std::string refresh_key_;
    bool derived_refresh_ = false;
};

}  // namespace bastion::auth
