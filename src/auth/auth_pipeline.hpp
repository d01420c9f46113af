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

// Bastion Auth Pipeline - Header
// Request-time authentication state machine and the login/refresh/logout flows

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "auth_error.hpp"
#include "login_rate_limiter.hpp"
#include "password_hasher.hpp"
#include "principal_store.hpp"
#include "revocation_store.hpp"
#include "token_codec.hpp"
#include "totp.hpp"

namespace bastion::auth {

/// Request authentication stages, in transition order
/// Any failed transition ends in Rejected; a missing or malformed header ends in
/// Unauthenticated.
enum class AuthStage : uint8_t {
    Unauthenticated,
    TokenExtracted,
    RevocationChecked,
    SignatureVerified,
    ClaimsValid,
    PrincipalLoaded,
    Authenticated,
    Rejected
};

[[nodiscard]] std::string_view to_string(AuthStage stage) noexcept;

/// Result of authenticating one request
struct AuthOutcome {
    AuthStage stage = AuthStage::Unauthenticated;
    AuthStage last_passed = AuthStage::Unauthenticated;  // Furthest stage reached
    std::optional<AuthError> error;
    TokenClaims claims;
    std::optional<Principal> principal;

    [[nodiscard]] bool authenticated() const noexcept { return stage == AuthStage::Authenticated; }
    [[nodiscard]] explicit operator bool() const noexcept { return authenticated(); }
};

struct LoginRequest {
    std::string email;
    std::string password;
    std::optional<std::string> mfa_code;
    std::optional<std::string> backup_code;
};

enum class LoginStatus : uint8_t {
    Success,
    MfaRequired,
    Rejected
};

/// Result of login or refresh
struct LoginOutcome {
    LoginStatus status = LoginStatus::Rejected;
    std::optional<AuthError> error;
    TokenPair tokens;
    std::optional<Principal> principal;
    RateLimitDecision rate_limit;  // Most restrictive decision seen (for response headers)

    [[nodiscard]] static LoginOutcome success(Principal principal, TokenPair tokens,
                                              RateLimitDecision rate_limit) {
        return {LoginStatus::Success, std::nullopt, std::move(tokens), std::move(principal),
                rate_limit};
    }

    [[nodiscard]] static LoginOutcome mfa_required(RateLimitDecision rate_limit) {
        return {LoginStatus::MfaRequired, AuthError::MfaRequired, {}, std::nullopt, rate_limit};
    }

    [[nodiscard]] static LoginOutcome failure(AuthError error, RateLimitDecision rate_limit = {}) {
        return {LoginStatus::Rejected, error, {}, std::nullopt, rate_limit};
    }

    [[nodiscard]] bool succeeded() const noexcept { return status == LoginStatus::Success; }
};

/// Result of logout
struct LogoutOutcome {
    bool valid = false;
    std::optional<AuthError> error;
    bool access_revoked = false;   // false when the token had already expired
    bool refresh_revoked = false;

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }
};

struct AuthPipelineConfig {
    bool rehash_on_login = true;  // Migrate legacy/outdated credentials after a good login
};

/// Collaborators owned outside the pipeline (shared with gateway and maintenance)
struct AuthComponents {
    std::shared_ptr<PasswordHasher> hasher;
    std::shared_ptr<TokenCodec> codec;
    std::shared_ptr<RevocationStore> revocations;
    std::shared_ptr<LoginRateLimiter> rate_limiter;
    std::shared_ptr<TotpVerifier> totp;
    std::shared_ptr<PrincipalStore> principals;
};

/// Bearer token from "Bearer <token>" (nullopt if absent or another scheme)
[[nodiscard]] std::optional<std::string_view> extract_bearer(std::string_view header) noexcept;

class AuthPipeline {
public:
    /// Throws std::invalid_argument if any component is missing
    AuthPipeline(AuthPipelineConfig config, AuthComponents components);

    // Non-copyable, movable
    AuthPipeline(const AuthPipeline&) = delete;
    AuthPipeline& operator=(const AuthPipeline&) = delete;
    AuthPipeline(AuthPipeline&&) noexcept = default;
    AuthPipeline& operator=(AuthPipeline&&) noexcept = default;

    /// Authenticate a request from its Authorization header value
    /// Order: extract -> revocation (cheap) -> signature/claims -> principal store (costly)
    [[nodiscard]] AuthOutcome authenticate(std::string_view authorization_header) const;

    /// Password (+ optional MFA) login; runs the memory-hard hash, call from a worker pool
    [[nodiscard]] LoginOutcome login(const LoginRequest& request, std::string_view client_ip);

    /// Exchange a refresh token for a new pair; the presented token is revoked (rotation)
    [[nodiscard]] LoginOutcome refresh(std::string_view refresh_token);

    /// Revoke the presented access token (and optionally a refresh token); idempotent
    [[nodiscard]] LogoutOutcome logout(std::string_view authorization_header,
                                       std::optional<std::string_view> refresh_token = std::nullopt);

    [[nodiscard]] const AuthComponents& components() const noexcept { return components_; }

private:
    [[nodiscard]] bool verify_mfa(const Principal& principal, const LoginRequest& request);

    AuthPipelineConfig config_;
    AuthComponents components_;
};

}  // namespace bastion::auth
