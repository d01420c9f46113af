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

// Bastion Auth Pipeline - Implementation

#include "auth_pipeline.hpp"

#include <stdexcept>

#include "../core/logging.hpp"

namespace bastion::auth {

namespace {

constexpr std::string_view kBearerPrefix = "Bearer ";

std::string ip_key(std::string_view client_ip) {
    return "ip:" + std::string(client_ip.empty() ? "unknown" : client_ip);
}

std::string account_key(std::string_view email) {
    return "account:" + to_lower_ascii(email);
}

/// Pick the decision the client should see
RateLimitDecision most_restrictive(const RateLimitDecision& a, const RateLimitDecision& b) {
    if (!a.allowed()) {
        return a;
    }
    if (!b.allowed()) {
        return b;
    }
    return a.remaining <= b.remaining ? a : b;
}

AuthError rate_limit_error(const RateLimitDecision& decision) {
    return decision.status == RateLimitStatus::Locked ? AuthError::Locked : AuthError::RateLimited;
}

AuthOutcome reject(AuthStage last_passed, AuthError error) {
    AuthOutcome outcome;
    outcome.stage = AuthStage::Rejected;
    outcome.last_passed = last_passed;
    outcome.error = error;
    return outcome;
}

void log_security(std::string_view event, std::string_view identifier, std::string_view reason) {
    if (auto* logger = logging::get_logger()) {
        LOG_SECURITY(logger, event, identifier, reason);
    }
}

}  // namespace

std::string_view to_string(AuthStage stage) noexcept {
    switch (stage) {
        case AuthStage::Unauthenticated:
            return "unauthenticated";
        case AuthStage::TokenExtracted:
            return "token_extracted";
        case AuthStage::RevocationChecked:
            return "revocation_checked";
        case AuthStage::SignatureVerified:
            return "signature_verified";
        case AuthStage::ClaimsValid:
            return "claims_valid";
        case AuthStage::PrincipalLoaded:
            return "principal_loaded";
        case AuthStage::Authenticated:
            return "authenticated";
        case AuthStage::Rejected:
            return "rejected";
    }
    return "unknown";
}

std::optional<std::string_view> extract_bearer(std::string_view header) noexcept {
    if (header.size() <= kBearerPrefix.size() ||
        header.substr(0, kBearerPrefix.size()) != kBearerPrefix) {
        return std::nullopt;
    }

    std::string_view token = header.substr(kBearerPrefix.size());
    while (!token.empty() && token.front() == ' ') {
        token.remove_prefix(1);
    }
    while (!token.empty() && token.back() == ' ') {
        token.remove_suffix(1);
    }
    if (token.empty()) {
        return std::nullopt;
    }
    return token;
}

AuthPipeline::AuthPipeline(AuthPipelineConfig config, AuthComponents components)
    : config_(config), components_(std::move(components)) {
    if (!components_.hasher || !components_.codec || !components_.revocations ||
        !components_.rate_limiter || !components_.totp || !components_.principals) {
        throw std::invalid_argument("AuthPipeline requires every component");
    }
}

// ============================================================================
// Request authentication
// ============================================================================

AuthOutcome AuthPipeline::authenticate(std::string_view authorization_header) const {
    // Unauthenticated -> TokenExtracted
    if (authorization_header.empty()) {
        return AuthOutcome{};
    }
    auto token = extract_bearer(authorization_header);
    if (!token) {
        AuthOutcome outcome;
        outcome.error = AuthError::Malformed;
        return outcome;
    }

    // TokenExtracted -> RevocationChecked (cheap lookup before any crypto)
    if (components_.revocations->is_revoked(*token)) {
        return reject(AuthStage::TokenExtracted, AuthError::Revoked);
    }

    // RevocationChecked -> SignatureVerified -> ClaimsValid
    auto verified = components_.codec->verify(*token, TokenType::Access);
    if (!verified) {
        bool signature_ok = verified.error != AuthError::Malformed &&
                            verified.error != AuthError::InvalidSignature;
        return reject(signature_ok ? AuthStage::SignatureVerified : AuthStage::RevocationChecked,
                      verified.error);
    }

    // ClaimsValid -> PrincipalLoaded (external store, most expensive step last)
    auto principal = components_.principals->find_by_id(verified.claims.sub);
    if (!principal) {
        return reject(AuthStage::ClaimsValid, AuthError::UserNotFound);
    }
    if (principal->is_banned()) {
        auto outcome = reject(AuthStage::PrincipalLoaded, AuthError::UserBanned);
        outcome.claims = std::move(verified.claims);
        return outcome;
    }

    AuthOutcome outcome;
    outcome.stage = AuthStage::Authenticated;
    outcome.last_passed = AuthStage::Authenticated;
    outcome.claims = std::move(verified.claims);
    outcome.principal = std::move(principal);
    return outcome;
}

// ============================================================================
// Login
// ============================================================================

LoginOutcome AuthPipeline::login(const LoginRequest& request, std::string_view client_ip) {
    auto& limiter = *components_.rate_limiter;
    const std::string ip_id = ip_key(client_ip);
    const std::string account_id = account_key(request.email);

    // STEP 1: Rate limits (every attempt counts per IP; account weight grows on failure)
    auto ip_decision = limiter.record_attempt(ip_id);
    if (!ip_decision.allowed()) {
        log_security("login_rate_limited", ip_id, to_string(rate_limit_error(ip_decision)));
        return LoginOutcome::failure(rate_limit_error(ip_decision), ip_decision);
    }

    auto account_decision = limiter.guard(account_id);
    if (!account_decision.allowed()) {
        log_security("login_rate_limited", account_id,
                     to_string(rate_limit_error(account_decision)));
        return LoginOutcome::failure(rate_limit_error(account_decision), account_decision);
    }

    auto decision = most_restrictive(ip_decision, account_decision);

    if (request.email.empty() || request.password.empty()) {
        return LoginOutcome::failure(AuthError::InvalidCredentials, decision);
    }

    // STEP 2: Account lookup; unknown accounts still pay for a full hash
    auto principal = components_.principals->find_by_email(request.email);
    if (!principal) {
        components_.hasher->hash_dummy();
        decision = most_restrictive(decision, limiter.record_failure(account_id));
        log_security("login_failed", account_id, to_string(AuthError::UserNotFound));
        return LoginOutcome::failure(AuthError::UserNotFound, decision);
    }

    // STEP 3: Password
    bool password_ok = false;
    try {
        password_ok = components_.hasher->verify(request.password, principal->credential_hash);
    } catch (const UnknownHashFormatError& e) {
        if (auto* logger = logging::get_logger()) {
            LOG_ERROR(logger, "Credential for principal {} has unknown format: {}", principal->id,
                      e.what());
        }
        decision = most_restrictive(decision, limiter.record_failure(account_id));
        return LoginOutcome::failure(AuthError::UnknownHashFormat, decision);
    }

    if (!password_ok) {
        decision = most_restrictive(decision, limiter.record_failure(account_id));
        log_security("login_failed", account_id, to_string(AuthError::InvalidCredentials));
        return LoginOutcome::failure(AuthError::InvalidCredentials, decision);
    }

    // STEP 4: Ban check (only after the password proved ownership)
    if (principal->is_banned()) {
        log_security("login_banned", account_id, to_string(AuthError::UserBanned));
        return LoginOutcome::failure(AuthError::UserBanned, decision);
    }

    // STEP 5: Second factor
    if (principal->mfa_enabled()) {
        if (!request.mfa_code && !request.backup_code) {
            log_security("login_mfa_required", account_id, to_string(AuthError::MfaRequired));
            return LoginOutcome::mfa_required(decision);
        }
        if (!verify_mfa(*principal, request)) {
            decision = most_restrictive(decision, limiter.record_failure(account_id));
            log_security("mfa_failed", account_id, to_string(AuthError::MfaInvalid));
            return LoginOutcome::failure(AuthError::MfaInvalid, decision);
        }
    }

    // STEP 6: Success
    limiter.clear(account_id);

    if (config_.rehash_on_login && components_.hasher->needs_rehash(principal->credential_hash)) {
        try {
            std::string upgraded = components_.hasher->hash(request.password);
            if (components_.principals->update_credential_hash(principal->id, upgraded)) {
                principal->credential_hash = std::move(upgraded);
                if (auto* logger = logging::get_logger()) {
                    LOG_INFO(logger, "Credential upgraded to current hash parameters: principal={}",
                             principal->id);
                }
            }
        } catch (const std::runtime_error& e) {
            // Login already succeeded; the old credential stays valid
            if (auto* logger = logging::get_logger()) {
                LOG_ERROR(logger, "Credential rehash failed: principal={}, error={}",
                          principal->id, e.what());
            }
        }
    }

    auto tokens = components_.codec->issue_pair(principal->id, {principal->email, principal->role});
    if (auto* logger = logging::get_logger()) {
        LOG_INFO(logger, "Login succeeded: principal={}, mfa={}, client_ip={}", principal->id,
                 principal->mfa_enabled(), client_ip);
    }
    return LoginOutcome::success(std::move(*principal), std::move(tokens), decision);
}

bool AuthPipeline::verify_mfa(const Principal& principal, const LoginRequest& request) {
    const auto& mfa = *principal.mfa;

    if (request.mfa_code) {
        return components_.totp->verify(mfa.base32_secret, *request.mfa_code);
    }

    auto index = TotpVerifier::verify_backup_code(*request.backup_code, mfa.backup_code_hashes);
    if (!index) {
        return false;
    }

    // Single use: a concurrent login with the same code loses here
    if (!components_.principals->consume_backup_code(principal.id,
                                                     mfa.backup_code_hashes[*index])) {
        return false;
    }

    if (auto* logger = logging::get_logger()) {
        LOG_INFO(logger, "Backup code consumed: principal={}, remaining={}", principal.id,
                 mfa.backup_code_hashes.size() - 1);
    }
    return true;
}

// ============================================================================
// Refresh
// ============================================================================

LoginOutcome AuthPipeline::refresh(std::string_view refresh_token) {
    if (refresh_token.empty()) {
        return LoginOutcome::failure(AuthError::Malformed);
    }

    if (components_.revocations->is_revoked(refresh_token)) {
        // A rotated refresh token presented again: possible theft
        log_security("refresh_replay", "refresh_token", to_string(AuthError::Revoked));
        return LoginOutcome::failure(AuthError::Revoked);
    }

    auto verified = components_.codec->verify(refresh_token, TokenType::Refresh);
    if (!verified) {
        log_security("refresh_rejected", "refresh_token", to_string(verified.error));
        return LoginOutcome::failure(verified.error);
    }

    auto principal = components_.principals->find_by_id(verified.claims.sub);
    if (!principal) {
        return LoginOutcome::failure(AuthError::UserNotFound);
    }
    if (principal->is_banned()) {
        log_security("refresh_rejected", principal->id, to_string(AuthError::UserBanned));
        return LoginOutcome::failure(AuthError::UserBanned);
    }

    // Rotation: the presented token is single-use
    auto remaining = verified.claims.remaining_ttl(components_.codec->now());
    if (!components_.revocations->try_revoke(refresh_token, remaining)) {
        log_security("refresh_replay", principal->id, to_string(AuthError::Revoked));
        return LoginOutcome::failure(AuthError::Revoked);
    }

    auto tokens = components_.codec->issue_pair(principal->id, {principal->email, principal->role});
    return LoginOutcome::success(std::move(*principal), std::move(tokens), RateLimitDecision{});
}

// ============================================================================
// Logout
// ============================================================================

LogoutOutcome AuthPipeline::logout(std::string_view authorization_header,
                                   std::optional<std::string_view> refresh_token) {
    LogoutOutcome outcome;

    auto token = extract_bearer(authorization_header);
    if (!token) {
        outcome.error = AuthError::Malformed;
        return outcome;
    }

    int64_t now = components_.codec->now();

    // Only signature-valid tokens are stored, bounding the list to genuine tokens
    auto access = components_.codec->verify(*token, TokenType::Access);
    if (access) {
        components_.revocations->revoke(*token, access.claims.remaining_ttl(now));
        outcome.access_revoked = true;
    } else if (access.error != AuthError::Expired) {
        log_security("logout_rejected", "access_token", to_string(access.error));
        outcome.error = access.error;
        return outcome;
    }

    if (refresh_token && !refresh_token->empty()) {
        auto refresh = components_.codec->verify(*refresh_token, TokenType::Refresh);
        if (refresh && refresh.claims.sub == access.claims.sub) {
            components_.revocations->revoke(*refresh_token, refresh.claims.remaining_ttl(now));
            outcome.refresh_revoked = true;
        } else if (refresh && !access) {
            // Access token already expired; the refresh token alone proves the session
            components_.revocations->revoke(*refresh_token, refresh.claims.remaining_ttl(now));
            outcome.refresh_revoked = true;
        } else if (!refresh && refresh.error != AuthError::Expired) {
            log_security("logout_refresh_ignored", "refresh_token", to_string(refresh.error));
        }
    }

    if (auto* logger = logging::get_logger()) {
        LOG_INFO(logger, "Logout: subject={}, access_revoked={}, refresh_revoked={}",
                 access ? access.claims.sub : std::string("-"), outcome.access_revoked,
                 outcome.refresh_revoked);
    }

    outcome.valid = true;
    return outcome;
}

}  // namespace bastion::auth
