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

// Bastion Component Factory - Header
// Factory functions for building auth components from a validated configuration

#pragma once

#include <memory>

#include "../auth/auth_pipeline.hpp"
#include "../control/config.hpp"
#include "../core/clock.hpp"
#include "../core/worker_pool.hpp"
#include "pipeline.hpp"

namespace bastion::gateway {

/// Config section -> component config
[[nodiscard]] auth::PasswordHasherConfig to_hasher_config(const control::PasswordConfig& config);
[[nodiscard]] auth::TokenCodecConfig to_codec_config(const control::TokenConfig& config);
[[nodiscard]] auth::LoginRateLimiterConfig to_limiter_config(
    const control::RateLimitConfig& config);
[[nodiscard]] auth::TotpConfig to_totp_config(const control::MfaConfig& config);

/// Build the password hasher
[[nodiscard]] std::shared_ptr<auth::PasswordHasher> build_password_hasher(
    const control::Config& config);

/// Build the token codec (throws std::invalid_argument on an empty access secret)
[[nodiscard]] std::shared_ptr<auth::TokenCodec> build_token_codec(
    const control::Config& config, core::Clock clock = core::system_clock());

/// Build the login rate limiter (in-memory store unless one is supplied)
[[nodiscard]] std::shared_ptr<auth::LoginRateLimiter> build_rate_limiter(
    const control::Config& config, core::Clock clock = core::system_clock(),
    std::shared_ptr<auth::RateLimitStore> store = nullptr);

/// Build the TOTP verifier
[[nodiscard]] std::shared_ptr<auth::TotpVerifier> build_totp_verifier(
    const control::Config& config, core::Clock clock = core::system_clock());

/// Build the hashing worker pool
[[nodiscard]] std::shared_ptr<core::WorkerPool> build_worker_pool(const control::Config& config);

/// Build every auth component around the caller's principal store
[[nodiscard]] auth::AuthComponents build_auth_components(
    const control::Config& config, std::shared_ptr<auth::PrincipalStore> principals,
    core::Clock clock = core::system_clock());

/// Build the auth pipeline
[[nodiscard]] std::shared_ptr<auth::AuthPipeline> build_auth_pipeline(
    const control::Config& config, auth::AuthComponents components);

/// Middleware chain for protected routes: correlation ID, then bearer authentication
[[nodiscard]] std::unique_ptr<Pipeline> build_protected_pipeline(
    std::shared_ptr<const auth::AuthPipeline> auth_pipeline);

}  // namespace bastion::gateway
