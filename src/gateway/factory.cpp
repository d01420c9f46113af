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

// Bastion Component Factory - Implementation

#include "factory.hpp"

#include "../core/logging.hpp"
#include "auth_middleware.hpp"

namespace bastion::gateway {

auth::PasswordHasherConfig to_hasher_config(const control::PasswordConfig& config) {
    auth::PasswordHasherConfig out;
    out.memory_kib = config.memory_kib;
    out.iterations = config.iterations;
    out.parallelism = config.parallelism;
    out.hash_length = config.hash_length;
    out.salt_length = config.salt_length;
    out.min_length = config.min_length;
    out.max_length = config.max_length;
    out.min_character_classes = config.min_character_classes;
    return out;
}

auth::TokenCodecConfig to_codec_config(const control::TokenConfig& config) {
    auth::TokenCodecConfig out;
    out.access_secret = config.access_secret;
    out.refresh_secret = config.refresh_secret;
    out.issuer = config.issuer;
    out.audience = config.audience;
    out.access_ttl = std::chrono::seconds(config.access_ttl_seconds);
    out.refresh_ttl = std::chrono::seconds(config.refresh_ttl_seconds);
    return out;
}

auth::LoginRateLimiterConfig to_limiter_config(const control::RateLimitConfig& config) {
    auth::LoginRateLimiterConfig out;
    out.enabled = config.enabled;
    out.max_attempts = config.max_attempts;
    out.window = std::chrono::seconds(config.window_seconds);
    out.failure_weight = config.failure_weight;
    out.lockout_threshold = config.lockout_threshold;
    out.lockout = std::chrono::seconds(config.lockout_seconds);
    return out;
}

auth::TotpConfig to_totp_config(const control::MfaConfig& config) {
    auth::TotpConfig out;
    out.drift_steps = config.drift_steps;
    out.backup_code_count = config.backup_code_count;
    out.issuer = config.issuer;
    return out;
}

std::shared_ptr<auth::PasswordHasher> build_password_hasher(const control::Config& config) {
    return std::make_shared<auth::PasswordHasher>(to_hasher_config(config.password));
}

std::shared_ptr<auth::TokenCodec> build_token_codec(const control::Config& config,
                                                    core::Clock clock) {
    return std::make_shared<auth::TokenCodec>(to_codec_config(config.token), std::move(clock));
}

std::shared_ptr<auth::LoginRateLimiter> build_rate_limiter(
    const control::Config& config, core::Clock clock,
    std::shared_ptr<auth::RateLimitStore> store) {
    return std::make_shared<auth::LoginRateLimiter>(to_limiter_config(config.rate_limit),
                                                    std::move(store), std::move(clock));
}

std::shared_ptr<auth::TotpVerifier> build_totp_verifier(const control::Config& config,
                                                        core::Clock clock) {
    return std::make_shared<auth::TotpVerifier>(to_totp_config(config.mfa), std::move(clock));
}

std::shared_ptr<core::WorkerPool> build_worker_pool(const control::Config& config) {
    auto pool = std::make_shared<core::WorkerPool>(config.workers.hash_threads,
                                                   config.workers.queue_capacity);
    if (auto* logger = logging::get_logger()) {
        LOG_INFO(logger, "Hash worker pool: threads={}, queue_capacity={}", pool->thread_count(),
                 pool->queue_capacity());
    }
    return pool;
}

auth::AuthComponents build_auth_components(const control::Config& config,
                                           std::shared_ptr<auth::PrincipalStore> principals,
                                           core::Clock clock) {
    auth::AuthComponents components;
    components.hasher = build_password_hasher(config);
    components.codec = build_token_codec(config, clock);
    components.revocations = std::make_shared<auth::RevocationStore>(clock);
    components.rate_limiter = build_rate_limiter(config, clock);
    components.totp = build_totp_verifier(config, clock);
    components.principals = std::move(principals);
    return components;
}

std::shared_ptr<auth::AuthPipeline> build_auth_pipeline(const control::Config& config,
                                                        auth::AuthComponents components) {
    auth::AuthPipelineConfig pipeline_config;
    pipeline_config.rehash_on_login = config.password.rehash_on_login;
    return std::make_shared<auth::AuthPipeline>(pipeline_config, std::move(components));
}

std::unique_ptr<Pipeline> build_protected_pipeline(
    std::shared_ptr<const auth::AuthPipeline> auth_pipeline) {
    auto pipeline = std::make_unique<Pipeline>();
    pipeline->use(std::make_unique<CorrelationIdMiddleware>());
    pipeline->use(std::make_unique<BearerAuthMiddleware>(BearerAuthMiddleware::Config{},
                                                         std::move(auth_pipeline)));
    return pipeline;
}

}  // namespace bastion::gateway
