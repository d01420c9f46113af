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

// Bastion Configuration - Implementation

#include "config.hpp"

#include <fmt/format.h>

#include <array>
#include <cstdio>
#include <fstream>
#include <span>
#include <sstream>

namespace bastion::control {

namespace {

constexpr size_t kMinSecretBytes = 32;
constexpr uint32_t kMinHashLength = 16;
constexpr std::array<std::string_view, 5> kLogLevels = {"trace", "debug", "info", "warning",
                                                       "error"};

bool is_one_of(std::string_view value, std::span<const std::string_view> allowed) {
    for (auto candidate : allowed) {
        if (value == candidate) {
            return true;
        }
    }
    return false;
}

void validate_token(const TokenConfig& token, ValidationResult& result) {
    if (token.access_secret.size() < kMinSecretBytes) {
        result.add_error(fmt::format("token.access_secret must be at least {} bytes (got {})",
                                     kMinSecretBytes, token.access_secret.size()));
    }

    if (token.refresh_secret.empty()) {
        result.add_warning(
            "token.refresh_secret is empty; a refresh key will be derived from access_secret");
    } else if (token.refresh_secret.size() < kMinSecretBytes) {
        result.add_error(fmt::format("token.refresh_secret must be at least {} bytes (got {})",
                                     kMinSecretBytes, token.refresh_secret.size()));
    } else if (token.refresh_secret == token.access_secret) {
        result.add_warning(
            "token.refresh_secret equals access_secret; refresh tokens still cannot pass as "
            "access tokens, but separate keys are recommended");
    }

    if (token.access_ttl_seconds == 0) {
        result.add_error("token.access_ttl_seconds must be > 0");
    }
    if (token.refresh_ttl_seconds == 0) {
        result.add_error("token.refresh_ttl_seconds must be > 0");
    } else if (token.refresh_ttl_seconds <= token.access_ttl_seconds) {
        result.add_error("token.refresh_ttl_seconds must be greater than access_ttl_seconds");
    }

    if (token.issuer.empty()) {
        result.add_error("token.issuer cannot be empty");
    }
    if (token.audience.empty()) {
        result.add_error("token.audience cannot be empty");
    }
}

void validate_password(const PasswordConfig& password, ValidationResult& result) {
    if (password.parallelism == 0) {
        result.add_error("password.parallelism must be > 0");
    }
    if (password.iterations == 0) {
        result.add_error("password.iterations must be > 0");
    }
    // Argon2 requires at least 8 KiB per lane
    if (password.memory_kib < 8 * password.parallelism) {
        result.add_error(fmt::format("password.memory_kib must be at least 8 * parallelism ({})",
                                     8 * password.parallelism));
    }
    if (password.hash_length < kMinHashLength) {
        result.add_error(fmt::format("password.hash_length must be at least {}", kMinHashLength));
    }
    if (password.salt_length < 8) {
        result.add_error("password.salt_length must be at least 8");
    }
    if (password.min_length > password.max_length) {
        result.add_error("password.min_length cannot exceed password.max_length");
    }
    if (password.min_character_classes < 1 || password.min_character_classes > 4) {
        result.add_error("password.min_character_classes must be between 1 and 4");
    }
    if (password.memory_kib < 19456) {
        result.add_warning("password.memory_kib is below 19 MiB; hashes are cheap to brute force");
    }
}

void validate_rate_limit(const RateLimitConfig& rate_limit, ValidationResult& result) {
    if (!rate_limit.enabled) {
        result.add_warning("rate_limit.enabled is false; login is open to brute force");
        return;
    }
    if (rate_limit.max_attempts == 0) {
        result.add_error("rate_limit.max_attempts must be > 0");
    }
    if (rate_limit.window_seconds == 0) {
        result.add_error("rate_limit.window_seconds must be > 0");
    }
    if (rate_limit.failure_weight == 0) {
        result.add_error("rate_limit.failure_weight must be > 0");
    }
    if (rate_limit.lockout_threshold <= rate_limit.max_attempts) {
        result.add_error("rate_limit.lockout_threshold must be greater than max_attempts");
    }
    if (rate_limit.lockout_seconds == 0) {
        result.add_error("rate_limit.lockout_seconds must be > 0");
    }
}

}  // namespace

// ConfigLoader implementation

std::optional<Config> ConfigLoader::load_from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_from_json(buffer.str());
}

std::optional<Config> ConfigLoader::load_from_json(std::string_view json) {
    try {
        auto j = nlohmann::json::parse(json);
        return j.get<Config>();
    } catch (const nlohmann::json::exception& e) {
        // Logging is not up yet when configuration loads
        fprintf(stderr, "JSON parsing error: %s\n", e.what());
        return std::nullopt;
    }
}

ValidationResult ConfigLoader::validate(const Config& config) {
    ValidationResult result;

    validate_token(config.token, result);
    validate_password(config.password, result);
    validate_rate_limit(config.rate_limit, result);

    // MFA
    if (config.mfa.drift_steps > 1) {
        result.add_error("mfa.drift_steps cannot exceed 1");
    }
    if (config.mfa.backup_code_count == 0) {
        result.add_error("mfa.backup_code_count must be > 0");
    }
    if (config.mfa.issuer.empty()) {
        result.add_error("mfa.issuer cannot be empty");
    }

    // Revocation / workers
    if (config.revocation.sweep_interval_seconds == 0) {
        result.add_error("revocation.sweep_interval_seconds must be > 0");
    }
    if (config.workers.queue_capacity == 0) {
        result.add_error("workers.queue_capacity must be > 0");
    }

    // Logging
    if (!is_one_of(config.logging.level, kLogLevels)) {
        result.add_error("logging.level must be one of: trace, debug, info, warning, error");
    }
    if (config.logging.format != "json" && config.logging.format != "text") {
        result.add_error("logging.format must be 'json' or 'text'");
    }
    if (config.logging.output.empty()) {
        result.add_error("logging.output cannot be empty");
    }

    return result;
}

bool ConfigLoader::save_to_file(const Config& config, std::string_view path) {
    std::string json = to_json(config);
    if (json.empty()) {
        return false;
    }

    std::string path_str{path};
    std::ofstream file{path_str};
    if (!file.is_open()) {
        return false;
    }

    file << json;
    return file.good();
}

std::string ConfigLoader::to_json(const Config& config) {
    try {
        nlohmann::json j = config;
        return j.dump(2);  // 2-space indentation
    } catch (const nlohmann::json::exception& e) {
        fprintf(stderr, "JSON serialization error: %s\n", e.what());
        return "";
    }
}

// ConfigManager implementation

bool ConfigManager::load(std::string_view path) {
    config_path_ = path;
    last_validation_ = ValidationResult{};

    auto maybe_config = ConfigLoader::load_from_file(path);
    if (!maybe_config.has_value()) {
        last_validation_.add_error(fmt::format("Failed to read or parse '{}'", path));
        return false;
    }

    last_validation_ = ConfigLoader::validate(*maybe_config);
    if (last_validation_.has_errors()) {
        return false;
    }

    current_config_ = std::make_shared<const Config>(std::move(*maybe_config));
    return true;
}

}  // namespace bastion::control
