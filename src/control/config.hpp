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

// Bastion Configuration - Header
// JSON configuration schema using nlohmann/json for serialization

#pragma once

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bastion::control {

/// Token signing configuration
struct TokenConfig {
    std::string access_secret;   // HS256 key for access tokens (>= 32 bytes)
    std::string refresh_secret;  // Empty = derived from access_secret
    std::string issuer = "bastion";
    std::string audience = "bastion-api";
    uint32_t access_ttl_seconds = 900;     // 15 minutes
    uint32_t refresh_ttl_seconds = 604800;  // 7 days
};

/// Password hashing and strength policy
struct PasswordConfig {
    uint32_t memory_kib = 65536;  // Argon2id m (64 MiB)
    uint32_t iterations = 3;      // Argon2id t
    uint32_t parallelism = 4;     // Argon2id p
    uint32_t hash_length = 32;
    uint32_t salt_length = 16;

    size_t min_length = 8;
    size_t max_length = 128;
    uint32_t min_character_classes = 3;  // Of lower, upper, digit, symbol
    bool rehash_on_login = true;
};

/// Login rate limiting
struct RateLimitConfig {
    bool enabled = true;
    uint32_t max_attempts = 5;       // Per window
    uint32_t window_seconds = 60;
    uint32_t failure_weight = 2;     // A failed attempt counts this many times
    uint32_t lockout_threshold = 10;  // Weighted count that triggers lockout
    uint32_t lockout_seconds = 900;
};

/// Second factor
struct MfaConfig {
    uint32_t drift_steps = 1;  // Accept codes this many 30s periods early/late
    uint32_t backup_code_count = 10;
    std::string issuer = "Bastion";  // Shown by authenticator apps
};

/// Token revocation list
struct RevocationConfig {
    uint32_t sweep_interval_seconds = 300;
};

/// Worker pool for password hashing
struct WorkerConfig {
    uint32_t hash_threads = 0;      // 0 = half the hardware threads
    uint32_t queue_capacity = 256;  // Pending logins before 503
};

/// Logging configuration
struct LogConfig {
    std::string level = "info";               // trace, debug, info, warning, error
    std::string format = "json";              // json, text
    std::string output = "/var/log/bastion";  // Log directory or "stdout"

    struct RotationConfig {
        uint32_t max_size_mb = 100;
        uint32_t max_files = 10;
    } rotation;
};

/// Full Bastion configuration
struct Config {
    TokenConfig token;
    PasswordConfig password;
    RateLimitConfig rate_limit;
    MfaConfig mfa;
    RevocationConfig revocation;
    WorkerConfig workers;

    // Observability
    LogConfig logging;

    // Metadata
    std::string version = "1.0";
};

// All config types use custom from_json/to_json so partial documents fall back to defaults

inline void from_json(const nlohmann::json& j, TokenConfig& t) {
    t.access_secret = j.value("access_secret", std::string());
    t.refresh_secret = j.value("refresh_secret", std::string());
    t.issuer = j.value("issuer", std::string("bastion"));
    t.audience = j.value("audience", std::string("bastion-api"));
    t.access_ttl_seconds = j.value("access_ttl_seconds", 900u);
    t.refresh_ttl_seconds = j.value("refresh_ttl_seconds", 604800u);
}

inline void from_json(const nlohmann::json& j, PasswordConfig& p) {
    p.memory_kib = j.value("memory_kib", 65536u);
    p.iterations = j.value("iterations", 3u);
    p.parallelism = j.value("parallelism", 4u);
    p.hash_length = j.value("hash_length", 32u);
    p.salt_length = j.value("salt_length", 16u);
    p.min_length = j.value("min_length", size_t(8));
    p.max_length = j.value("max_length", size_t(128));
    p.min_character_classes = j.value("min_character_classes", 3u);
    p.rehash_on_login = j.value("rehash_on_login", true);
}

inline void from_json(const nlohmann::json& j, RateLimitConfig& r) {
    r.enabled = j.value("enabled", true);
    r.max_attempts = j.value("max_attempts", 5u);
    r.window_seconds = j.value("window_seconds", 60u);
    r.failure_weight = j.value("failure_weight", 2u);
    r.lockout_threshold = j.value("lockout_threshold", 10u);
    r.lockout_seconds = j.value("lockout_seconds", 900u);
}

inline void from_json(const nlohmann::json& j, MfaConfig& m) {
    m.drift_steps = j.value("drift_steps", 1u);
    m.backup_code_count = j.value("backup_code_count", 10u);
    m.issuer = j.value("issuer", std::string("Bastion"));
}

inline void from_json(const nlohmann::json& j, RevocationConfig& r) {
    r.sweep_interval_seconds = j.value("sweep_interval_seconds", 300u);
}

inline void from_json(const nlohmann::json& j, WorkerConfig& w) {
    w.hash_threads = j.value("hash_threads", 0u);
    w.queue_capacity = j.value("queue_capacity", 256u);
}

inline void from_json(const nlohmann::json& j, LogConfig::RotationConfig& r) {
    r.max_size_mb = j.value("max_size_mb", 100u);
    r.max_files = j.value("max_files", 10u);
}

inline void from_json(const nlohmann::json& j, LogConfig& l) {
    l.level = j.value("level", std::string("info"));
    l.format = j.value("format", std::string("json"));
    l.output = j.value("output", std::string("/var/log/bastion"));
    if (j.contains("rotation")) {
        j.at("rotation").get_to(l.rotation);
    }
}

inline void from_json(const nlohmann::json& j, Config& c) {
    // Use contains() + get_to() instead of value() to avoid infinite recursion
    // when default values trigger to_json() -> from_json() cycles
    if (j.contains("token")) {
        j.at("token").get_to(c.token);
    }
    if (j.contains("password")) {
        j.at("password").get_to(c.password);
    }
    if (j.contains("rate_limit")) {
        j.at("rate_limit").get_to(c.rate_limit);
    }
    if (j.contains("mfa")) {
        j.at("mfa").get_to(c.mfa);
    }
    if (j.contains("revocation")) {
        j.at("revocation").get_to(c.revocation);
    }
    if (j.contains("workers")) {
        j.at("workers").get_to(c.workers);
    }
    if (j.contains("logging")) {
        j.at("logging").get_to(c.logging);
    }
    c.version = j.value("version", std::string("1.0"));
}

// Secrets are never serialized back out
inline void to_json(nlohmann::json& j, const TokenConfig& t) {
    j = nlohmann::json{{"access_secret", t.access_secret.empty() ? "" : "<redacted>"},
                       {"refresh_secret", t.refresh_secret.empty() ? "" : "<redacted>"},
                       {"issuer", t.issuer},
                       {"audience", t.audience},
                       {"access_ttl_seconds", t.access_ttl_seconds},
                       {"refresh_ttl_seconds", t.refresh_ttl_seconds}};
}

inline void to_json(nlohmann::json& j, const PasswordConfig& p) {
    j = nlohmann::json{{"memory_kib", p.memory_kib},
                       {"iterations", p.iterations},
                       {"parallelism", p.parallelism},
                       {"hash_length", p.hash_length},
                       {"salt_length", p.salt_length},
                       {"min_length", p.min_length},
                       {"max_length", p.max_length},
                       {"min_character_classes", p.min_character_classes},
                       {"rehash_on_login", p.rehash_on_login}};
}

inline void to_json(nlohmann::json& j, const RateLimitConfig& r) {
    j = nlohmann::json{{"enabled", r.enabled},
                       {"max_attempts", r.max_attempts},
                       {"window_seconds", r.window_seconds},
                       {"failure_weight", r.failure_weight},
                       {"lockout_threshold", r.lockout_threshold},
                       {"lockout_seconds", r.lockout_seconds}};
}

inline void to_json(nlohmann::json& j, const MfaConfig& m) {
    j = nlohmann::json{{"drift_steps", m.drift_steps},
                       {"backup_code_count", m.backup_code_count},
                       {"issuer", m.issuer}};
}

inline void to_json(nlohmann::json& j, const RevocationConfig& r) {
    j = nlohmann::json{{"sweep_interval_seconds", r.sweep_interval_seconds}};
}

inline void to_json(nlohmann::json& j, const WorkerConfig& w) {
    j = nlohmann::json{{"hash_threads", w.hash_threads}, {"queue_capacity", w.queue_capacity}};
}

inline void to_json(nlohmann::json& j, const LogConfig::RotationConfig& r) {
    j = nlohmann::json{{"max_size_mb", r.max_size_mb}, {"max_files", r.max_files}};
}

inline void to_json(nlohmann::json& j, const LogConfig& l) {
    j = nlohmann::json{
        {"level", l.level}, {"format", l.format}, {"output", l.output}, {"rotation", l.rotation}};
}

inline void to_json(nlohmann::json& j, const Config& c) {
    j["token"] = c.token;
    j["password"] = c.password;
    j["rate_limit"] = c.rate_limit;
    j["mfa"] = c.mfa;
    j["revocation"] = c.revocation;
    j["workers"] = c.workers;
    j["logging"] = c.logging;
    j["version"] = c.version;
}

/// Configuration validation result
struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void add_error(std::string error) {
        valid = false;
        errors.push_back(std::move(error));
    }

    void add_warning(std::string warning) { warnings.push_back(std::move(warning)); }

    [[nodiscard]] bool has_errors() const noexcept { return !valid || !errors.empty(); }
};

/// Configuration loader
class ConfigLoader {
public:
    /// Load configuration from JSON file (parse only, call validate() separately)
    [[nodiscard]] static std::optional<Config> load_from_file(std::string_view path);

    /// Load configuration from JSON string (parse only)
    [[nodiscard]] static std::optional<Config> load_from_json(std::string_view json);

    /// Validate configuration
    [[nodiscard]] static ValidationResult validate(const Config& config);

    /// Save configuration to JSON file (secrets redacted)
    [[nodiscard]] static bool save_to_file(const Config& config, std::string_view path);

    /// Convert configuration to JSON string (secrets redacted)
    [[nodiscard]] static std::string to_json(const Config& config);
};

/// Holds the validated configuration for the process
class ConfigManager {
public:
    ConfigManager() = default;
    ~ConfigManager() = default;

    // Non-copyable, non-movable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /// Load and validate configuration; false on parse or validation failure
    [[nodiscard]] bool load(std::string_view path);

    /// Get current configuration
    [[nodiscard]] std::shared_ptr<const Config> get() const noexcept { return current_config_; }

    /// Get configuration file path
    [[nodiscard]] std::string_view config_path() const noexcept { return config_path_; }

    /// Check if configuration is loaded
    [[nodiscard]] bool is_loaded() const noexcept { return current_config_ != nullptr; }

    /// Get last validation result
    [[nodiscard]] const ValidationResult& last_validation() const noexcept {
        return last_validation_;
    }

private:
    std::string config_path_;
    std::shared_ptr<const Config> current_config_;
    ValidationResult last_validation_;
};

}  // namespace bastion::control
