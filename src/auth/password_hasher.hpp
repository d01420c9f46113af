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

// Bastion Password Hasher - Header
// Argon2id (primary) and bcrypt (legacy, verify-only) credential hashing

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace bastion::auth {

/// Stored credential formats, dispatched by prefix
enum class HashFormat : uint8_t {
    Argon2id,  // $argon2id$v=19$m=..,t=..,p=..$salt$hash
    Bcrypt     // $2b$ (and legacy $2y$, $2a$, $2x$ variants)
};

/// Detect format from the hash string prefix (nullopt = unknown)
[[nodiscard]] std::optional<HashFormat> detect_format(std::string_view hash) noexcept;

/// Rewrite legacy bcrypt prefixes ($2y$, $2a$, $2x$) to $2b$
[[nodiscard]] std::string normalize_bcrypt_prefix(std::string_view hash);

/// Hashing cost and password policy
struct PasswordHasherConfig {
    // Argon2id cost (applied to every new hash)
    uint32_t memory_kib = 65536;  // 64 MiB
    uint32_t iterations = 3;
    uint32_t parallelism = 4;
    uint32_t hash_length = 32;
    uint32_t salt_length = 16;

    // Strength policy (checked before hashing new passwords)
    size_t min_length = 8;
    size_t max_length = 128;
    uint32_t min_character_classes = 3;  // of lower, upper, digit, symbol
};

/// Result of hashing a user-chosen password
struct PasswordHashResult {
    bool valid = false;
    std::string hash;
    std::string error;

    [[nodiscard]] static PasswordHashResult success(std::string hash) {
        return {true, std::move(hash), ""};
    }

    [[nodiscard]] static PasswordHashResult failure(std::string error) {
        return {false, "", std::move(error)};
    }

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }
};

/// Password hasher (stateless apart from its configuration, safe to share across threads)
class PasswordHasher {
public:
    explicit PasswordHasher(PasswordHasherConfig config = {});

    /// Hash with Argon2id and a fresh random salt
    /// Throws std::runtime_error if the KDF fails (e.g. memory allocation)
    [[nodiscard]] std::string hash(std::string_view password) const;

    /// Verify password against a stored hash
    /// Throws UnknownHashFormatError for unrecognized formats (never "no match")
    [[nodiscard]] bool verify(std::string_view password, std::string_view stored_hash) const;

    /// Full-cost hash of a fixed placeholder, result discarded
    /// Called when an account lookup fails so both failure paths cost the same.
    void hash_dummy() const;

    /// Policy check; returns the violation or nullopt if the password is acceptable
    [[nodiscard]] std::optional<std::string> validate_strength(std::string_view password) const;

    /// Policy check first, then hash (password set/change flows)
    [[nodiscard]] PasswordHashResult hash_new_password(std::string_view password) const;

    /// True if the stored hash is legacy or was produced with different Argon2id cost
    [[nodiscard]] bool needs_rehash(std::string_view stored_hash) const noexcept;

    [[nodiscard]] const PasswordHasherConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] bool verify_argon2id(std::string_view password, std::string_view stored) const;
    [[nodiscard]] bool verify_bcrypt(std::string_view password, std::string_view stored) const;

    PasswordHasherConfig config_;
};

}  // namespace bastion::auth
