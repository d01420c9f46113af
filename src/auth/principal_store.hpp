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

// Bastion Principal Store - Header
// Boundary to the account records owned by the surrounding application

#pragma once

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace bastion::auth {

/// MFA enrollment of a principal
struct MfaEnrollment {
    std::string base32_secret;
    std::vector<std::string> backup_code_hashes;
};

/// Account as seen by the auth core
struct Principal {
    std::string id;
    std::string email;
    std::string role;
    std::optional<int64_t> banned_at;  // Unix seconds
    std::string credential_hash;
    std::optional<MfaEnrollment> mfa;

    [[nodiscard]] bool is_banned() const noexcept { return banned_at.has_value(); }
    [[nodiscard]] bool mfa_enabled() const noexcept { return mfa.has_value(); }
};

/// Principal lookup; read-only apart from the two writes below
class PrincipalStore {
public:
    virtual ~PrincipalStore() = default;

    [[nodiscard]] virtual std::optional<Principal> find_by_id(std::string_view id) const = 0;

    /// Email lookup is case-insensitive
    [[nodiscard]] virtual std::optional<Principal> find_by_email(std::string_view email) const = 0;

    /// Replace the stored credential (rehash on login, password change)
    virtual bool update_credential_hash(std::string_view id, std::string new_hash) = 0;

    /// Atomically remove the stored backup code hash equal to `code_hash`
    /// Returns false when it is no longer present (another request consumed it first).
    virtual bool consume_backup_code(std::string_view id, std::string_view code_hash) = 0;
};

/// Hash-map implementation (tests, CLI, embedding without a database)
class InMemoryPrincipalStore final : public PrincipalStore {
public:
    InMemoryPrincipalStore() = default;

    // Non-copyable, non-movable (owns a mutex)
    InMemoryPrincipalStore(const InMemoryPrincipalStore&) = delete;
    InMemoryPrincipalStore& operator=(const InMemoryPrincipalStore&) = delete;

    /// Insert or replace
    void upsert(Principal principal);

    void set_banned(std::string_view id, std::optional<int64_t> banned_at);

    std::optional<Principal> find_by_id(std::string_view id) const override;
    std::optional<Principal> find_by_email(std::string_view email) const override;
    bool update_credential_hash(std::string_view id, std::string new_hash) override;
    bool consume_backup_code(std::string_view id, std::string_view code_hash) override;

    [[nodiscard]] size_t size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Principal> by_id_;
    std::unordered_map<std::string, std::string> id_by_email_;  // lowercased email -> id
};

/// Lowercase ASCII (email keys, rate-limit identifiers)
[[nodiscard]] std::string to_lower_ascii(std::string_view input);

}  // namespace bastion::auth
