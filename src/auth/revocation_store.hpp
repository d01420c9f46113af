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

// Token Revocation - In-Memory Denylist
//
// Architecture:
// - Keyed by SHA-256 fingerprint of the token (the token itself is never retained)
// - Reader/writer lock: concurrent is_revoked(), exclusive revoke()/sweep()
// - Entries live through the revoked token's own expiry second (a token is valid while
//   exp >= now, so an entry with expires_at == exp denies it for as long as it verifies);
//   sweep() frees them afterwards
//
// Process-local: revocations are not shared between instances.

#pragma once

#include <chrono>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <string_view>

#include "../core/clock.hpp"
#include "../core/containers.hpp"

namespace bastion::auth {

/// Identifier under which a token is stored (hex SHA-256 of the full token)
/// TokenCodec accepts only the canonical base64url spelling of each segment, so a token
/// that verifies has exactly one fingerprint.
[[nodiscard]] std::string token_fingerprint(std::string_view token);

class RevocationStore {
public:
    explicit RevocationStore(core::Clock clock = core::system_clock());
    ~RevocationStore() = default;

    // Non-copyable, non-movable (owns a mutex)
    RevocationStore(const RevocationStore&) = delete;
    RevocationStore& operator=(const RevocationStore&) = delete;

    /// Deny the token for the rest of its lifetime (through now + remaining_ttl inclusive)
    /// Zero TTL covers the token's final second; negative TTL is a no-op (token already
    /// dead). Re-revoking keeps the later expiry.
    void revoke(std::string_view token, std::chrono::seconds remaining_ttl);

    /// Revoke unless an unexpired entry already exists
    /// Returns false if the token was already revoked (single-use tokens: refresh rotation).
    [[nodiscard]] bool try_revoke(std::string_view token, std::chrono::seconds remaining_ttl);

    /// True while an entry with expires_at >= now exists
    /// Expired entries read as absent but are only removed by sweep().
    [[nodiscard]] bool is_revoked(std::string_view token) const;

    /// Remove entries with expires_at < now; returns the number removed
    size_t sweep();

    /// Entries currently held (expired-but-unswept included)
    [[nodiscard]] size_t size() const;

private:
    core::Clock clock_;
    mutable std::shared_mutex mutex_;
    // fingerprint -> expires_at (Unix seconds)
    core::fast_map<std::string, int64_t> entries_;
};

}  // namespace bastion::auth
