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

// Token Revocation - Implementation

#include "revocation_store.hpp"

#include <mutex>

#include "../core/crypto.hpp"

namespace bastion::auth {

std::string token_fingerprint(std::string_view token) {
    return core::sha256_hex(token);
}

RevocationStore::RevocationStore(core::Clock clock) : clock_(std::move(clock)) {}

void RevocationStore::revoke(std::string_view token, std::chrono::seconds remaining_ttl) {
    if (remaining_ttl.count() < 0) {
        return;
    }

    std::string id = token_fingerprint(token);
    int64_t expires_at = core::to_unix_seconds(clock_()) + remaining_ttl.count();

    std::unique_lock lock(mutex_);
    auto [it, inserted] = entries_.try_emplace(std::move(id), expires_at);
    if (!inserted && it->second < expires_at) {
        it->second = expires_at;
    }
}

bool RevocationStore::try_revoke(std::string_view token, std::chrono::seconds remaining_ttl) {
    std::string id = token_fingerprint(token);
    int64_t now = core::to_unix_seconds(clock_());

    std::unique_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it != entries_.end() && it->second >= now) {
        return false;
    }
    if (remaining_ttl.count() >= 0) {
        entries_[std::move(id)] = now + remaining_ttl.count();
    }
    return true;
}

bool RevocationStore::is_revoked(std::string_view token) const {
    std::string id = token_fingerprint(token);
    int64_t now = core::to_unix_seconds(clock_());

    std::shared_lock lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return false;
    }
    // Died of natural causes; sweep() will drop it
    return it->second >= now;
}

size_t RevocationStore::sweep() {
    int64_t now = core::to_unix_seconds(clock_());

    std::unique_lock lock(mutex_);
    return core::erase_where(entries_,
                             [now](const auto&, int64_t expires_at) { return expires_at < now; });
}

size_t RevocationStore::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

}  // namespace bastion::auth
