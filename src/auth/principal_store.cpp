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

// Bastion Principal Store - Implementation

#include "principal_store.hpp"

#include <mutex>

#include "../core/crypto.hpp"

namespace bastion::auth {

std::string to_lower_ascii(std::string_view input) {
    std::string out(input);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return out;
}

void InMemoryPrincipalStore::upsert(Principal principal) {
    std::unique_lock lock(mutex_);

    auto existing = by_id_.find(principal.id);
    if (existing != by_id_.end()) {
        id_by_email_.erase(to_lower_ascii(existing->second.email));
    }

    id_by_email_[to_lower_ascii(principal.email)] = principal.id;
    std::string id = principal.id;
    by_id_[std::move(id)] = std::move(principal);
}

void InMemoryPrincipalStore::set_banned(std::string_view id, std::optional<int64_t> banned_at) {
    std::unique_lock lock(mutex_);
    auto it = by_id_.find(std::string(id));
    if (it != by_id_.end()) {
        it->second.banned_at = banned_at;
    }
}

std::optional<Principal> InMemoryPrincipalStore::find_by_id(std::string_view id) const {
    std::shared_lock lock(mutex_);
    auto it = by_id_.find(std::string(id));
    if (it == by_id_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Principal> InMemoryPrincipalStore::find_by_email(std::string_view email) const {
    std::shared_lock lock(mutex_);
    auto id_it = id_by_email_.find(to_lower_ascii(email));
    if (id_it == id_by_email_.end()) {
        return std::nullopt;
    }
    auto it = by_id_.find(id_it->second);
    if (it == by_id_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryPrincipalStore::update_credential_hash(std::string_view id, std::string new_hash) {
    std::unique_lock lock(mutex_);
    auto it = by_id_.find(std::string(id));
    if (it == by_id_.end()) {
        return false;
    }
    it->second.credential_hash = std::move(new_hash);
    return true;
}

bool InMemoryPrincipalStore::consume_backup_code(std::string_view id,
                                                 std::string_view code_hash) {
    std::unique_lock lock(mutex_);
    auto it = by_id_.find(std::string(id));
    if (it == by_id_.end() || !it->second.mfa) {
        return false;
    }

    auto& hashes = it->second.mfa->backup_code_hashes;
    for (auto h = hashes.begin(); h != hashes.end(); ++h) {
        if (core::constant_time_equals(*h, code_hash)) {
            hashes.erase(h);
            return true;
        }
    }
    return false;
}

size_t InMemoryPrincipalStore::size() const {
    std::shared_lock lock(mutex_);
    return by_id_.size();
}

}  // namespace bastion::auth
