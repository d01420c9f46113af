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

// Bastion Login Rate Limiter - Implementation

#include "login_rate_limiter.hpp"

#include <algorithm>
#include <mutex>

#include "../core/logging.hpp"
#include "auth_error.hpp"

namespace bastion::auth {

// ============================================================================
// InMemoryRateLimitStore
// ============================================================================

RateLimitEntry InMemoryRateLimitStore::update(const std::string& identifier,
                                              const Mutator& mutate) {
    std::unique_lock lock(mutex_);
    auto& entry = entries_[identifier];
    mutate(entry);
    return entry;
}

std::optional<RateLimitEntry> InMemoryRateLimitStore::find(const std::string& identifier) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(identifier);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryRateLimitStore::erase(const std::string& identifier) {
    std::unique_lock lock(mutex_);
    entries_.erase(identifier);
}

size_t InMemoryRateLimitStore::erase_if(const Predicate& predicate) {
    std::unique_lock lock(mutex_);
    return core::erase_where(entries_, [&predicate](const auto&, const RateLimitEntry& entry) {
        return predicate(entry);
    });
}

size_t InMemoryRateLimitStore::size() const {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

// ============================================================================
// LoginRateLimiter
// ============================================================================

LoginRateLimiter::LoginRateLimiter(LoginRateLimiterConfig config,
                                   std::shared_ptr<RateLimitStore> store, core::Clock clock)
    : config_(std::move(config)),
      store_(store ? std::move(store) : std::make_shared<InMemoryRateLimitStore>()),
      clock_(std::move(clock)) {}

RateLimitDecision LoginRateLimiter::record_attempt(std::string_view identifier) {
    return apply(identifier, 1, Mode::Count);
}

RateLimitDecision LoginRateLimiter::record_failure(std::string_view identifier) {
    return apply(identifier, config_.failure_weight, Mode::Count);
}

RateLimitDecision LoginRateLimiter::guard(std::string_view identifier) {
    return apply(identifier, 1, Mode::GuardOnly);
}

RateLimitDecision LoginRateLimiter::peek(std::string_view identifier) const {
    if (!config_.enabled) {
        return allow_all();
    }

    int64_t now = core::to_unix_seconds(clock_());
    try {
        auto entry = store_->find(std::string(identifier));
        if (!entry) {
            return allow_all();
        }
        reset_if_elapsed(*entry, now);
        return decide(*entry, now);
    } catch (const RateLimitStoreUnavailable& e) {
        log_store_failure(identifier, e.what());
        return allow_all();
    }
}

void LoginRateLimiter::clear(std::string_view identifier) {
    try {
        store_->erase(std::string(identifier));
    } catch (const RateLimitStoreUnavailable& e) {
        log_store_failure(identifier, e.what());
    }
}

size_t LoginRateLimiter::sweep() {
    int64_t now = core::to_unix_seconds(clock_());
    int64_t window = config_.window.count();

    try {
        return store_->erase_if([now, window](const RateLimitEntry& entry) {
            if (entry.locked_until && *entry.locked_until > now) {
                return false;
            }
            return now - entry.window_start > window;
        });
    } catch (const RateLimitStoreUnavailable& e) {
        log_store_failure("*", e.what());
        return 0;
    }
}

size_t LoginRateLimiter::size() const {
    try {
        return store_->size();
    } catch (const RateLimitStoreUnavailable& e) {
        log_store_failure("*", e.what());
        return 0;
    }
}

RateLimitDecision LoginRateLimiter::apply(std::string_view identifier, uint32_t weight,
                                          Mode mode) {
    if (!config_.enabled) {
        return allow_all();
    }

    int64_t now = core::to_unix_seconds(clock_());
    const uint32_t max_attempts = config_.max_attempts;
    const uint32_t lockout_threshold = config_.lockout_threshold;
    const int64_t lockout = config_.lockout.count();

    bool lockout_started = false;
    try {
        auto entry = store_->update(std::string(identifier), [&](RateLimitEntry& e) {
            reset_if_elapsed(e, now);

            bool rejected = (e.locked_until && *e.locked_until > now) || e.count > max_attempts;
            if (mode == Mode::GuardOnly && !rejected) {
                return;
            }

            e.count += weight;
            if (!e.locked_until && e.count > lockout_threshold) {
                e.locked_until = now + lockout;
                lockout_started = true;
            }
        });

        auto decision = decide(entry, now);
        decision.lockout_started = lockout_started;
        if (lockout_started) {
            if (auto* logger = logging::get_logger()) {
                LOG_SECURITY(logger, "lockout", identifier, "attempt threshold exceeded");
            }
        }
        return decision;
    } catch (const RateLimitStoreUnavailable& e) {
        log_store_failure(identifier, e.what());
        return allow_all();
    }
}

void LoginRateLimiter::reset_if_elapsed(RateLimitEntry& entry, int64_t now) const {
    if (entry.locked_until) {
        if (*entry.locked_until > now) {
            return;
        }
        // Lockout served: start clean
        entry.locked_until.reset();
        entry.count = 0;
        entry.window_start = now;
        return;
    }

    if (now - entry.window_start > config_.window.count()) {
        entry.count = 0;
        entry.window_start = now;
    }
}

RateLimitDecision LoginRateLimiter::decide(const RateLimitEntry& entry, int64_t now) const {
    RateLimitDecision decision;
    decision.limit = config_.max_attempts;
    decision.remaining =
        entry.count >= config_.max_attempts ? 0 : config_.max_attempts - entry.count;

    if (entry.locked_until && *entry.locked_until > now) {
        decision.status = RateLimitStatus::Locked;
        decision.remaining = 0;
        decision.retry_after = std::chrono::seconds{*entry.locked_until - now};
        return decision;
    }

    if (entry.count > config_.max_attempts) {
        decision.status = RateLimitStatus::Limited;
        int64_t window_end = entry.window_start + config_.window.count();
        decision.retry_after = std::chrono::seconds{std::max<int64_t>(1, window_end - now)};
        return decision;
    }

    decision.status = RateLimitStatus::Allowed;
    return decision;
}

RateLimitDecision LoginRateLimiter::allow_all() const noexcept {
    RateLimitDecision decision;
    decision.status = RateLimitStatus::Allowed;
    decision.limit = config_.max_attempts;
    decision.remaining = config_.max_attempts;
    return decision;
}

void LoginRateLimiter::log_store_failure(std::string_view identifier,
                                         std::string_view what) const {
    // Fail open: availability over strict lockout
    if (auto* logger = logging::get_logger()) {
        LOG_SECURITY(logger, "rate_limit_store_unavailable", identifier, what);
    }
}

}  // namespace bastion::auth
