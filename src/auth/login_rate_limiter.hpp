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

// Bastion Login Rate Limiter - Header
// Fixed-window attempt counter per identifier (IP or account) with lockout escalation

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

#include "../core/clock.hpp"
#include "../core/containers.hpp"

namespace bastion::auth {

/// Per-identifier counter state (created lazily on first attempt)
struct RateLimitEntry {
    uint32_t count = 0;
    int64_t window_start = 0;              // Unix seconds
    std::optional<int64_t> locked_until;   // Unix seconds
};

/// Backing store for rate-limit entries
/// Implementations throw RateLimitStoreUnavailable when the store cannot be reached.
class RateLimitStore {
public:
    using Mutator = std::function<void(RateLimitEntry&)>;
    using Predicate = std::function<bool(const RateLimitEntry&)>;

    virtual ~RateLimitStore() = default;

    /// Atomically apply `mutate` to the entry (default-constructed if absent)
    /// and return the updated copy
    [[nodiscard]] virtual RateLimitEntry update(const std::string& identifier,
                                                const Mutator& mutate) = 0;

    [[nodiscard]] virtual std::optional<RateLimitEntry> find(const std::string& identifier) const = 0;

    virtual void erase(const std::string& identifier) = 0;

    /// Remove all entries matching the predicate; returns the number removed
    virtual size_t erase_if(const Predicate& predicate) = 0;

    [[nodiscard]] virtual size_t size() const = 0;
};

/// Process-local store: hash map behind a reader/writer lock
class InMemoryRateLimitStore final : public RateLimitStore {
public:
    InMemoryRateLimitStore() = default;

    // Non-copyable, non-movable (owns a mutex)
    InMemoryRateLimitStore(const InMemoryRateLimitStore&) = delete;
    InMemoryRateLimitStore& operator=(const InMemoryRateLimitStore&) = delete;

    RateLimitEntry update(const std::string& identifier, const Mutator& mutate) override;
    std::optional<RateLimitEntry> find(const std::string& identifier) const override;
    void erase(const std::string& identifier) override;
    size_t erase_if(const Predicate& predicate) override;
    size_t size() const override;

private:
    mutable std::shared_mutex mutex_;
    core::fast_map<std::string, RateLimitEntry> entries_;
};

struct LoginRateLimiterConfig {
    bool enabled = true;
    uint32_t max_attempts = 5;               // Allowed weight per window
    std::chrono::seconds window{60};
    uint32_t failure_weight = 2;             // Weight of a failed login (bare attempt = 1)
    uint32_t lockout_threshold = 10;         // Weight above which the identifier is locked
    std::chrono::seconds lockout{900};
};

enum class RateLimitStatus : uint8_t {
    Allowed,
    Limited,
    Locked
};

/// Outcome of a rate-limit check
struct RateLimitDecision {
    RateLimitStatus status = RateLimitStatus::Allowed;
    uint32_t limit = 0;
    uint32_t remaining = 0;
    std::chrono::seconds retry_after{0};  // Non-zero unless Allowed
    bool lockout_started = false;         // This attempt set locked_until

    [[nodiscard]] bool allowed() const noexcept { return status == RateLimitStatus::Allowed; }
};

/// Login rate limiter
///
/// Window arithmetic: an entry whose window has elapsed (now - window_start > window)
/// restarts at the next attempt. Weight above max_attempts is Limited until the window
/// ends; weight above lockout_threshold sets locked_until = now + lockout and every
/// attempt is Locked until then. Rejected attempts still add weight.
///
/// Store failures fail open: the attempt is allowed and a security event is logged.
class LoginRateLimiter {
public:
    explicit LoginRateLimiter(LoginRateLimiterConfig config,
                              std::shared_ptr<RateLimitStore> store = nullptr,
                              core::Clock clock = core::system_clock());

    /// Count one attempt (weight 1) and decide
    [[nodiscard]] RateLimitDecision record_attempt(std::string_view identifier);

    /// Count one failed attempt (failure_weight) and decide
    RateLimitDecision record_failure(std::string_view identifier);

    /// Decide without counting, unless the identifier is already limited/locked, in which
    /// case the rejected attempt is counted (weight 1) so persistent retries escalate
    [[nodiscard]] RateLimitDecision guard(std::string_view identifier);

    /// Current decision without mutation
    [[nodiscard]] RateLimitDecision peek(std::string_view identifier) const;

    /// Forget the identifier (successful login)
    void clear(std::string_view identifier);

    /// Drop entries whose window has elapsed and that are not locked; returns count removed
    size_t sweep();

    [[nodiscard]] size_t size() const;

    [[nodiscard]] const LoginRateLimiterConfig& config() const noexcept { return config_; }

private:
    enum class Mode : uint8_t { Count, GuardOnly };

    [[nodiscard]] RateLimitDecision apply(std::string_view identifier, uint32_t weight, Mode mode);
    [[nodiscard]] RateLimitDecision decide(const RateLimitEntry& entry, int64_t now) const;
    [[nodiscard]] RateLimitDecision allow_all() const noexcept;
    void reset_if_elapsed(RateLimitEntry& entry, int64_t now) const;
    void log_store_failure(std::string_view identifier, std::string_view what) const;

    LoginRateLimiterConfig config_;
    std::shared_ptr<RateLimitStore> store_;
    core::Clock clock_;
};

}  // namespace bastion::auth
