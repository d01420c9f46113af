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

// Bastion Runtime Maintenance - Header
// Background sweeper that bounds the memory of the revocation list and the
// rate-limit table by dropping entries that can no longer affect a decision.

#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

#include "../auth/login_rate_limiter.hpp"
#include "../auth/revocation_store.hpp"

namespace bastion::runtime {

struct SweepStats {
    size_t revocations_removed = 0;
    size_t rate_limits_removed = 0;
};

class Maintenance {
public:
    Maintenance(std::shared_ptr<auth::RevocationStore> revocations,
                std::shared_ptr<auth::LoginRateLimiter> rate_limiter,
                std::chrono::seconds interval);
    ~Maintenance();

    // Non-copyable, non-movable (owns a running thread)
    Maintenance(const Maintenance&) = delete;
    Maintenance& operator=(const Maintenance&) = delete;

    /// Start the background thread (no-op if already running)
    void start();

    /// Wake the thread and join it; safe to call more than once and concurrently
    void stop();

    /// One sweep pass on the calling thread
    SweepStats run_once();

    [[nodiscard]] bool running() const;

    /// Passes completed by the background thread
    [[nodiscard]] size_t passes() const;

private:
    void loop();

    std::shared_ptr<auth::RevocationStore> revocations_;
    std::shared_ptr<auth::LoginRateLimiter> rate_limiter_;
    std::chrono::seconds interval_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    bool stopping_ = false;  // A stop() is joining; start() is a no-op
    size_t passes_ = 0;
    std::thread thread_;
};

}  // namespace bastion::runtime
