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

// Bastion Runtime Maintenance - Implementation

#include "maintenance.hpp"

#include <stdexcept>

#include "../core/logging.hpp"

namespace bastion::runtime {

Maintenance::Maintenance(std::shared_ptr<auth::RevocationStore> revocations,
                         std::shared_ptr<auth::LoginRateLimiter> rate_limiter,
                         std::chrono::seconds interval)
    : revocations_(std::move(revocations)),
      rate_limiter_(std::move(rate_limiter)),
      interval_(interval.count() > 0 ? interval : std::chrono::seconds(1)) {
    if (!revocations_ || !rate_limiter_) {
        throw std::invalid_argument("Maintenance requires a revocation store and a rate limiter");
    }
}

Maintenance::~Maintenance() {
    stop();
}

void Maintenance::start() {
    std::lock_guard lock(mutex_);
    if (thread_.joinable() || stopping_) {
        return;
    }
    stop_requested_ = false;
    thread_ = std::thread([this] { loop(); });
}

void Maintenance::stop() {
    std::thread worker;
    {
        std::lock_guard lock(mutex_);
        if (!thread_.joinable()) {
            return;
        }
        // Only the caller that takes the thread joins it
        worker = std::move(thread_);
        stop_requested_ = true;
        stopping_ = true;
    }
    cv_.notify_all();
    worker.join();

    std::lock_guard lock(mutex_);
    stopping_ = false;
}

bool Maintenance::running() const {
    std::lock_guard lock(mutex_);
    return thread_.joinable() && !stop_requested_;
}

size_t Maintenance::passes() const {
    std::lock_guard lock(mutex_);
    return passes_;
}

SweepStats Maintenance::run_once() {
    SweepStats stats;
    stats.revocations_removed = revocations_->sweep();
    stats.rate_limits_removed = rate_limiter_->sweep();

    if (auto* logger = logging::get_logger()) {
        LOG_INFO(logger,
                 "Maintenance sweep: revocations_removed={}, revocations_left={}, "
                 "rate_limits_removed={}, rate_limits_left={}",
                 stats.revocations_removed, revocations_->size(), stats.rate_limits_removed,
                 rate_limiter_->size());
    }
    return stats;
}

void Maintenance::loop() {
    std::unique_lock lock(mutex_);
    while (!stop_requested_) {
        if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
            break;
        }

        lock.unlock();
        run_once();
        lock.lock();
        ++passes_;
    }
}

}  // namespace bastion::runtime
