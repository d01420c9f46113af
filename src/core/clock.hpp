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

// Bastion Clock - Injectable wall clock for expiry and window arithmetic

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace bastion::core {

using TimePoint = std::chrono::system_clock::time_point;

/// Wall-clock source (stores take one so tests can advance time)
using Clock = std::function<TimePoint()>;

/// Default clock: std::chrono::system_clock::now
[[nodiscard]] inline Clock system_clock() {
    return [] { return std::chrono::system_clock::now(); };
}

/// Seconds since the Unix epoch
[[nodiscard]] inline int64_t to_unix_seconds(TimePoint tp) noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

[[nodiscard]] inline TimePoint from_unix_seconds(int64_t seconds) noexcept {
    return TimePoint{std::chrono::seconds{seconds}};
}

/// Manually advanced clock (tests, CLI dry runs)
/// Copies of clock() share the same underlying time.
class ManualClock {
public:
    explicit ManualClock(int64_t start_unix_seconds = 1'700'000'000)
        : seconds_(std::make_shared<std::atomic<int64_t>>(start_unix_seconds)) {}

    void advance(std::chrono::seconds delta) noexcept { seconds_->fetch_add(delta.count()); }

    void set(int64_t unix_seconds) noexcept { seconds_->store(unix_seconds); }

    [[nodiscard]] int64_t now_seconds() const noexcept { return seconds_->load(); }

    [[nodiscard]] Clock clock() const {
        auto seconds = seconds_;
        return [seconds] { return from_unix_seconds(seconds->load()); };
    }

private:
    std::shared_ptr<std::atomic<int64_t>> seconds_;
};

}  // namespace bastion::core
