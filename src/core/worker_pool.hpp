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

// Bastion Worker Pool - Header
// Fixed-size thread pool with a bounded queue for CPU/memory-expensive work
// (password hashing). Submission never blocks: a full queue is reported to the
// caller, which sheds load instead of stalling request dispatch.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

namespace bastion::core {

class WorkerPool {
public:
    /// @param threads Worker count (0 = half the hardware threads, minimum 1)
    /// @param queue_capacity Maximum number of queued (not yet running) tasks
    WorkerPool(size_t threads, size_t queue_capacity);
    ~WorkerPool();

    // Non-copyable, non-movable (owns running threads)
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// Submit a task; returns nullopt when the queue is full or the pool is stopping
    template <typename F>
    [[nodiscard]] auto try_submit(F&& func) -> std::optional<std::future<std::invoke_result_t<F>>> {
        using R = std::invoke_result_t<F>;

        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(func));
        auto future = task->get_future();

        if (!enqueue([task]() { (*task)(); })) {
            return std::nullopt;
        }
        return future;
    }

    /// Stop accepting work, drain queued tasks and join all workers
    void shutdown();

    [[nodiscard]] size_t thread_count() const noexcept { return workers_.size(); }
    [[nodiscard]] size_t queue_capacity() const noexcept { return queue_capacity_; }

    /// Tasks waiting for a worker
    [[nodiscard]] size_t pending() const;

private:
    [[nodiscard]] bool enqueue(std::function<void()> job);
    void worker_loop();

    size_t queue_capacity_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

/// Resolve a configured thread count (0 = auto)
[[nodiscard]] size_t resolve_worker_threads(size_t configured) noexcept;

}  // namespace bastion::core
