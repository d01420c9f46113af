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

// Bastion Auth Routes - Header
// POST /auth/login, /auth/refresh, /auth/logout
//
// Login runs the memory-hard hash, so it is executed on the worker pool and never on
// the dispatching thread. A saturated pool answers 503 immediately.

#pragma once

#include <future>
#include <memory>
#include <string_view>

#include "../auth/auth_pipeline.hpp"
#include "../core/worker_pool.hpp"
#include "../http/http.hpp"

namespace bastion::gateway {

inline constexpr std::string_view kLoginPath = "/auth/login";
inline constexpr std::string_view kRefreshPath = "/auth/refresh";
inline constexpr std::string_view kLogoutPath = "/auth/logout";

class AuthRoutes {
public:
    /// Throws std::invalid_argument if either collaborator is null
    AuthRoutes(std::shared_ptr<auth::AuthPipeline> pipeline,
               std::shared_ptr<core::WorkerPool> workers);

    // Non-copyable; queued logins share the pipeline, never this object
    AuthRoutes(const AuthRoutes&) = delete;
    AuthRoutes& operator=(const AuthRoutes&) = delete;

    /// Route by path and method; login resolves on a worker, the rest are ready immediately
    [[nodiscard]] std::future<http::Response> dispatch(http::Request request);

    /// True for the three auth paths
    [[nodiscard]] static bool handles(std::string_view path) noexcept;

    /// Queue a login on the worker pool (ready 503 future when saturated)
    /// The queued task keeps the pipeline alive and may outlive this object.
    [[nodiscard]] std::future<http::Response> login_async(http::Request request);

    /// Synchronous login (caller owns the thread)
    [[nodiscard]] http::Response login(const http::Request& request);

    [[nodiscard]] http::Response refresh(const http::Request& request);

    [[nodiscard]] http::Response logout(const http::Request& request);

private:
    std::shared_ptr<auth::AuthPipeline> pipeline_;
    std::shared_ptr<core::WorkerPool> workers_;
};

}  // namespace bastion::gateway
