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

// Bastion Bearer Authentication Middleware - Header

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "../auth/auth_pipeline.hpp"
#include "pipeline.hpp"

namespace bastion::gateway {

/// Bearer token authentication for protected routes
/// On success the principal is attached to the context and claims are copied into
/// metadata (auth_sub, auth_email, auth_role). On failure the response is written and
/// the pipeline stops.
class BearerAuthMiddleware : public Middleware {
public:
    struct Config {
        std::string header = "Authorization";
    };

    /// Throws std::invalid_argument if pipeline is null
    BearerAuthMiddleware(Config config, std::shared_ptr<const auth::AuthPipeline> pipeline);
    ~BearerAuthMiddleware() override = default;

    [[nodiscard]] MiddlewareResult process_request(RequestContext& ctx) override;

    [[nodiscard]] std::string_view name() const override { return "BearerAuthMiddleware"; }

private:
    Config config_;
    std::shared_ptr<const auth::AuthPipeline> pipeline_;
};

}  // namespace bastion::gateway
