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

// Bastion Bearer Authentication Middleware - Implementation

#include "auth_middleware.hpp"

#include <stdexcept>

#include "../core/logging.hpp"
#include "auth_responses.hpp"

namespace bastion::gateway {

BearerAuthMiddleware::BearerAuthMiddleware(Config config,
                                           std::shared_ptr<const auth::AuthPipeline> pipeline)
    : config_(std::move(config)), pipeline_(std::move(pipeline)) {
    if (!pipeline_) {
        throw std::invalid_argument("BearerAuthMiddleware requires an AuthPipeline");
    }
}

MiddlewareResult BearerAuthMiddleware::process_request(RequestContext& ctx) {
    if (!ctx.request || !ctx.response) {
        return MiddlewareResult::Error;
    }

    auto outcome = pipeline_->authenticate(ctx.request->get_header(config_.header));

    if (!outcome) {
        auto error = outcome.error.value_or(auth::AuthError::Malformed);

        // Missing header is routine traffic, not a security event
        if (outcome.error) {
            if (auto* logger = logging::get_logger()) {
                LOG_WARNING(logger,
                            "Authentication rejected: reason={}, last_stage={}, client_ip={}, "
                            "correlation_id={}",
                            auth::to_string(error), auth::to_string(outcome.last_passed),
                            ctx.client_ip, ctx.correlation_id);
            }
        }

        write_auth_failure(*ctx.response, error);
        return MiddlewareResult::Stop;
    }

    const auto& principal = *outcome.principal;
    ctx.set_metadata("auth_sub", principal.id);
    ctx.set_metadata("auth_email", principal.email);
    ctx.set_metadata("auth_role", principal.role);
    ctx.principal = std::move(outcome.principal);

    if (auto* logger = logging::get_logger()) {
        LOG_DEBUG(logger, "Authenticated: sub={}, client_ip={}, correlation_id={}",
                  ctx.principal->id, ctx.client_ip, ctx.correlation_id);
    }

    return MiddlewareResult::Continue;
}

}  // namespace bastion::gateway
