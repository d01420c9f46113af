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

// Bastion Pipeline - Implementation

#include "pipeline.hpp"

#include "../core/logging.hpp"

namespace bastion::gateway {

// CorrelationIdMiddleware implementation

MiddlewareResult CorrelationIdMiddleware::process_request(RequestContext& ctx) {
    if (!ctx.request || !ctx.response) {
        return MiddlewareResult::Error;
    }

    auto incoming = ctx.request->get_header("X-Correlation-ID");
    if (!incoming.empty() && logging::is_valid_correlation_id(incoming)) {
        ctx.correlation_id = std::string(incoming);
    } else {
        // Client-supplied values that fail validation are never echoed into logs
        ctx.correlation_id = logging::generate_correlation_id();
    }

    ctx.response->set_header("X-Correlation-ID", ctx.correlation_id);
    return MiddlewareResult::Continue;
}

// Pipeline implementation

void Pipeline::use(std::unique_ptr<Middleware> middleware) {
    middleware_.push_back(std::move(middleware));
}

void Pipeline::use(MiddlewareFunc func, std::string_view name) {
    middleware_.push_back(std::make_unique<FunctionMiddleware>(std::move(func), std::string(name)));
}

MiddlewareResult Pipeline::execute_request(RequestContext& ctx) {
    for (auto& middleware : middleware_) {
        MiddlewareResult result = middleware->process_request(ctx);

        if (result == MiddlewareResult::Stop) {
            return MiddlewareResult::Stop;
        }

        if (result == MiddlewareResult::Error || ctx.has_error) {
            if (auto* logger = logging::get_logger()) {
                LOG_ERROR_CTX(logger, "Middleware failed", ctx.correlation_id, middleware->name(),
                              ctx.error_message);
            }
            return MiddlewareResult::Error;
        }
    }

    return MiddlewareResult::Continue;
}

}  // namespace bastion::gateway
