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

// Bastion Auth Responses - Implementation

#include "auth_responses.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <nlohmann/json.hpp>
#include <string>

namespace bastion::gateway {

void write_error(http::Response& response, http::StatusCode status, std::string_view code,
                 std::string_view message) {
    response.status = status;
    nlohmann::json body = {{"error", code}, {"message", message}};
    response.set_json_body(body.dump());
}

void write_unauthorized(http::Response& response) {
    write_error(response, http::StatusCode::Unauthorized, "unauthorized",
                "Authentication required");
    response.set_header("WWW-Authenticate", fmt::format("Bearer realm=\"{}\"", kAuthRealm));
}

void write_invalid_credentials(http::Response& response) {
    write_error(response, http::StatusCode::Unauthorized, "invalid_credentials",
                "The provided credentials are incorrect.");
}

void write_banned(http::Response& response) {
    write_error(response, http::StatusCode::Forbidden, "account_suspended",
                "This account has been suspended. Contact support to restore access.");
}

void write_rate_limited(http::Response& response, const auth::RateLimitDecision& decision) {
    int64_t retry_after = std::max<int64_t>(1, decision.retry_after.count());

    response.status = http::StatusCode::TooManyRequests;
    nlohmann::json body = {{"error", "too_many_requests"},
                           {"message", "Too many attempts. Try again later."},
                           {"retry_after", retry_after}};
    response.set_json_body(body.dump());
    response.set_header("Retry-After", std::to_string(retry_after));
    add_rate_limit_headers(response, decision);
}

void write_overloaded(http::Response& response) {
    write_error(response, http::StatusCode::ServiceUnavailable, "service_unavailable",
                "The server is busy. Try again shortly.");
    response.set_header("Retry-After", "1");
}

void add_rate_limit_headers(http::Response& response, const auth::RateLimitDecision& decision) {
    if (decision.limit == 0) {
        return;
    }
    response.set_header("X-RateLimit-Limit", std::to_string(decision.limit));
    response.set_header("X-RateLimit-Remaining", std::to_string(decision.remaining));
}

void write_auth_failure(http::Response& response, auth::AuthError error) {
    if (error == auth::AuthError::UserBanned) {
        write_banned(response);
        return;
    }
    write_unauthorized(response);
}

}  // namespace bastion::gateway
