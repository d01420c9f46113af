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

// Bastion Auth Responses - Header
// Maps AuthError to client-visible HTTP responses.
//
// The internal reason code is never sent to the client: every token or credential
// failure collapses to one generic body. Only UserBanned and rate limiting are specific.

#pragma once

#include <string_view>

#include "../auth/auth_error.hpp"
#include "../auth/login_rate_limiter.hpp"
#include "../http/http.hpp"

namespace bastion::gateway {

inline constexpr std::string_view kAuthRealm = "bastion";

/// JSON body {"error": code, "message": message}
void write_error(http::Response& response, http::StatusCode status, std::string_view code,
                 std::string_view message);

/// 401 with the generic body and WWW-Authenticate challenge (RFC 6750)
void write_unauthorized(http::Response& response);

/// 401 for a failed login (credential or MFA failure)
void write_invalid_credentials(http::Response& response);

/// 403 for a suspended account
void write_banned(http::Response& response);

/// 429 with Retry-After plus the X-RateLimit-* headers
void write_rate_limited(http::Response& response, const auth::RateLimitDecision& decision);

/// 503 when the hashing pool is saturated
void write_overloaded(http::Response& response);

/// X-RateLimit-Limit / X-RateLimit-Remaining (no-op when limiting is disabled)
void add_rate_limit_headers(http::Response& response, const auth::RateLimitDecision& decision);

/// Token or credential failure on a protected route: 403 for UserBanned, otherwise 401
void write_auth_failure(http::Response& response, auth::AuthError error);

}  // namespace bastion::gateway
