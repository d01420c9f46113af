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

// Bastion Auth Routes - Implementation

#include "auth_routes.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>

#include "../core/logging.hpp"
#include "auth_responses.hpp"

namespace bastion::gateway {

namespace {

std::future<http::Response> ready(http::Response response) {
    std::promise<http::Response> promise;
    promise.set_value(std::move(response));
    return promise.get_future();
}

http::Response bad_request(std::string_view message) {
    http::Response response;
    write_error(response, http::StatusCode::BadRequest, "bad_request", message);
    return response;
}

/// Parse a JSON object body; nullopt on invalid JSON or a non-object
std::optional<nlohmann::json> parse_object(std::string_view body) {
    auto j = nlohmann::json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    return j;
}

/// Optional string member: absent or null -> nullopt, wrong type -> error flag set
std::optional<std::string> optional_string(const nlohmann::json& j, const char* key,
                                           bool& type_error) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        type_error = true;
        return std::nullopt;
    }
    return it->get<std::string>();
}

/// 200 body shared by login and refresh
http::Response session_response(const auth::LoginOutcome& outcome) {
    http::Response response;
    response.status = http::StatusCode::OK;

    const auto& principal = *outcome.principal;
    nlohmann::json body = {{"token", outcome.tokens.access_token},
                           {"refresh_token", outcome.tokens.refresh_token},
                           {"expires_at", outcome.tokens.access_expires_at},
                           {"user",
                            {{"id", principal.id},
                             {"email", principal.email},
                             {"role", principal.role}}}};
    response.set_json_body(body.dump());
    response.set_header("Cache-Control", "no-store");
    return response;
}

using SteadyClock = std::chrono::steady_clock;

void log_completed(const http::Request& request, const http::Response& response,
                   SteadyClock::time_point start) {
    auto* logger = logging::get_logger();
    if (!logger) {
        return;
    }
    auto duration_us =
        std::chrono::duration_cast<std::chrono::microseconds>(SteadyClock::now() - start).count();
    auto correlation_id = request.get_header("X-Correlation-ID");
    if (!logging::is_valid_correlation_id(correlation_id)) {
        correlation_id = "-";
    }
    LOG_REQUEST(logger, http::to_string(request.method), request.path,
                static_cast<int>(response.status), duration_us, request.client_ip,
                correlation_id);
}

http::Response internal_error() {
    http::Response response;
    write_error(response, http::StatusCode::InternalServerError, "internal_error",
                "An unexpected error occurred.");
    return response;
}

/// Login handler body, shared by login() and queued logins
http::Response handle_login(auth::AuthPipeline& pipeline, const http::Request& request) {
    auto j = parse_object(request.body);
    if (!j) {
        return bad_request("Request body must be a JSON object");
    }

    bool type_error = false;
    auto email = optional_string(*j, "email", type_error);
    auto password = optional_string(*j, "password", type_error);
    auto code = optional_string(*j, "code", type_error);
    auto backup_code = optional_string(*j, "backup_code", type_error);
    if (type_error || !email || !password) {
        return bad_request("email and password are required strings");
    }

    auth::LoginRequest login_request{std::move(*email), std::move(*password), std::move(code),
                                     std::move(backup_code)};

    auth::LoginOutcome outcome;
    try {
        outcome = pipeline.login(login_request, request.client_ip);
    } catch (const std::exception& e) {
        // KDF or CSPRNG failure: no credential decision was made
        if (auto* logger = logging::get_logger()) {
            LOG_ERROR(logger, "Login failed with internal error: {}", e.what());
        }
        return internal_error();
    }

    http::Response response;
    switch (outcome.status) {
        case auth::LoginStatus::Success:
            response = session_response(outcome);
            break;
        case auth::LoginStatus::MfaRequired:
            response.status = http::StatusCode::OK;
            response.set_json_body(nlohmann::json{{"mfa_required", true}}.dump());
            break;
        case auth::LoginStatus::Rejected: {
            auto error = outcome.error.value_or(auth::AuthError::InvalidCredentials);
            if (error == auth::AuthError::RateLimited || error == auth::AuthError::Locked) {
                write_rate_limited(response, outcome.rate_limit);
                return response;
            }
            if (error == auth::AuthError::UserBanned) {
                write_banned(response);
            } else {
                write_invalid_credentials(response);
            }
            break;
        }
    }

    add_rate_limit_headers(response, outcome.rate_limit);
    return response;
}

}  // namespace

AuthRoutes::AuthRoutes(std::shared_ptr<auth::AuthPipeline> pipeline,
                       std::shared_ptr<core::WorkerPool> workers)
    : pipeline_(std::move(pipeline)), workers_(std::move(workers)) {
    if (!pipeline_ || !workers_) {
        throw std::invalid_argument("AuthRoutes requires a pipeline and a worker pool");
    }
}

bool AuthRoutes::handles(std::string_view path) noexcept {
    return path == kLoginPath || path == kRefreshPath || path == kLogoutPath;
}

std::future<http::Response> AuthRoutes::dispatch(http::Request request) {
    if (!handles(request.path)) {
        http::Response response;
        write_error(response, http::StatusCode::NotFound, "not_found", "Not found");
        return ready(std::move(response));
    }

    if (request.method != http::Method::POST) {
        http::Response response;
        write_error(response, http::StatusCode::MethodNotAllowed, "method_not_allowed",
                    "Use POST");
        response.set_header("Allow", "POST");
        return ready(std::move(response));
    }

    if (request.path == kLoginPath) {
        return login_async(std::move(request));
    }

    auto start = SteadyClock::now();
    auto response = request.path == kRefreshPath ? refresh(request) : logout(request);
    log_completed(request, response, start);
    return ready(std::move(response));
}

std::future<http::Response> AuthRoutes::login_async(http::Request request) {
    auto queued = workers_->try_submit(
        [pipeline = pipeline_, request = std::move(request), start = SteadyClock::now()]() {
            auto response = handle_login(*pipeline, request);
            log_completed(request, response, start);
            return response;
        });
    if (!queued) {
        if (auto* logger = logging::get_logger()) {
            LOG_WARNING(logger, "Login rejected: worker pool saturated (pending={})",
                        workers_->pending());
        }
        http::Response response;
        write_overloaded(response);
        return ready(std::move(response));
    }
    return std::move(*queued);
}

http::Response AuthRoutes::login(const http::Request& request) {
    return handle_login(*pipeline_, request);
}

http::Response AuthRoutes::refresh(const http::Request& request) {
    auto j = parse_object(request.body);
    if (!j) {
        return bad_request("Request body must be a JSON object");
    }

    bool type_error = false;
    auto token = optional_string(*j, "refresh_token", type_error);
    if (type_error || !token || token->empty()) {
        return bad_request("refresh_token is required");
    }

    auth::LoginOutcome outcome;
    try {
        outcome = pipeline_->refresh(*token);
    } catch (const std::exception& e) {
        if (auto* logger = logging::get_logger()) {
            LOG_ERROR(logger, "Refresh failed with internal error: {}", e.what());
        }
        return internal_error();
    }

    if (!outcome.succeeded()) {
        http::Response response;
        write_auth_failure(response, outcome.error.value_or(auth::AuthError::Malformed));
        return response;
    }
    return session_response(outcome);
}

http::Response AuthRoutes::logout(const http::Request& request) {
    std::optional<std::string> refresh_token;
    if (!request.body.empty()) {
        auto j = parse_object(request.body);
        if (!j) {
            return bad_request("Request body must be a JSON object");
        }
        bool type_error = false;
        refresh_token = optional_string(*j, "refresh_token", type_error);
        if (type_error) {
            return bad_request("refresh_token must be a string");
        }
    }

    std::optional<std::string_view> refresh_view;
    if (refresh_token) {
        refresh_view = *refresh_token;
    }

    auto outcome = pipeline_->logout(request.get_header("Authorization"), refresh_view);

    http::Response response;
    if (!outcome) {
        write_unauthorized(response);
        return response;
    }
    response.status = http::StatusCode::NoContent;
    return response;
}

}  // namespace bastion::gateway
