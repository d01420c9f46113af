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

// Bastion HTTP Types - Header
// Transport-neutral request/response values handed to the auth middleware and routes.
// Bastion does not own a listener; the embedding server converts to and from these.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bastion::http {

/// HTTP methods
enum class Method : uint8_t { GET, POST, PUT, DELETE, HEAD, OPTIONS, PATCH, UNKNOWN };

/// HTTP status codes used by the auth surface
enum class StatusCode : uint16_t {
    // 2xx Success
    OK = 200,
    NoContent = 204,

    // 4xx Client Error
    BadRequest = 400,
    Unauthorized = 401,
    Forbidden = 403,
    NotFound = 404,
    MethodNotAllowed = 405,
    TooManyRequests = 429,

    // 5xx Server Error
    InternalServerError = 500,
    ServiceUnavailable = 503,
};

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/// HTTP request (owned strings; outlives the connection buffer)
struct Request {
    Method method = Method::UNKNOWN;
    std::string path;
    HeaderList headers;
    std::string body;
    std::string client_ip;

    // Helper: Get header value or default (case-insensitive name)
    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    // Helper: Check if header exists
    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    void add_header(std::string_view name, std::string_view value);
};

/// HTTP response
struct Response {
    StatusCode status = StatusCode::OK;
    HeaderList headers;
    std::string body;

    [[nodiscard]] std::string_view get_header(std::string_view name,
                                              std::string_view default_value = {}) const noexcept;

    [[nodiscard]] bool has_header(std::string_view name) const noexcept;

    // Appends; repeated names are kept
    void add_header(std::string_view name, std::string_view value);

    // Replaces an existing header (case-insensitive) or appends
    void set_header(std::string_view name, std::string_view value);

    // Sets body and Content-Type: application/json
    void set_json_body(std::string json);
};

// Conversion functions

/// Convert Method to string
[[nodiscard]] std::string_view to_string(Method method) noexcept;

/// Convert string to Method
[[nodiscard]] Method parse_method(std::string_view str) noexcept;

/// Convert StatusCode to reason phrase
[[nodiscard]] std::string_view to_reason_phrase(StatusCode code) noexcept;

/// Case-insensitive header name comparison
[[nodiscard]] bool header_name_equals(std::string_view a, std::string_view b) noexcept;

}  // namespace bastion::http
