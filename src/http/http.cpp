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

// Bastion HTTP Types - Implementation

#include "http.hpp"

#include <algorithm>
#include <cctype>

namespace bastion::http {

namespace {

const std::pair<std::string, std::string>* find_in(const HeaderList& headers,
                                                   std::string_view name) noexcept {
    for (const auto& header : headers) {
        if (header_name_equals(header.first, name)) {
            return &header;
        }
    }
    return nullptr;
}

}  // namespace

// Request implementation

std::string_view Request::get_header(std::string_view name,
                                     std::string_view default_value) const noexcept {
    const auto* header = find_in(headers, name);
    return header ? std::string_view(header->second) : default_value;
}

bool Request::has_header(std::string_view name) const noexcept {
    return find_in(headers, name) != nullptr;
}

void Request::add_header(std::string_view name, std::string_view value) {
    headers.emplace_back(std::string(name), std::string(value));
}

// Response implementation

std::string_view Response::get_header(std::string_view name,
                                      std::string_view default_value) const noexcept {
    const auto* header = find_in(headers, name);
    return header ? std::string_view(header->second) : default_value;
}

bool Response::has_header(std::string_view name) const noexcept {
    return find_in(headers, name) != nullptr;
}

void Response::add_header(std::string_view name, std::string_view value) {
    headers.emplace_back(std::string(name), std::string(value));
}

void Response::set_header(std::string_view name, std::string_view value) {
    for (auto& header : headers) {
        if (header_name_equals(header.first, name)) {
            header.second = value;
            return;
        }
    }
    add_header(name, value);
}

void Response::set_json_body(std::string json) {
    body = std::move(json);
    set_header("Content-Type", "application/json");
}

// Conversion functions

std::string_view to_string(Method method) noexcept {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        case Method::PUT:
            return "PUT";
        case Method::DELETE:
            return "DELETE";
        case Method::HEAD:
            return "HEAD";
        case Method::OPTIONS:
            return "OPTIONS";
        case Method::PATCH:
            return "PATCH";
        case Method::UNKNOWN:
            return "UNKNOWN";
    }
    return "UNKNOWN";
}

Method parse_method(std::string_view str) noexcept {
    if (str == "GET")
        return Method::GET;
    if (str == "POST")
        return Method::POST;
    if (str == "PUT")
        return Method::PUT;
    if (str == "DELETE")
        return Method::DELETE;
    if (str == "HEAD")
        return Method::HEAD;
    if (str == "OPTIONS")
        return Method::OPTIONS;
    if (str == "PATCH")
        return Method::PATCH;
    return Method::UNKNOWN;
}

std::string_view to_reason_phrase(StatusCode code) noexcept {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::NoContent:
            return "No Content";
        case StatusCode::BadRequest:
            return "Bad Request";
        case StatusCode::Unauthorized:
            return "Unauthorized";
        case StatusCode::Forbidden:
            return "Forbidden";
        case StatusCode::NotFound:
            return "Not Found";
        case StatusCode::MethodNotAllowed:
            return "Method Not Allowed";
        case StatusCode::TooManyRequests:
            return "Too Many Requests";
        case StatusCode::InternalServerError:
            return "Internal Server Error";
        case StatusCode::ServiceUnavailable:
            return "Service Unavailable";
    }
    return "Unknown";
}

bool header_name_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    return std::equal(a.begin(), a.end(), b.begin(), [](char ca, char cb) {
        return std::tolower(static_cast<unsigned char>(ca)) ==
               std::tolower(static_cast<unsigned char>(cb));
    });
}

}  // namespace bastion::http
