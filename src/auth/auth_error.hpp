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

// Bastion Auth Errors - Internal failure taxonomy
// Reason codes are for logs only; the HTTP boundary collapses them (see gateway).

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace bastion::auth {

enum class AuthError : uint8_t {
    Malformed,
    InvalidSignature,
    Expired,
    IssuerMismatch,
    AudienceMismatch,
    WrongTokenType,
    Revoked,
    UnknownHashFormat,
    InvalidCredentials,
    UserNotFound,
    UserBanned,
    RateLimited,
    Locked,
    MfaRequired,
    MfaInvalid,
    WeakPassword
};

/// Stable snake_case reason code
[[nodiscard]] std::string_view to_string(AuthError error) noexcept;

/// Stored credential carries a format tag we cannot verify
class UnknownHashFormatError : public std::runtime_error {
public:
    explicit UnknownHashFormatError(const std::string& what) : std::runtime_error(what) {}
};

/// Rate-limit backing store cannot be reached
class RateLimitStoreUnavailable : public std::runtime_error {
public:
    explicit RateLimitStoreUnavailable(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace bastion::auth
