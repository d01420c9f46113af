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

#include "auth_error.hpp"

namespace bastion::auth {

std::string_view to_string(AuthError error) noexcept {
    switch (error) {
        case AuthError::Malformed:
            return "malformed";
        case AuthError::InvalidSignature:
            return "invalid_signature";
        case AuthError::Expired:
            return "expired";
        case AuthError::IssuerMismatch:
            return "issuer_mismatch";
        case AuthError::AudienceMismatch:
            return "audience_mismatch";
        case AuthError::WrongTokenType:
            return "wrong_token_type";
        case AuthError::Revoked:
            return "revoked";
        case AuthError::UnknownHashFormat:
            return "unknown_hash_format";
        case AuthError::InvalidCredentials:
            return "invalid_credentials";
        case AuthError::UserNotFound:
            return "user_not_found";
        case AuthError::UserBanned:
            return "user_banned";
        case AuthError::RateLimited:
            return "rate_limited";
        case AuthError::Locked:
            return "locked";
        case AuthError::MfaRequired:
            return "mfa_required";
        case AuthError::MfaInvalid:
            return "mfa_invalid";
        case AuthError::WeakPassword:
            return "weak_password";
    }
    return "unknown";
}

}  // namespace bastion::auth
