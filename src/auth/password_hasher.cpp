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

// Bastion Password Hasher - Implementation

#include "password_hasher.hpp"

#include <cctype>
#include <memory>
#include <stdexcept>
#include <vector>

#include <argon2.h>
#include <crypt.h>

#include "../core/crypto.hpp"
#include "../core/logging.hpp"
#include "auth_error.hpp"

namespace bastion::auth {

namespace {

constexpr std::string_view kArgon2idPrefix = "$argon2id$";
constexpr std::string_view kDummyPassword = "bastion-dummy-password-placeholder";

/// Argon2id cost parameters encoded in "$argon2id$v=19$m=65536,t=3,p=4$..."
struct Argon2Params {
    uint32_t memory_kib = 0;
    uint32_t iterations = 0;
    uint32_t parallelism = 0;
};

std::optional<uint32_t> parse_param(std::string_view field, char key) {
    if (field.size() < 3 || field[0] != key || field[1] != '=') {
        return std::nullopt;
    }
    uint64_t value = 0;
    for (char c : field.substr(2)) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<uint64_t>(c - '0');
        if (value > UINT32_MAX) {
            return std::nullopt;
        }
    }
    return static_cast<uint32_t>(value);
}

std::optional<Argon2Params> parse_argon2_params(std::string_view hash) {
    // Skip "$argon2id$" and the "v=19$" version segment
    std::string_view rest = hash.substr(kArgon2idPrefix.size());
    auto version_end = rest.find('$');
    if (version_end == std::string_view::npos) {
        return std::nullopt;
    }
    rest = rest.substr(version_end + 1);

    auto params_end = rest.find('$');
    if (params_end == std::string_view::npos) {
        return std::nullopt;
    }
    std::string_view params = rest.substr(0, params_end);

    auto first = params.find(',');
    if (first == std::string_view::npos) {
        return std::nullopt;
    }
    auto second = params.find(',', first + 1);
    if (second == std::string_view::npos) {
        return std::nullopt;
    }

    auto m = parse_param(params.substr(0, first), 'm');
    auto t = parse_param(params.substr(first + 1, second - first - 1), 't');
    auto p = parse_param(params.substr(second + 1), 'p');
    if (!m || !t || !p) {
        return std::nullopt;
    }
    return Argon2Params{*m, *t, *p};
}

bool is_symbol(unsigned char c) noexcept {
    return std::ispunct(c) || c == ' ' || c >= 0x80;
}

}  // namespace

// ============================================================================
// Format detection
// ============================================================================

std::optional<HashFormat> detect_format(std::string_view hash) noexcept {
    if (hash.starts_with(kArgon2idPrefix)) {
        return HashFormat::Argon2id;
    }
    if (hash.starts_with("$2b$") || hash.starts_with("$2y$") || hash.starts_with("$2a$") ||
        hash.starts_with("$2x$")) {
        return HashFormat::Bcrypt;
    }
    return std::nullopt;
}

std::string normalize_bcrypt_prefix(std::string_view hash) {
    std::string normalized(hash);
    if (normalized.size() >= 4 && normalized[0] == '$' && normalized[1] == '2' &&
        normalized[3] == '$' &&
        (normalized[2] == 'y' || normalized[2] == 'a' || normalized[2] == 'x')) {
        normalized[2] = 'b';
    }
    return normalized;
}

// ============================================================================
// PasswordHasher
// ============================================================================

PasswordHasher::PasswordHasher(PasswordHasherConfig config) : config_(std::move(config)) {}

std::string PasswordHasher::hash(std::string_view password) const {
    std::string salt = core::random_bytes(config_.salt_length);

    size_t encoded_len =
        argon2_encodedlen(config_.iterations, config_.memory_kib, config_.parallelism,
                          config_.salt_length, config_.hash_length, Argon2_id);
    std::vector<char> encoded(encoded_len);

    int rc = argon2id_hash_encoded(config_.iterations, config_.memory_kib, config_.parallelism,
                                   password.data(), password.size(), salt.data(), salt.size(),
                                   config_.hash_length, encoded.data(), encoded.size());
    if (rc != ARGON2_OK) {
        throw std::runtime_error(std::string("argon2id hashing failed: ") +
                                 argon2_error_message(rc));
    }

    return std::string(encoded.data());
}

bool PasswordHasher::verify(std::string_view password, std::string_view stored_hash) const {
    auto format = detect_format(stored_hash);
    if (!format) {
        throw UnknownHashFormatError("unrecognized password hash format");
    }

    switch (*format) {
        case HashFormat::Argon2id:
            return verify_argon2id(password, stored_hash);
        case HashFormat::Bcrypt:
            return verify_bcrypt(password, stored_hash);
    }
    throw UnknownHashFormatError("unhandled password hash format");
}

bool PasswordHasher::verify_argon2id(std::string_view password, std::string_view stored) const {
    // argon2id_verify needs a NUL-terminated encoded string
    std::string encoded(stored);
    int rc = argon2id_verify(encoded.c_str(), password.data(), password.size());

    switch (rc) {
        case ARGON2_OK:
            return true;
        case ARGON2_VERIFY_MISMATCH:
            return false;
        case ARGON2_MEMORY_ALLOCATION_ERROR:
        case ARGON2_THREAD_FAIL:
            throw std::runtime_error(std::string("argon2id verification failed: ") +
                                     argon2_error_message(rc));
        default:
            if (auto* logger = logging::get_logger()) {
                LOG_ERROR(logger, "Stored argon2id hash rejected by decoder: error={}",
                          argon2_error_message(rc));
            }
            return false;
    }
}

bool PasswordHasher::verify_bcrypt(std::string_view password, std::string_view stored) const {
    std::string setting = normalize_bcrypt_prefix(stored);
    std::string phrase(password);

    // crypt_data is ~32KB, keep it off the stack
    auto data = std::make_unique<crypt_data>();
    const char* computed =
        crypt_rn(phrase.c_str(), setting.c_str(), data.get(), static_cast<int>(sizeof(crypt_data)));
    if (computed == nullptr) {
        if (auto* logger = logging::get_logger()) {
            LOG_ERROR(logger, "Stored bcrypt hash rejected by crypt_rn");
        }
        return false;
    }

    return core::constant_time_equals(computed, setting);
}

void PasswordHasher::hash_dummy() const {
    [[maybe_unused]] auto discarded = hash(kDummyPassword);
}

std::optional<std::string> PasswordHasher::validate_strength(std::string_view password) const {
    if (password.size() < config_.min_length) {
        return "Password must be at least " + std::to_string(config_.min_length) +
               " characters";
    }
    if (password.size() > config_.max_length) {
        return "Password must be at most " + std::to_string(config_.max_length) + " characters";
    }

    bool has_lower = false;
    bool has_upper = false;
    bool has_digit = false;
    bool has_symbol = false;
    for (unsigned char c : password) {
        if (std::islower(c)) {
            has_lower = true;
        } else if (std::isupper(c)) {
            has_upper = true;
        } else if (std::isdigit(c)) {
            has_digit = true;
        } else if (is_symbol(c)) {
            has_symbol = true;
        }
    }

    uint32_t classes = static_cast<uint32_t>(has_lower) + static_cast<uint32_t>(has_upper) +
                       static_cast<uint32_t>(has_digit) + static_cast<uint32_t>(has_symbol);
    if (classes < config_.min_character_classes) {
        return "Password must mix at least " + std::to_string(config_.min_character_classes) +
               " of: lowercase, uppercase, digits, symbols";
    }

    return std::nullopt;
}

PasswordHashResult PasswordHasher::hash_new_password(std::string_view password) const {
    if (auto violation = validate_strength(password)) {
        return PasswordHashResult::failure(std::move(*violation));
    }
    return PasswordHashResult::success(hash(password));
}

bool PasswordHasher::needs_rehash(std::string_view stored_hash) const noexcept {
    auto format = detect_format(stored_hash);
    if (!format || *format == HashFormat::Bcrypt) {
        return true;
    }

    auto params = parse_argon2_params(stored_hash);
    if (!params) {
        return true;
    }
    return params->memory_kib != config_.memory_kib || params->iterations != config_.iterations ||
           params->parallelism != config_.parallelism;
}

}  // namespace bastion::auth
