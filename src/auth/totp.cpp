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

// Bastion TOTP - Implementation

#include "totp.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

#include "../core/crypto.hpp"

namespace bastion::auth {

namespace {

// No 0/O, 1/I: codes are read off a screen and typed back
constexpr std::string_view kBackupAlphabet = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";
constexpr size_t kBackupGroupLength = 5;

/// RFC 4226 HOTP with dynamic truncation
std::string hotp(std::string_view key, uint64_t counter) {
    char message[8];
    for (int i = 7; i >= 0; --i) {
        message[i] = static_cast<char>(counter & 0xFF);
        counter >>= 8;
    }

    std::string mac = core::hmac_sha1(key, std::string_view(message, sizeof(message)));
    const auto* digest = reinterpret_cast<const unsigned char*>(mac.data());

    size_t offset = digest[mac.size() - 1] & 0x0F;
    uint32_t binary = (static_cast<uint32_t>(digest[offset] & 0x7F) << 24) |
                      (static_cast<uint32_t>(digest[offset + 1]) << 16) |
                      (static_cast<uint32_t>(digest[offset + 2]) << 8) |
                      static_cast<uint32_t>(digest[offset + 3]);

    return fmt::format("{:06}", binary % 1'000'000u);
}

bool is_six_digits(std::string_view code) noexcept {
    return code.size() == kTotpDigits &&
           std::all_of(code.begin(), code.end(), [](char c) { return c >= '0' && c <= '9'; });
}

int64_t time_step(int64_t unix_time) noexcept {
    // floor division (negative times never occur in practice, keep it exact anyway)
    int64_t step = unix_time / kTotpPeriodSeconds;
    if (unix_time < 0 && unix_time % kTotpPeriodSeconds != 0) {
        --step;
    }
    return step;
}

std::string percent_encode(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (unsigned char c : input) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '@') {
            out.push_back(static_cast<char>(c));
        } else {
            out += fmt::format("%{:02X}", c);
        }
    }
    return out;
}

}  // namespace

TotpVerifier::TotpVerifier(TotpConfig config, core::Clock clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
    // Widening the window multiplies brute-force exposure
    config_.drift_steps = std::min<uint32_t>(config_.drift_steps, 1);
}

bool TotpVerifier::verify(std::string_view base32_secret, std::string_view code) const {
    return verify_at(base32_secret, code, core::to_unix_seconds(clock_()));
}

bool TotpVerifier::verify_at(std::string_view base32_secret, std::string_view code,
                             int64_t unix_time) const {
    if (!is_six_digits(code)) {
        return false;
    }

    auto key = core::base32_decode(base32_secret);
    if (!key || key->empty()) {
        return false;
    }

    int64_t step = time_step(unix_time);
    int64_t drift = static_cast<int64_t>(config_.drift_steps);

    bool matched = false;
    for (int64_t offset = -drift; offset <= drift; ++offset) {
        int64_t counter = step + offset;
        if (counter < 0) {
            continue;
        }
        matched |= core::constant_time_equals(hotp(*key, static_cast<uint64_t>(counter)), code);
    }
    return matched;
}

std::optional<std::string> TotpVerifier::generate_code(std::string_view base32_secret,
                                                       int64_t unix_time) {
    auto key = core::base32_decode(base32_secret);
    if (!key || key->empty() || unix_time < 0) {
        return std::nullopt;
    }
    return hotp(*key, static_cast<uint64_t>(time_step(unix_time)));
}

std::string TotpVerifier::generate_secret() {
    return core::base32_encode(core::random_bytes(kTotpSecretBytes));
}

BackupCodeSet TotpVerifier::generate_backup_codes(size_t count) {
    BackupCodeSet set;
    set.plain_codes.reserve(count);
    set.hashed_codes.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        // 32-symbol alphabet: masking a random byte to 5 bits is unbiased
        std::string random = core::random_bytes(kBackupGroupLength * 2);
        std::string code;
        code.reserve(kBackupGroupLength * 2 + 1);
        for (size_t j = 0; j < random.size(); ++j) {
            if (j == kBackupGroupLength) {
                code.push_back('-');
            }
            code.push_back(kBackupAlphabet[static_cast<unsigned char>(random[j]) & 0x1F]);
        }

        set.hashed_codes.push_back(hash_backup_code(code));
        set.plain_codes.push_back(std::move(code));
    }

    return set;
}

std::optional<size_t> TotpVerifier::verify_backup_code(
    std::string_view code, const std::vector<std::string>& hashed_codes) {
    std::string normalized = normalize_backup_code(code);
    if (normalized.empty()) {
        return std::nullopt;
    }
    std::string candidate = core::sha256_hex(normalized);

    // Scan everything; position of the match must not show in timing
    std::optional<size_t> match;
    for (size_t i = 0; i < hashed_codes.size(); ++i) {
        bool equal = core::constant_time_equals(candidate, hashed_codes[i]);
        if (equal && !match) {
            match = i;
        }
    }
    return match;
}

std::string TotpVerifier::normalize_backup_code(std::string_view code) {
    std::string normalized;
    normalized.reserve(code.size());
    for (unsigned char c : code) {
        if (c == '-' || c == ' ' || c == '\t') {
            continue;
        }
        normalized.push_back(static_cast<char>(std::toupper(c)));
    }
    return normalized;
}

std::string TotpVerifier::hash_backup_code(std::string_view code) {
    return core::sha256_hex(normalize_backup_code(code));
}

std::string TotpVerifier::provisioning_uri(std::string_view base32_secret,
                                           std::string_view account) const {
    std::string issuer = percent_encode(config_.issuer);
    return fmt::format(
        "otpauth://totp/{}:{}?secret={}&issuer={}&algorithm=SHA1&digits={}&period={}", issuer,
        percent_encode(account), base32_secret, issuer, kTotpDigits, kTotpPeriodSeconds);
}

}  // namespace bastion::auth
