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

// Bastion TOTP - Header
// RFC 6238 time-based one-time passwords (HMAC-SHA1, 6 digits, 30s step)
// plus single-use backup codes

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../core/clock.hpp"

namespace bastion::auth {

inline constexpr uint32_t kTotpDigits = 6;
inline constexpr int64_t kTotpPeriodSeconds = 30;
inline constexpr size_t kTotpSecretBytes = 20;  // 160 bits

struct TotpConfig {
    uint32_t drift_steps = 1;         // Accepted steps either side of now (max 1)
    size_t backup_code_count = 10;
    std::string issuer = "Bastion";   // Shown by authenticator apps
};

/// Backup codes: plaintext shown once, hashes stored
struct BackupCodeSet {
    std::vector<std::string> plain_codes;   // XXXXX-XXXXX
    std::vector<std::string> hashed_codes;  // hex SHA-256 of the normalized code
};

class TotpVerifier {
public:
    explicit TotpVerifier(TotpConfig config = {}, core::Clock clock = core::system_clock());

    /// Verify a code against the current time
    [[nodiscard]] bool verify(std::string_view base32_secret, std::string_view code) const;

    /// Verify a code at a fixed Unix time
    /// Rejects anything but exactly 6 ASCII digits before touching the secret.
    /// Every step in the drift window is evaluated; no early exit on match.
    [[nodiscard]] bool verify_at(std::string_view base32_secret, std::string_view code,
                                 int64_t unix_time) const;

    /// Code for the step containing unix_time (nullopt if the secret does not decode)
    [[nodiscard]] static std::optional<std::string> generate_code(std::string_view base32_secret,
                                                                  int64_t unix_time);

    /// 160-bit random secret, base32 encoded (32 chars)
    [[nodiscard]] static std::string generate_secret();

    /// n random codes; plaintext returned once for display
    [[nodiscard]] static BackupCodeSet generate_backup_codes(size_t count);

    /// Index of the matching stored hash, scanning all entries in constant time
    /// Consuming the matched code is the caller's job.
    [[nodiscard]] static std::optional<size_t> verify_backup_code(
        std::string_view code, const std::vector<std::string>& hashed_codes);

    /// Strip separators/whitespace and uppercase
    [[nodiscard]] static std::string normalize_backup_code(std::string_view code);

    /// Stored form of a backup code
    [[nodiscard]] static std::string hash_backup_code(std::string_view code);

    /// otpauth:// URI for QR enrollment
    [[nodiscard]] std::string provisioning_uri(std::string_view base32_secret,
                                               std::string_view account) const;

    [[nodiscard]] const TotpConfig& config() const noexcept { return config_; }

private:
    TotpConfig config_;
    core::Clock clock_;
};

}  // namespace bastion::auth
