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

// Bastion Crypto Primitives - Header
// Encodings (base64url, base32), HMAC/SHA digests, CSPRNG and constant-time compare

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace bastion::core {

// ============================================================================
// Encodings
// ============================================================================

/// Base64url encode without padding (RFC 4648 §5)
[[nodiscard]] std::string base64url_encode(std::string_view input);

/// Base64url decode (canonical, unpadded)
/// Returns nullopt on '=', characters outside the URL-safe alphabet, or non-zero
/// trailing bits; an accepted string is always base64url_encode() of its result
[[nodiscard]] std::optional<std::string> base64url_decode(std::string_view input);

/// Base32 encode without padding (RFC 4648 §6)
[[nodiscard]] std::string base32_encode(std::string_view input);

/// Base32 decode (case-insensitive, '=' padding and whitespace ignored)
/// Returns nullopt on invalid characters or empty input
[[nodiscard]] std::optional<std::string> base32_decode(std::string_view input);

/// Lowercase hex encoding
[[nodiscard]] std::string to_hex(std::string_view bytes);

// ============================================================================
// Digests
// ============================================================================

/// HMAC-SHA256 (32 raw bytes)
[[nodiscard]] std::string hmac_sha256(std::string_view key, std::string_view message);

/// HMAC-SHA1 (20 raw bytes), used by TOTP
[[nodiscard]] std::string hmac_sha1(std::string_view key, std::string_view message);

/// SHA-256 (32 raw bytes)
[[nodiscard]] std::string sha256(std::string_view data);

/// SHA-256 as lowercase hex (64 chars)
[[nodiscard]] std::string sha256_hex(std::string_view data);

// ============================================================================
// Randomness
// ============================================================================

/// Cryptographically secure random bytes (OpenSSL RAND_bytes)
/// Throws std::runtime_error if the CSPRNG fails
[[nodiscard]] std::string random_bytes(size_t count);

/// Random bytes rendered as lowercase hex (2 * count chars)
[[nodiscard]] std::string random_hex(size_t count);

// ============================================================================
// Comparison
// ============================================================================

/// Constant-time equality
/// Length is checked first; equal-length inputs are XOR-accumulated over every
/// byte with no early return, so timing does not depend on the first mismatch.
[[nodiscard]] bool constant_time_equals(std::string_view a, std::string_view b) noexcept;

}  // namespace bastion::core
