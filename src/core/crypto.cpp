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

// Bastion Crypto Primitives - Implementation

#include "crypto.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace bastion::core {

namespace {

constexpr std::string_view kBase32Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

bool is_base64url_char(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_';
}

int base32_value(char c) noexcept {
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a';
    }
    if (c >= '2' && c <= '7') {
        return c - '2' + 26;
    }
    return -1;
}

std::string hmac(const EVP_MD* md, std::string_view key, std::string_view message) {
    // HMAC() rejects a null key pointer even with zero length
    static const unsigned char empty_key = 0;
    const auto* key_ptr =
        key.empty() ? &empty_key : reinterpret_cast<const unsigned char*>(key.data());

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (HMAC(md, key_ptr, static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(message.data()), message.size(), digest,
             &digest_len) == nullptr) {
        throw std::runtime_error("HMAC computation failed");
    }

    return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

}  // namespace

// ============================================================================
// Base64url
// ============================================================================

std::string base64url_encode(std::string_view input) {
    if (input.empty()) {
        return "";
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new(BIO_s_mem());
    b64 = BIO_push(b64, bmem);
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);

    BIO_write(b64, input.data(), static_cast<int>(input.size()));
    BIO_flush(b64);

    BUF_MEM* bptr;
    BIO_get_mem_ptr(b64, &bptr);

    std::string result(bptr->data, bptr->length);
    BIO_free_all(b64);

    // '+' -> '-', '/' -> '_', strip '='
    std::replace(result.begin(), result.end(), '+', '-');
    std::replace(result.begin(), result.end(), '/', '_');
    result.erase(std::remove(result.begin(), result.end(), '='), result.end());

    return result;
}

std::optional<std::string> base64url_decode(std::string_view input) {
    if (input.empty()) {
        return std::string{};
    }

    // Unpadded URL-safe alphabet only ('=' is outside it)
    if (input.size() % 4 == 1) {
        return std::nullopt;
    }
    if (!std::all_of(input.begin(), input.end(), is_base64url_char)) {
        return std::nullopt;
    }

    std::string base64(input);
    std::replace(base64.begin(), base64.end(), '-', '+');
    std::replace(base64.begin(), base64.end(), '_', '/');

    size_t padding = (4 - (base64.size() % 4)) % 4;
    base64.append(padding, '=');

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new_mem_buf(base64.data(), static_cast<int>(base64.size()));
    bmem = BIO_push(b64, bmem);
    BIO_set_flags(bmem, BIO_FLAGS_BASE64_NO_NL);

    std::vector<char> buffer(base64.size());
    int decoded_size = BIO_read(bmem, buffer.data(), static_cast<int>(buffer.size()));
    BIO_free_all(bmem);

    if (decoded_size < 0) {
        return std::nullopt;
    }

    std::string decoded(buffer.data(), static_cast<size_t>(decoded_size));

    // Canonical form only: unused low bits of the last character must be zero,
    // so every byte string has exactly one accepted spelling
    if (base64url_encode(decoded) != input) {
        return std::nullopt;
    }
    return decoded;
}

// ============================================================================
// Base32
// ============================================================================

std::string base32_encode(std::string_view input) {
    std::string result;
    result.reserve((input.size() * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;

    for (unsigned char byte : input) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            result.push_back(kBase32Alphabet[(buffer >> (bits - 5)) & 0x1F]);
            bits -= 5;
        }
    }

    if (bits > 0) {
        result.push_back(kBase32Alphabet[(buffer << (5 - bits)) & 0x1F]);
    }

    return result;
}

std::optional<std::string> base32_decode(std::string_view input) {
    std::string result;
    result.reserve(input.size() * 5 / 8);

    uint32_t buffer = 0;
    int bits = 0;
    size_t symbols = 0;

    for (char c : input) {
        if (c == '=' || c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            continue;
        }

        int value = base32_value(c);
        if (value < 0) {
            return std::nullopt;
        }

        buffer = (buffer << 5) | static_cast<uint32_t>(value);
        bits += 5;
        ++symbols;

        if (bits >= 8) {
            result.push_back(static_cast<char>((buffer >> (bits - 8)) & 0xFF));
            bits -= 8;
        }
    }

    if (symbols == 0) {
        return std::nullopt;
    }

    return result;
}

std::string to_hex(std::string_view bytes) {
    static constexpr char kHex[] = "0123456789abcdef";

    std::string result;
    result.reserve(bytes.size() * 2);
    for (unsigned char byte : bytes) {
        result.push_back(kHex[byte >> 4]);
        result.push_back(kHex[byte & 0x0F]);
    }
    return result;
}

// ============================================================================
// Digests
// ============================================================================

std::string hmac_sha256(std::string_view key, std::string_view message) {
    return hmac(EVP_sha256(), key, message);
}

std::string hmac_sha1(std::string_view key, std::string_view message) {
    return hmac(EVP_sha1(), key, message);
}

std::string sha256(std::string_view data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
    return std::string(reinterpret_cast<const char*>(digest), SHA256_DIGEST_LENGTH);
}

std::string sha256_hex(std::string_view data) {
    return to_hex(sha256(data));
}

// ============================================================================
// Randomness
// ============================================================================

std::string random_bytes(size_t count) {
    std::string result(count, '\0');
    if (count == 0) {
        return result;
    }

    if (RAND_bytes(reinterpret_cast<unsigned char*>(result.data()), static_cast<int>(count)) !=
        1) {
        throw std::runtime_error("CSPRNG failure (RAND_bytes)");
    }
    return result;
}

std::string random_hex(size_t count) {
    return to_hex(random_bytes(count));
}

// ============================================================================
// Comparison
// ============================================================================

bool constant_time_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }

    unsigned char diff = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        diff |= static_cast<unsigned char>(a[i]) ^ static_cast<unsigned char>(b[i]);
    }
    return diff == 0;
}

}  // namespace bastion::core
