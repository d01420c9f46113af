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

// Bastion - Operator CLI
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "auth/auth_error.hpp"
#include "auth/password_hasher.hpp"
#include "auth/token_codec.hpp"
#include "auth/totp.hpp"
#include "control/config.hpp"
#include "core/clock.hpp"
#include "core/logging.hpp"
#include "gateway/factory.hpp"
#include "runtime/maintenance.hpp"

namespace {

using Args = std::vector<std::string>;

void print_usage(const char* program) {
    fprintf(stderr,
            "Usage: %s --config <config.json> <command> [args]\n\n"
            "Commands:\n"
            "  hash-password                        Hash a password read from stdin\n"
            "  verify-password <hash>               Check a password read from stdin\n"
            "  issue-token <sub> <email> <role> [access|refresh]\n"
            "  verify-token <token> [access|refresh]\n"
            "  totp-secret <account>                New TOTP secret and provisioning URI\n"
            "  totp-code <secret>                   Current TOTP code for a secret\n"
            "  backup-codes [n]                     Generate backup codes\n"
            "  sweep                                Run one maintenance pass\n",
            program);
}

std::string read_stdin_line() {
    std::string line;
    std::getline(std::cin, line);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

int cmd_hash_password(const bastion::control::Config& config) {
    auto hasher = bastion::gateway::build_password_hasher(config);
    auto result = hasher->hash_new_password(read_stdin_line());
    if (!result) {
        fprintf(stderr, "Rejected: %s\n", result.error.c_str());
        return EXIT_FAILURE;
    }
    printf("%s\n", result.hash.c_str());
    return EXIT_SUCCESS;
}

int cmd_verify_password(const bastion::control::Config& config, const Args& args) {
    if (args.empty()) {
        fprintf(stderr, "verify-password requires <hash>\n");
        return EXIT_FAILURE;
    }

    auto hasher = bastion::gateway::build_password_hasher(config);
    bool ok = false;
    try {
        ok = hasher->verify(read_stdin_line(), args[0]);
    } catch (const bastion::auth::UnknownHashFormatError& e) {
        fprintf(stderr, "Unknown hash format: %s\n", e.what());
        return EXIT_FAILURE;
    }

    printf("%s\n", ok ? "valid" : "invalid");
    if (ok && hasher->needs_rehash(args[0])) {
        printf("needs_rehash\n");
    }
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}

int cmd_issue_token(const bastion::control::Config& config, const Args& args) {
    if (args.size() < 3) {
        fprintf(stderr, "issue-token requires <subject> <email> <role>\n");
        return EXIT_FAILURE;
    }

    auto type = bastion::auth::TokenType::Access;
    if (args.size() > 3) {
        auto parsed = bastion::auth::parse_token_type(args[3]);
        if (!parsed) {
            fprintf(stderr, "Unknown token type: %s\n", args[3].c_str());
            return EXIT_FAILURE;
        }
        type = *parsed;
    }

    auto codec = bastion::gateway::build_token_codec(config);
    auto ttl = type == bastion::auth::TokenType::Access ? codec->config().access_ttl
                                                        : codec->config().refresh_ttl;
    printf("%s\n", codec->issue(args[0], {args[1], args[2]}, ttl, type).c_str());
    return EXIT_SUCCESS;
}

int cmd_verify_token(const bastion::control::Config& config, const Args& args) {
    if (args.empty()) {
        fprintf(stderr, "verify-token requires <token>\n");
        return EXIT_FAILURE;
    }

    auto type = bastion::auth::TokenType::Access;
    if (args.size() > 1) {
        auto parsed = bastion::auth::parse_token_type(args[1]);
        if (!parsed) {
            fprintf(stderr, "Unknown token type: %s\n", args[1].c_str());
            return EXIT_FAILURE;
        }
        type = *parsed;
    }

    auto codec = bastion::gateway::build_token_codec(config);
    auto result = codec->verify(args[0], type);
    if (!result) {
        printf("invalid: %s\n", std::string(bastion::auth::to_string(result.error)).c_str());
        return EXIT_FAILURE;
    }

    const auto& c = result.claims;
    nlohmann::json claims = {{"sub", c.sub},
                             {"email", c.email},
                             {"role", c.role},
                             {"iat", c.iat},
                             {"exp", c.exp},
                             {"iss", c.iss},
                             {"aud", c.aud},
                             {"token_type", bastion::auth::to_string(c.token_type)},
                             {"jti", c.jti}};
    printf("%s\n", claims.dump(2).c_str());
    return EXIT_SUCCESS;
}

int cmd_totp_secret(const bastion::control::Config& config, const Args& args) {
    if (args.empty()) {
        fprintf(stderr, "totp-secret requires <account>\n");
        return EXIT_FAILURE;
    }

    auto totp = bastion::gateway::build_totp_verifier(config);
    auto secret = bastion::auth::TotpVerifier::generate_secret();
    printf("secret: %s\n", secret.c_str());
    printf("uri:    %s\n", totp->provisioning_uri(secret, args[0]).c_str());
    return EXIT_SUCCESS;
}

int cmd_totp_code(const Args& args) {
    if (args.empty()) {
        fprintf(stderr, "totp-code requires <secret>\n");
        return EXIT_FAILURE;
    }

    auto now = bastion::core::to_unix_seconds(bastion::core::system_clock()());
    auto code = bastion::auth::TotpVerifier::generate_code(args[0], now);
    if (!code) {
        fprintf(stderr, "Secret is not valid base32\n");
        return EXIT_FAILURE;
    }
    printf("%s\n", code->c_str());
    return EXIT_SUCCESS;
}

int cmd_backup_codes(const bastion::control::Config& config, const Args& args) {
    size_t count = config.mfa.backup_code_count;
    if (!args.empty()) {
        try {
            count = std::stoul(args[0]);
        } catch (const std::exception&) {
            fprintf(stderr, "Invalid count: %s\n", args[0].c_str());
            return EXIT_FAILURE;
        }
    }
    if (count == 0 || count > 100) {
        fprintf(stderr, "Count must be between 1 and 100\n");
        return EXIT_FAILURE;
    }

    auto codes = bastion::auth::TotpVerifier::generate_backup_codes(count);
    printf("Plaintext codes (show once):\n");
    for (const auto& code : codes.plain_codes) {
        printf("  %s\n", code.c_str());
    }
    printf("Stored hashes:\n");
    for (const auto& hash : codes.hashed_codes) {
        printf("  %s\n", hash.c_str());
    }
    return EXIT_SUCCESS;
}

int cmd_sweep(const bastion::control::Config& config) {
    auto revocations = std::make_shared<bastion::auth::RevocationStore>();
    auto limiter = bastion::gateway::build_rate_limiter(config);
    bastion::runtime::Maintenance maintenance(
        revocations, limiter, std::chrono::seconds(config.revocation.sweep_interval_seconds));

    auto stats = maintenance.run_once();
    printf("revocations_removed=%zu rate_limits_removed=%zu\n", stats.revocations_removed,
           stats.rate_limits_removed);
    return EXIT_SUCCESS;
}

int run_command(const bastion::control::Config& config, const std::string& command,
                const Args& args) {
    if (command == "hash-password") {
        return cmd_hash_password(config);
    }
    if (command == "verify-password") {
        return cmd_verify_password(config, args);
    }
    if (command == "issue-token") {
        return cmd_issue_token(config, args);
    }
    if (command == "verify-token") {
        return cmd_verify_token(config, args);
    }
    if (command == "totp-secret") {
        return cmd_totp_secret(config, args);
    }
    if (command == "totp-code") {
        return cmd_totp_code(args);
    }
    if (command == "backup-codes") {
        return cmd_backup_codes(config, args);
    }
    if (command == "sweep") {
        return cmd_sweep(config);
    }
    fprintf(stderr, "Unknown command: %s\n", command.c_str());
    return EXIT_FAILURE;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 4 || std::string(argv[1]) != "--config") {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    std::string config_path = argv[2];
    std::string command = argv[3];
    Args args(argv + 4, argv + argc);

    bastion::control::ConfigManager config_manager;
    if (!config_manager.load(config_path)) {
        fprintf(stderr, "Failed to load configuration from %s\n", config_path.c_str());

        const auto& validation = config_manager.last_validation();
        if (!validation.errors.empty()) {
            fprintf(stderr, "Configuration validation errors:\n");
            for (const auto& error : validation.errors) {
                fprintf(stderr, "  - %s\n", error.c_str());
            }
        }
        return EXIT_FAILURE;
    }

    const auto& validation = config_manager.last_validation();
    for (const auto& warning : validation.warnings) {
        fprintf(stderr, "Warning: %s\n", warning.c_str());
    }

    auto config_ptr = config_manager.get();
    const bastion::control::Config& config = *config_ptr;

    bastion::logging::init_logging_system();
    try {
        bastion::logging::init_logger(config.logging);
    } catch (const std::filesystem::filesystem_error& e) {
        fprintf(stderr, "Failed to open log output '%s': %s\n", config.logging.output.c_str(),
                e.what());
        bastion::logging::shutdown_logging();
        return EXIT_FAILURE;
    }

    int rc = EXIT_FAILURE;
    try {
        rc = run_command(config, command, args);
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        if (auto* logger = bastion::logging::get_logger()) {
            LOG_ERROR(logger, "Command '{}' failed: {}", command, e.what());
        }
    }

    bastion::logging::shutdown_logging();
    return rc;
}
