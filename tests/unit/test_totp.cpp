// Bastion TOTP and Backup Code Tests

#include <catch2/catch_test_macros.hpp>
#include <cctype>
#include <set>
#include <string>

#include "../../src/auth/totp.hpp"
#include "../../src/core/clock.hpp"

using namespace bastion;
using namespace bastion::auth;

namespace {

// base32("12345678901234567890"), the RFC 6238 SHA-1 seed
constexpr const char* kRfcSecret = "GEZDGNBVGY3TQOJQGEZDGNBVGY3TQOJQ";
constexpr const char* kAppSecret = "JBSWY3DPEHPK3PXP";
constexpr int64_t kNow = 1'700'000'000;

}  // namespace

TEST_CASE("TOTP - RFC 6238 vectors", "[totp]") {
    REQUIRE(TotpVerifier::generate_code(kRfcSecret, 59) == std::optional<std::string>("287082"));
    REQUIRE(TotpVerifier::generate_code(kRfcSecret, 1111111109) ==
            std::optional<std::string>("081804"));
    REQUIRE(TotpVerifier::generate_code(kAppSecret, kNow) ==
            std::optional<std::string>("324550"));

    SECTION("Invalid secret yields no code") {
        REQUIRE_FALSE(TotpVerifier::generate_code("not base32!", kNow).has_value());
        REQUIRE_FALSE(TotpVerifier::generate_code("", kNow).has_value());
    }
}

TEST_CASE("TOTP - verification window", "[totp][drift]") {
    TotpVerifier verifier;
    auto code = *TotpVerifier::generate_code(kAppSecret, kNow);

    SECTION("Current step and one step either side accepted") {
        REQUIRE(verifier.verify_at(kAppSecret, code, kNow));
        REQUIRE(verifier.verify_at(kAppSecret, code, kNow + 30));
        REQUIRE(verifier.verify_at(kAppSecret, code, kNow - 30));
    }

    SECTION("Two steps away rejected") {
        REQUIRE_FALSE(verifier.verify_at(kAppSecret, code, kNow + 61));
        REQUIRE_FALSE(verifier.verify_at(kAppSecret, code, kNow - 61));
    }

    SECTION("Drift is capped at one step") {
        TotpConfig config;
        config.drift_steps = 5;
        TotpVerifier wide(config);
        REQUIRE(wide.config().drift_steps == 1);
        REQUIRE_FALSE(wide.verify_at(kAppSecret, code, kNow + 61));
    }

    SECTION("Zero drift accepts only the current step") {
        TotpConfig config;
        config.drift_steps = 0;
        TotpVerifier strict(config);
        REQUIRE(strict.verify_at(kAppSecret, code, kNow));
        REQUIRE_FALSE(strict.verify_at(kAppSecret, code, kNow + 30));
    }

    SECTION("Uses the injected clock") {
        core::ManualClock clock(kNow);
        TotpVerifier clocked({}, clock.clock());
        REQUIRE(clocked.verify(kAppSecret, code));
        clock.advance(std::chrono::seconds(90));
        REQUIRE_FALSE(clocked.verify(kAppSecret, code));
    }
}

TEST_CASE("TOTP - code shape", "[totp][input]") {
    TotpVerifier verifier;

    REQUIRE_FALSE(verifier.verify_at(kRfcSecret, "28708", 59));
    REQUIRE_FALSE(verifier.verify_at(kRfcSecret, "2870820", 59));
    REQUIRE_FALSE(verifier.verify_at(kRfcSecret, "28708a", 59));
    REQUIRE_FALSE(verifier.verify_at(kRfcSecret, " 287082", 59));
    REQUIRE_FALSE(verifier.verify_at(kRfcSecret, "", 59));
    REQUIRE_FALSE(verifier.verify_at("###", "287082", 59));
}

TEST_CASE("TOTP - enrollment", "[totp][enroll]") {
    SECTION("Secrets are 160-bit base32") {
        auto secret = TotpVerifier::generate_secret();
        REQUIRE(secret.size() == 32);
        REQUIRE(TotpVerifier::generate_code(secret, kNow).has_value());
        REQUIRE(secret != TotpVerifier::generate_secret());
    }

    SECTION("Provisioning URI") {
        TotpVerifier verifier;
        REQUIRE(verifier.provisioning_uri(kAppSecret, "a@example.com") ==
                "otpauth://totp/Bastion:a@example.com?secret=JBSWY3DPEHPK3PXP&issuer=Bastion"
                "&algorithm=SHA1&digits=6&period=30");
    }

    SECTION("Issuer and account are percent-encoded") {
        TotpConfig config;
        config.issuer = "Acme Corp";
        TotpVerifier verifier(config);
        auto uri = verifier.provisioning_uri(kAppSecret, "a b");
        REQUIRE(uri.starts_with("otpauth://totp/Acme%20Corp:a%20b?"));
        REQUIRE(uri.find("issuer=Acme%20Corp") != std::string::npos);
    }
}

TEST_CASE("Backup codes", "[totp][backup]") {
    auto set = TotpVerifier::generate_backup_codes(10);
    REQUIRE(set.plain_codes.size() == 10);
    REQUIRE(set.hashed_codes.size() == 10);

    SECTION("Format XXXXX-XXXXX without ambiguous characters") {
        for (const auto& code : set.plain_codes) {
            REQUIRE(code.size() == 11);
            REQUIRE(code[5] == '-');
            REQUIRE(code.find_first_of("01IO") == std::string::npos);
        }
        std::set<std::string> unique(set.plain_codes.begin(), set.plain_codes.end());
        REQUIRE(unique.size() == 10);
    }

    SECTION("Only hashes are stored") {
        for (size_t i = 0; i < set.plain_codes.size(); ++i) {
            REQUIRE(set.hashed_codes[i] != set.plain_codes[i]);
            REQUIRE(set.hashed_codes[i] == TotpVerifier::hash_backup_code(set.plain_codes[i]));
        }
    }

    SECTION("Match returns the index, including the first entry") {
        REQUIRE(TotpVerifier::verify_backup_code(set.plain_codes[0], set.hashed_codes) ==
                std::optional<size_t>(0));
        REQUIRE(TotpVerifier::verify_backup_code(set.plain_codes[7], set.hashed_codes) ==
                std::optional<size_t>(7));
    }

    SECTION("Entry is case and separator tolerant") {
        std::string typed = set.plain_codes[3];
        for (auto& c : typed) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        typed.erase(5, 1);
        REQUIRE(TotpVerifier::verify_backup_code(typed, set.hashed_codes) ==
                std::optional<size_t>(3));
    }

    SECTION("Unknown and empty codes do not match") {
        REQUIRE_FALSE(TotpVerifier::verify_backup_code("AAAAA-AAAAA", {}).has_value());
        REQUIRE_FALSE(TotpVerifier::verify_backup_code("", set.hashed_codes).has_value());
        REQUIRE_FALSE(TotpVerifier::verify_backup_code("---", set.hashed_codes).has_value());
    }
}
