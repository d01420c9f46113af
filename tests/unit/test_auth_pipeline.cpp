// Bastion Auth Pipeline Tests
// Authentication stages plus the login, refresh and logout flows

#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "../../src/auth/auth_pipeline.hpp"
#include "../../src/control/config.hpp"
#include "../../src/core/clock.hpp"
#include "../../src/gateway/factory.hpp"

using namespace bastion;
using namespace bastion::auth;
using namespace std::chrono_literals;

namespace {

constexpr const char* kTotpSecret = "JBSWY3DPEHPK3PXP";
constexpr const char* kTotpCodeAtStart = "324550";  // kTotpSecret at ManualClock default start
constexpr const char* kLegacyBcrypt =
    "$2b$04$abcdefghijklmnopqrstuujgIIHJjWz/K2VeDhyP0ztfzOelvR7Oi";  // "Legacy-Pass1"

control::Config test_config() {
    control::Config config;
    config.token.access_secret = "access-secret-0123456789abcdef-0123456789";
    config.token.refresh_secret = "refresh-secret-0123456789abcdef-012345678";
    config.password.memory_kib = 1024;
    config.password.iterations = 1;
    config.password.parallelism = 1;
    return config;
}

/// Other spellings of the same token bytes: padding, and a flipped spare bit
std::vector<std::string> respellings(const std::string& token) {
    static constexpr std::string_view kAlphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    std::string flipped = token;
    flipped.back() = kAlphabet[kAlphabet.find(flipped.back()) ^ 1];
    return {token + "=", token + "======", flipped};
}

struct PipelineFixture {
    core::ManualClock clock;
    control::Config config = test_config();
    std::shared_ptr<InMemoryPrincipalStore> principals = std::make_shared<InMemoryPrincipalStore>();
    AuthComponents components;
    std::shared_ptr<AuthPipeline> pipeline;
    BackupCodeSet backup_codes;

    PipelineFixture() {
        components = gateway::build_auth_components(config, principals, clock.clock());
        pipeline = gateway::build_auth_pipeline(config, components);

        add("u-alice", "alice@example.com", "admin", components.hasher->hash("Alice-Pass1"));
        add("u-bob", "bob@example.com", "member", components.hasher->hash("Bob-Pass1"));
        principals->set_banned("u-bob", clock.now_seconds() - 3600);

        backup_codes = TotpVerifier::generate_backup_codes(3);
        Principal carol = make("u-carol", "carol@example.com", "member",
                               components.hasher->hash("Carol-Pass1"));
        carol.mfa = MfaEnrollment{kTotpSecret, backup_codes.hashed_codes};
        principals->upsert(carol);

        add("u-dave", "dave@example.com", "member", kLegacyBcrypt);
    }

    static Principal make(std::string id, std::string email, std::string role,
                          std::string hash) {
        Principal p;
        p.id = std::move(id);
        p.email = std::move(email);
        p.role = std::move(role);
        p.credential_hash = std::move(hash);
        return p;
    }

    void add(std::string id, std::string email, std::string role, std::string hash) {
        principals->upsert(make(std::move(id), std::move(email), std::move(role), std::move(hash)));
    }

    LoginOutcome login(std::string email, std::string password, std::string ip = "10.0.0.1") {
        return pipeline->login({std::move(email), std::move(password), std::nullopt, std::nullopt},
                               ip);
    }

    std::string bearer(const std::string& token) const { return "Bearer " + token; }
};

}  // namespace

TEST_CASE("AuthPipeline - construction", "[pipeline]") {
    REQUIRE_THROWS_AS(AuthPipeline({}, AuthComponents{}), std::invalid_argument);
}

TEST_CASE("AuthPipeline - bearer extraction", "[pipeline][bearer]") {
    REQUIRE(extract_bearer("Bearer abc") == std::optional<std::string_view>("abc"));
    REQUIRE(extract_bearer("Bearer   abc  ") == std::optional<std::string_view>("abc"));
    REQUIRE_FALSE(extract_bearer("Bearer ").has_value());
    REQUIRE_FALSE(extract_bearer("Bearer    ").has_value());
    REQUIRE_FALSE(extract_bearer("Basic dXNlcjpwYXNz").has_value());
    REQUIRE_FALSE(extract_bearer("bearer abc").has_value());
    REQUIRE_FALSE(extract_bearer("").has_value());
}

TEST_CASE("AuthPipeline - request authentication stages", "[pipeline][authenticate]") {
    PipelineFixture f;
    auto& codec = *f.components.codec;
    auto access = codec.issue("u-alice", {"alice@example.com", "admin"}, 900s, TokenType::Access);

    SECTION("Missing header stays unauthenticated without error") {
        auto outcome = f.pipeline->authenticate("");
        REQUIRE(outcome.stage == AuthStage::Unauthenticated);
        REQUIRE_FALSE(outcome.error.has_value());
    }

    SECTION("Other scheme is malformed") {
        auto outcome = f.pipeline->authenticate("Basic dXNlcjpwYXNz");
        REQUIRE(outcome.stage == AuthStage::Unauthenticated);
        REQUIRE(outcome.error == AuthError::Malformed);
    }

    SECTION("Valid token authenticates and loads the principal") {
        auto outcome = f.pipeline->authenticate(f.bearer(access));
        REQUIRE(outcome);
        REQUIRE(outcome.stage == AuthStage::Authenticated);
        REQUIRE(outcome.principal->id == "u-alice");
        REQUIRE(outcome.claims.role == "admin");
        REQUIRE_FALSE(outcome.error.has_value());
    }

    SECTION("Revocation is checked before the signature") {
        f.components.revocations->revoke(access, 900s);
        auto outcome = f.pipeline->authenticate(f.bearer(access));
        REQUIRE(outcome.stage == AuthStage::Rejected);
        REQUIRE(outcome.last_passed == AuthStage::TokenExtracted);
        REQUIRE(outcome.error == AuthError::Revoked);
    }

    SECTION("Garbage token fails at the signature stage") {
        auto outcome = f.pipeline->authenticate("Bearer not.a.token");
        REQUIRE(outcome.stage == AuthStage::Rejected);
        REQUIRE(outcome.last_passed == AuthStage::RevocationChecked);
        REQUIRE((outcome.error == AuthError::Malformed ||
                 outcome.error == AuthError::InvalidSignature));
    }

    SECTION("Refresh token cannot authenticate a request") {
        auto refresh = codec.issue("u-alice", {}, 900s, TokenType::Refresh);
        auto outcome = f.pipeline->authenticate(f.bearer(refresh));
        REQUIRE(outcome.stage == AuthStage::Rejected);
        REQUIRE(outcome.error == AuthError::InvalidSignature);
    }

    SECTION("Expired token fails claims after the signature passed") {
        f.clock.advance(901s);
        auto outcome = f.pipeline->authenticate(f.bearer(access));
        REQUIRE(outcome.stage == AuthStage::Rejected);
        REQUIRE(outcome.last_passed == AuthStage::SignatureVerified);
        REQUIRE(outcome.error == AuthError::Expired);
    }

    SECTION("Unknown principal") {
        auto ghost = codec.issue("u-ghost", {}, 900s, TokenType::Access);
        auto outcome = f.pipeline->authenticate(f.bearer(ghost));
        REQUIRE(outcome.last_passed == AuthStage::ClaimsValid);
        REQUIRE(outcome.error == AuthError::UserNotFound);
    }

    SECTION("Ban takes effect on tokens already issued") {
        f.principals->set_banned("u-alice", f.clock.now_seconds());
        auto outcome = f.pipeline->authenticate(f.bearer(access));
        REQUIRE(outcome.stage == AuthStage::Rejected);
        REQUIRE(outcome.last_passed == AuthStage::PrincipalLoaded);
        REQUIRE(outcome.error == AuthError::UserBanned);
    }

    SECTION("Stage names") {
        REQUIRE(to_string(AuthStage::RevocationChecked) == "revocation_checked");
        REQUIRE(to_string(AuthStage::Authenticated) == "authenticated");
    }
}

TEST_CASE("AuthPipeline - password login", "[pipeline][login]") {
    PipelineFixture f;

    SECTION("Correct credentials issue a verifiable pair") {
        auto outcome = f.login("alice@example.com", "Alice-Pass1");
        REQUIRE(outcome.succeeded());
        REQUIRE(outcome.principal->id == "u-alice");
        REQUIRE(f.pipeline->authenticate(f.bearer(outcome.tokens.access_token)));
        REQUIRE(f.components.codec->verify(outcome.tokens.refresh_token, TokenType::Refresh));
        REQUIRE(outcome.tokens.access_expires_at == f.clock.now_seconds() + 900);
    }

    SECTION("Email is case-insensitive") {
        REQUIRE(f.login("ALICE@example.com", "Alice-Pass1").succeeded());
    }

    SECTION("Wrong password") {
        auto outcome = f.login("alice@example.com", "wrong");
        REQUIRE(outcome.status == LoginStatus::Rejected);
        REQUIRE(outcome.error == AuthError::InvalidCredentials);
    }

    SECTION("Unknown account") {
        auto outcome = f.login("nobody@example.com", "Whatever-1");
        REQUIRE(outcome.error == AuthError::UserNotFound);
    }

    SECTION("Empty fields") {
        REQUIRE(f.login("", "Alice-Pass1").error == AuthError::InvalidCredentials);
        REQUIRE(f.login("alice@example.com", "").error == AuthError::InvalidCredentials);
    }

    SECTION("Ban is revealed only after the password checks out") {
        REQUIRE(f.login("bob@example.com", "wrong").error == AuthError::InvalidCredentials);
        REQUIRE(f.login("bob@example.com", "Bob-Pass1").error == AuthError::UserBanned);
    }

    SECTION("Unknown stored hash format is a failed login") {
        f.add("u-erin", "erin@example.com", "member", "5f4dcc3b5aa765d61d8327deb882cf99");
        REQUIRE(f.login("erin@example.com", "password").error == AuthError::UnknownHashFormat);
    }

    SECTION("Legacy bcrypt credential is upgraded on login") {
        auto outcome = f.login("dave@example.com", "Legacy-Pass1");
        REQUIRE(outcome.succeeded());

        auto stored = f.principals->find_by_id("u-dave")->credential_hash;
        REQUIRE(detect_format(stored) == HashFormat::Argon2id);
        REQUIRE(f.components.hasher->verify("Legacy-Pass1", stored));
        REQUIRE(f.login("dave@example.com", "Legacy-Pass1").succeeded());
    }

    SECTION("Rehash can be disabled") {
        AuthPipelineConfig config;
        config.rehash_on_login = false;
        AuthPipeline pipeline(config, f.components);
        REQUIRE(pipeline.login({"dave@example.com", "Legacy-Pass1", {}, {}}, "10.0.0.9")
                    .succeeded());
        REQUIRE(f.principals->find_by_id("u-dave")->credential_hash == kLegacyBcrypt);
    }
}

TEST_CASE("AuthPipeline - second factor", "[pipeline][mfa]") {
    PipelineFixture f;

    SECTION("Password alone asks for a code") {
        auto outcome = f.login("carol@example.com", "Carol-Pass1");
        REQUIRE(outcome.status == LoginStatus::MfaRequired);
        REQUIRE(outcome.error == AuthError::MfaRequired);
        REQUIRE(outcome.tokens.access_token.empty());
    }

    SECTION("Valid TOTP code completes login") {
        auto outcome = f.pipeline->login(
            {"carol@example.com", "Carol-Pass1", std::string(kTotpCodeAtStart), std::nullopt},
            "10.0.0.1");
        REQUIRE(outcome.succeeded());
    }

    SECTION("Invalid TOTP code") {
        auto outcome = f.pipeline->login(
            {"carol@example.com", "Carol-Pass1", std::string("12345x"), std::nullopt}, "10.0.0.1");
        REQUIRE(outcome.error == AuthError::MfaInvalid);
    }

    SECTION("MFA is not checked before the password") {
        auto outcome = f.pipeline->login(
            {"carol@example.com", "wrong", std::string(kTotpCodeAtStart), std::nullopt},
            "10.0.0.1");
        REQUIRE(outcome.error == AuthError::InvalidCredentials);
    }

    SECTION("Backup code works exactly once") {
        LoginRequest request{"carol@example.com", "Carol-Pass1", std::nullopt,
                             f.backup_codes.plain_codes[0]};
        REQUIRE(f.pipeline->login(request, "10.0.0.1").succeeded());
        REQUIRE(f.principals->find_by_id("u-carol")->mfa->backup_code_hashes.size() == 2);

        auto replay = f.pipeline->login(request, "10.0.0.2");
        REQUIRE(replay.error == AuthError::MfaInvalid);
    }
}

TEST_CASE("AuthPipeline - login rate limiting", "[pipeline][ratelimit]") {
    PipelineFixture f;

    SECTION("Sixth attempt from one IP is limited") {
        for (int i = 0; i < 5; ++i) {
            auto email = "nobody" + std::to_string(i) + "@example.com";
            REQUIRE(f.login(email, "x", "10.9.9.9").error == AuthError::UserNotFound);
        }
        auto sixth = f.login("alice@example.com", "Alice-Pass1", "10.9.9.9");
        REQUIRE(sixth.error == AuthError::RateLimited);
        REQUIRE(sixth.rate_limit.retry_after > 0s);
    }

    SECTION("Account failures limit across IPs, then lock") {
        for (int i = 0; i < 3; ++i) {
            (void)f.login("alice@example.com", "wrong", "10.1.0." + std::to_string(i));
        }
        auto limited = f.login("alice@example.com", "Alice-Pass1", "10.2.0.1");
        REQUIRE(limited.error == AuthError::RateLimited);

        LoginOutcome last;
        for (int i = 0; i < 5; ++i) {
            last = f.login("alice@example.com", "Alice-Pass1", "10.3.0." + std::to_string(i));
        }
        REQUIRE(last.error == AuthError::Locked);
        REQUIRE(last.rate_limit.retry_after == 900s);
    }

    SECTION("Success clears the account counter") {
        (void)f.login("alice@example.com", "wrong", "10.4.0.1");
        (void)f.login("alice@example.com", "wrong", "10.4.0.2");
        REQUIRE(f.login("alice@example.com", "Alice-Pass1", "10.4.0.3").succeeded());
        REQUIRE(f.components.rate_limiter->peek("account:alice@example.com").remaining == 5);
    }

    SECTION("Remaining budget is reported on success") {
        auto outcome = f.login("alice@example.com", "Alice-Pass1", "10.5.0.1");
        REQUIRE(outcome.rate_limit.limit == 5);
        REQUIRE(outcome.rate_limit.remaining == 4);
    }
}

TEST_CASE("AuthPipeline - refresh rotation", "[pipeline][refresh]") {
    PipelineFixture f;
    auto first = f.login("alice@example.com", "Alice-Pass1");
    REQUIRE(first.succeeded());

    SECTION("Refresh issues a new pair and retires the old token") {
        auto rotated = f.pipeline->refresh(first.tokens.refresh_token);
        REQUIRE(rotated.succeeded());
        REQUIRE(rotated.tokens.refresh_token != first.tokens.refresh_token);
        REQUIRE(f.pipeline->authenticate(f.bearer(rotated.tokens.access_token)));

        auto replay = f.pipeline->refresh(first.tokens.refresh_token);
        REQUIRE(replay.error == AuthError::Revoked);

        REQUIRE(f.pipeline->refresh(rotated.tokens.refresh_token).succeeded());
    }

    SECTION("Access token is not a refresh token") {
        REQUIRE(f.pipeline->refresh(first.tokens.access_token).error ==
                AuthError::InvalidSignature);
    }

    SECTION("Empty and expired tokens") {
        REQUIRE(f.pipeline->refresh("").error == AuthError::Malformed);
        f.clock.advance(7 * 24h + 1s);
        REQUIRE(f.pipeline->refresh(first.tokens.refresh_token).error == AuthError::Expired);
    }

    SECTION("Re-spelled copies of a rotated token are refused") {
        REQUIRE(f.pipeline->refresh(first.tokens.refresh_token).succeeded());

        for (const auto& variant : respellings(first.tokens.refresh_token)) {
            REQUIRE_FALSE(f.pipeline->refresh(variant).succeeded());
        }
    }

    SECTION("Rotation holds in the token's final second") {
        f.clock.advance(7 * 24h);
        REQUIRE(f.pipeline->refresh(first.tokens.refresh_token).succeeded());
        REQUIRE(f.pipeline->refresh(first.tokens.refresh_token).error == AuthError::Revoked);
    }

    SECTION("Banned principal cannot refresh") {
        f.principals->set_banned("u-alice", f.clock.now_seconds());
        REQUIRE(f.pipeline->refresh(first.tokens.refresh_token).error == AuthError::UserBanned);
    }
}

TEST_CASE("AuthPipeline - logout", "[pipeline][logout]") {
    PipelineFixture f;
    auto session = f.login("alice@example.com", "Alice-Pass1");
    REQUIRE(session.succeeded());
    const auto header = f.bearer(session.tokens.access_token);

    SECTION("Revokes the access token and is idempotent") {
        auto outcome = f.pipeline->logout(header);
        REQUIRE(outcome);
        REQUIRE(outcome.access_revoked);
        REQUIRE_FALSE(outcome.refresh_revoked);
        REQUIRE(f.pipeline->authenticate(header).error == AuthError::Revoked);

        REQUIRE(f.pipeline->logout(header));
        REQUIRE(f.components.revocations->size() == 1);
    }

    SECTION("Revokes the session's refresh token too") {
        auto outcome = f.pipeline->logout(header, session.tokens.refresh_token);
        REQUIRE(outcome.refresh_revoked);
        REQUIRE(f.pipeline->refresh(session.tokens.refresh_token).error == AuthError::Revoked);
    }

    SECTION("Does not revoke another subject's refresh token") {
        auto other = f.components.codec->issue("u-dave", {}, 3600s, TokenType::Refresh);
        auto outcome = f.pipeline->logout(header, std::string_view(other));
        REQUIRE(outcome);
        REQUIRE_FALSE(outcome.refresh_revoked);
        REQUIRE_FALSE(f.components.revocations->is_revoked(other));
    }

    SECTION("Expired access token still lets the refresh token be retired") {
        f.clock.advance(901s);
        auto outcome = f.pipeline->logout(header, session.tokens.refresh_token);
        REQUIRE(outcome);
        REQUIRE_FALSE(outcome.access_revoked);
        REQUIRE(outcome.refresh_revoked);
    }

    SECTION("Re-spelled copies of a logged-out token stay rejected") {
        REQUIRE(f.pipeline->logout(header));

        for (const auto& variant : respellings(session.tokens.access_token)) {
            REQUIRE_FALSE(f.pipeline->authenticate(f.bearer(variant)));
        }
    }

    SECTION("Logout in the token's final second still revokes it") {
        f.clock.advance(900s);
        REQUIRE(f.pipeline->authenticate(header));

        auto outcome = f.pipeline->logout(header);
        REQUIRE(outcome.access_revoked);
        REQUIRE(f.pipeline->authenticate(header).error == AuthError::Revoked);
    }

    SECTION("Invalid tokens are rejected and never stored") {
        auto outcome = f.pipeline->logout("Bearer forged.token.value");
        REQUIRE_FALSE(outcome);
        REQUIRE(f.components.revocations->size() == 0);

        REQUIRE(f.pipeline->logout("").error == AuthError::Malformed);
    }

    SECTION("Invalid refresh token is ignored") {
        auto outcome = f.pipeline->logout(header, std::string_view("garbage"));
        REQUIRE(outcome);
        REQUIRE(outcome.access_revoked);
        REQUIRE_FALSE(outcome.refresh_revoked);
    }
}
