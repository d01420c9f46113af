// Bastion Middleware Tests
// Pipeline ordering, correlation IDs, bearer authentication and error bodies

#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../../src/core/clock.hpp"
#include "../../src/core/logging.hpp"
#include "../../src/gateway/auth_middleware.hpp"
#include "../../src/gateway/auth_responses.hpp"
#include "../../src/gateway/factory.hpp"
#include "../../src/gateway/pipeline.hpp"

using namespace bastion;
using namespace bastion::gateway;
using namespace std::chrono_literals;

namespace {

control::Config test_config() {
    control::Config config;
    config.token.access_secret = "access-secret-0123456789abcdef-0123456789";
    config.token.refresh_secret = "refresh-secret-0123456789abcdef-012345678";
    config.password.memory_kib = 1024;
    config.password.iterations = 1;
    config.password.parallelism = 1;
    return config;
}

struct AuthFixture {
    core::ManualClock clock;
    control::Config config = test_config();
    std::shared_ptr<auth::InMemoryPrincipalStore> principals =
        std::make_shared<auth::InMemoryPrincipalStore>();
    auth::AuthComponents components;
    std::shared_ptr<auth::AuthPipeline> auth_pipeline;

    AuthFixture() {
        components = build_auth_components(config, principals, clock.clock());
        auth_pipeline = build_auth_pipeline(config, components);

        auth::Principal alice;
        alice.id = "u-alice";
        alice.email = "alice@example.com";
        alice.role = "admin";
        alice.credential_hash = components.hasher->hash("Alice-Pass1");
        principals->upsert(alice);
    }

    std::string access_token(const std::string& sub = "u-alice") const {
        return components.codec->issue(sub, {"alice@example.com", "admin"}, 900s,
                                       auth::TokenType::Access);
    }
};

struct Exchange {
    http::Request request;
    http::Response response;
    RequestContext ctx;

    Exchange() {
        request.method = http::Method::GET;
        request.path = "/api/profile";
        request.client_ip = "10.0.0.1";
        ctx.request = &request;
        ctx.response = &response;
        ctx.client_ip = request.client_ip;
    }
};

}  // namespace

TEST_CASE("Pipeline - execution order", "[middleware][pipeline]") {
    std::vector<std::string> order;
    Pipeline pipeline;
    pipeline.use(
        [&order](RequestContext&) {
            order.push_back("first");
            return MiddlewareResult::Continue;
        },
        "first");
    pipeline.use(
        [&order](RequestContext&) {
            order.push_back("second");
            return MiddlewareResult::Continue;
        },
        "second");
    REQUIRE(pipeline.size() == 2);

    Exchange ex;
    REQUIRE(pipeline.execute_request(ex.ctx) == MiddlewareResult::Continue);
    REQUIRE(order == std::vector<std::string>{"first", "second"});
}

TEST_CASE("Pipeline - Stop and Error end the chain", "[middleware][pipeline]") {
    bool reached = false;
    auto tail = [&reached](RequestContext&) {
        reached = true;
        return MiddlewareResult::Continue;
    };

    SECTION("Stop") {
        auto pipeline = PipelineBuilder()
                            .use([](RequestContext&) { return MiddlewareResult::Stop; }, "gate")
                            .use(tail, "tail")
                            .build();
        Exchange ex;
        REQUIRE(pipeline.execute_request(ex.ctx) == MiddlewareResult::Stop);
        REQUIRE_FALSE(reached);
    }

    SECTION("Error flag set by a middleware") {
        Pipeline pipeline;
        pipeline.use(
            [](RequestContext& ctx) {
                ctx.set_error("store unavailable");
                return MiddlewareResult::Continue;
            },
            "failing");
        pipeline.use(tail, "tail");

        Exchange ex;
        REQUIRE(pipeline.execute_request(ex.ctx) == MiddlewareResult::Error);
        REQUIRE(ex.ctx.has_error);
        REQUIRE(ex.ctx.error_message == "store unavailable");
        REQUIRE_FALSE(reached);
    }

    SECTION("Clear") {
        Pipeline pipeline;
        pipeline.use(tail, "tail");
        pipeline.clear();
        REQUIRE(pipeline.size() == 0);
    }
}

TEST_CASE("CorrelationIdMiddleware", "[middleware][correlation]") {
    CorrelationIdMiddleware middleware;

    SECTION("Generates an ID when absent") {
        Exchange ex;
        REQUIRE(middleware.process_request(ex.ctx) == MiddlewareResult::Continue);
        REQUIRE(logging::is_valid_correlation_id(ex.ctx.correlation_id));
        REQUIRE(ex.response.get_header("X-Correlation-ID") == ex.ctx.correlation_id);
    }

    SECTION("Keeps a well-formed client ID") {
        Exchange ex;
        auto id = logging::generate_correlation_id();
        ex.request.add_header("X-Correlation-ID", id);
        (void)middleware.process_request(ex.ctx);
        REQUIRE(ex.ctx.correlation_id == id);
    }

    SECTION("Replaces a malformed client ID") {
        Exchange ex;
        ex.request.add_header("X-Correlation-ID", "abc\r\nInjected: header");
        (void)middleware.process_request(ex.ctx);
        REQUIRE(ex.ctx.correlation_id != "abc\r\nInjected: header");
        REQUIRE(logging::is_valid_correlation_id(ex.ctx.correlation_id));
    }

    SECTION("Missing request is an error") {
        RequestContext ctx;
        REQUIRE(middleware.process_request(ctx) == MiddlewareResult::Error);
    }
}

TEST_CASE("BearerAuthMiddleware", "[middleware][auth]") {
    AuthFixture f;
    BearerAuthMiddleware middleware({}, f.auth_pipeline);

    SECTION("Requires a pipeline") {
        REQUIRE_THROWS_AS(BearerAuthMiddleware({}, nullptr), std::invalid_argument);
    }

    SECTION("Valid token continues with the principal attached") {
        Exchange ex;
        ex.request.add_header("Authorization", "Bearer " + f.access_token());
        REQUIRE(middleware.process_request(ex.ctx) == MiddlewareResult::Continue);
        REQUIRE(ex.ctx.principal.has_value());
        REQUIRE(ex.ctx.principal->id == "u-alice");
        REQUIRE(ex.ctx.get_metadata("auth_sub") == "u-alice");
        REQUIRE(ex.ctx.get_metadata("auth_role") == "admin");
    }

    SECTION("Missing header gets 401 with a challenge") {
        Exchange ex;
        REQUIRE(middleware.process_request(ex.ctx) == MiddlewareResult::Stop);
        REQUIRE(ex.response.status == http::StatusCode::Unauthorized);
        REQUIRE(ex.response.get_header("WWW-Authenticate") == "Bearer realm=\"bastion\"");
        auto body = nlohmann::json::parse(ex.response.body);
        REQUIRE(body["error"] == "unauthorized");
        REQUIRE(body["message"] == "Authentication required");
    }

    SECTION("Every token failure looks the same to the client") {
        Exchange expired;
        expired.request.add_header("Authorization", "Bearer " + f.access_token());
        f.clock.advance(901s);
        (void)middleware.process_request(expired.ctx);

        Exchange forged;
        forged.request.add_header("Authorization", "Bearer aaa.bbb.ccc");
        (void)middleware.process_request(forged.ctx);

        Exchange ghost;
        ghost.request.add_header("Authorization", "Bearer " + f.access_token("u-ghost"));
        (void)middleware.process_request(ghost.ctx);

        REQUIRE(expired.response.status == http::StatusCode::Unauthorized);
        REQUIRE(expired.response.body == forged.response.body);
        REQUIRE(forged.response.body == ghost.response.body);
        REQUIRE_FALSE(expired.ctx.principal.has_value());
    }

    SECTION("Revoked token is rejected") {
        auto token = f.access_token();
        f.components.revocations->revoke(token, 900s);
        Exchange ex;
        ex.request.add_header("Authorization", "Bearer " + token);
        REQUIRE(middleware.process_request(ex.ctx) == MiddlewareResult::Stop);
        REQUIRE(ex.response.status == http::StatusCode::Unauthorized);
    }

    SECTION("Banned principal gets 403") {
        auto token = f.access_token();
        f.principals->set_banned("u-alice", f.clock.now_seconds());
        Exchange ex;
        ex.request.add_header("Authorization", "Bearer " + token);
        REQUIRE(middleware.process_request(ex.ctx) == MiddlewareResult::Stop);
        REQUIRE(ex.response.status == http::StatusCode::Forbidden);
        REQUIRE(nlohmann::json::parse(ex.response.body)["error"] == "account_suspended");
    }

    SECTION("Custom header name") {
        BearerAuthMiddleware custom({"X-Api-Token"}, f.auth_pipeline);
        Exchange ex;
        ex.request.add_header("X-Api-Token", "Bearer " + f.access_token());
        REQUIRE(custom.process_request(ex.ctx) == MiddlewareResult::Continue);
    }
}

TEST_CASE("Protected pipeline", "[middleware][factory]") {
    AuthFixture f;
    auto pipeline = build_protected_pipeline(f.auth_pipeline);
    REQUIRE(pipeline->size() == 2);

    SECTION("Rejection still carries a correlation ID") {
        Exchange ex;
        REQUIRE(pipeline->execute_request(ex.ctx) == MiddlewareResult::Stop);
        REQUIRE(ex.response.status == http::StatusCode::Unauthorized);
        REQUIRE(ex.response.has_header("X-Correlation-ID"));
    }

    SECTION("Authenticated request reaches the handler") {
        Exchange ex;
        ex.request.add_header("Authorization", "Bearer " + f.access_token());
        REQUIRE(pipeline->execute_request(ex.ctx) == MiddlewareResult::Continue);
        REQUIRE(ex.ctx.principal->email == "alice@example.com");
    }
}

TEST_CASE("Auth responses", "[middleware][responses]") {
    SECTION("429 carries Retry-After and budget headers") {
        auth::RateLimitDecision decision;
        decision.status = auth::RateLimitStatus::Limited;
        decision.limit = 5;
        decision.remaining = 0;
        decision.retry_after = 42s;

        http::Response resp;
        write_rate_limited(resp, decision);
        REQUIRE(resp.status == http::StatusCode::TooManyRequests);
        REQUIRE(resp.get_header("Retry-After") == "42");
        REQUIRE(resp.get_header("X-RateLimit-Limit") == "5");
        REQUIRE(resp.get_header("X-RateLimit-Remaining") == "0");
        auto body = nlohmann::json::parse(resp.body);
        REQUIRE(body["error"] == "too_many_requests");
        REQUIRE(body["retry_after"] == 42);
    }

    SECTION("Retry-After is at least one second") {
        auth::RateLimitDecision decision;
        decision.status = auth::RateLimitStatus::Limited;
        http::Response resp;
        write_rate_limited(resp, decision);
        REQUIRE(resp.get_header("Retry-After") == "1");
        REQUIRE_FALSE(resp.has_header("X-RateLimit-Limit"));
    }

    SECTION("Invalid credentials and overload") {
        http::Response invalid;
        write_invalid_credentials(invalid);
        REQUIRE(invalid.status == http::StatusCode::Unauthorized);
        REQUIRE(nlohmann::json::parse(invalid.body)["error"] == "invalid_credentials");
        REQUIRE_FALSE(invalid.has_header("WWW-Authenticate"));

        http::Response busy;
        write_overloaded(busy);
        REQUIRE(busy.status == http::StatusCode::ServiceUnavailable);
        REQUIRE(busy.get_header("Retry-After") == "1");
    }
}
