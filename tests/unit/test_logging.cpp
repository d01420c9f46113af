// Bastion Logging Unit Tests

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <set>
#include <string>
#include <thread>

#include "../../src/core/logging.hpp"

using namespace bastion::logging;

TEST_CASE("Correlation ID generation", "[logging][correlation_id]") {
    SECTION("generates valid UUID format") {
        std::string correlation_id = generate_correlation_id();

        // Exactly one '#' separator
        size_t hash_count = std::count(correlation_id.begin(), correlation_id.end(), '#');
        REQUIRE(hash_count == 1);
        REQUIRE(is_valid_correlation_id(correlation_id));
    }

    SECTION("same thread shares the base, counter increments") {
        std::string id1 = generate_correlation_id();
        std::string id2 = generate_correlation_id();
        REQUIRE(id1 != id2);

        size_t hash_pos1 = id1.find('#');
        size_t hash_pos2 = id2.find('#');
        REQUIRE(id1.substr(0, hash_pos1) == id2.substr(0, hash_pos2));

        auto counter1 = std::stoull(id1.substr(hash_pos1 + 1));
        auto counter2 = std::stoull(id2.substr(hash_pos2 + 1));
        REQUIRE(counter2 == counter1 + 1);
    }

    SECTION("different threads get different bases") {
        std::string main_id = generate_correlation_id();
        std::string other_id;
        std::thread worker([&other_id] { other_id = generate_correlation_id(); });
        worker.join();

        REQUIRE(is_valid_correlation_id(other_id));
        REQUIRE(main_id.substr(0, 36) != other_id.substr(0, 36));
    }

    SECTION("version and variant bits") {
        for (int i = 0; i < 50; ++i) {
            std::string id = generate_correlation_id();
            REQUIRE(id[14] == '4');
            REQUIRE(std::string("89ab").find(id[19]) != std::string::npos);
        }
    }
}

TEST_CASE("Correlation ID validation", "[logging][validation]") {
    SECTION("accepts valid correlation IDs") {
        REQUIRE(is_valid_correlation_id("550e8400-e29b-41d4-a716-446655440000#0"));
        REQUIRE(is_valid_correlation_id("550e8400-e29b-41d4-a716-446655440000#999999"));
        REQUIRE(is_valid_correlation_id("ABCDEF12-3456-4789-ABCD-EF0123456789#42"));
    }

    SECTION("rejects invalid formats") {
        // Missing separator or counter
        REQUIRE_FALSE(is_valid_correlation_id("550e8400-e29b-41d4-a716-446655440000"));
        REQUIRE_FALSE(is_valid_correlation_id("550e8400-e29b-41d4-a716-446655440000#"));
        REQUIRE_FALSE(is_valid_correlation_id("550e8400-e29b-41d4-a716-446655440000#12a"));

        // Wrong length or hyphen positions
        REQUIRE_FALSE(is_valid_correlation_id("550e8400-e29b-41d4-a716-44665544000#0"));
        REQUIRE_FALSE(is_valid_correlation_id("550e84-00-e29b-41d4-a716-446655440000#0"));

        // Wrong version or variant
        REQUIRE_FALSE(is_valid_correlation_id("550e8400-e29b-31d4-a716-446655440000#0"));
        REQUIRE_FALSE(is_valid_correlation_id("550e8400-e29b-41d4-c716-446655440000#0"));

        // Non-hex, header injection, oversized counter
        REQUIRE_FALSE(is_valid_correlation_id("550g8400-e29b-41d4-a716-446655440000#0"));
        REQUIRE_FALSE(is_valid_correlation_id("550e8400-e29b-41d4-a716-446655440000#1\r\nX: y"));
        REQUIRE_FALSE(is_valid_correlation_id("550e8400-e29b-41d4-a716-446655440000#" +
                                              std::string(21, '1')));
        REQUIRE_FALSE(is_valid_correlation_id(""));
    }

    SECTION("validates generated correlation IDs") {
        std::set<std::string> seen;
        for (int i = 0; i < 100; ++i) {
            std::string correlation_id = generate_correlation_id();
            REQUIRE(is_valid_correlation_id(correlation_id));
            seen.insert(correlation_id);
        }
        REQUIRE(seen.size() == 100);
    }
}

TEST_CASE("Process logger", "[logging][logger]") {
    SECTION("initialized by the test fixture") {
        auto* logger = get_logger();
        REQUIRE(logger != nullptr);

        // Security events and structured errors go through the same logger
        LOG_SECURITY(logger, "login_failed", "account:test@example.com", "invalid_credentials");
        LOG_ERROR_CTX(logger, "Middleware failed", generate_correlation_id(), "TestMiddleware",
                      "synthetic");
        logger->flush_log();
    }
}
