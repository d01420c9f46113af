// Bastion Unit Tests - Main Entry Point
#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>

#include "../../src/control/config.hpp"
#include "../../src/core/logging.hpp"

// Global test fixture - runs once before all tests
struct GlobalSetup {
    GlobalSetup() {
        bastion::logging::init_logging_system();

        bastion::control::LogConfig log_config;
        log_config.output = "/tmp/bastion_tests";
        log_config.level = "debug";
        bastion::logging::init_logger(log_config, "bastion_tests");
    }

    ~GlobalSetup() { bastion::logging::shutdown_logging(); }
};

// Create global instance to run setup/teardown
static GlobalSetup g_setup;

TEST_CASE("Basic sanity test", "[smoke]") {
    REQUIRE(bastion::logging::get_logger() != nullptr);
}
