// Lattice Unit Tests - Main Entry Point
#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>

#include "../../src/control/config.hpp"
#include "../../src/core/logging.hpp"

// Global test fixture - runs once before all tests
struct GlobalSetup {
    GlobalSetup() {
        lattice::logging::init_logging_system();

        lattice::control::LogConfig log_config;
        log_config.level = "debug";
        log_config.output = "/tmp/lattice_tests";
        lattice::logging::init_logger("lattice_tests", log_config);
    }

    ~GlobalSetup() { lattice::logging::shutdown_logging(); }
};

static GlobalSetup g_setup;

TEST_CASE("Basic sanity test", "[smoke]") {
    REQUIRE(1 + 1 == 2);
}
