// Sluice Unit Tests - Global Setup

#include "../../src/control/config.hpp"
#include "../../src/core/logging.hpp"

// Global test fixture - runs once before all tests
struct GlobalSetup {
    GlobalSetup() {
        sluice::logging::init_logging_system();

        // Rotating file output keeps test logs off the console
        sluice::control::LogConfig log_config;
        log_config.level = "debug";
        log_config.output = "/tmp/sluice_tests";
        sluice::logging::init_logger(log_config);
    }

    ~GlobalSetup() { sluice::logging::shutdown_logging(); }
};

static GlobalSetup g_setup;
