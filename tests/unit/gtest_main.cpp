#include <gtest/gtest.h>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

#include <iostream>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        tally::config::Config cfg;
        cfg.logging.levels.console_log_level = spdlog::level::warn;
        cfg.auth.jwt_secret = "test-secret";
        tally::config::ConfigRegistry::init(std::move(cfg));
        tally::log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize tally test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
