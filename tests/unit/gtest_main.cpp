#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        ad::config::Config cfg;
        cfg.logging.levels.console_log_level = spdlog::level::err;
        ad::config::ConfigRegistry::init(cfg);
        ad::log::Registry::init(cfg.logging);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize archdiff test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
