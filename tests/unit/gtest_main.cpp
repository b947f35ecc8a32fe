#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"
#include "log/Registry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        vcs::paths::setLogPathForTesting();
        vcs::config::ConfigRegistry::init();
        vcs::log::Registry::init(vcs::paths::getLogPath());
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize vcstatus test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
