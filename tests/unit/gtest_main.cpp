#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "util/paths.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        cw::paths::setLogPathForTesting();
        cw::config::ConfigRegistry::init(cw::config::Config{});
        cw::log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize chunkwise test environment: " << e.what() << std::endl;
        return 1;
    }

    const int rc = RUN_ALL_TESTS();
    cw::log::Registry::shutdown();
    return rc;
}
