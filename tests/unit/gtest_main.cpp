#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>
#include <unistd.h>

#include "config/ConfigRegistry.hpp"
#include "config/paths.hpp"
#include "log/Registry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    const auto base = fs::temp_directory_path() / ("locksmith-tests-" + std::to_string(::getpid()));

    try {
        fs::create_directories(base);
        lsm::paths::setBaseDirForTesting(base);
        lsm::config::ConfigRegistry::init();
        lsm::log::Registry::init(lsm::paths::getLogDir());
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize locksmith test environment: " << e.what() << std::endl;
        return 1;
    }

    const int rc = RUN_ALL_TESTS();

    lsm::log::Registry::shutdown();
    std::error_code ec;
    fs::remove_all(base, ec);
    return rc;
}
