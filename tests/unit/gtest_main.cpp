#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        lw::config::Config cfg;
        cfg.store.backend = lw::config::StoreBackend::Memory;
        cfg.logging.log_dir = fs::temp_directory_path() / "lockwright-tests";
        cfg.logging.levels.console_log_level = spdlog::level::warn;
        lw::config::ConfigRegistry::init(std::move(cfg));
        lw::log::Registry::init(lw::config::ConfigRegistry::get().logging.log_dir);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize lockwright test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
