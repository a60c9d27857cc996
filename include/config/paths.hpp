#pragma once

#include <cstdlib>
#include <filesystem>

namespace lw::paths {

inline std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv("LOCKWRIGHT_CONFIG"); env && *env) return env;
    return "/etc/lockwright/config.yaml";
}

}
