#include "config/paths.hpp"

#include <cstdlib>

namespace kb::paths {

static constexpr const auto* DEFAULT_CONFIG_PATH = "/etc/keybridge/config.yaml";

std::filesystem::path getConfigPath() {
    if (const char* env = std::getenv("KB_CONFIG"); env && *env) return env;
    if (testMode) return {};
    return DEFAULT_CONFIG_PATH;
}

void setTestMode() { testMode = true; }

}
