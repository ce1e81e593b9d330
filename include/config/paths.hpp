#pragma once

#include <filesystem>

namespace kb::paths {

inline bool testMode = false;

// KB_CONFIG when set, /etc/keybridge/config.yaml otherwise.
std::filesystem::path getConfigPath();

// Console-only logging and no config file unless KB_CONFIG points at one.
void setTestMode();

}
