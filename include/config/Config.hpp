#pragma once

#include <filesystem>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace kb::config {

// Attributes applied to every key object this process generates or imports.
struct KeysConfig {
    bool token = false;       // persist on the token instead of the session
    bool sensitive = false;   // never reveal CKA_VALUE, whatever the caller asks
};

struct ModuleConfig {
    unsigned int interface_major = 2;
    unsigned int interface_minor = 40;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum keybridge = spdlog::level::info;   // startup, CLI
    spdlog::level::level_enum crypto    = spdlog::level::warn;   // key generation failures, rejected requests
    spdlog::level::level_enum session   = spdlog::level::warn;   // module return codes
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::string log_dir;      // empty: console only
    LogLevelsConfig levels;
};

struct Config {
    KeysConfig keys;
    ModuleConfig module;
    LoggingConfig logging;
};

// Missing file yields defaults. KB_PKCS11_TOKEN / KB_PKCS11_SENSITIVE override
// the keys section when set to a non-empty value.
Config loadConfig(const std::filesystem::path& path);

void applyEnvironment(Config& cfg);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const KeysConfig& c);
void to_json(nlohmann::json& j, const ModuleConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const LogLevelsConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);

}
