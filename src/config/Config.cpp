#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <cstdlib>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace kb::config {

static bool envFlag(const char* name) {
    const char* v = std::getenv(name);
    return v && *v;
}

void applyEnvironment(Config& cfg) {
    if (envFlag("KB_PKCS11_TOKEN")) cfg.keys.token = true;
    if (envFlag("KB_PKCS11_SENSITIVE")) cfg.keys.sensitive = true;
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;

    if (!path.empty() && std::filesystem::exists(path)) {
        const YAML::Node root = YAML::LoadFile(path.string());

        if (auto node = root["keys"]) cfg.keys = node.as<KeysConfig>();
        if (auto node = root["module"]) cfg.module = node.as<ModuleConfig>();
        if (auto node = root["logging"]) cfg.logging = node.as<LoggingConfig>();
    }

    applyEnvironment(cfg);
    return cfg;
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"keys", c.keys},
        {"module", c.module},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const KeysConfig& c) {
    j = {
        {"token", c.token},
        {"sensitive", c.sensitive}
    };
}

void to_json(nlohmann::json& j, const ModuleConfig& c) {
    j = {
        {"interface_version", {
            {"major", c.interface_major},
            {"minor", c.interface_minor}
        }}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir},
        {"log_levels", c.levels}
    };
}

void to_json(nlohmann::json& j, const LogLevelsConfig& c) {
    j = {
        {"console_log_level", detail::levelName(c.console_log_level)},
        {"file_log_level", detail::levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"keybridge", detail::levelName(c.keybridge)},
        {"crypto", detail::levelName(c.crypto)},
        {"session", detail::levelName(c.session)}
    };
}

}
