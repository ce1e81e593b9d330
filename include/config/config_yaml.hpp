#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace kb::config::detail {

inline std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

}

namespace YAML {

template<>
struct convert<kb::config::KeysConfig> {
    static Node encode(const kb::config::KeysConfig& rhs) {
        Node node;
        node["token"] = rhs.token;
        node["sensitive"] = rhs.sensitive;
        return node;
    }

    static bool decode(const Node& node, kb::config::KeysConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.token = node["token"].as<bool>(false);
        rhs.sensitive = node["sensitive"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<kb::config::ModuleConfig> {
    static Node encode(const kb::config::ModuleConfig& rhs) {
        Node node;
        node["interface_version"]["major"] = rhs.interface_major;
        node["interface_version"]["minor"] = rhs.interface_minor;
        return node;
    }

    static bool decode(const Node& node, kb::config::ModuleConfig& rhs) {
        if (!node.IsMap()) return false;
        if (const auto v = node["interface_version"]) {
            rhs.interface_major = v["major"].as<unsigned int>(2);
            rhs.interface_minor = v["minor"].as<unsigned int>(40);
        }
        return true;
    }
};

template<>
struct convert<kb::config::SubsystemLogLevelsConfig> {
    static Node encode(const kb::config::SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["keybridge"] = kb::config::detail::levelName(rhs.keybridge);
        node["crypto"]    = kb::config::detail::levelName(rhs.crypto);
        node["session"]   = kb::config::detail::levelName(rhs.session);
        return node;
    }

    static bool decode(const Node& node, kb::config::SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.keybridge = spdlog::level::from_str(node["keybridge"].as<std::string>("info"));
        rhs.crypto = spdlog::level::from_str(node["crypto"].as<std::string>("warn"));
        rhs.session = spdlog::level::from_str(node["session"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<kb::config::LogLevelsConfig> {
    static Node encode(const kb::config::LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = kb::config::detail::levelName(rhs.console_log_level);
        node["file_log_level"]    = kb::config::detail::levelName(rhs.file_log_level);
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, kb::config::LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("warn"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<kb::config::SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<kb::config::LoggingConfig> {
    static Node encode(const kb::config::LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir;
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, kb::config::LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<kb::config::LogLevelsConfig>();
        return true;
    }
};

}
