#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace ds::config;

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<AdbConfig> {
    static Node encode(const AdbConfig& rhs) {
        Node node;
        node["binary"] = rhs.binary;
        node["flags"] = rhs.flags;
        for (const auto& [k, v] : rhs.options) node["options"][k] = v;
        node["show_progress"] = rhs.show_progress;
        return node;
    }

    static bool decode(const Node& node, AdbConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.binary = node["binary"].as<std::string>("adb");
        rhs.flags = node["flags"].as<std::vector<std::string>>(std::vector<std::string>{});
        rhs.options.clear();
        if (const auto opts = node["options"]; opts && opts.IsMap())
            for (const auto& kv : opts)
                rhs.options.emplace_back(kv.first.as<std::string>(), kv.second.as<std::string>());
        rhs.show_progress = node["show_progress"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<SyncDefaultsConfig> {
    static Node encode(const SyncDefaultsConfig& rhs) {
        Node node;
        node["exclude"] = rhs.exclude;
        node["preserve_times"] = rhs.preserve_times;
        node["copy_links"] = rhs.copy_links;
        return node;
    }

    static bool decode(const Node& node, SyncDefaultsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.exclude = node["exclude"].as<std::vector<std::string>>(std::vector<std::string>{});
        rhs.preserve_times = node["preserve_times"].as<bool>(false);
        rhs.copy_links = node["copy_links"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["devsync"] = to_std_string(spdlog::level::to_string_view(rhs.devsync));
        node["sync"]    = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["fs"]      = to_std_string(spdlog::level::to_string_view(rhs.fs));
        node["shell"]   = to_std_string(spdlog::level::to_string_view(rhs.shell));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.devsync = spdlog::level::from_str(node["devsync"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.fs = spdlog::level::from_str(node["fs"].as<std::string>("info"));
        rhs.shell = spdlog::level::from_str(node["shell"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (const auto sub = node["subsystem_levels"]) convert<SubsystemLogLevelsConfig>::decode(sub, rhs.subsystem_levels);
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (const auto levels = node["log_levels"]) convert<LogLevelsConfig>::decode(levels, rhs.levels);
        return true;
    }
};

}
