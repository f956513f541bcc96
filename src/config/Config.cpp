#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <stdexcept>

namespace ds::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (path.empty() || !std::filesystem::exists(path)) return cfg;

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config file " + path.string() + ": " + e.what());
    }

    if (auto node = root["adb"]) YAML::convert<AdbConfig>::decode(node, cfg.adb);
    if (auto node = root["sync"]) YAML::convert<SyncDefaultsConfig>::decode(node, cfg.sync);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

}
