#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>
#include <spdlog/spdlog.h>

namespace ds::config {

struct AdbConfig {
    std::string binary = "adb";
    std::vector<std::string> flags;                            // "d" -> adb -d
    std::vector<std::pair<std::string, std::string>> options;  // {"s", "SERIAL"} -> adb -s SERIAL
    bool show_progress = false;                                // log adb push/pull progress lines
};

struct SyncDefaultsConfig {
    std::vector<std::string> exclude;
    bool preserve_times = false;
    bool copy_links = false;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum devsync = spdlog::level::info;   // CLI driver, pair summaries
    spdlog::level::level_enum sync    = spdlog::level::info;   // Plan and per-operation progress
    spdlog::level::level_enum fs      = spdlog::level::info;   // Adapter diagnostics, unparseable lines
    spdlog::level::level_enum shell   = spdlog::level::warn;   // Raw adb invocations
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;  // empty disables the file sink
    LogLevelsConfig levels;
};

struct Config {
    AdbConfig adb;
    SyncDefaultsConfig sync;
    LoggingConfig logging;
};

Config loadConfig(const std::filesystem::path& path);

}
