#pragma once

#include "cli/Parser.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"
#include "sync/Controller.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ds::cli {

struct Options {
    sync::Request request;

    std::optional<std::filesystem::path> configPath;
    log::ConsoleOverrides console;

    std::optional<std::string> adbBinary;
    std::vector<std::string> adbFlags;
    std::vector<std::pair<std::string, std::string>> adbOptions;
    bool showProgress{false};

    std::vector<std::string> excludeFrom;

    bool showHelp{false};
    bool showVersion{false};
};

[[nodiscard]] std::optional<FlagInfo> lookupFlag(const std::string& spelled);
[[nodiscard]] std::size_t flagArity(const std::string& spelled);

// argv without the program name. Throws UsageError.
Options parseArgs(const std::vector<std::string>& args);

// Folds configuration defaults and --exclude-from files into the request.
// Configured excludes come first; options only ever switch defaults on.
void applyConfig(const config::Config& cnf, Options& opts);

// The adb command prefix: configuration, then command-line additions.
config::AdbConfig resolveAdb(const config::Config& cnf, const Options& opts);

}
