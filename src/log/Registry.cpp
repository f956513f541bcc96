#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <vector>

namespace ds::log {

void Registry::init(const ConsoleOverrides& console) {
    if (initialized_) {
        spdlog::warn("[log::Registry] Already initialized, ignoring second init()");
        return;
    }

    const auto& cnf = config::ConfigRegistry::get().logging;
    const auto consoleLevel = console.level.value_or(cnf.levels.console_log_level);

    // console goes to stderr so stdout stays clean for --help/--version
    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(consoleLevel);
    console_sink_->set_color_mode(console.color ? spdlog::color_mode::automatic : spdlog::color_mode::never);
    console_sink_->set_pattern(CONSOLE_LOG_FORMAT);

    if (!cnf.log_dir.empty()) {
        namespace fs = std::filesystem;
        if (!fs::exists(cnf.log_dir)) fs::create_directories(cnf.log_dir);
        main_log_path_ = cnf.log_dir / "devsync.log";

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(FILE_LOG_FORMAT);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        std::vector<spdlog::sink_ptr> sinks{console_sink_};
        if (main_file_sink_) sinks.push_back(main_file_sink_);

        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        // a -v on the command line must not be swallowed by a stricter subsystem level
        logger->set_level(console.level ? std::min(lvl, *console.level) : lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("devsync", sub_levels.devsync);
    makeLogger("sync",    sub_levels.sync);
    makeLogger("fs",      sub_levels.fs);
    makeLogger("shell",   sub_levels.shell);

    initialized_ = true;
    devsync()->debug("[log::Registry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[log::Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[log::Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }

void Registry::flushAll() {
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& lg) { lg->flush(); });
}

}
