#pragma once

#include <memory>
#include <optional>
#include <string>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace ds::log {

struct ConsoleOverrides {
    std::optional<spdlog::level::level_enum> level;  // -v / -q
    bool color = true;
};

class Registry {
public:
    // Initialize all loggers with sinks/levels taken from ConfigRegistry.
    static void init(const ConsoleOverrides& console = {});

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> devsync() { return get("devsync"); }
    static std::shared_ptr<spdlog::logger> sync()    { return get("sync"); }
    static std::shared_ptr<spdlog::logger> fs()      { return get("fs"); }
    static std::shared_ptr<spdlog::logger> shell()   { return get("shell"); }

    [[nodiscard]] static bool isInitialized();

    static void flushAll();

private:
    static constexpr const auto* FILE_LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";
    static constexpr const auto* CONSOLE_LOG_FORMAT = "[%^%l%$] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
