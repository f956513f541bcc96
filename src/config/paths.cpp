#include "config/paths.hpp"

#include <cstdlib>
#include <optional>

namespace ds::paths {

namespace {
std::optional<std::filesystem::path> testConfigPath;
}

std::filesystem::path getConfigPath() {
    if (testConfigPath) return *testConfigPath;

    if (const char* env = std::getenv("DEVSYNC_CONFIG"); env && *env) return env;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "devsync" / "config.yaml";
    if (const char* home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".config" / "devsync" / "config.yaml";
    return "devsync.yaml";
}

void setConfigPathForTesting(const std::filesystem::path& path) {
    testConfigPath = path.empty() ? std::filesystem::temp_directory_path() / "devsync_test_missing_config.yaml" : path;
}

}
