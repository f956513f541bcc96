#pragma once

#include <filesystem>

namespace ds::paths {

// $DEVSYNC_CONFIG, else $XDG_CONFIG_HOME/devsync/config.yaml, else ~/.config/devsync/config.yaml
std::filesystem::path getConfigPath();

// Points the config lookup at a file that does not exist, so tests run on defaults.
void setConfigPathForTesting(const std::filesystem::path& path = {});

}
