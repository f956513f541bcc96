#include "config/Config.hpp"
#include "config/ConfigRegistry.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace ds::config;
namespace stdfs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    stdfs::path file = stdfs::temp_directory_path() /
                       ("devsync_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) + ".yaml");

    void write(const std::string& yaml) const { std::ofstream(file) << yaml; }

    void TearDown() override { stdfs::remove(file); }
};

TEST_F(ConfigTest, MissingFileGivesDefaults) {
    const auto cnf = loadConfig("/nonexistent/devsync/config.yaml");

    EXPECT_EQ(cnf.adb.binary, "adb");
    EXPECT_TRUE(cnf.adb.flags.empty());
    EXPECT_TRUE(cnf.adb.options.empty());
    EXPECT_FALSE(cnf.adb.show_progress);
    EXPECT_TRUE(cnf.sync.exclude.empty());
    EXPECT_FALSE(cnf.sync.preserve_times);
    EXPECT_TRUE(cnf.logging.log_dir.empty());
    EXPECT_EQ(cnf.logging.levels.console_log_level, spdlog::level::info);
    EXPECT_EQ(cnf.logging.levels.subsystem_levels.shell, spdlog::level::warn);
}

TEST_F(ConfigTest, LoadsAllSections) {
    write(R"(
adb:
  binary: /opt/platform-tools/adb
  flags: [d]
  options:
    s: R58M123ABC
  show_progress: true
sync:
  exclude:
    - .thumbnails
    - "*.tmp"
  preserve_times: true
  copy_links: true
logging:
  log_dir: /tmp/devsync-logs
  log_levels:
    console_log_level: warn
    file_log_level: trace
    subsystem_levels:
      shell: debug
)");

    const auto cnf = loadConfig(file);

    EXPECT_EQ(cnf.adb.binary, "/opt/platform-tools/adb");
    EXPECT_EQ(cnf.adb.flags, (std::vector<std::string>{"d"}));
    ASSERT_EQ(cnf.adb.options.size(), 1u);
    EXPECT_EQ(cnf.adb.options[0].first, "s");
    EXPECT_EQ(cnf.adb.options[0].second, "R58M123ABC");
    EXPECT_TRUE(cnf.adb.show_progress);

    EXPECT_EQ(cnf.sync.exclude, (std::vector<std::string>{".thumbnails", "*.tmp"}));
    EXPECT_TRUE(cnf.sync.preserve_times);
    EXPECT_TRUE(cnf.sync.copy_links);

    EXPECT_EQ(cnf.logging.log_dir, "/tmp/devsync-logs");
    EXPECT_EQ(cnf.logging.levels.console_log_level, spdlog::level::warn);
    EXPECT_EQ(cnf.logging.levels.file_log_level, spdlog::level::trace);
    EXPECT_EQ(cnf.logging.levels.subsystem_levels.shell, spdlog::level::debug);
    EXPECT_EQ(cnf.logging.levels.subsystem_levels.sync, spdlog::level::info);
}

TEST_F(ConfigTest, PartialSectionsKeepDefaults) {
    write("sync:\n  preserve_times: true\n");

    const auto cnf = loadConfig(file);
    EXPECT_TRUE(cnf.sync.preserve_times);
    EXPECT_FALSE(cnf.sync.copy_links);
    EXPECT_EQ(cnf.adb.binary, "adb");
}

TEST_F(ConfigTest, MalformedYamlThrows) {
    write("adb: [unterminated\n");
    EXPECT_THROW(loadConfig(file), std::runtime_error);
}

TEST_F(ConfigTest, RegistryIsInitializedForTests) {
    ASSERT_TRUE(ConfigRegistry::isInitialized());
    EXPECT_EQ(ConfigRegistry::get().adb.binary, "adb");
}
