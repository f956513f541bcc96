#include "cli/Args.hpp"
#include "cli/Usage.hpp"
#include "sync/errors.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace ds::cli;
using namespace ds::sync::model;

using Strings = std::vector<std::string>;

TEST(TokenizeTest, SplitsFlagForms) {
    const auto toks = tokenize({"-tv", "--exclude=*.o", "--delete", "-", "src", "--", "-not-a-flag"});
    EXPECT_EQ(to_string(toks),
              "Flag(t) Flag(v) Flag(exclude) Value(*.o) Flag(delete) Word(-) Word(src) Word(--) Word(-not-a-flag)");
}

TEST(ParseTokensTest, ValueFromNextWord) {
    const auto call = parseTokens(tokenize({"--exclude", "*.tmp", "a", "b"}), lookupFlag);
    EXPECT_EQ(call.values("exclude"), (Strings{"*.tmp"}));
    EXPECT_EQ(call.positionals, (Strings{"a", "b"}));
}

TEST(ParseTokensTest, Errors) {
    EXPECT_THROW(parseTokens(tokenize({"--bogus", "a", "b"}), lookupFlag), UsageError);
    EXPECT_THROW(parseTokens(tokenize({"-x"}), lookupFlag), UsageError);
    EXPECT_THROW(parseTokens(tokenize({"--delete=yes"}), lookupFlag), UsageError);
    EXPECT_THROW(parseTokens(tokenize({"a", "--exclude"}), lookupFlag), UsageError);
    EXPECT_THROW(parseTokens(tokenize({"--exclude", "--", "a"}), lookupFlag), UsageError);
    EXPECT_THROW(parseTokens(tokenize({"--adb-option", "P"}, flagArity), lookupFlag), UsageError);
}

TEST(TokenizeTest, ValueTakingFlagsSwallowDashedArguments) {
    const auto toks = tokenize({"--adb-flag", "-d", "--adb-option=-s", "--", "--exclude", "-x", "-v", "a"}, flagArity);
    EXPECT_EQ(to_string(toks),
              "Flag(adb-flag) Value(-d) Flag(adb-option) Value(-s) Value(--) Flag(exclude) Value(-x) Flag(v) Word(a)");
}

TEST(ParseArgsTest, DefaultIsPush) {
    const auto opts = parseArgs({"photos", "/sdcard"});
    const auto& p = opts.request.policy;

    EXPECT_EQ(opts.request.sources, (Strings{"photos"}));
    EXPECT_EQ(opts.request.destination, "/sdcard");
    EXPECT_FALSE(opts.request.reverse);
    EXPECT_TRUE(p.localToRemote);
    EXPECT_FALSE(p.remoteToLocal);
    EXPECT_TRUE(p.allowOverwrite);
    EXPECT_FALSE(p.allowReplace);
    EXPECT_FALSE(p.deletes());
    EXPECT_FALSE(opts.console.level.has_value());
    EXPECT_TRUE(opts.console.color);
}

TEST(ParseArgsTest, ReverseAndTwoWay) {
    const auto rev = parseArgs({"-R", "/sdcard/DCIM", "/sdcard/Music", "backup"});
    EXPECT_TRUE(rev.request.reverse);
    EXPECT_FALSE(rev.request.policy.localToRemote);
    EXPECT_TRUE(rev.request.policy.remoteToLocal);
    EXPECT_EQ(rev.request.sources, (Strings{"/sdcard/DCIM", "/sdcard/Music"}));

    const auto both = parseArgs({"--two-way", "a", "b"});
    EXPECT_TRUE(both.request.policy.twoWay());
}

TEST(ParseArgsTest, BundledPolicyFlags) {
    const auto opts = parseArgs({"-tdfnL", "--dry-run", "a", "b"});
    const auto& p = opts.request.policy;
    EXPECT_TRUE(p.preserveTimes);
    EXPECT_TRUE(p.deleteExtraneous);
    EXPECT_FALSE(p.deleteExcluded);
    EXPECT_TRUE(p.allowReplace);
    EXPECT_FALSE(p.allowOverwrite);
    EXPECT_TRUE(p.followLinks);
    EXPECT_TRUE(p.dryRun);
}

TEST(ParseArgsTest, DeleteExcludedImpliesDelete) {
    const auto opts = parseArgs({"--delete-excluded", "a", "b"});
    EXPECT_TRUE(opts.request.policy.deleteExtraneous);
    EXPECT_TRUE(opts.request.policy.deleteExcluded);
}

TEST(ParseArgsTest, TwoWayWithDeleteFailsValidation) {
    const auto opts = parseArgs({"-2", "--del", "a", "b"});
    EXPECT_THROW(opts.request.policy.validate(), ds::sync::ConfigConflict);
}

TEST(ParseArgsTest, PositionalsAfterDoubleDash) {
    const auto opts = parseArgs({"--", "-odd-name", "dst"});
    EXPECT_EQ(opts.request.sources, (Strings{"-odd-name"}));
    EXPECT_EQ(opts.request.destination, "dst");
}

TEST(ParseArgsTest, NeedsSourceAndDestination) {
    EXPECT_THROW(parseArgs({}), UsageError);
    EXPECT_THROW(parseArgs({"only-one"}), UsageError);
}

TEST(ParseArgsTest, HelpAndVersionNeedNoPaths) {
    EXPECT_TRUE(parseArgs({"-h"}).showHelp);
    EXPECT_TRUE(parseArgs({"--version"}).showVersion);
}

TEST(ParseArgsTest, Verbosity) {
    EXPECT_EQ(parseArgs({"-v", "a", "b"}).console.level, spdlog::level::debug);
    EXPECT_EQ(parseArgs({"-vv", "a", "b"}).console.level, spdlog::level::trace);
    EXPECT_EQ(parseArgs({"-vvvv", "a", "b"}).console.level, spdlog::level::trace);
    EXPECT_EQ(parseArgs({"-q", "a", "b"}).console.level, spdlog::level::warn);
    EXPECT_EQ(parseArgs({"-qqqqqq", "a", "b"}).console.level, spdlog::level::off);
    EXPECT_EQ(parseArgs({"-vq", "a", "b"}).console.level, spdlog::level::info);
    EXPECT_FALSE(parseArgs({"--no-color", "a", "b"}).console.color);
}

TEST(ParseArgsTest, AdbSelection) {
    const auto opts = parseArgs({"--adb-bin", "/opt/adb", "--adb-flag", "-d", "--adb-option", "-s", "emulator-5554",
                                 "--adb-option", "H", "host", "a", "b"});
    EXPECT_EQ(opts.adbBinary, "/opt/adb");
    EXPECT_EQ(opts.adbFlags, (Strings{"d"}));
    ASSERT_EQ(opts.adbOptions.size(), 2u);
    EXPECT_EQ(opts.adbOptions[0], (std::pair<std::string, std::string>{"s", "emulator-5554"}));
    EXPECT_EQ(opts.adbOptions[1], (std::pair<std::string, std::string>{"H", "host"}));

    EXPECT_FALSE(opts.showProgress);

    EXPECT_THROW(parseArgs({"a", "b", "--adb-option", "P"}), UsageError);
    EXPECT_THROW(parseArgs({"--adb-option", "-", "5037", "a", "b"}), UsageError);
}

TEST(ParseArgsTest, ShowProgressReachesAdbConfig) {
    const auto opts = parseArgs({"--show-progress", "a", "b"});
    EXPECT_TRUE(opts.showProgress);
    EXPECT_TRUE(resolveAdb(ds::config::Config{}, opts).show_progress);
    EXPECT_FALSE(resolveAdb(ds::config::Config{}, parseArgs({"a", "b"})).show_progress);
}

TEST(ApplyConfigTest, MergesExcludesAndDefaults) {
    const auto file = std::filesystem::temp_directory_path() / "devsync_cli_excludes.txt";
    std::ofstream(file) << "*.tmp\r\n\nbuild/\n";

    ds::config::Config cnf;
    cnf.sync.exclude = {".git"};
    cnf.sync.preserve_times = true;

    auto opts = parseArgs({"--exclude", "*.o", "--exclude-from", file.string(), "a", "b"});
    applyConfig(cnf, opts);
    std::filesystem::remove(file);

    EXPECT_EQ(opts.request.policy.excludes, (Strings{".git", "*.tmp", "build/", "*.o"}));
    EXPECT_TRUE(opts.request.policy.preserveTimes);
    EXPECT_FALSE(opts.request.policy.followLinks);
}

TEST(ApplyConfigTest, MissingExcludeFileThrows) {
    auto opts = parseArgs({"--exclude-from", "/nonexistent/devsync/excludes", "a", "b"});
    EXPECT_THROW(applyConfig(ds::config::Config{}, opts), std::runtime_error);
}

TEST(ResolveAdbTest, CommandLineExtendsConfig) {
    ds::config::Config cnf;
    cnf.adb.flags = {"d"};
    cnf.adb.options = {{"P", "5038"}};

    const auto opts = parseArgs({"--adb-bin", "adb2", "--adb-option", "s", "XYZ", "a", "b"});
    const auto adb = resolveAdb(cnf, opts);

    EXPECT_EQ(adb.binary, "adb2");
    EXPECT_EQ(adb.flags, (Strings{"d"}));
    ASSERT_EQ(adb.options.size(), 2u);
    EXPECT_EQ(adb.options[1].first, "s");
}

TEST(UsageTest, MentionsEveryOption) {
    auto usage = devsyncUsage();
    usage.theme.enabled = false;
    const auto text = usage.toText();
    for (const auto* opt : {"--reverse", "--two-way", "--times", "--delete", "--delete-excluded", "--force",
                            "--no-clobber", "--copy-links", "--dry-run", "--exclude", "--exclude-from",
                            "--adb-bin", "--adb-flag", "--adb-option", "--show-progress", "--config", "--verbose", "--quiet", "--help"})
        EXPECT_NE(text.find(opt), std::string::npos) << opt;
}
