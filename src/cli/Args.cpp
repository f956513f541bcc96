#include "cli/Args.hpp"
#include "sync/Filter.hpp"

#include <algorithm>
#include <unordered_map>

using namespace ds::cli;

namespace {

struct OptionDef {
    const char* name;
    std::size_t arity;
    std::vector<std::string> spellings;
};

const std::vector<OptionDef>& optionTable() {
    static const std::vector<OptionDef> table{
        {"reverse",         0, {"R", "reverse"}},
        {"two-way",         0, {"2", "two-way"}},
        {"times",           0, {"t", "times"}},
        {"delete",          0, {"d", "delete", "del"}},
        {"delete-excluded", 0, {"delete-excluded"}},
        {"force",           0, {"f", "force"}},
        {"no-clobber",      0, {"n", "no-clobber"}},
        {"copy-links",      0, {"L", "copy-links"}},
        {"dry-run",         0, {"dry-run"}},
        {"exclude",         1, {"exclude"}},
        {"exclude-from",    1, {"exclude-from"}},
        {"show-progress",   0, {"show-progress"}},
        {"adb-bin",         1, {"adb-bin"}},
        {"adb-flag",        1, {"adb-flag"}},
        {"adb-option",      2, {"adb-option"}},
        {"config",          1, {"config"}},
        {"verbose",         0, {"v", "verbose"}},
        {"quiet",           0, {"q", "quiet"}},
        {"no-color",        0, {"no-color"}},
        {"help",            0, {"h", "help"}},
        {"version",         0, {"version"}},
    };
    return table;
}

std::string stripDashes(std::string s) {
    s.erase(0, s.find_first_not_of('-'));
    return s;
}

spdlog::level::level_enum verbosityLevel(const int verbose, const int quiet) {
    // info is 2; -v steps toward trace, -q toward off
    const int lvl = std::clamp(static_cast<int>(spdlog::level::info) - verbose + quiet,
                               static_cast<int>(spdlog::level::trace),
                               static_cast<int>(spdlog::level::off));
    return static_cast<spdlog::level::level_enum>(lvl);
}

}

std::optional<FlagInfo> ds::cli::lookupFlag(const std::string& spelled) {
    static const auto index = [] {
        std::unordered_map<std::string, const OptionDef*> m;
        for (const auto& s : optionTable())
            for (const auto& alias : s.spellings) m.emplace(alias, &s);
        return m;
    }();

    const auto it = index.find(spelled);
    if (it == index.end()) return std::nullopt;
    return FlagInfo{it->second->name, it->second->arity};
}

std::size_t ds::cli::flagArity(const std::string& spelled) {
    const auto info = lookupFlag(spelled);
    return info ? info->arity : 0;
}

Options ds::cli::parseArgs(const std::vector<std::string>& args) {
    const auto call = parseTokens(tokenize(args, flagArity), lookupFlag);

    Options opts;
    opts.showHelp = call.has("help");
    opts.showVersion = call.has("version");
    if (opts.showHelp || opts.showVersion) return opts;

    if (call.positionals.size() < 2) throw UsageError("Need at least one SRC and a DST");

    auto& req = opts.request;
    req.sources.assign(call.positionals.begin(), call.positionals.end() - 1);
    req.destination = call.positionals.back();
    req.reverse = call.has("reverse");

    auto& p = req.policy;
    p.localToRemote = !req.reverse;
    p.remoteToLocal = req.reverse;
    if (call.has("two-way")) p.localToRemote = p.remoteToLocal = true;

    p.deleteExcluded = call.has("delete-excluded");
    p.deleteExtraneous = call.has("delete") || p.deleteExcluded;
    p.allowReplace = call.has("force");
    p.allowOverwrite = !call.has("no-clobber");
    p.preserveTimes = call.has("times");
    p.followLinks = call.has("copy-links");
    p.dryRun = call.has("dry-run");
    p.excludes = call.values("exclude");
    opts.excludeFrom = call.values("exclude-from");

    if (const auto cnf = call.value("config")) opts.configPath = *cnf;

    opts.adbBinary = call.value("adb-bin");
    for (const auto& f : call.values("adb-flag")) {
        auto flag = stripDashes(f);
        if (flag.empty()) throw UsageError("Empty --adb-flag");
        opts.adbFlags.push_back(std::move(flag));
    }
    for (const auto& kv : call.occurrences("adb-option")) {
        auto key = stripDashes(kv[0]);
        if (key.empty()) throw UsageError("--adb-option expects OPTION VALUE, got '" + kv[0] + "'");
        opts.adbOptions.emplace_back(std::move(key), kv[1]);
    }
    opts.showProgress = call.has("show-progress");

    const auto verbose = static_cast<int>(call.count("verbose"));
    const auto quiet = static_cast<int>(call.count("quiet"));
    if (verbose || quiet) opts.console.level = verbosityLevel(verbose, quiet);
    opts.console.color = !call.has("no-color");

    return opts;
}

void ds::cli::applyConfig(const config::Config& cnf, Options& opts) {
    auto& p = opts.request.policy;

    std::vector<std::string> excludes = cnf.sync.exclude;
    for (const auto& file : opts.excludeFrom) {
        const auto patterns = sync::Filter::readPatternFile(file);
        excludes.insert(excludes.end(), patterns.begin(), patterns.end());
    }
    excludes.insert(excludes.end(), p.excludes.begin(), p.excludes.end());
    p.excludes = std::move(excludes);

    p.preserveTimes = p.preserveTimes || cnf.sync.preserve_times;
    p.followLinks = p.followLinks || cnf.sync.copy_links;
}

ds::config::AdbConfig ds::cli::resolveAdb(const config::Config& cnf, const Options& opts) {
    auto adb = cnf.adb;
    if (opts.adbBinary) adb.binary = *opts.adbBinary;
    adb.flags.insert(adb.flags.end(), opts.adbFlags.begin(), opts.adbFlags.end());
    adb.options.insert(adb.options.end(), opts.adbOptions.begin(), opts.adbOptions.end());
    adb.show_progress = adb.show_progress || opts.showProgress;
    return adb;
}
