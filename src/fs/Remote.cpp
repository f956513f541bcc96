#include "fs/Remote.hpp"
#include "fs/errors.hpp"
#include "fs/model/Path.hpp"
#include "fs/remote/ls.hpp"
#include "shell/Adb.hpp"
#include "log/Registry.hpp"

#include <array>
#include <regex>

using namespace ds::fs;
using namespace ds::fs::model;

namespace {

// Chatter the adb client prints while starting its server.
bool isDaemonNoise(const std::string& line) {
    static const std::regex notRunning(R"(^\* daemon not running; starting now at tcp:\d+$)");
    static const std::regex started(R"(^\* daemon started successfully$)");
    return std::regex_match(line, notRunning) || std::regex_match(line, started);
}

std::string describe(const ds::shell::Result& res) {
    std::string out = "exit " + std::to_string(res.exit_code);
    for (const auto& line : res.lines) {
        if (isDaemonNoise(line)) continue;
        out += "; " + line;
    }
    return out;
}

std::string touchStamp(const std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y%m%d%H%M.%S", &tm);
    return buf;
}

}

Remote::Remote(std::shared_ptr<shell::Adb> adb) : adb_(std::move(adb)) {}

std::vector<std::string> Remote::list(const std::string& path) {
    auto dir = stripTrailingSlashes(path);
    if (dir.empty() || dir.back() != '/') dir.push_back('/');
    const auto res = adb_->shell({"ls", "-al", dir});

    std::vector<std::string> names;
    for (const auto& line : res.lines) {
        if (line.empty() || isDaemonNoise(line) || remote::isTotalLine(line)) continue;
        try {
            auto [entryName, meta] = remote::parseLsLine(line);
            if (entryName == "." || entryName == "..") continue;
            cache_.put(join(path, entryName), meta);
            names.push_back(std::move(entryName));
        } catch (const Unparseable& e) {
            log::Registry::fs()->warn("[Remote] Skipping entry in '{}': {}", path, e.what());
        }
    }
    return names;
}

Metadata Remote::statOne(const std::vector<std::string>& lsArgs, const std::string& path) {
    auto words = lsArgs;
    words.push_back(path);
    const auto res = adb_->shell(words);

    for (const auto& line : res.lines) {
        if (line.empty() || isDaemonNoise(line)) continue;
        return remote::parseLsLine(line).meta;
    }
    throw OperationFailed("ls '" + path + "' produced no output (" + describe(res) + ")");
}

Metadata Remote::lstat(const std::string& path) {
    if (const auto hit = cache_.get(path)) return *hit;
    const auto meta = statOne({"ls", "-ald"}, path);
    cache_.put(path, meta);
    return meta;
}

Metadata Remote::stat(const std::string& path) {
    if (const auto hit = cache_.get(path); hit && !hit->isSymlink()) return *hit;
    return statOne({"ls", "-aldL"}, path);
}

void Remote::runQuiet(const std::vector<std::string>& words, const std::string& path) {
    cache_.evictPath(path);
    const auto res = adb_->shell(words);

    bool output = false;
    for (const auto& line : res.lines) {
        if (isDaemonNoise(line)) continue;
        log::Registry::fs()->error("[Remote] {}: {}", words.front(), line);
        output = true;
    }
    if (output || !res.ok()) throw OperationFailed(words.front() + " '" + path + "' failed (" + describe(res) + ")");
}

void Remote::unlink(const std::string& path) { runQuiet({"rm", path}, path); }

void Remote::rmdir(const std::string& path) { runQuiet({"rmdir", path}, path); }

void Remote::makedirs(const std::string& path) { runQuiet({"mkdir", "-p", path}, path); }

// -h: a symlink gets its own times, as with Local::utime
void Remote::utime(const std::string& path, const std::time_t atime, const std::time_t mtime) {
    runQuiet({"touch", "-h", "-a", "-t", touchStamp(atime), path}, path);
    runQuiet({"touch", "-h", "-m", "-t", touchStamp(mtime), path}, path);
}

void Remote::copyInto(const std::string& srcPath, const std::string& dstPath) {
    cache_.evictPath(dstPath);
    const auto res = adb_->push(srcPath, dstPath);
    if (!res.ok()) throw OperationFailed("adb push '" + srcPath + "' -> '" + dstPath + "' failed (" + describe(res) + ")");
    log::Registry::fs()->debug("[Remote] Pushed {} -> {}", srcPath, dstPath);
}

bool Remote::selfTest() {
    static const std::regex noDevice(R"(^adb: no devices/emulators found$)");

    const auto ping = adb_->shell({":"});
    for (const auto& line : ping.lines) {
        if (isDaemonNoise(line)) continue;
        if (std::regex_match(line, noDevice)) {
            log::Registry::fs()->error("[Remote] No device found");
            return false;
        }
        log::Registry::fs()->warn("[Remote] Unexpected output from device: {}", line);
    }
    if (!ping.ok()) {
        log::Registry::fs()->error("[Remote] Device not reachable ({})", describe(ping));
        return false;
    }

    // Round-trip strings the device shell would mangle if quoting were broken
    static constexpr std::array<const char*, 10> probes{
        "plain", "two  spaces", "'single'", "\"double\"", "`backtick`",
        "$HOME", "semi;colon", "#hash", "(paren)", "back\\slash"};

    for (const auto* probe : probes) {
        const auto res = adb_->shell({"date", std::string("+") + probe});
        std::vector<std::string> lines;
        for (const auto& line : res.lines)
            if (!isDaemonNoise(line)) lines.push_back(line);

        if (!res.ok() || lines.size() != 1 || lines.front() != probe) {
            log::Registry::fs()->error("[Remote] Shell quoting self-test failed for <{}>: got <{}>",
                                       probe, lines.empty() ? std::string() : lines.front());
            return false;
        }
    }

    log::Registry::fs()->debug("[Remote] Self-test passed");
    return true;
}
