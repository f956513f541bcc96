#include "shell/Adb.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

using namespace ds::shell;

Adb::Adb(std::vector<std::string> prefix, Runner runner)
    : prefix_(std::move(prefix)), runner_(std::move(runner)) {
    if (prefix_.empty()) prefix_.emplace_back("adb");
}

Adb Adb::fromConfig(const config::AdbConfig& cnf, Runner runner) {
    std::vector<std::string> prefix{cnf.binary};
    for (const auto& flag : cnf.flags) prefix.push_back("-" + flag);
    for (const auto& [option, value] : cnf.options) {
        prefix.push_back("-" + option);
        prefix.push_back(value);
    }
    Adb adb(std::move(prefix), std::move(runner));
    adb.setShowProgress(cnf.show_progress);
    return adb;
}

std::vector<std::string> Adb::command(const std::initializer_list<std::string> tail) const {
    auto argv = prefix_;
    argv.insert(argv.end(), tail.begin(), tail.end());
    return argv;
}

Result Adb::shell(const std::vector<std::string>& words) const {
    // adb joins its arguments with spaces and hands the line to the device shell,
    // so each word is quoted here and passed as a single argument
    std::string line;
    for (const auto& w : words) {
        if (!line.empty()) line.push_back(' ');
        line += quote(w);
    }
    return runner_(command({"shell", line}));
}

Result Adb::transfer(const std::string& verb, const std::string& from, const std::string& to) const {
    auto res = showProgress_ ? runner_(command({verb, "-p", from, to})) : runner_(command({verb, from, to}));
    if (showProgress_)
        for (const auto& line : res.lines) log::Registry::fs()->info("[adb {}] {}", verb, line);
    else
        for (const auto& line : res.lines) log::Registry::shell()->debug("[adb {}] {}", verb, line);
    return res;
}

Result Adb::push(const std::string& localSrc, const std::string& remoteDst) const {
    return transfer("push", localSrc, remoteDst);
}

Result Adb::pull(const std::string& remoteSrc, const std::string& localDst) const {
    return transfer("pull", remoteSrc, localDst);
}
