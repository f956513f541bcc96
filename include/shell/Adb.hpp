#pragma once

#include "shell/Process.hpp"

#include <string>
#include <utility>
#include <vector>

namespace ds::config {
struct AdbConfig;
}

namespace ds::shell {

// The opaque channel to the device: every call is one blocking adb invocation.
class Adb {
public:
    explicit Adb(std::vector<std::string> prefix, Runner runner = run);

    static Adb fromConfig(const config::AdbConfig& cnf, Runner runner = run);

    // adb shell <words...>, each word quoted for the device shell
    Result shell(const std::vector<std::string>& words) const;

    Result push(const std::string& localSrc, const std::string& remoteDst) const;
    Result pull(const std::string& remoteSrc, const std::string& localDst) const;

    [[nodiscard]] const std::vector<std::string>& prefix() const { return prefix_; }

    // push/pull pass -p and log their output at info level
    void setShowProgress(const bool on) { showProgress_ = on; }

private:
    std::vector<std::string> prefix_;
    Runner runner_;
    bool showProgress_{false};

    Result transfer(const std::string& verb, const std::string& from, const std::string& to) const;

    [[nodiscard]] std::vector<std::string> command(std::initializer_list<std::string> tail) const;
};

}
