#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ds::cli {

// Bad command line: exit status 2 with the help text.
struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct FlagKV {
    std::string key;
    std::vector<std::string> args;  // empty for switches
};

struct CommandCall {
    std::vector<FlagKV> options;  // in command-line order, repeats kept
    std::vector<std::string> positionals;

    [[nodiscard]] bool has(const std::string& key) const {
        for (const auto& o : options) if (o.key == key) return true;
        return false;
    }

    [[nodiscard]] std::size_t count(const std::string& key) const {
        std::size_t n = 0;
        for (const auto& o : options) if (o.key == key) ++n;
        return n;
    }

    // First argument of every occurrence
    [[nodiscard]] std::vector<std::string> values(const std::string& key) const {
        std::vector<std::string> out;
        for (const auto& o : options) if (o.key == key && !o.args.empty()) out.push_back(o.args.front());
        return out;
    }

    [[nodiscard]] std::vector<std::vector<std::string>> occurrences(const std::string& key) const {
        std::vector<std::vector<std::string>> out;
        for (const auto& o : options) if (o.key == key) out.push_back(o.args);
        return out;
    }

    // Last one wins
    [[nodiscard]] std::optional<std::string> value(const std::string& key) const {
        std::optional<std::string> out;
        for (const auto& o : options) if (o.key == key && !o.args.empty()) out = o.args.front();
        return out;
    }
};

}
