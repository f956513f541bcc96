#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ds::cli {

// A simple labeled entry (option/flag), with optional aliases.
struct Entry {
    std::string label;                  // primary, e.g. "--delete"
    std::string desc;
    std::vector<std::string> aliases;   // e.g. {"-d", "--del"}
};

struct GroupedOptions {
    std::string title;
    std::vector<Entry> items;
};

struct Example {
    std::string cmd;
    std::string note;
};

// ANSI color theme. Set enabled=false to disable.
struct ColorTheme {
    bool enabled = true;

    std::string header = "\033[1;36m"; // section titles (bold cyan)
    std::string command = "\033[1;32m"; // command name (bold green)
    std::string key = "\033[33m";      // left column keys (yellow)
    std::string reset = "\033[0m";

    [[nodiscard]] std::string maybe(const std::string& code) const {
        return enabled ? code : "";
    }
    [[nodiscard]] std::string H() const { return maybe(header); }
    [[nodiscard]] std::string C() const { return maybe(command); }
    [[nodiscard]] std::string K() const { return maybe(key); }
    [[nodiscard]] std::string R() const { return maybe(reset); }
};

class Usage {
public:
    std::string command;
    std::string description;
    std::vector<Entry> positionals;
    std::vector<GroupedOptions> groups;
    std::vector<Example> examples;

    int term_width = 100;
    std::size_t max_key_col = 34;
    ColorTheme theme{};

    [[nodiscard]] std::string toText() const;

private:
    [[nodiscard]] std::string buildSynopsis_() const;
};

// Help text for the devsync command line.
Usage devsyncUsage();

}
