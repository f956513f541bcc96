#include "cli/Usage.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace ds::cli {

namespace {

std::string trimRight(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

std::vector<std::string> wrap(const std::string& s, const int width) {
    const int W = std::max(20, width);
    std::vector<std::string> out;
    std::size_t i = 0;
    const std::size_t n = s.size();
    while (i < n) {
        while (i < n && s[i] == ' ') ++i;
        if (i >= n) break;

        const std::size_t end = std::min<std::size_t>(i + W, n);
        std::size_t break_pos = end;

        // prefer last space before end
        if (end < n && s[end] != ' ') {
            const auto sp = s.rfind(' ', end);
            if (sp != std::string::npos && sp > i) break_pos = sp;
        }

        out.push_back(trimRight(s.substr(i, break_pos - i)));
        i = break_pos;
    }
    if (out.empty()) out.emplace_back("");
    return out;
}

std::string keyText(const Entry& it) {
    if (it.aliases.empty()) return it.label;
    return fmt::format("{}, {}", fmt::join(it.aliases, ", "), it.label);
}

std::string padRight(const std::string& s, const std::size_t width) {
    if (s.size() >= width) return s;
    return s + std::string(width - s.size(), ' ');
}

void emitTwoColSection(std::ostringstream& out, const std::string& title, const std::vector<Entry>& items,
                       const std::size_t indent, const std::size_t gap, const int width,
                       const std::size_t max_key_col, const ColorTheme& theme) {
    if (items.empty()) return;
    out << theme.H() << title << theme.R() << "\n";

    std::size_t keyw = 0;
    for (const auto& it : items) keyw = std::max(keyw, keyText(it).size());
    keyw = std::min(keyw, max_key_col);

    const int rightw = width - static_cast<int>(indent + keyw + gap);
    for (const auto& it : items) {
        const auto key = keyText(it);
        const auto desc_lines = wrap(it.desc, rightw);

        out << std::string(indent, ' ') << theme.K() << padRight(key, keyw) << theme.R();
        // overlong keys push the description to its own line
        if (key.size() > keyw) out << "\n" << std::string(indent + keyw, ' ');
        out << std::string(gap, ' ') << desc_lines[0] << "\n";
        for (std::size_t i = 1; i < desc_lines.size(); ++i)
            out << std::string(indent + keyw + gap, ' ') << desc_lines[i] << "\n";
    }
    out << "\n";
}

}

std::string Usage::buildSynopsis_() const {
    std::string s = command + " [options]";
    for (const auto& p : positionals) s += " " + p.label;
    return s;
}

std::string Usage::toText() const {
    std::ostringstream out;
    out << theme.H() << "Usage:" << theme.R() << " " << theme.C() << buildSynopsis_() << theme.R() << "\n\n";

    for (const auto& ln : wrap(description, term_width - 2)) out << "  " << ln << "\n";
    out << "\n";

    emitTwoColSection(out, "Arguments:", positionals, 2, 2, term_width, max_key_col, theme);
    for (const auto& g : groups) emitTwoColSection(out, g.title + ":", g.items, 2, 2, term_width, max_key_col, theme);

    if (!examples.empty()) {
        out << theme.H() << "Examples:" << theme.R() << "\n";
        for (const auto& ex : examples) {
            out << "  " << theme.C() << ex.cmd << theme.R() << "\n";
            if (!ex.note.empty()) out << "      " << ex.note << "\n";
        }
    }
    return out.str();
}

Usage devsyncUsage() {
    Usage u;
    u.command = "devsync";
    u.description =
        "Synchronize a local directory tree with a tree on an Android device over adb. "
        "By default files are pushed to the device; regular files are compared by size "
        "and, in two-way mode, by modification minute.";

    u.positionals = {
        {"SRC...", "Source paths. A trailing '/' syncs the contents of SRC into DST, otherwise SRC itself is synced into DST/<name>."},
        {"DST", "Destination path."},
    };

    u.groups = {
        {"Direction", {
            {"--reverse", "Pull from the device: SRC paths are on the device, DST is local.", {"-R"}},
            {"--two-way", "Sync both directions; the newer modification minute wins.", {"-2"}},
        }},
        {"Sync", {
            {"--times", "Preserve access and modification times.", {"-t"}},
            {"--delete", "Delete destination entries that do not exist on the source.", {"-d", "--del"}},
            {"--delete-excluded", "Also delete excluded destination entries (implies --delete).", {}},
            {"--force", "Allow replacing files by directories and vice versa.", {"-f"}},
            {"--no-clobber", "Never overwrite a differing destination entry.", {"-n"}},
            {"--copy-links", "Follow symlinks and copy what they point to.", {"-L"}},
            {"--dry-run", "Log the plan but change nothing.", {}},
            {"--exclude PATTERN", "Skip paths matching the glob (repeatable).", {}},
            {"--exclude-from FILE", "Read exclude patterns from FILE, one per line (repeatable).", {}},
        }},
        {"adb", {
            {"--adb-bin PATH", "adb executable to run (default: adb).", {}},
            {"--adb-flag FLAG", "Pass -FLAG to adb, e.g. d or e (repeatable).", {}},
            {"--adb-option OPTION VALUE", "Pass -OPTION VALUE to adb, e.g. P 5037 (repeatable).", {}},
            {"--show-progress", "Log the progress lines of adb push and pull.", {}},
        }},
        {"General", {
            {"--config PATH", "Configuration file (default: $DEVSYNC_CONFIG or ~/.config/devsync/config.yaml).", {}},
            {"--verbose", "More output (repeatable).", {"-v"}},
            {"--quiet", "Less output (repeatable).", {"-q"}},
            {"--no-color", "Disable colored output.", {}},
            {"--help", "Show this help.", {"-h"}},
            {"--version", "Show the version.", {}},
        }},
    };

    u.examples = {
        {"devsync ~/Music/ /sdcard/Music", "Push the contents of ~/Music to /sdcard/Music."},
        {"devsync -R -t /sdcard/DCIM ~/Pictures", "Pull /sdcard/DCIM into ~/Pictures/DCIM, keeping times."},
        {"devsync -2 ~/notes/ /sdcard/notes", "Keep both trees in step, newer edits win."},
    };
    return u;
}

}
