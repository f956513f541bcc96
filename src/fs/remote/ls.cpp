#include "fs/remote/ls.hpp"
#include "fs/errors.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <regex>
#include <sstream>
#include <vector>

using namespace ds::fs;
using namespace ds::fs::model;

namespace {

const std::regex& lineRegex() {
    static const std::regex re(
        R"(^([-bcdlps])[-r][-w][-xsS][-r][-w][-xsS][-r][-w][-xtT]\S*( .*?) (\d{4}-\d{2}-\d{2} \d{2}:\d{2}) (.*)$)");
    return re;
}

const std::regex& totalRegex() {
    static const std::regex re(R"(^total \d+$)");
    return re;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> words(const std::string& s) {
    std::istringstream in(s);
    std::vector<std::string> out;
    for (std::string w; in >> w;) out.push_back(std::move(w));
    return out;
}

bool isNumber(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](const unsigned char c) { return std::isdigit(c); });
}

mode_t typeBits(const char c) {
    switch (c) {
    case '-': return S_IFREG;
    case 'd': return S_IFDIR;
    case 'l': return S_IFLNK;
    case 'b': return S_IFBLK;
    case 'c': return S_IFCHR;
    case 'p': return S_IFIFO;
    case 's': return S_IFSOCK;
    default: return 0;
    }
}

std::time_t parseMinute(const std::string& stamp, const std::string& line) {
    std::tm tm{};
    const char* end = strptime(stamp.c_str(), "%Y-%m-%d %H:%M", &tm);
    if (!end || *end != '\0') throw Unparseable(line);
    tm.tm_isdst = -1;
    const auto t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1)) throw Unparseable(line);
    return t;
}

}

namespace ds::fs::remote {

bool isTotalLine(const std::string& line) {
    return std::regex_match(line, totalRegex());
}

ListingEntry parseLsLine(const std::string& line) {
    if (endsWith(line, ": No such file or directory") || endsWith(line, ": Not a directory"))
        throw NotFound(line.substr(0, line.rfind(": ")));

    std::smatch m;
    if (!std::regex_match(line, m, lineRegex())) throw Unparseable(line);

    const mode_t type = typeBits(m[1].str().front());
    const auto kind = kindFromMode(type);

    // [links] user group [size | major, minor]
    const auto middle = words(m[2].str());
    if (middle.size() < 2) throw Unparseable(line);

    std::optional<uintmax_t> size;
    if (kind == EntryKind::RegularFile) {
        if (middle.size() < 3 || !isNumber(middle.back())) throw Unparseable(line);
        size = std::stoull(middle.back());
    }

    const auto mtime = parseMinute(m[3].str(), line);

    std::string name = m[4].str();
    if (kind == EntryKind::Symlink) {
        if (const auto arrow = name.find(" -> "); arrow != std::string::npos) name.erase(arrow);
    }
    if (name.empty()) throw Unparseable(line);

    return {std::move(name), Metadata{kind, size, mtime, mtime, static_cast<mode_t>(type | 0755)}};
}

}
