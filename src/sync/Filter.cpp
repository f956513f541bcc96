#include "sync/Filter.hpp"
#include "fs/model/Path.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fnmatch.h>
#include <fstream>
#include <stdexcept>

using namespace ds::sync;
using namespace ds::fs::model;

Filter::Filter(const std::vector<std::string>& patterns) {
    for (const auto& raw : patterns) {
        auto p = trim(raw);
        while (p.starts_with("./")) p.erase(0, 2);
        while (p.starts_with("/")) p.erase(0, 1);
        p = stripTrailingSlashes(p);
        if (p.empty()) continue;
        patterns_.push_back(std::move(p));
    }
}

bool Filter::matches(const std::string& path) const {
    return std::any_of(patterns_.begin(), patterns_.end(), [&](const std::string& p) {
        return fnmatch(p.c_str(), path.c_str(), 0) == 0;
    });
}

bool Filter::excluded(const std::string& relPath) const {
    if (relPath.empty() || patterns_.empty()) return false;

    for (auto slash = relPath.find('/'); slash != std::string::npos; slash = relPath.find('/', slash + 1))
        if (matches(relPath.substr(0, slash))) return true;

    return matches(relPath);
}

Snapshot Filter::apply(Snapshot& snapshot) const {
    if (patterns_.empty()) return {};

    const auto mid = std::stable_partition(snapshot.begin(), snapshot.end(),
                                           [this](const Item& item) { return !excluded(item.path); });

    Snapshot out(std::make_move_iterator(mid), std::make_move_iterator(snapshot.end()));
    snapshot.erase(mid, snapshot.end());

    for (const auto& item : out) ds::log::Registry::sync()->debug("[Filter] Excluded {}", item.path);
    return out;
}

std::vector<std::string> Filter::readPatternFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("Cannot read exclude file: " + path);

    std::vector<std::string> out;
    for (std::string line; std::getline(in, line);) {
        while (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) out.push_back(std::move(line));
    }
    return out;
}
