#include "fs/model/Path.hpp"

#include <vector>

namespace ds::fs::model {

std::string child(const std::string_view parent, const std::string_view name) {
    if (parent.empty()) return std::string(name);
    std::string out;
    out.reserve(parent.size() + 1 + name.size());
    out.append(parent).push_back('/');
    out.append(name);
    return out;
}

std::string join(const std::string_view root, const std::string_view rel) {
    if (rel.empty()) return std::string(root);
    if (root.empty()) return std::string(rel);
    std::string out(root);
    if (out.back() != '/') out.push_back('/');
    out.append(rel);
    return out;
}

bool isUnder(const std::string_view path, const std::string_view dir) {
    if (dir.empty()) return !path.empty();
    return path.size() > dir.size() && path.starts_with(dir) && path[dir.size()] == '/';
}

std::string normalize(const std::string_view path) {
    if (path.empty()) return ".";

    const bool absolute = path.front() == '/';
    std::vector<std::string_view> parts;

    std::size_t i = 0;
    while (i < path.size()) {
        while (i < path.size() && path[i] == '/') ++i;
        const auto begin = i;
        while (i < path.size() && path[i] != '/') ++i;
        const auto part = path.substr(begin, i - begin);

        if (part.empty() || part == ".") continue;
        if (part == "..") {
            if (!parts.empty() && parts.back() != "..") parts.pop_back();
            else if (!absolute) parts.push_back(part);
            continue;
        }
        parts.push_back(part);
    }

    std::string out = absolute ? "/" : "";
    for (std::size_t p = 0; p < parts.size(); ++p) {
        if (p) out.push_back('/');
        out.append(parts[p]);
    }
    if (out.empty()) out = ".";
    return out;
}

std::string stripTrailingSlashes(const std::string_view path) {
    auto end = path.size();
    while (end > 1 && path[end - 1] == '/') --end;
    return std::string(path.substr(0, end));
}

std::string basename(const std::string_view path) {
    const auto stripped = stripTrailingSlashes(path);
    const auto pos = stripped.rfind('/');
    if (pos == std::string::npos) return stripped;
    return stripped.substr(pos + 1);
}

}
