#pragma once

#include <string>
#include <string_view>

namespace ds::fs::model {

// Relative paths are root-relative, '/'-separated, without a leading slash.
// The sync root itself is the empty path.

/// Appends a child name to a relative path ("" + "a" -> "a", "a" + "b" -> "a/b").
[[nodiscard]] std::string child(std::string_view parent, std::string_view name);

/// Resolves a relative path against an endpoint root. The root path maps to the root itself.
[[nodiscard]] std::string join(std::string_view root, std::string_view rel);

/// True if `path` lies strictly below `dir`. Every non-root path lies below the root.
[[nodiscard]] bool isUnder(std::string_view path, std::string_view dir);

/// Collapses duplicate slashes, "." components and resolvable ".." components.
/// Keeps a leading slash, drops a trailing one.
[[nodiscard]] std::string normalize(std::string_view path);

/// Final path component, ignoring trailing slashes ("/a/b/" -> "b").
[[nodiscard]] std::string basename(std::string_view path);

[[nodiscard]] std::string stripTrailingSlashes(std::string_view path);

inline std::string trim(const std::string& str) {
    const auto strBegin = str.find_first_not_of(" \t\n\r");
    if (strBegin == std::string::npos) return "";

    const auto strEnd = str.find_last_not_of(" \t\n\r");
    return str.substr(strBegin, strEnd - strBegin + 1);
}

}
