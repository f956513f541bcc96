#pragma once

#include "fs/model/Entry.hpp"

#include <functional>
#include <string>

namespace ds::fs { class Filesystem; }

namespace ds::sync {

// Walks one endpoint from a root. Directories are visited before their
// descendants; sibling order is whatever the listing returns.
struct Enumerator {
    using Visitor = std::function<void(const fs::model::Item&)>;

    // A missing root is an empty tree. Entries that vanish mid-walk are skipped.
    static void walk(fs::Filesystem& fs, const std::string& root, bool followLinks,
                     const Visitor& visit, const std::string& prefix = "");

    static fs::model::Snapshot collect(fs::Filesystem& fs, const std::string& root, bool followLinks);
};

}
