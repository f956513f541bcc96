#pragma once

#include "fs/model/Entry.hpp"

#include <string>
#include <vector>

namespace ds::sync {

// fnmatch(3) exclude patterns matched against root-relative paths. An entry
// is excluded if it or any of its ancestors matches.
class Filter {
public:
    Filter() = default;
    explicit Filter(const std::vector<std::string>& patterns);

    [[nodiscard]] bool empty() const { return patterns_.empty(); }
    [[nodiscard]] bool excluded(const std::string& relPath) const;

    // Removes excluded entries from the snapshot and returns them.
    fs::model::Snapshot apply(fs::model::Snapshot& snapshot) const;

    // One pattern per non-empty line. Throws std::runtime_error if the file cannot be read.
    static std::vector<std::string> readPatternFile(const std::string& path);

private:
    std::vector<std::string> patterns_;

    [[nodiscard]] bool matches(const std::string& path) const;
};

}
