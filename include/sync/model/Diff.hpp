#pragma once

#include "fs/model/Entry.hpp"

#include <string>
#include <vector>

namespace ds::sync::model {

// A path present on both sides, with each side's metadata.
struct Pair {
    std::string path;
    fs::model::Metadata left, right;

    [[nodiscard]] bool operator==(const Pair& other) const = default;
};

// The three partitions are disjoint by path and each is sorted ascending.
struct DiffResult {
    fs::model::Snapshot leftOnly;
    std::vector<Pair> common;
    fs::model::Snapshot rightOnly;
};

}
