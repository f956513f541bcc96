#pragma once

#include "sync/model/Action.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace ds::sync::model {

// Work flowing into one side, in execution order.
struct Lane {
    std::vector<Action> deletions;  // extraneous entries, deepest first
    std::vector<Action> clears;     // destination entries in the way of a conflicting source entry
    std::vector<Action> copies;     // parents before children

    [[nodiscard]] std::size_t size() const { return deletions.size() + clears.size() + copies.size(); }
};

struct Plan {
    std::array<Lane, 2> lanes;  // indexed by destination side
    std::vector<std::string> skipped;  // conflicting paths left untouched

    [[nodiscard]] bool empty() const { return size() == 0; }
    [[nodiscard]] std::size_t size() const { return lanes[0].size() + lanes[1].size(); }
};

}
