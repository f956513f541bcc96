#include "sync/Differ.hpp"

#include <algorithm>

using namespace ds::sync;
using namespace ds::sync::model;
using namespace ds::fs::model;

DiffResult Differ::diff(Snapshot left, Snapshot right) {
    // descending, so the smallest path sits at the back and pops cheaply
    const auto byPathDesc = [](const Item& a, const Item& b) { return a.path > b.path; };
    std::sort(left.begin(), left.end(), byPathDesc);
    std::sort(right.begin(), right.end(), byPathDesc);

    DiffResult out;
    while (!left.empty() || !right.empty()) {
        if (right.empty() || (!left.empty() && left.back().path < right.back().path)) {
            out.leftOnly.push_back(std::move(left.back()));
            left.pop_back();
        } else if (left.empty() || right.back().path < left.back().path) {
            out.rightOnly.push_back(std::move(right.back()));
            right.pop_back();
        } else {
            out.common.push_back({left.back().path, left.back().meta, right.back().meta});
            left.pop_back();
            right.pop_back();
        }
    }
    return out;
}
