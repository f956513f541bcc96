#pragma once

#include "sync/model/Diff.hpp"

namespace ds::sync {

struct Differ {
    // Sorted merge by raw byte order of the relative paths. Paths must be unique per side.
    static model::DiffResult diff(fs::model::Snapshot left, fs::model::Snapshot right);
};

}
