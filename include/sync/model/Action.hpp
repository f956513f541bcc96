#pragma once

#include "fs/model/Entry.hpp"

#include <string>

namespace ds::sync::model {

enum class ActionType {
    Unlink,
    RemoveDir,
    MakeDirs,
    Copy,
};

// One planned operation against the destination side of a lane.
struct Action {
    ActionType type{ActionType::Copy};
    std::string path;           // root-relative
    fs::model::Metadata meta{}; // source metadata for MakeDirs/Copy, destination metadata for deletions
};

// Unlink for leaves, RemoveDir for directories.
[[nodiscard]] Action removal(const fs::model::Item& item);

// MakeDirs for directories, Copy for everything else.
[[nodiscard]] Action materialize(const fs::model::Item& item);

std::string to_string(ActionType type);

}
