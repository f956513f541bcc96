#pragma once

#include "sync/model/Action.hpp"

#include <memory>
#include <string>

namespace ds::fs { class Filesystem; }

namespace ds::sync::model {
struct ScopedOp;
}

namespace ds::sync::tasks {

// Unlink or RemoveDir against one endpoint.
struct Delete {
    std::shared_ptr<fs::Filesystem> fs;
    std::string path;
    const model::Action& action;
    model::ScopedOp& op;
    bool dryRun{false};

    Delete(std::shared_ptr<fs::Filesystem> fs, std::string path,
           const model::Action& action, model::ScopedOp& op, bool dryRun = false);

    void operator()();
};

}
