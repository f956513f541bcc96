#pragma once

#include "sync/model/Action.hpp"

#include <memory>
#include <string>

namespace ds::fs { class Filesystem; }

namespace ds::sync::model {
struct ScopedOp;
}

namespace ds::sync::tasks {

// Removes a destination file unless released. Held across a copy so an
// aborted transfer never leaves a truncated file behind.
class PartialFileGuard {
public:
    PartialFileGuard(std::shared_ptr<fs::Filesystem> fs, std::string path);
    ~PartialFileGuard();

    PartialFileGuard(const PartialFileGuard&) = delete;
    PartialFileGuard& operator=(const PartialFileGuard&) = delete;

    void release() { armed_ = false; }

private:
    std::shared_ptr<fs::Filesystem> fs_;
    std::string path_;
    bool armed_{true};
};

struct Copy {
    std::shared_ptr<fs::Filesystem> dst;
    std::string srcPath, dstPath;
    const model::Action& action;
    model::ScopedOp& op;
    bool dryRun{false};

    Copy(std::shared_ptr<fs::Filesystem> dst, std::string srcPath, std::string dstPath,
         const model::Action& action, model::ScopedOp& op, bool dryRun = false);

    // Throws fs::OperationFailed; the partial destination is gone by then.
    void operator()();
};

}
