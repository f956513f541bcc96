#include "sync/tasks/Copy.hpp"
#include "sync/model/ScopedOp.hpp"
#include "fs/Filesystem.hpp"
#include "fs/errors.hpp"
#include "log/Registry.hpp"

#include <utility>

using namespace ds::sync::tasks;
using namespace ds::log;

PartialFileGuard::PartialFileGuard(std::shared_ptr<fs::Filesystem> fs, std::string path)
    : fs_(std::move(fs)), path_(std::move(path)) {}

PartialFileGuard::~PartialFileGuard() {
    if (!armed_) return;
    try {
        fs_->lstat(path_);
        fs_->unlink(path_);
        Registry::sync()->warn("[Copy] Removed partial file {}:{}", fs_->name(), path_);
    } catch (const fs::NotFound&) {
        // nothing was written
    } catch (const std::exception& e) {
        Registry::sync()->error("[Copy] Could not remove partial file {}:{}: {}", fs_->name(), path_, e.what());
    }
}

Copy::Copy(std::shared_ptr<fs::Filesystem> dst, std::string srcPath, std::string dstPath,
           const model::Action& action, model::ScopedOp& op, const bool dryRun)
    : dst(std::move(dst)), srcPath(std::move(srcPath)), dstPath(std::move(dstPath)),
      action(action), op(op), dryRun(dryRun) {}

void Copy::operator()() {
    op.start(action.meta.size.value_or(0));

    if (dryRun) {
        Registry::sync()->info("[dry-run] {} -> {}:{}", srcPath, dst->name(), dstPath);
        op.success = true;
        op.stop();
        return;
    }

    Registry::sync()->info("{} -> {}:{}", srcPath, dst->name(), dstPath);
    try {
        PartialFileGuard guard(dst, dstPath);
        dst->copyInto(srcPath, dstPath);
        guard.release();
        op.success = true;
    } catch (const std::exception& e) {
        op.stop();
        Registry::sync()->error("[Copy] Failed to copy {} -> {}:{} - {}", srcPath, dst->name(), dstPath, e.what());
        throw;
    }
    op.stop();
}
