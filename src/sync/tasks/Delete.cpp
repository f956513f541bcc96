#include "sync/tasks/Delete.hpp"
#include "sync/model/ScopedOp.hpp"
#include "fs/Filesystem.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <utility>

using namespace ds::sync::tasks;
using namespace ds::sync::model;
using namespace ds::log;

Delete::Delete(std::shared_ptr<fs::Filesystem> fs, std::string path,
               const Action& action, ScopedOp& op, const bool dryRun)
    : fs(std::move(fs)), path(std::move(path)), action(action), op(op), dryRun(dryRun) {}

void Delete::operator()() {
    op.start(action.meta.size.value_or(0));

    const auto verb = action.type == ActionType::RemoveDir ? "rmdir" : "rm";
    Registry::sync()->info("{}{} {}:{}", dryRun ? "[dry-run] " : "", verb, fs->name(), path);

    try {
        if (!dryRun) {
            if (action.type == ActionType::RemoveDir) fs->rmdir(path);
            else if (action.type == ActionType::Unlink) fs->unlink(path);
            else throw std::logic_error("Delete: not a removal: " + to_string(action.type));
        }
        op.success = true;
    } catch (const std::exception& e) {
        op.stop();
        Registry::sync()->error("[Delete] Failed to delete {}:{} - {}", fs->name(), path, e.what());
        throw;
    }

    op.stop();
}
