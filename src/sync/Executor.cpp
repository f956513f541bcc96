#include "sync/Executor.hpp"
#include "sync/interrupt.hpp"
#include "sync/model/Context.hpp"
#include "sync/model/Event.hpp"
#include "sync/model/Plan.hpp"
#include "sync/tasks/Copy.hpp"
#include "sync/tasks/Delete.hpp"
#include "fs/Filesystem.hpp"
#include "fs/model/Path.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <stdexcept>

using namespace ds::sync;
using namespace ds::sync::model;
using namespace ds::fs::model;
using namespace ds::log;

void Executor::run(const Context& ctx, const Plan& plan, Event& event) {
    std::vector<PendingTimes> dirTimes;

    struct Phase {
        std::vector<Action> Lane::* list;
        Throughput::Metric metric;
    };

    for (const auto& [list, metric] : {Phase{&Lane::deletions, Throughput::DELETE},
                                       Phase{&Lane::clears, Throughput::CLEAR},
                                       Phase{&Lane::copies, Throughput::COPY}}) {
        for (const auto lane : {LOCAL, REMOTE}) {
            for (const auto& action : plan.lanes[lane].*list) {
                interrupt::check();
                try {
                    dispatch(ctx, lane, action, metric, event, dirTimes);
                } catch (const std::exception&) {
                    interrupt::check();  // a signal killed the transfer
                    throw;
                }
            }
        }
    }

    // Directory times last and deepest first; creating children moves a parent's mtime
    std::sort(dirTimes.begin(), dirTimes.end(), [](const PendingTimes& a, const PendingTimes& b) {
        return a.action->path > b.action->path;
    });
    for (const auto& [lane, action] : dirTimes) {
        interrupt::check();
        setTimes(ctx, lane, *action, event);
    }
}

void Executor::dispatch(const Context& ctx, const std::size_t lane, const Action& action,
                        const Throughput::Metric metric, Event& event,
                        std::vector<PendingTimes>& dirTimes) {
    const auto& dst = ctx.dst(lane);
    const auto& src = ctx.src(lane);
    const auto dstPath = join(dst.root, action.path);
    const bool dryRun = ctx.policy.dryRun;

    switch (action.type) {
    case ActionType::Unlink:
    case ActionType::RemoveDir:
        tasks::Delete(dst.fs, dstPath, action, event.throughput(metric).newOp(), dryRun)();
        return;
    case ActionType::MakeDirs: {
        auto& op = event.throughput(Throughput::MKDIR).newOp();
        op.start();
        Registry::sync()->info("{}mkdir -p {}:{}", dryRun ? "[dry-run] " : "", dst.fs->name(), dstPath);
        if (!dryRun) {
            try {
                dst.fs->makedirs(dstPath);
            } catch (const std::exception&) {
                op.stop();
                throw;
            }
        }
        op.success = true;
        op.stop();
        if (ctx.policy.preserveTimes) dirTimes.push_back({lane, &action});
        return;
    }
    case ActionType::Copy:
        tasks::Copy(dst.fs, join(src.root, action.path), dstPath, action,
                    event.throughput(Throughput::COPY).newOp(), dryRun)();
        if (ctx.policy.preserveTimes) setTimes(ctx, lane, action, event);
        return;
    }
    throw std::logic_error("Executor: unknown action type");
}

void Executor::setTimes(const Context& ctx, const std::size_t lane, const Action& action, Event& event) {
    const auto& dst = ctx.dst(lane);
    const auto dstPath = join(dst.root, action.path);

    auto& op = event.throughput(Throughput::TOUCH).newOp();
    op.start();
    Registry::sync()->debug("{}touch {}:{}", ctx.policy.dryRun ? "[dry-run] " : "", dst.fs->name(), dstPath);
    if (!ctx.policy.dryRun) {
        try {
            dst.fs->utime(dstPath, action.meta.atime, action.meta.mtime);
        } catch (const std::exception&) {
            op.stop();
            throw;
        }
    }
    op.success = true;
    op.stop();
}
