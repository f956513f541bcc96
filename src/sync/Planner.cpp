#include "sync/Planner.hpp"
#include "sync/model/Context.hpp"
#include "fs/Filesystem.hpp"
#include "fs/model/Path.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <vector>

using namespace ds::sync;
using namespace ds::sync::model;
using namespace ds::fs::model;
using namespace ds::log;

namespace {

bool containsExcluded(const Snapshot& excluded, const std::string& dir) {
    return std::any_of(excluded.begin(), excluded.end(),
                       [&](const Item& item) { return isUnder(item.path, dir); });
}

// Descendants sort after their ancestors, so descending order removes children first.
void sortDeepestFirst(Snapshot& items) {
    std::sort(items.begin(), items.end(), [](const Item& a, const Item& b) { return a.path > b.path; });
}

std::string where(const Side& side, const std::string& path) {
    return side.fs->name() + ":" + join(side.root, path);
}

// A skipped path stays untouched on both sides, subtree included.
void skip(Context& ctx, Plan& plan, const std::string& path) {
    plan.skipped.push_back(path);
    for (auto& side : ctx.sides)
        std::erase_if(side.only, [&](const Item& item) { return isUnder(item.path, path); });
}

}

Plan Planner::build(Context& ctx) {
    Plan plan;
    planDeletions(ctx, plan);
    planConflicts(ctx, plan);
    planCopies(ctx, plan);

    for (const auto i : {LOCAL, REMOTE}) {
        const auto& lane = plan.lanes[i];
        if (!lane.size()) continue;
        Registry::sync()->info("[Planner] {} <- {}: {} deletions, {} replacements, {} copies",
                               ctx.dst(i).fs->name(), ctx.src(i).fs->name(),
                               lane.deletions.size(), lane.clears.size(), lane.copies.size());
    }
    return plan;
}

void Planner::planDeletions(Context& ctx, Plan& plan) {
    if (!ctx.policy.deletes()) return;

    for (const auto i : {LOCAL, REMOTE}) {
        auto& dst = ctx.dst(i);
        const auto& src = ctx.src(i);
        if (!dst.destination || dst.source) continue;

        // Evaluated on the pre-deletion snapshots
        if (src.only.empty() && ctx.common.empty()) {
            Registry::sync()->error("[Planner] Refusing to delete from {}: nothing from {} would remain",
                                    where(dst, ""), where(src, ""));
            continue;
        }

        Snapshot doomed;
        if (ctx.policy.deleteExtraneous) {
            for (const auto& item : dst.only) {
                if (!ctx.policy.deleteExcluded && item.meta.isDirectory() && containsExcluded(dst.excluded, item.path)) {
                    Registry::sync()->debug("[Planner] Keeping {}: it holds excluded entries", where(dst, item.path));
                    continue;
                }
                doomed.push_back(item);
            }
            dst.only.clear();
        }

        if (ctx.policy.deleteExcluded) {
            doomed.insert(doomed.end(), dst.excluded.begin(), dst.excluded.end());
            dst.excluded.clear();
        }

        sortDeepestFirst(doomed);
        auto& lane = plan.lanes[i];
        for (const auto& item : doomed) lane.deletions.push_back(removal(item));
    }
}

void Planner::planConflicts(Context& ctx, Plan& plan) {
    std::array<Snapshot, 2> winners;

    for (const auto& [path, left, right] : ctx.common) {
        if (left.isDirectory() && right.isDirectory()) continue;

        const bool typeMismatch = left.isDirectory() != right.isDirectory();
        if (!typeMismatch && left.kind == right.kind && left.size == right.size) continue;

        bool l2r = ctx.policy.localToRemote;
        bool r2l = ctx.policy.remoteToLocal;
        if (l2r && r2l && !typeMismatch) {
            if (left.mtimeMinute() > right.mtimeMinute()) r2l = false;
            else if (right.mtimeMinute() > left.mtimeMinute()) l2r = false;
        }

        if (l2r == r2l) {
            Registry::sync()->warn("[Planner] Unresolvable: {}", path.empty() ? "." : path);
            skip(ctx, plan, path);
            continue;
        }

        const auto i = l2r ? REMOTE : LOCAL;
        auto& dst = ctx.dst(i);
        const auto& srcMeta = l2r ? left : right;
        const auto& dstMeta = l2r ? right : left;

        if (typeMismatch && !ctx.policy.allowReplace) {
            Registry::sync()->warn("[Planner] Would have to replace {} {} by a {}; use --force",
                                   to_string(dstMeta.kind), where(dst, path), to_string(srcMeta.kind));
            skip(ctx, plan, path);
            continue;
        }
        if (!ctx.policy.allowOverwrite) {
            Registry::sync()->info("[Planner] Not overwriting {} (--no-clobber)", where(dst, path));
            skip(ctx, plan, path);
            continue;
        }

        auto& lane = plan.lanes[i];
        if (dstMeta.isDirectory()) {
            if (containsExcluded(dst.excluded, path)) {
                Registry::sync()->warn("[Planner] Cannot replace {}: it holds excluded entries", where(dst, path));
                skip(ctx, plan, path);
                continue;
            }

            // Pull the directory's contents out of the only-list so nothing is removed twice
            const auto nestedBegin = std::stable_partition(dst.only.begin(), dst.only.end(),
                [&](const Item& item) { return !isUnder(item.path, path); });
            Snapshot nested(nestedBegin, dst.only.end());
            dst.only.erase(nestedBegin, dst.only.end());

            sortDeepestFirst(nested);
            for (const auto& item : nested) lane.clears.push_back(removal(item));
        }
        lane.clears.push_back(removal({path, dstMeta}));

        winners[i].push_back({path, srcMeta});
    }

    for (const auto i : {LOCAL, REMOTE}) {
        auto& copies = ctx.src(i).only;
        copies.insert(copies.begin(), winners[i].begin(), winners[i].end());
    }
}

void Planner::planCopies(const Context& ctx, Plan& plan) {
    for (const auto i : {LOCAL, REMOTE}) {
        if (!ctx.dst(i).destination) continue;
        auto& lane = plan.lanes[i];
        for (const auto& item : ctx.src(i).only) lane.copies.push_back(materialize(item));
    }
}
