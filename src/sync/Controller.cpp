#include "sync/Controller.hpp"
#include "sync/Differ.hpp"
#include "sync/Enumerator.hpp"
#include "sync/Executor.hpp"
#include "sync/Filter.hpp"
#include "sync/Planner.hpp"
#include "sync/errors.hpp"
#include "sync/interrupt.hpp"
#include "sync/model/Context.hpp"
#include "sync/model/Event.hpp"
#include "fs/Filesystem.hpp"
#include "fs/model/Path.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <array>
#include <set>

using namespace ds::sync;
using namespace ds::sync::model;
using namespace ds::fs;
using namespace ds::fs::model;
using namespace ds::log;

Controller::Controller(std::shared_ptr<Filesystem> local, std::shared_ptr<Filesystem> remote)
    : local_(std::move(local)), remote_(std::move(remote)) {}

std::vector<PathPair> Controller::resolvePairs(const Request& req) {
    if (req.sources.empty()) throw ConfigConflict("No source paths given");
    if (req.destination.empty()) throw ConfigConflict("No destination path given");

    const auto dstRoot = stripTrailingSlashes(req.destination);

    std::vector<PathPair> pairs;
    std::set<std::string> seen;
    for (const auto& source : req.sources) {
        if (source.empty()) throw ConfigConflict("Empty source path");

        const auto name = basename(source);
        const bool contents = source.back() == '/' || name.empty() || name == "." || name == "..";
        const auto src = stripTrailingSlashes(source);
        const auto dst = contents ? dstRoot : join(dstRoot, name);

        if ((req.policy.twoWay() || req.policy.deletes()) && !seen.insert(normalize(dst)).second)
            throw ConfigConflict(fmt::format("More than one source maps to '{}'", dst));

        pairs.push_back(req.reverse ? PathPair{dst, src} : PathPair{src, dst});
    }
    return pairs;
}

Controller::Outcome Controller::run(const Request& req) {
    std::vector<PathPair> pairs;
    try {
        req.policy.validate();
        pairs = resolvePairs(req);
    } catch (const ConfigConflict& e) {
        Registry::devsync()->error("[Controller] {}", e.what());
        return Outcome::Failed;
    }

    if (!remote_->selfTest()) {
        Registry::devsync()->error("[Controller] Device self-test failed, aborting");
        return Outcome::Failed;
    }

    bool failed = false;
    for (const auto& pair : pairs) {
        const auto event = runPair(pair, req.policy);
        if (event->status != Event::Status::SUCCESS) failed = true;
    }
    return failed ? Outcome::Failed : Outcome::Success;
}

std::shared_ptr<Event> Controller::runPair(const PathPair& pair, const Policy& policy) {
    const bool push = policy.localToRemote && !policy.remoteToLocal;
    const bool pull = policy.remoteToLocal && !policy.localToRemote;

    auto event = std::make_shared<Event>();
    const auto localName = local_->name() + ":" + pair.local;
    const auto remoteName = remote_->name() + ":" + pair.remote;
    event->source = pull ? remoteName : localName;
    event->destination = pull ? localName : remoteName;
    events_.push_back(event);

    Registry::devsync()->info("[Controller] Sync {} {} {}", event->source, push || pull ? "->" : "<->", event->destination);

    Context ctx(pair.local, local_, pair.remote, remote_, policy);
    const Filter filter(policy.excludes);
    std::array<Snapshot, 2> snapshots;
    Plan plan;

    const Stage stages[] = {
        {"scan", [&] {
            local_->invalidateCache();
            remote_->invalidateCache();
            snapshots[LOCAL] = Enumerator::collect(*local_, pair.local, policy.followLinks);
            interrupt::check();
            snapshots[REMOTE] = Enumerator::collect(*remote_, pair.remote, policy.followLinks);
        }},
        {"filter", [&] {
            if (filter.empty()) return;
            for (const auto i : {LOCAL, REMOTE}) ctx.sides[i].excluded = filter.apply(snapshots[i]);
        }},
        {"diff", [&] {
            ctx.apply(Differ::diff(std::move(snapshots[LOCAL]), std::move(snapshots[REMOTE])));
        }},
        {"plan", [&] {
            plan = Planner::build(ctx);
            event->num_unresolved = plan.skipped.size();
            if (plan.empty()) Registry::sync()->info("[Controller] Nothing to do");
        }},
        {"execute", [&] { Executor::run(ctx, plan, *event); }},
    };

    event->start();
    const bool ok = runStages(stages, *event);
    event->stop();
    if (ok) event->status = Event::Status::SUCCESS;

    report(*event);
    return event;
}

bool Controller::runStages(const std::span<const Stage> stages, Event& event) {
    for (const auto& [name, fn] : stages) {
        try {
            fn();
            interrupt::check();
        } catch (const Interrupted&) {
            event.status = Event::Status::CANCELLED;
            event.stop();
            Registry::devsync()->warn("[Controller:{}] Interrupted", name);
            throw;
        } catch (const std::exception& e) {
            event.status = Event::Status::ERROR;
            event.error_message = e.what();
            Registry::devsync()->error("[Controller:{}] {} -> {}: {}", name, event.source, event.destination, e.what());
            return false;
        }
    }
    return true;
}

void Controller::report(const Event& event) {
    for (const auto& t : event.throughputs) {
        if (!t->num_ops) continue;
        Registry::sync()->debug("[Controller] {}: {} ops, {} failed, {} bytes, {} ms",
                                t->metricToString(), t->num_ops, t->failed_ops, t->size_bytes, t->duration_ms);
    }
    if (const auto* copies = event.getThroughput(Throughput::COPY); copies && copies->num_ops)
        Registry::devsync()->info("[Controller] {} copies ({} bytes)", copies->num_ops, copies->size_bytes);
    if (event.num_unresolved)
        Registry::devsync()->warn("[Controller] {} conflicting paths left untouched", event.num_unresolved);

    Registry::devsync()->info("[Controller] {} -> {}: {}: {}", event.source, event.destination,
                              event.statusToString(), event.rateString());
}
