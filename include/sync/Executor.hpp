#pragma once

#include "sync/model/Throughput.hpp"

#include <cstddef>
#include <vector>

namespace ds::sync {

namespace model {
struct Action;
struct Context;
struct Event;
struct Plan;
}

// Applies a plan phase by phase: deletions, replacements, copies. The first
// failed operation aborts the run; completed operations are not rolled back.
class Executor {
public:
    static void run(const model::Context& ctx, const model::Plan& plan, model::Event& event);

private:
    struct PendingTimes {
        std::size_t lane;
        const model::Action* action;
    };

    static void dispatch(const model::Context& ctx, std::size_t lane, const model::Action& action,
                         model::Throughput::Metric metric, model::Event& event,
                         std::vector<PendingTimes>& dirTimes);

    static void setTimes(const model::Context& ctx, std::size_t lane, const model::Action& action, model::Event& event);
};

}
