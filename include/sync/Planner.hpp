#pragma once

#include "sync/model/Plan.hpp"

namespace ds::sync {

namespace model {
struct Context;
}

// Turns a diffed context into per-side work lists. Mutates the context's
// only-lists in place: deleted entries leave them, conflict winners are
// prepended to the winning side's list.
struct Planner {
    static model::Plan build(model::Context& ctx);

private:
    static void planDeletions(model::Context& ctx, model::Plan& plan);
    static void planConflicts(model::Context& ctx, model::Plan& plan);
    static void planCopies(const model::Context& ctx, model::Plan& plan);
};

}
