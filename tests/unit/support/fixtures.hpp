#pragma once

#include "support/MemoryFilesystem.hpp"
#include "sync/Differ.hpp"
#include "sync/Enumerator.hpp"
#include "sync/Filter.hpp"
#include "sync/model/Context.hpp"
#include "sync/model/Plan.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace ds::test {

// "copy a/b.txt", "rmdir x", ...
inline std::vector<std::string> render(const std::vector<sync::model::Action>& actions) {
    std::vector<std::string> out;
    for (const auto& a : actions) out.push_back(to_string(a.type) + " " + a.path);
    return out;
}

// A local tree under /l and a remote tree under /r, wired as copy peers.
class SyncFixture : public ::testing::Test {
protected:
    std::shared_ptr<MemoryFilesystem> local = std::make_shared<MemoryFilesystem>("local");
    std::shared_ptr<MemoryFilesystem> remote = std::make_shared<MemoryFilesystem>("remote");
    sync::model::Policy policy;

    void SetUp() override { MemoryFilesystem::connect(local, remote); }

    // Scan, filter and diff both trees, as one sync run does before planning.
    sync::model::Context prepare() const {
        using namespace sync;
        model::Context ctx("/l", local, "/r", remote, policy);
        const Filter filter(policy.excludes);
        auto l = Enumerator::collect(*local, "/l", policy.followLinks);
        auto r = Enumerator::collect(*remote, "/r", policy.followLinks);
        ctx.sides[model::LOCAL].excluded = filter.apply(l);
        ctx.sides[model::REMOTE].excluded = filter.apply(r);
        ctx.apply(Differ::diff(std::move(l), std::move(r)));
        return ctx;
    }
};

}
