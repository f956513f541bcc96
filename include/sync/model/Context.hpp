#pragma once

#include "fs/model/Entry.hpp"
#include "sync/model/Diff.hpp"
#include "sync/model/Policy.hpp"

#include <array>
#include <memory>
#include <string>

namespace ds::fs { class Filesystem; }

namespace ds::sync::model {

struct Side {
    std::string root;
    std::shared_ptr<fs::Filesystem> fs;
    bool source{false}, destination{false};

    fs::model::Snapshot only;       // entries absent on the other side
    fs::model::Snapshot excluded;   // entries dropped by the exclude filter
};

// Everything one sync run knows about one (local, remote) path pair. A lane i
// moves data from sides[1 - i] into sides[i].
struct Context {
    std::array<Side, 2> sides;
    std::vector<Pair> common;
    Policy policy;

    Context(std::string localRoot, std::shared_ptr<fs::Filesystem> local,
            std::string remoteRoot, std::shared_ptr<fs::Filesystem> remote,
            const Policy& policy);

    Side& src(const std::size_t lane) { return sides[1 - lane]; }
    Side& dst(const std::size_t lane) { return sides[lane]; }
    [[nodiscard]] const Side& src(const std::size_t lane) const { return sides[1 - lane]; }
    [[nodiscard]] const Side& dst(const std::size_t lane) const { return sides[lane]; }

    void apply(DiffResult diff);
};

}
