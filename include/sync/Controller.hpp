#pragma once

#include "sync/model/Policy.hpp"

#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace ds::fs { class Filesystem; }

namespace ds::sync {

namespace model {
struct Event;
}

struct Stage {
    const char* name;
    std::function<void()> fn;
};

struct Request {
    std::vector<std::string> sources;
    std::string destination;
    model::Policy policy;
    bool reverse{false};  // positional paths: sources on the device, destination local
};

struct PathPair {
    std::string local, remote;

    [[nodiscard]] bool operator==(const PathPair& other) const = default;
};

// Drives one invocation: validates the request, probes the device, then runs
// every (local, remote) pair as an independent sync.
class Controller {
public:
    enum class Outcome { Success, Failed };

    Controller(std::shared_ptr<fs::Filesystem> local, std::shared_ptr<fs::Filesystem> remote);

    // Throws sync::Interrupted once a stop was requested.
    Outcome run(const Request& req);

    // rsync-style: "src/" syncs the contents of src, "src" syncs src itself into dst/<name>.
    // Throws ConfigConflict for duplicate destinations when two-way or deleting.
    static std::vector<PathPair> resolvePairs(const Request& req);

    std::shared_ptr<model::Event> runPair(const PathPair& pair, const model::Policy& policy);

    [[nodiscard]] const std::vector<std::shared_ptr<model::Event>>& events() const { return events_; }

private:
    std::shared_ptr<fs::Filesystem> local_, remote_;
    std::vector<std::shared_ptr<model::Event>> events_;

    static bool runStages(std::span<const Stage> stages, model::Event& event);
    static void report(const model::Event& event);
};

}
