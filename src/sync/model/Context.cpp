#include "sync/model/Context.hpp"

using namespace ds::sync::model;

Context::Context(std::string localRoot, std::shared_ptr<fs::Filesystem> local,
                 std::string remoteRoot, std::shared_ptr<fs::Filesystem> remote,
                 const Policy& policy)
    : policy(policy) {
    sides[LOCAL].root = std::move(localRoot);
    sides[LOCAL].fs = std::move(local);
    sides[REMOTE].root = std::move(remoteRoot);
    sides[REMOTE].fs = std::move(remote);

    for (std::size_t i : {LOCAL, REMOTE}) {
        sides[i].source = policy.isSource(i);
        sides[i].destination = policy.isDestination(i);
    }
}

void Context::apply(DiffResult diff) {
    sides[LOCAL].only = std::move(diff.leftOnly);
    sides[REMOTE].only = std::move(diff.rightOnly);
    common = std::move(diff.common);
}
