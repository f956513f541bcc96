#include "sync/model/Policy.hpp"
#include "sync/errors.hpp"

using namespace ds::sync;
using namespace ds::sync::model;

bool Policy::isSource(const std::size_t side) const {
    return side == LOCAL ? localToRemote : remoteToLocal;
}

bool Policy::isDestination(const std::size_t side) const {
    return side == LOCAL ? remoteToLocal : localToRemote;
}

void Policy::validate() const {
    if (!localToRemote && !remoteToLocal)
        throw ConfigConflict("No sync direction enabled");
    if (twoWay() && deleteExtraneous)
        throw ConfigConflict("--two-way and --delete are mutually exclusive");
    if (twoWay() && deleteExcluded)
        throw ConfigConflict("--two-way and --delete-excluded are mutually exclusive");
}
