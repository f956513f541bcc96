#pragma once

#include <stdexcept>
#include <string>

namespace ds::sync {

// Mutually exclusive options or overlapping destinations. Raised before any I/O.
struct ConfigConflict : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct Interrupted : std::runtime_error {
    Interrupted() : std::runtime_error("Interrupted") {}
};

}
