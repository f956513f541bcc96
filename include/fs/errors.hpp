#pragma once

#include <stdexcept>
#include <string>

namespace ds::fs {

// Entry vanished or never existed. Enumeration treats this as an empty tree.
struct NotFound : std::runtime_error {
    explicit NotFound(const std::string& path) : std::runtime_error("No such file or directory: " + path), path(path) {}
    std::string path;
};

// A remote listing line that could not be decoded into metadata.
struct Unparseable : std::runtime_error {
    explicit Unparseable(const std::string& line) : std::runtime_error("Unparseable listing line: '" + line + "'"), line(line) {}
    std::string line;
};

// A delete/create/stat/copy/time-set call failed. Fatal to the current path pair.
struct OperationFailed : std::runtime_error {
    using std::runtime_error::runtime_error;
};

}
