#pragma once

#include "fs/model/Entry.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace ds::fs::cache {

// Path -> metadata memo filled by directory listings and reused by later stat
// calls. Owned by one adapter instance; cleared for every sync run.
class Registry {
public:
    [[nodiscard]] std::optional<model::Metadata> get(const std::string& path) const;

    void put(const std::string& path, const model::Metadata& meta);

    void evictPath(const std::string& path);

    void clear();

    [[nodiscard]] std::size_t size() const { return entries_.size(); }
    [[nodiscard]] std::size_t hits() const { return hits_; }

private:
    std::unordered_map<std::string, model::Metadata> entries_;
    mutable std::size_t hits_ = 0;
};

}
