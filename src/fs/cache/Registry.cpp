#include "fs/cache/Registry.hpp"

using namespace ds::fs::cache;
using namespace ds::fs::model;

std::optional<Metadata> Registry::get(const std::string& path) const {
    const auto it = entries_.find(path);
    if (it == entries_.end()) return std::nullopt;
    ++hits_;
    return it->second;
}

void Registry::put(const std::string& path, const Metadata& meta) {
    entries_.insert_or_assign(path, meta);
}

void Registry::evictPath(const std::string& path) {
    entries_.erase(path);
}

void Registry::clear() {
    entries_.clear();
    hits_ = 0;
}
