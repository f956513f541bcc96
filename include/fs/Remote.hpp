#pragma once

#include "fs/Filesystem.hpp"
#include "fs/cache/Registry.hpp"
#include "shell/Process.hpp"

#include <memory>

namespace ds::shell { class Adb; }

namespace ds::fs {

// The device side, driven entirely through `adb shell` commands. Metadata
// gathered by directory listings is memoized until the next invalidateCache().
class Remote final : public Filesystem {
public:
    explicit Remote(std::shared_ptr<shell::Adb> adb);

    [[nodiscard]] std::string name() const override { return "remote"; }

    std::vector<std::string> list(const std::string& path) override;
    model::Metadata stat(const std::string& path) override;
    model::Metadata lstat(const std::string& path) override;

    void unlink(const std::string& path) override;
    void rmdir(const std::string& path) override;
    void makedirs(const std::string& path) override;
    void utime(const std::string& path, std::time_t atime, std::time_t mtime) override;

    void copyInto(const std::string& srcPath, const std::string& dstPath) override;

    [[nodiscard]] bool selfTest() override;

    void invalidateCache() override { cache_.clear(); }

    [[nodiscard]] const cache::Registry& cache() const { return cache_; }

private:
    std::shared_ptr<shell::Adb> adb_;
    cache::Registry cache_;

    model::Metadata statOne(const std::vector<std::string>& lsArgs, const std::string& path);

    // Runs a command that must succeed silently.
    void runQuiet(const std::vector<std::string>& words, const std::string& path);
};

}
