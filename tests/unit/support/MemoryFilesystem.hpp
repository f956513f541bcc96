#pragma once

#include "fs/Filesystem.hpp"

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace ds::test {

// In-memory endpoint. Paths are absolute and '/'-separated. Two instances
// wired as peers copy files between each other.
class MemoryFilesystem final : public fs::Filesystem {
public:
    struct Node {
        fs::model::Metadata meta;
        std::string target;  // symlinks only, absolute
    };

    explicit MemoryFilesystem(std::string name) : name_(std::move(name)) {}

    static void connect(const std::shared_ptr<MemoryFilesystem>& a, const std::shared_ptr<MemoryFilesystem>& b);

    // Fixtures; parents are created as needed
    void addDir(const std::string& path, std::time_t mtime = 0);
    void addFile(const std::string& path, uintmax_t size, std::time_t mtime = 0);
    void addSymlink(const std::string& path, const std::string& target);
    void addOther(const std::string& path);

    [[nodiscard]] bool exists(const std::string& path) const;
    [[nodiscard]] const Node* find(const std::string& path) const;

    // Every entry strictly below root, as root-relative paths
    [[nodiscard]] std::set<std::string> tree(const std::string& root) const;

    [[nodiscard]] std::string name() const override { return name_; }

    std::vector<std::string> list(const std::string& path) override;
    fs::model::Metadata stat(const std::string& path) override;
    fs::model::Metadata lstat(const std::string& path) override;

    void unlink(const std::string& path) override;
    void rmdir(const std::string& path) override;
    void makedirs(const std::string& path) override;
    void utime(const std::string& path, std::time_t atime, std::time_t mtime) override;

    void copyInto(const std::string& srcPath, const std::string& dstPath) override;

    [[nodiscard]] bool selfTest() override { return selfTestResult; }

    void invalidateCache() override { ++invalidations; }

    // Mutating calls in order, e.g. "unlink /r/a"
    std::vector<std::string> calls;

    // copyInto writes half of the file to these destinations, then fails
    std::set<std::string> failCopies;

    // Runs after the partial write of a failing copy, before it throws
    std::function<void(const std::string& dstPath)> onCopyFailure;

    bool selfTestResult = true;
    int invalidations = 0;
    std::time_t clock = 1'700'000'000;  // mtime given to copied files

private:
    std::string name_;
    std::map<std::string, Node> nodes_;
    std::weak_ptr<MemoryFilesystem> peer_;

    static std::string clean(const std::string& path);
    [[nodiscard]] std::string resolve(const std::string& path, bool followLast) const;
    [[nodiscard]] bool hasChildren(const std::string& path) const;
    void requireParentDir(const std::string& path) const;
};

}
