#pragma once

#include "fs/model/Entry.hpp"

#include <ctime>
#include <string>
#include <vector>

namespace ds::fs {

// One endpoint of a sync. Implemented once for the local machine and once for
// the device behind adb. Paths are endpoint-absolute.
class Filesystem {
public:
    virtual ~Filesystem() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    // Names of the entries in a directory. Throws NotFound if absent or not a directory.
    virtual std::vector<std::string> list(const std::string& path) = 0;

    // Throw NotFound if the entry does not exist.
    virtual model::Metadata stat(const std::string& path) = 0;
    virtual model::Metadata lstat(const std::string& path) = 0;

    // Throw OperationFailed.
    virtual void unlink(const std::string& path) = 0;
    virtual void rmdir(const std::string& path) = 0;
    virtual void makedirs(const std::string& path) = 0;
    virtual void utime(const std::string& path, std::time_t atime, std::time_t mtime) = 0;

    // Brings the regular file at `srcPath` on the other endpoint to `dstPath` on this one.
    virtual void copyInto(const std::string& srcPath, const std::string& dstPath) = 0;

    [[nodiscard]] virtual bool selfTest() = 0;

    // Drops memoized metadata; called at the start of every sync run.
    virtual void invalidateCache() {}
};

}
