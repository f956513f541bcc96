#include "fs/Local.hpp"
#include "fs/errors.hpp"
#include "shell/Adb.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

using namespace ds::fs;
using namespace ds::fs::model;

namespace {

[[noreturn]] void fail(const std::string& op, const std::string& path, const int err) {
    if (err == ENOENT || err == ENOTDIR) throw NotFound(path);
    throw OperationFailed(op + " '" + path + "': " + std::strerror(err));
}

}

Local::Local(std::shared_ptr<shell::Adb> adb) : adb_(std::move(adb)) {}

std::vector<std::string> Local::list(const std::string& path) {
    namespace stdfs = std::filesystem;

    std::error_code ec;
    stdfs::directory_iterator it(path, ec);
    if (ec) fail("list", path, ec.value());

    std::vector<std::string> names;
    for (const auto end = stdfs::directory_iterator(); it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    if (ec) fail("list", path, ec.value());
    return names;
}

Metadata Local::stat(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) fail("stat", path, errno);
    return Metadata::fromStat(st);
}

Metadata Local::lstat(const std::string& path) {
    struct stat st{};
    if (::lstat(path.c_str(), &st) != 0) fail("lstat", path, errno);
    return Metadata::fromStat(st);
}

void Local::unlink(const std::string& path) {
    if (::unlink(path.c_str()) != 0)
        throw OperationFailed("unlink '" + path + "': " + std::strerror(errno));
}

void Local::rmdir(const std::string& path) {
    if (::rmdir(path.c_str()) != 0)
        throw OperationFailed("rmdir '" + path + "': " + std::strerror(errno));
}

void Local::makedirs(const std::string& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) throw OperationFailed("mkdir -p '" + path + "': " + ec.message());
}

void Local::utime(const std::string& path, const std::time_t atime, const std::time_t mtime) {
    const timespec times[2] = {{atime, 0}, {mtime, 0}};
    if (utimensat(AT_FDCWD, path.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0)
        throw OperationFailed("utime '" + path + "': " + std::strerror(errno));
}

void Local::copyInto(const std::string& srcPath, const std::string& dstPath) {
    const auto res = adb_->pull(srcPath, dstPath);
    if (!res.ok()) {
        for (const auto& line : res.lines) log::Registry::fs()->error("[Local] adb pull: {}", line);
        throw OperationFailed("adb pull '" + srcPath + "' -> '" + dstPath + "' exited with " + std::to_string(res.exit_code));
    }
    log::Registry::fs()->debug("[Local] Pulled {} -> {}", srcPath, dstPath);
}
