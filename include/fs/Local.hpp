#pragma once

#include "fs/Filesystem.hpp"

#include <memory>

namespace ds::shell { class Adb; }

namespace ds::fs {

// The machine devsync runs on. Files arrive from the device through `adb pull`.
class Local final : public Filesystem {
public:
    explicit Local(std::shared_ptr<shell::Adb> adb);

    [[nodiscard]] std::string name() const override { return "local"; }

    std::vector<std::string> list(const std::string& path) override;
    model::Metadata stat(const std::string& path) override;
    model::Metadata lstat(const std::string& path) override;

    void unlink(const std::string& path) override;
    void rmdir(const std::string& path) override;
    void makedirs(const std::string& path) override;
    void utime(const std::string& path, std::time_t atime, std::time_t mtime) override;

    void copyInto(const std::string& srcPath, const std::string& dstPath) override;

    [[nodiscard]] bool selfTest() override { return true; }

private:
    std::shared_ptr<shell::Adb> adb_;
};

}
