#pragma once

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <sys/stat.h>

namespace ds::fs::model {

enum class EntryKind { Directory, RegularFile, Symlink, Other };

// Result of a stat call on either endpoint. Immutable once produced.
struct Metadata {
    EntryKind kind{EntryKind::Other};
    std::optional<uintmax_t> size{};    // regular files only
    std::time_t atime{}, mtime{};
    mode_t mode{};

    Metadata() = default;
    Metadata(EntryKind kind, std::optional<uintmax_t> size, std::time_t atime, std::time_t mtime, mode_t mode = 0);

    static Metadata fromStat(const struct stat& st);

    [[nodiscard]] bool isDirectory() const { return kind == EntryKind::Directory; }
    [[nodiscard]] bool isRegularFile() const { return kind == EntryKind::RegularFile; }
    [[nodiscard]] bool isSymlink() const { return kind == EntryKind::Symlink; }

    // Modification time truncated to whole minutes, the remote listing's granularity.
    [[nodiscard]] std::time_t mtimeMinute() const;

    [[nodiscard]] bool operator==(const Metadata& other) const = default;
};

EntryKind kindFromMode(mode_t mode);

std::string to_string(EntryKind kind);

// One enumerated entry: root-relative path plus its metadata.
struct Item {
    std::string path;
    Metadata meta;

    [[nodiscard]] bool operator==(const Item& other) const = default;
};

using Snapshot = std::vector<Item>;

}
