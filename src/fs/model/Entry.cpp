#include "fs/model/Entry.hpp"

#include <utility>

namespace ds::fs::model {

Metadata::Metadata(const EntryKind kind, std::optional<uintmax_t> size, const std::time_t atime,
                   const std::time_t mtime, const mode_t mode)
    : kind(kind), size(std::move(size)), atime(atime), mtime(mtime), mode(mode) {
    if (kind != EntryKind::RegularFile) this->size.reset();
}

Metadata Metadata::fromStat(const struct stat& st) {
    const auto kind = kindFromMode(st.st_mode);
    std::optional<uintmax_t> size;
    if (kind == EntryKind::RegularFile) size = static_cast<uintmax_t>(st.st_size);
    return {kind, size, st.st_atime, st.st_mtime, st.st_mode};
}

std::time_t Metadata::mtimeMinute() const {
    // floor division, so pre-epoch times truncate the same way
    return mtime >= 0 ? mtime / 60 : -((-mtime + 59) / 60);
}

EntryKind kindFromMode(const mode_t mode) {
    if (S_ISDIR(mode)) return EntryKind::Directory;
    if (S_ISREG(mode)) return EntryKind::RegularFile;
    if (S_ISLNK(mode)) return EntryKind::Symlink;
    return EntryKind::Other;
}

std::string to_string(const EntryKind kind) {
    switch (kind) {
    case EntryKind::Directory: return "directory";
    case EntryKind::RegularFile: return "file";
    case EntryKind::Symlink: return "symlink";
    case EntryKind::Other: return "other";
    }
    return "unknown";
}

}
