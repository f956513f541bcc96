#include "sync/Enumerator.hpp"
#include "fs/Filesystem.hpp"
#include "fs/errors.hpp"
#include "fs/model/Path.hpp"
#include "log/Registry.hpp"

using namespace ds::sync;
using namespace ds::fs;
using namespace ds::fs::model;
using namespace ds::log;

void Enumerator::walk(Filesystem& fs, const std::string& root, const bool followLinks,
                      const Visitor& visit, const std::string& prefix) {
    const auto path = join(root, prefix);

    Metadata meta;
    try {
        meta = followLinks ? fs.stat(path) : fs.lstat(path);
    } catch (const NotFound&) {
        if (followLinks) {
            try {
                if (fs.lstat(path).isSymlink())
                    Registry::sync()->warn("[Enumerator] Skipping dead symlink on {}: {}", fs.name(), path);
            } catch (const NotFound&) {}
        }
        return;
    }

    switch (meta.kind) {
    case EntryKind::Directory: {
        visit({prefix, meta});

        std::vector<std::string> names;
        try {
            names = fs.list(path);
        } catch (const NotFound&) {
            return;
        }

        for (const auto& name : names) {
            if (name == "." || name == "..") continue;
            walk(fs, root, followLinks, visit, child(prefix, name));
        }
        return;
    }
    case EntryKind::RegularFile:
    case EntryKind::Symlink:
        visit({prefix, meta});
        return;
    case EntryKind::Other:
        Registry::sync()->info("[Enumerator] Skipping unsupported file type on {}: {}", fs.name(), path);
        return;
    }
}

Snapshot Enumerator::collect(Filesystem& fs, const std::string& root, const bool followLinks) {
    Snapshot out;
    walk(fs, root, followLinks, [&out](const Item& item) { out.push_back(item); });
    Registry::sync()->debug("[Enumerator] {} entries under {}:{}", out.size(), fs.name(), root);
    return out;
}
