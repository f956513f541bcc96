#pragma once

#include "fs/model/Entry.hpp"

#include <string>

namespace ds::fs::remote {

struct ListingEntry {
    std::string name;
    model::Metadata meta;
};

// "total 42" header emitted by ls -l for directory listings.
[[nodiscard]] bool isTotalLine(const std::string& line);

// Decodes one toybox/toolbox `ls -l` line:
//   <type><rwx x3> [links] <user> <group> [<size>|<major>, <minor>] YYYY-MM-DD HH:MM <name>
// mtime is read as local time at minute granularity, atime mirrors it.
// Throws NotFound for the "No such file or directory" / "Not a directory"
// diagnostics and Unparseable for anything else it cannot decode.
ListingEntry parseLsLine(const std::string& line);

}
