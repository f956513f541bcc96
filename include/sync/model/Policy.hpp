#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ds::sync::model {

// Side indices. Policy logic is written over i in {LOCAL, REMOTE}.
inline constexpr std::size_t LOCAL = 0;
inline constexpr std::size_t REMOTE = 1;

struct Policy {
    bool localToRemote{true};
    bool remoteToLocal{false};

    bool deleteExtraneous{false};   // --delete
    bool deleteExcluded{false};     // --delete-excluded
    bool allowOverwrite{true};      // cleared by --no-clobber
    bool allowReplace{false};       // --force

    bool preserveTimes{false};
    bool followLinks{false};
    bool dryRun{false};

    std::vector<std::string> excludes;

    [[nodiscard]] bool twoWay() const { return localToRemote && remoteToLocal; }
    [[nodiscard]] bool deletes() const { return deleteExtraneous || deleteExcluded; }

    [[nodiscard]] bool isSource(std::size_t side) const;
    [[nodiscard]] bool isDestination(std::size_t side) const;

    // Throws ConfigConflict for combinations that cannot be honored.
    void validate() const;
};

}
