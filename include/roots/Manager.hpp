#pragma once

#include "tool/VersionControl.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <vector>

namespace vcs::watch { class Registry; }

namespace vcs::roots {

// Recognized repository roots, nested sub-repositories included. The set only
// grows until clear().
class Manager {
public:
    Manager(tool::VersionControl& tool, watch::Registry& watchers, tool::Completion onInitialStatus);

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    // False only for an empty path. A directory outside any repository adds nothing.
    bool addRoot(const std::filesystem::path& directory);

    [[nodiscard]] bool hasAnyRoot() const;
    [[nodiscard]] bool isRoot(const std::filesystem::path& directory) const;

    // Shortest path first, so parents precede their nested roots.
    [[nodiscard]] std::vector<std::filesystem::path> sortedRoots() const;

    void clear();

private:
    tool::VersionControl& tool_;
    watch::Registry& watchers_;
    tool::Completion onInitialStatus_;

    mutable std::mutex mutex_;
    std::map<std::filesystem::path, bool> roots_;  // root -> active
};

}
