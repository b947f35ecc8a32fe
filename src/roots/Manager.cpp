#include "roots/Manager.hpp"
#include "watch/Registry.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace vcs::roots;

Manager::Manager(tool::VersionControl& tool, watch::Registry& watchers, tool::Completion onInitialStatus)
    : tool_(tool), watchers_(watchers), onInitialStatus_(std::move(onInitialStatus)) {}

bool Manager::addRoot(const std::filesystem::path& directory) {
    if (directory.empty()) return false;

    const auto root = tool_.findRootDirectory(directory);
    if (root.empty()) {
        log::Registry::roots()->debug("[RootManager] {} is not inside a repository", directory.string());
        return true;
    }

    {
        std::scoped_lock lock(mutex_);
        if (roots_.contains(root)) return true;
        roots_[root] = true;
    }

    log::Registry::roots()->info("[RootManager] New repository root {}", root.string());

    if (!watchers_.contains(root)) {
        try {
            watchers_.watch(root);
        } catch (const std::exception& e) {
            log::Registry::roots()->error("[RootManager] Failed to watch {}: {}", root.string(), e.what());
        }
    }

    tool_.queryRootStatusAsync(root, onInitialStatus_);
    return true;
}

bool Manager::hasAnyRoot() const {
    return watchers_.size() > 0;
}

bool Manager::isRoot(const std::filesystem::path& directory) const {
    std::scoped_lock lock(mutex_);
    return roots_.contains(directory);
}

std::vector<std::filesystem::path> Manager::sortedRoots() const {
    std::vector<std::filesystem::path> out;
    {
        std::scoped_lock lock(mutex_);
        out.reserve(roots_.size());
        for (const auto& [root, active] : roots_)
            if (active) out.push_back(root);
    }

    std::ranges::stable_sort(out, [](const auto& a, const auto& b) {
        return a.native().size() < b.native().size();
    });
    return out;
}

void Manager::clear() {
    std::scoped_lock lock(mutex_);
    roots_.clear();
}
