#pragma once

#include "watch/ChangeSource.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <map>
#include <utility>
#include <vector>

namespace vcs::watch {

using SourceFactory = std::function<std::unique_ptr<ChangeSource>(const std::filesystem::path& root)>;

// Owns one ChangeSource per watched root.
class Registry {
public:
    // Reported by latestChangeTime() when no source has ever fired.
    static constexpr auto NEVER_CHANGED_DELTA = std::chrono::hours(24);

    explicit Registry(SourceFactory factory, util::NowFn now = util::systemNow);
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Idempotent per root. Returns true when a new source was started.
    bool watch(const std::filesystem::path& root);

    [[nodiscard]] bool contains(const std::filesystem::path& root) const;
    [[nodiscard]] std::size_t size() const;

    void setEnabled(bool enabled);

    [[nodiscard]] std::size_t changedFileCount() const;
    [[nodiscard]] util::TimePoint latestChangeTime() const;

    [[nodiscard]] std::vector<std::pair<std::filesystem::path, DirtyMap>> drainAll();

    // True when any source lost events since the last call.
    [[nodiscard]] bool takeOverflow();

    // Stops and discards every source.
    void clear();

private:
    SourceFactory factory_;
    util::NowFn now_;

    mutable std::mutex mutex_;
    std::map<std::filesystem::path, std::unique_ptr<ChangeSource>> sources_;
    bool enabled_ = true;
};

// Default factory producing inotify sources.
SourceFactory inotifyFactory(bool recursive = true, util::NowFn now = util::systemNow);

}
