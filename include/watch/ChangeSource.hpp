#pragma once

#include "util/clock.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace vcs::watch {

// path -> time of the most recent event for that path
using DirtyMap = std::unordered_map<std::filesystem::path, util::TimePoint>;

// Raw change notifications for one watched root. Delivery happens on the
// source's own thread; the accumulated dirty map is drained by the sync engine.
class ChangeSource {
public:
    explicit ChangeSource(std::filesystem::path root, util::NowFn now = util::systemNow);
    virtual ~ChangeSource() = default;

    ChangeSource(const ChangeSource&) = delete;
    ChangeSource& operator=(const ChangeSource&) = delete;

    virtual void start() = 0;
    virtual void stop() = 0;

    // Events arriving while disabled are dropped.
    void setEnabled(bool enabled) { enabled_.store(enabled, std::memory_order_release); }
    [[nodiscard]] bool isEnabled() const { return enabled_.load(std::memory_order_acquire); }

    // Records an event for path, collapsing repeats into one entry with the latest timestamp.
    void notify(const std::filesystem::path& path);

    // Called when the backend lost events. The pending map can no longer be trusted.
    void notifyOverflow();

    // True once per overflow since the last call.
    [[nodiscard]] bool takeOverflow() { return overflowed_.exchange(false, std::memory_order_acq_rel); }

    // Returns the pending map and resets it, atomically.
    [[nodiscard]] DirtyMap drain();

    [[nodiscard]] std::size_t changedCount() const;
    [[nodiscard]] std::optional<util::TimePoint> latestEventTime() const;

    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

    static bool directoryExists(const std::filesystem::path& path);

protected:
    std::filesystem::path root_;
    util::NowFn now_;

private:
    std::atomic<bool> enabled_{true};
    std::atomic<bool> overflowed_{false};
    mutable std::mutex mutex_;
    DirtyMap dirty_;
    std::optional<util::TimePoint> latest_;
};

}
