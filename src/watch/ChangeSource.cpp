#include "watch/ChangeSource.hpp"

using namespace vcs::watch;

ChangeSource::ChangeSource(std::filesystem::path root, util::NowFn now)
    : root_(std::move(root)), now_(std::move(now)) {}

void ChangeSource::notify(const std::filesystem::path& path) {
    if (!isEnabled()) return;

    const auto when = now_();
    std::scoped_lock lock(mutex_);
    dirty_.insert_or_assign(path, when);
    if (!latest_ || *latest_ < when) latest_ = when;
}

void ChangeSource::notifyOverflow() {
    if (!isEnabled()) return;

    const auto when = now_();
    overflowed_.store(true, std::memory_order_release);
    std::scoped_lock lock(mutex_);
    if (!latest_ || *latest_ < when) latest_ = when;
}

DirtyMap ChangeSource::drain() {
    std::scoped_lock lock(mutex_);
    DirtyMap out;
    out.swap(dirty_);
    return out;
}

std::size_t ChangeSource::changedCount() const {
    std::scoped_lock lock(mutex_);
    return dirty_.size();
}

std::optional<vcs::util::TimePoint> ChangeSource::latestEventTime() const {
    std::scoped_lock lock(mutex_);
    return latest_;
}

bool ChangeSource::directoryExists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}
