#include "watch/Registry.hpp"
#include "watch/InotifyChangeSource.hpp"
#include "log/Registry.hpp"

using namespace vcs::watch;

Registry::Registry(SourceFactory factory, util::NowFn now)
    : factory_(std::move(factory)), now_(std::move(now)) {}

Registry::~Registry() {
    clear();
}

bool Registry::watch(const std::filesystem::path& root) {
    bool enabled = true;
    {
        std::scoped_lock lock(mutex_);
        if (sources_.contains(root)) return false;
        enabled = enabled_;
    }

    // starting may walk the whole tree, keep the tick thread out of it
    auto source = factory_(root);
    if (!source) {
        log::Registry::watch()->error("[ChangeSourceRegistry] No change source created for {}", root.string());
        return false;
    }
    source->setEnabled(enabled);
    source->start();

    std::size_t count = 0;
    {
        std::scoped_lock lock(mutex_);
        if (!sources_.contains(root)) {
            source->setEnabled(enabled_);
            sources_.emplace(root, std::move(source));
            count = sources_.size();
        }
    }

    if (source) {
        log::Registry::watch()->debug("[ChangeSourceRegistry] {} was registered concurrently, dropping duplicate",
                                      root.string());
        source->stop();
        return false;
    }

    log::Registry::watch()->info("[ChangeSourceRegistry] Watching {} ({} roots)", root.string(), count);
    return true;
}

bool Registry::contains(const std::filesystem::path& root) const {
    std::scoped_lock lock(mutex_);
    return sources_.contains(root);
}

std::size_t Registry::size() const {
    std::scoped_lock lock(mutex_);
    return sources_.size();
}

void Registry::setEnabled(const bool enabled) {
    std::scoped_lock lock(mutex_);
    enabled_ = enabled;
    for (const auto& [_, source] : sources_) source->setEnabled(enabled);
}

std::size_t Registry::changedFileCount() const {
    std::scoped_lock lock(mutex_);
    std::size_t total = 0;
    for (const auto& [_, source] : sources_) total += source->changedCount();
    return total;
}

vcs::util::TimePoint Registry::latestChangeTime() const {
    std::optional<util::TimePoint> latest;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [_, source] : sources_) {
            const auto t = source->latestEventTime();
            if (t && (!latest || *latest < *t)) latest = t;
        }
    }
    return latest ? *latest : now_() - NEVER_CHANGED_DELTA;
}

std::vector<std::pair<std::filesystem::path, DirtyMap>> Registry::drainAll() {
    std::scoped_lock lock(mutex_);
    std::vector<std::pair<std::filesystem::path, DirtyMap>> out;
    out.reserve(sources_.size());
    for (const auto& [root, source] : sources_) out.emplace_back(root, source->drain());
    return out;
}

bool Registry::takeOverflow() {
    std::scoped_lock lock(mutex_);
    bool any = false;
    for (const auto& [_, source] : sources_) any = source->takeOverflow() || any;
    return any;
}

void Registry::clear() {
    std::map<std::filesystem::path, std::unique_ptr<ChangeSource>> doomed;
    {
        std::scoped_lock lock(mutex_);
        doomed.swap(sources_);
    }

    // join delivery threads outside the lock
    for (const auto& [_, source] : doomed) source->stop();
}

SourceFactory vcs::watch::inotifyFactory(const bool recursive, util::NowFn now) {
    return [recursive, now = std::move(now)](const std::filesystem::path& root) -> std::unique_ptr<ChangeSource> {
        return std::make_unique<InotifyChangeSource>(root, recursive, now);
    };
}
