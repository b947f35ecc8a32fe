#include "core/StatusCache.hpp"
#include "concurrency/Dispatcher.hpp"
#include "tool/VersionControl.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <vector>

using namespace vcs::core;
using namespace vcs::status;

StatusCache::StatusCache(const config::Config& cfg,
                         std::shared_ptr<tool::VersionControl> tool,
                         std::shared_ptr<concurrency::Dispatcher> dispatcher,
                         watch::SourceFactory sourceFactory,
                         util::NowFn now)
    : tool_(tool ? std::move(tool) : throw std::invalid_argument("StatusCache requires a version control tool")),
      dispatcher_(std::move(dispatcher)),
      subscribers_(std::make_shared<Subscribers>()),
      watchers_(sourceFactory ? std::move(sourceFactory) : watch::inotifyFactory(cfg.watch.recursive, now), now),
      roots_(*tool_, watchers_,
             [this](const std::filesystem::path& root, const StatusMap& result) { engine_.onToolResult(root, result); }),
      engine_(cfg.sync, store_, watchers_, roots_, *tool_, [this] { fireStatusChanged(); }, now) {}

StatusCache::~StatusCache() {
    engine_.stop();
    watchers_.clear();
}

void StatusCache::start() {
    engine_.start();
}

void StatusCache::stop() {
    engine_.stop();
}

FileStatus StatusCache::getFileStatus(const std::filesystem::path& path) const {
    if (const auto record = store_.get(path)) return fromStateChar(record->state);
    return FileStatus::Uncontrolled;
}

std::optional<Record> StatusCache::getFileStatusInfo(const std::filesystem::path& path) const {
    return store_.get(path);
}

bool StatusCache::addRoot(const std::filesystem::path& directory) {
    return roots_.addRoot(directory);
}

bool StatusCache::updateProject(const std::string& name, const std::filesystem::path& directory) {
    log::Registry::vcstatus()->debug("[StatusCache] Updating project {} at {}", name, directory.string());
    return addRoot(directory);
}

void StatusCache::updateProjects(const std::map<std::string, std::filesystem::path>& projects) {
    for (const auto& [name, directory] : projects)
        if (!name.empty() && !directory.empty()) updateProject(name, directory);
}

bool StatusCache::anyItemsUnderSourceControl() const {
    return roots_.hasAnyRoot();
}

void StatusCache::addFiles(const tool::PathList& paths) {
    engine_.addFiles(paths);
}

void StatusCache::addFilesNotIgnored(const tool::PathList& paths) {
    engine_.addFilesNotIgnored(paths);
}

void StatusCache::propagateRenamed(const tool::PathList& oldPaths, const tool::PathList& newPaths) {
    engine_.propagateRenamed(oldPaths, newPaths);
}

void StatusCache::propagateRemoved(const tool::PathList& paths) {
    engine_.propagateRemoved(paths);
}

void StatusCache::removeFromCache(const std::filesystem::path& path) {
    store_.remove(path);
}

void StatusCache::enterBuildMode() { engine_.enterBuildMode(); }
void StatusCache::exitBuildMode() { engine_.exitBuildMode(); }
void StatusCache::markSelfModified() { engine_.markSelfModified(); }
void StatusCache::markCacheDirty() { engine_.markCacheDirty(); }
void StatusCache::setWatchingEnabled(const bool enabled) { watchers_.setEnabled(enabled); }

void StatusCache::clearAll() {
    watchers_.clear();
    roots_.clear();
    store_.clear();
    log::Registry::vcstatus()->info("[StatusCache] Cleared all roots and cached status");
}

StatusCache::HandlerId StatusCache::onStatusChanged(Handler handler) {
    std::scoped_lock lock(subscribers_->mutex);
    const auto id = subscribers_->nextId++;
    subscribers_->handlers.emplace(id, std::move(handler));
    return id;
}

void StatusCache::removeStatusChangedHandler(const HandlerId id) {
    std::scoped_lock lock(subscribers_->mutex);
    subscribers_->handlers.erase(id);
}

void StatusCache::fireStatusChanged() {
    auto deliver = [weak = std::weak_ptr<Subscribers>(subscribers_)] {
        const auto subs = weak.lock();
        if (!subs) return;

        std::vector<Handler> handlers;
        {
            std::scoped_lock lock(subs->mutex);
            handlers.reserve(subs->handlers.size());
            for (const auto& [_, h] : subs->handlers) handlers.push_back(h);
        }

        for (const auto& h : handlers)
            if (h) h();
    };

    // without a dispatcher handlers run on the notifying thread
    if (dispatcher_) dispatcher_->post(std::move(deliver));
    else deliver();
}
