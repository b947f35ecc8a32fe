#pragma once

#include "config/Config.hpp"
#include "status/FileStatus.hpp"
#include "status/Store.hpp"
#include "watch/Registry.hpp"
#include "roots/Manager.hpp"
#include "sync/Engine.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace vcs::concurrency { class Dispatcher; }
namespace vcs::tool { class VersionControl; }

namespace vcs::core {

// Host facing status cache for a set of watched repository roots.
class StatusCache {
public:
    using Handler = std::function<void()>;
    using HandlerId = std::uint64_t;

    // An empty factory watches roots with inotify.
    StatusCache(const config::Config& cfg,
                std::shared_ptr<tool::VersionControl> tool,
                std::shared_ptr<concurrency::Dispatcher> dispatcher,
                watch::SourceFactory sourceFactory = {},
                util::NowFn now = util::systemNow);

    ~StatusCache();

    StatusCache(const StatusCache&) = delete;
    StatusCache& operator=(const StatusCache&) = delete;

    // Starts/stops the periodic sync engine.
    void start();
    void stop();

    [[nodiscard]] status::FileStatus getFileStatus(const std::filesystem::path& path) const;
    [[nodiscard]] std::optional<status::Record> getFileStatusInfo(const std::filesystem::path& path) const;

    bool addRoot(const std::filesystem::path& directory);
    bool updateProject(const std::string& name, const std::filesystem::path& directory);
    void updateProjects(const std::map<std::string, std::filesystem::path>& projects);
    [[nodiscard]] bool anyItemsUnderSourceControl() const;

    void addFiles(const tool::PathList& paths);
    void addFilesNotIgnored(const tool::PathList& paths);
    void propagateRenamed(const tool::PathList& oldPaths, const tool::PathList& newPaths);
    void propagateRemoved(const tool::PathList& paths);
    void removeFromCache(const std::filesystem::path& path);

    void enterBuildMode();
    void exitBuildMode();
    void markSelfModified();
    void markCacheDirty();
    void setWatchingEnabled(bool enabled);

    // Drops every source, root and cached status.
    void clearAll();

    HandlerId onStatusChanged(Handler handler);
    void removeStatusChangedHandler(HandlerId id);

    [[nodiscard]] std::size_t count() const { return store_.count(); }
    [[nodiscard]] status::RecordMap snapshot() const { return store_.snapshot(); }

    [[nodiscard]] sync::Engine& engine() { return engine_; }

private:
    struct Subscribers {
        std::mutex mutex;
        std::map<HandlerId, Handler> handlers;
        HandlerId nextId = 1;
    };

    std::shared_ptr<tool::VersionControl> tool_;
    std::shared_ptr<concurrency::Dispatcher> dispatcher_;
    std::shared_ptr<Subscribers> subscribers_;

    status::Store store_;
    watch::Registry watchers_;
    roots::Manager roots_;
    sync::Engine engine_;

    void fireStatusChanged();
};

}
