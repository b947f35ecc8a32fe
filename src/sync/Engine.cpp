#include "sync/Engine.hpp"
#include "status/Store.hpp"
#include "watch/Registry.hpp"
#include "watch/ChangeSource.hpp"
#include "roots/Manager.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <optional>
#include <boost/algorithm/string/predicate.hpp>

using namespace vcs::sync;
using namespace vcs::status;
using namespace std::chrono;

namespace {

// Before the first self modification every state file change counts as external.
constexpr auto NEVER_MODIFIED_DELTA = hours(24);

}

std::string vcs::sync::to_string(const TickAction action) {
    switch (action) {
        case TickAction::None: return "none";
        case TickAction::IncrementalRefresh: return "incremental";
        case TickAction::FullRebuild: return "rebuild";
    }
    return "none";
}

Engine::Engine(config::SyncConfig cfg,
               Store& store,
               watch::Registry& watchers,
               roots::Manager& roots,
               tool::VersionControl& tool,
               std::function<void()> notify,
               util::NowFn now)
    : AsyncService("SyncEngine"),
      cfg_(std::move(cfg)),
      store_(store),
      watchers_(watchers),
      roots_(roots),
      tool_(tool),
      notify_(std::move(notify)),
      now_(std::move(now)),
      metadataDir_(tool.metadataDirName()),
      stateFile_(tool.stateFileName()),
      selfModifiedAt_((now_() - NEVER_MODIFIED_DELTA).time_since_epoch().count()) {}

Engine::~Engine() {
    stop();
}

void Engine::runLoop() {
    while (!shouldStop()) {
        lazySleep(duration_cast<milliseconds>(cfg_.tick_interval));
        if (shouldStop()) break;
        if (isBuildSuspended()) continue;

        try {
            tick();
        } catch (const std::exception& e) {
            log::Registry::sync()->error("[SyncEngine] Tick failed: {}", e.what());
        }
    }
}

TickAction Engine::decide(const std::size_t changedCount, const util::Clock::duration sinceLastChange) const {
    if (rebuildRequired() || changedCount > cfg_.rebuild_threshold_files)
        return sinceLastChange > cfg_.rebuild_quiet ? TickAction::FullRebuild : TickAction::None;

    if (changedCount > 0 && sinceLastChange > cfg_.incremental_quiet)
        return TickAction::IncrementalRefresh;

    return TickAction::None;
}

TickAction Engine::tick() {
    if (isBuildSuspended()) return TickAction::None;

    if (watchers_.takeOverflow()) {
        log::Registry::sync()->warn("[SyncEngine] Change events were lost, rebuild required");
        markCacheDirty();
    }

    const auto changed = watchers_.changedFileCount();
    const auto since = now_() - watchers_.latestChangeTime();
    const auto action = decide(changed, since);

    switch (action) {
        case TickAction::FullRebuild:
            log::Registry::sync()->info("[SyncEngine] Full rebuild ({} changed files)", changed);
            rebuild();
            if (notify_) notify_();
            break;
        case TickAction::IncrementalRefresh:
            log::Registry::sync()->debug("[SyncEngine] Incremental refresh ({} changed files)", changed);
            if (refreshIncremental() && notify_) notify_();
            break;
        case TickAction::None:
            break;
    }

    return action;
}

bool Engine::isStateFile(const std::filesystem::path& path) const {
    return path.filename() == stateFile_ && path.parent_path().filename() == metadataDir_;
}

bool Engine::isInsideMetadataDir(const std::filesystem::path& path) const {
    for (const auto& part : path)
        if (part == metadataDir_) return true;
    return false;
}

bool Engine::classify(const std::filesystem::path& path) {
    // directories carry no status of their own
    if (watch::ChangeSource::directoryExists(path)) return false;

    if (isStateFile(path)) {
        const auto elapsed = now_() - selfModifiedAt();
        if (elapsed > cfg_.self_modified_window) {
            log::Registry::sync()->debug("[SyncEngine] External change of {} after {} ms, rebuild required",
                                         path.string(), duration_cast<milliseconds>(elapsed).count());
            rebuildRequired_.store(true, std::memory_order_release);
        }
        return false;
    }

    if (isInsideMetadataDir(path)) return false;

    const auto cached = store_.get(path);
    if (!cached) return true;

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        const auto current = Record::fromDisk(path, cached->state);
        return current.size != cached->size || current.mod_time != cached->mod_time;
    }

    return !(cached->state == 'R' || cached->state == '?');
}

bool Engine::refreshIncremental() {
    tool::PathList query;

    for (const auto& [root, dirty] : watchers_.drainAll()) {
        for (const auto& [path, _] : dirty) {
            if (classify(path) && !rebuildRequired()) query.push_back(path);
            if (rebuildRequired()) break;
        }
        if (rebuildRequired()) break;
    }

    if (rebuildRequired()) {
        log::Registry::sync()->debug("[SyncEngine] Incremental pass superseded by rebuild");
        return false;
    }

    if (query.empty()) return false;

    markSelfModified();
    const auto result = tool_.queryFileStatus(query);
    if (!result) {
        log::Registry::sync()->warn("[SyncEngine] Status query for {} dirty files failed, keeping cached entries",
                                    query.size());
        return true;
    }

    log::Registry::sync()->debug("[SyncEngine] Got status for {} of {} dirty files", result->size(), query.size());
    store_.merge(*result);
    return true;
}

void Engine::rebuild() {
    rebuildRequired_.store(false, std::memory_order_release);
    markSelfModified();

    // fresh baseline
    size_t discarded = 0;
    for (const auto& [root, dirty] : watchers_.drainAll()) discarded += dirty.size();
    log::Registry::sync()->debug("[SyncEngine] Discarded {} pending changes", discarded);

    std::optional<RecordMap> previous;
    RecordMap fresh;

    for (const auto& root : roots_.sortedRoots()) {
        const auto result = tool_.queryRootStatus(root);

        if (!result) {
            // keep what we knew about this root rather than evicting it on a failed query
            log::Registry::sync()->warn("[SyncEngine] Status query failed for {}, keeping cached entries", root.string());
            if (!previous) previous = store_.snapshot();
            for (const auto& [path, record] : *previous) {
                const auto rel = path.lexically_relative(root);
                if (!rel.empty() && *rel.begin() != "..") fresh.insert_or_assign(path, record);
            }
            continue;
        }

        log::Registry::sync()->debug("[SyncEngine] Rebuild of {}: {} files", root.string(), result->size());
        for (auto& [path, record] : Store::toRecords(*result, root)) fresh.insert_or_assign(path, std::move(record));
    }

    store_.replace(std::move(fresh));
    log::Registry::sync()->info("[SyncEngine] Status cache rebuilt, {} files", store_.count());
}

void Engine::enterBuildMode() {
    buildInProgress_.store(true, std::memory_order_release);
    log::Registry::sync()->debug("[SyncEngine] Build started, ticking suspended");
}

void Engine::exitBuildMode() {
    buildInProgress_.store(false, std::memory_order_release);
    log::Registry::sync()->debug("[SyncEngine] Build done, ticking resumed");
}

void Engine::markSelfModified() {
    selfModifiedAt_.store(now_().time_since_epoch().count(), std::memory_order_release);
}

vcs::util::TimePoint Engine::selfModifiedAt() const {
    return util::TimePoint(util::Clock::duration(selfModifiedAt_.load(std::memory_order_acquire)));
}

void Engine::onToolResult(const std::filesystem::path& root, const StatusMap& result) {
    store_.merge(result, root);
    if (notify_) notify_();
}

vcs::tool::Completion Engine::completion() {
    return [this](const std::filesystem::path& root, const StatusMap& result) { onToolResult(root, result); };
}

void Engine::addFiles(const tool::PathList& paths) {
    markSelfModified();
    tool_.addFiles(paths, completion());
}

void Engine::addFilesNotIgnored(const tool::PathList& paths) {
    markSelfModified();
    tool_.addFilesNotIgnored(paths, completion());
}

void Engine::propagateRenamed(const tool::PathList& oldPaths, const tool::PathList& newPaths) {
    tool::PathList from, to, evicted;
    const auto n = std::min(oldPaths.size(), newPaths.size());

    for (size_t i = 0; i < n; ++i) {
        const auto& o = oldPaths[i];
        const auto& nw = newPaths[i];

        if (!nw.has_filename() || watch::ChangeSource::directoryExists(nw)) continue;
        if (boost::algorithm::iequals(o.native(), nw.native())) continue;

        from.push_back(o);
        to.push_back(nw);
        evicted.push_back(o);
        evicted.push_back(nw);
    }

    store_.removeAll(evicted);

    markSelfModified();
    if (!from.empty()) tool_.propagateFileRenamed(from, to, completion());
}

void Engine::propagateRemoved(const tool::PathList& paths) {
    store_.removeAll(paths);

    markSelfModified();
    tool_.propagateFileRemoved(paths, completion());
}
