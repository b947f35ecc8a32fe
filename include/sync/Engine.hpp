#pragma once

#include "concurrency/AsyncService.hpp"
#include "config/Config.hpp"
#include "tool/VersionControl.hpp"
#include "util/clock.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <string>

namespace vcs::status { class Store; }
namespace vcs::watch { class Registry; }
namespace vcs::roots { class Manager; }

namespace vcs::sync {

enum class TickAction { None, IncrementalRefresh, FullRebuild };

std::string to_string(TickAction action);

// Periodic coordinator keeping the status store consistent with the repository.
// Each tick drains the change sources and either patches the store for the
// dirty paths or rebuilds it from full root queries.
class Engine final : public concurrency::AsyncService {
public:
    Engine(config::SyncConfig cfg,
           status::Store& store,
           watch::Registry& watchers,
           roots::Manager& roots,
           tool::VersionControl& tool,
           std::function<void()> notify,
           util::NowFn now = util::systemNow);

    ~Engine() override;

    // One processing pass; returns what was decided. No-op while build mode is active.
    TickAction tick();

    [[nodiscard]] TickAction decide(std::size_t changedCount, util::Clock::duration sinceLastChange) const;

    // True when path has to be requeried. A change of the working state file made
    // outside the self-modification window raises the rebuild flag instead.
    bool classify(const std::filesystem::path& path);

    // Full requery of every root; the store is swapped in one step.
    void rebuild();

    // Returns true when a query was issued.
    bool refreshIncremental();

    void enterBuildMode();
    void exitBuildMode();
    [[nodiscard]] bool isBuildSuspended() const { return buildInProgress_.load(std::memory_order_acquire); }

    void markSelfModified();
    [[nodiscard]] util::TimePoint selfModifiedAt() const;

    void markCacheDirty() { rebuildRequired_.store(true, std::memory_order_release); }
    [[nodiscard]] bool rebuildRequired() const { return rebuildRequired_.load(std::memory_order_acquire); }

    void addFiles(const tool::PathList& paths);
    void addFilesNotIgnored(const tool::PathList& paths);
    void propagateRenamed(const tool::PathList& oldPaths, const tool::PathList& newPaths);
    void propagateRemoved(const tool::PathList& paths);

    // Completion for asynchronous tool results: merge, then notify.
    void onToolResult(const std::filesystem::path& root, const status::StatusMap& result);
    [[nodiscard]] tool::Completion completion();

    [[nodiscard]] const config::SyncConfig& config() const { return cfg_; }

protected:
    void runLoop() override;

private:
    config::SyncConfig cfg_;
    status::Store& store_;
    watch::Registry& watchers_;
    roots::Manager& roots_;
    tool::VersionControl& tool_;
    std::function<void()> notify_;
    util::NowFn now_;

    std::string metadataDir_;
    std::string stateFile_;

    std::atomic<bool> rebuildRequired_{false};
    std::atomic<bool> buildInProgress_{false};
    std::atomic<util::Clock::rep> selfModifiedAt_;

    [[nodiscard]] bool isStateFile(const std::filesystem::path& path) const;
    [[nodiscard]] bool isInsideMetadataDir(const std::filesystem::path& path) const;
};

}
