#include <gtest/gtest.h>
#include "core/StatusCache.hpp"
#include "fakes.hpp"

#include <nlohmann/json.hpp>

using namespace vcs;
using namespace vcs::test;
using namespace std::chrono;
using status::FileStatus;

class StatusCacheTest : public ::testing::Test {
protected:
    ManualClock clock;
    ManualSources sources;
    std::shared_ptr<FakeVersionControl> tool = std::make_shared<FakeVersionControl>();
    std::shared_ptr<ManualDispatcher> dispatcher = std::make_shared<ManualDispatcher>();
    std::unique_ptr<core::StatusCache> cache;
    int changed = 0;

    const fs::path repo = "/repo";

    void SetUp() override {
        tool->repoRoots = {repo};
        tool->rootStatus[repo] = {{repo / "x.txt", 'C'}};

        cache = std::make_unique<core::StatusCache>(config::Config{}, tool, dispatcher,
                                                    sources.factory(clock.fn()), clock.fn());
        cache->onStatusChanged([this] { ++changed; });
    }

    void TearDown() override { cache.reset(); }

    // Adds repo and delivers its initial notification.
    void addRepo() {
        ASSERT_TRUE(cache->addRoot(repo));
        dispatcher->drain();
        changed = 0;
    }
};

TEST_F(StatusCacheTest, RequiresTool) {
    EXPECT_THROW(core::StatusCache(config::Config{}, nullptr, dispatcher), std::invalid_argument);
}

TEST_F(StatusCacheTest, InitialRootStatusIsCached) {
    ASSERT_TRUE(cache->addRoot(repo));

    EXPECT_EQ(cache->getFileStatus(repo / "x.txt"), FileStatus::Controlled);
    EXPECT_TRUE(cache->anyItemsUnderSourceControl());
    EXPECT_EQ(dispatcher->drain(), 1u);
    EXPECT_EQ(changed, 1);
}

TEST_F(StatusCacheTest, UnknownPathIsUncontrolled) {
    addRepo();
    EXPECT_EQ(cache->getFileStatus(repo / "never-seen.txt"), FileStatus::Uncontrolled);
    EXPECT_FALSE(cache->getFileStatusInfo(repo / "never-seen.txt").has_value());
}

TEST_F(StatusCacheTest, AddFilesReportsAddedAndNotifiesOnce) {
    addRepo();
    tool->addResult = {{"new.txt", 'A'}};

    cache->addFiles({repo / "new.txt"});

    EXPECT_EQ(cache->getFileStatus(repo / "new.txt"), FileStatus::Added);
    EXPECT_EQ(dispatcher->drain(), 1u);
    EXPECT_EQ(changed, 1);
}

TEST_F(StatusCacheTest, AddFilesNotIgnoredGoesThroughTool) {
    addRepo();
    tool->addResult = {{repo / "keep.cpp", 'A'}};

    cache->addFilesNotIgnored({repo / "keep.cpp", repo / "build.o"});

    ASSERT_EQ(tool->addedNotIgnored.size(), 1u);
    EXPECT_EQ(cache->getFileStatus(repo / "keep.cpp"), FileStatus::Added);
    EXPECT_EQ(cache->getFileStatus(repo / "build.o"), FileStatus::Uncontrolled);
}

TEST_F(StatusCacheTest, RemovedPathIsEvictedBeforeToolReturns) {
    addRepo();
    auto during = FileStatus::Controlled;
    tool->beforeCompletion = [&] { during = cache->getFileStatus(repo / "x.txt"); };

    cache->propagateRemoved({repo / "x.txt"});

    EXPECT_EQ(during, FileStatus::Uncontrolled);
    EXPECT_EQ(cache->getFileStatus(repo / "x.txt"), FileStatus::Uncontrolled);
}

TEST_F(StatusCacheTest, RenamedPairIsEvictedAndForwarded) {
    addRepo();
    tool->renameResult = {{"y.txt", 'N'}, {"x.txt", 'R'}};

    cache->propagateRenamed({repo / "x.txt"}, {repo / "y.txt"});

    ASSERT_EQ(tool->renamed.size(), 1u);
    EXPECT_EQ(cache->getFileStatus(repo / "y.txt"), FileStatus::Renamed);
    EXPECT_EQ(cache->getFileStatus(repo / "x.txt"), FileStatus::Removed);
}

TEST_F(StatusCacheTest, BuildModeSuspendsProcessing) {
    addRepo();
    const auto rootQueries = tool->rootQueries.size();

    cache->enterBuildMode();
    for (int i = 0; i < 250; ++i) sources.at(repo).notify(repo / ("gen" + std::to_string(i) + ".o"));
    clock.advance(seconds(3));

    EXPECT_EQ(cache->engine().tick(), vcs::sync::TickAction::None);
    EXPECT_EQ(tool->rootQueries.size(), rootQueries);
    EXPECT_TRUE(tool->fileQueries.empty());
    EXPECT_EQ(dispatcher->pending(), 0u);

    cache->exitBuildMode();
    EXPECT_EQ(cache->engine().tick(), vcs::sync::TickAction::FullRebuild);
    EXPECT_EQ(tool->rootQueries.size(), rootQueries + 1);
    EXPECT_EQ(dispatcher->drain(), 1u);
}

TEST_F(StatusCacheTest, DisabledWatchingDropsEvents) {
    addRepo();
    cache->setWatchingEnabled(false);
    sources.at(repo).notify(repo / "ignored.txt");
    clock.advance(seconds(1));

    EXPECT_EQ(cache->engine().tick(), vcs::sync::TickAction::None);
}

TEST_F(StatusCacheTest, UpdateProjectsSkipsIncompleteEntries) {
    tool->repoRoots.insert("/other");

    cache->updateProjects({{"", "/other"}, {"app", repo}, {"empty", ""}});

    EXPECT_EQ(tool->rootQueries, std::vector<fs::path>{repo});
}

TEST_F(StatusCacheTest, RemovedHandlerIsNotCalled) {
    const auto id = cache->onStatusChanged([this] { changed += 10; });
    cache->removeStatusChangedHandler(id);

    cache->addRoot(repo);
    dispatcher->drain();

    EXPECT_EQ(changed, 1);
}

TEST_F(StatusCacheTest, NotificationAfterDestructionIsDropped) {
    cache->addRoot(repo);
    cache.reset();

    EXPECT_EQ(dispatcher->drain(), 1u);
    EXPECT_EQ(changed, 0);
}

TEST_F(StatusCacheTest, WithoutDispatcherHandlersRunInline) {
    ManualSources inlineSources;
    core::StatusCache direct(config::Config{}, tool, nullptr, inlineSources.factory(clock.fn()), clock.fn());
    int calls = 0;
    direct.onStatusChanged([&calls] { ++calls; });

    direct.addRoot(repo);

    EXPECT_EQ(calls, 1);
}

TEST_F(StatusCacheTest, ClearAllForgetsEverything) {
    addRepo();
    cache->clearAll();

    EXPECT_FALSE(cache->anyItemsUnderSourceControl());
    EXPECT_EQ(cache->count(), 0u);
    EXPECT_TRUE(sources.stoppedRoots.contains(repo));
}

TEST_F(StatusCacheTest, SnapshotSerializesRecords) {
    addRepo();
    const nlohmann::json j = cache->getFileStatusInfo(repo / "x.txt").value();

    EXPECT_EQ(j.at("path").get<std::string>(), "/repo/x.txt");
    EXPECT_EQ(j.at("state").get<std::string>(), "C");
    EXPECT_EQ(j.at("status").get<std::string>(), "controlled");
    EXPECT_EQ(cache->snapshot().size(), 1u);
}
