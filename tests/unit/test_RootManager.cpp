#include <gtest/gtest.h>
#include "roots/Manager.hpp"
#include "watch/Registry.hpp"
#include "fakes.hpp"

using namespace vcs;
using namespace vcs::test;

class RootManagerTest : public ::testing::Test {
protected:
    ManualClock clock;
    ManualSources sources;
    FakeVersionControl tool;
    std::vector<std::pair<fs::path, status::StatusMap>> initial;

    std::unique_ptr<watch::Registry> watchers;
    std::unique_ptr<roots::Manager> manager;

    void SetUp() override {
        tool.repoRoots = {"/work/app", "/work/app/vendor/lib", "/work/other"};
        tool.rootStatus["/work/app"] = {{"/work/app/main.cpp", 'C'}};

        watchers = std::make_unique<watch::Registry>(sources.factory(clock.fn()), clock.fn());
        manager = std::make_unique<roots::Manager>(tool, *watchers,
            [this](const fs::path& root, const status::StatusMap& result) { initial.emplace_back(root, result); });
    }
};

TEST_F(RootManagerTest, EmptyPathIsRejected) {
    EXPECT_FALSE(manager->addRoot({}));
    EXPECT_FALSE(manager->hasAnyRoot());
}

TEST_F(RootManagerTest, DirectoryOutsideRepositoryAddsNothing) {
    EXPECT_TRUE(manager->addRoot("/tmp/not-a-repo"));
    EXPECT_FALSE(manager->hasAnyRoot());
    EXPECT_TRUE(tool.rootQueries.empty());
}

TEST_F(RootManagerTest, NewRootIsWatchedAndQueried) {
    EXPECT_TRUE(manager->addRoot("/work/app/src"));

    EXPECT_TRUE(manager->isRoot("/work/app"));
    EXPECT_TRUE(watchers->contains("/work/app"));
    EXPECT_TRUE(manager->hasAnyRoot());

    ASSERT_EQ(initial.size(), 1u);
    EXPECT_EQ(initial[0].first, "/work/app");
    EXPECT_EQ(initial[0].second.at("/work/app/main.cpp"), 'C');
}

TEST_F(RootManagerTest, FailedInitialQuerySkipsCompletion) {
    tool.failingRoots = {"/work/other"};

    EXPECT_TRUE(manager->addRoot("/work/other"));

    EXPECT_TRUE(manager->isRoot("/work/other"));
    EXPECT_EQ(tool.rootQueries.size(), 1u);
    EXPECT_TRUE(initial.empty());
}

TEST_F(RootManagerTest, KnownRootIsNotQueriedAgain) {
    manager->addRoot("/work/app");
    manager->addRoot("/work/app/src");
    manager->addRoot("/work/app");

    EXPECT_EQ(tool.rootQueries.size(), 1u);
    EXPECT_EQ(watchers->size(), 1u);
}

TEST_F(RootManagerTest, NestedRepositoryIsSeparateRoot) {
    manager->addRoot("/work/app");
    manager->addRoot("/work/app/vendor/lib/include");

    EXPECT_TRUE(manager->isRoot("/work/app/vendor/lib"));
    EXPECT_EQ(watchers->size(), 2u);
}

TEST_F(RootManagerTest, SortedRootsPutsParentsFirst) {
    manager->addRoot("/work/app/vendor/lib");
    manager->addRoot("/work/other");
    manager->addRoot("/work/app");

    const auto sorted = manager->sortedRoots();
    ASSERT_EQ(sorted.size(), 3u);
    EXPECT_EQ(sorted.front(), "/work/app");
    EXPECT_EQ(sorted.back(), "/work/app/vendor/lib");
}

TEST_F(RootManagerTest, ClearForgetsRoots) {
    manager->addRoot("/work/app");
    manager->clear();

    EXPECT_TRUE(manager->sortedRoots().empty());
    EXPECT_FALSE(manager->isRoot("/work/app"));
}
