#include <gtest/gtest.h>
#include "status/Store.hpp"
#include "status/FileStatus.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace vcs::status;

class StoreTest : public ::testing::Test {
protected:
    fs::path dir;
    Store store;

    void SetUp() override {
        dir = fs::temp_directory_path() / "vcstatus_store_test";
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override { fs::remove_all(dir); }

    fs::path writeFile(const std::string& name, const std::string& content) const {
        const auto p = dir / name;
        std::ofstream(p) << content;
        return p;
    }
};

TEST_F(StoreTest, MergeCapturesSizeAndModTime) {
    const auto file = writeFile("a.txt", "hello");
    store.merge(StatusMap{{file, 'C'}});

    const auto rec = store.get(file);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->state, 'C');
    EXPECT_EQ(rec->size, 5u);
    EXPECT_EQ(rec->mod_time, fs::last_write_time(file));
}

TEST_F(StoreTest, MergeOfAbsentFileRecordsZeroSize) {
    const auto missing = dir / "gone.txt";
    store.merge(StatusMap{{missing, 'R'}});

    const auto rec = store.get(missing);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->size, 0u);
    EXPECT_EQ(rec->mod_time, fs::file_time_type{});
}

TEST_F(StoreTest, MergeIsIdempotent) {
    const auto file = writeFile("a.txt", "x");
    const StatusMap subset{{file, 'M'}, {dir / "b.txt", '?'}};

    store.merge(subset);
    const auto first = store.snapshot();
    store.merge(subset);

    EXPECT_EQ(store.snapshot(), first);
    EXPECT_EQ(store.count(), 2u);
}

TEST_F(StoreTest, MergeReplacesExistingEntry) {
    const auto file = writeFile("a.txt", "x");
    store.merge(StatusMap{{file, 'C'}});
    store.merge(StatusMap{{file, 'M'}});

    EXPECT_EQ(store.get(file)->state, 'M');
    EXPECT_EQ(store.count(), 1u);
}

TEST_F(StoreTest, MergeResolvesRelativeKeysAgainstBase) {
    store.merge(StatusMap{{"sub/../new.txt", 'A'}}, dir);

    EXPECT_TRUE(store.contains(dir / "new.txt"));
    EXPECT_FALSE(store.contains("new.txt"));
}

TEST_F(StoreTest, EmptyMergeLeavesStoreUntouched) {
    store.merge(StatusMap{{dir / "a.txt", 'C'}});
    store.merge(StatusMap{});
    EXPECT_EQ(store.count(), 1u);
}

TEST_F(StoreTest, RemoveIsIdempotent) {
    const auto p = dir / "a.txt";
    store.merge(StatusMap{{p, 'C'}});

    store.remove(p);
    EXPECT_FALSE(store.contains(p));
    EXPECT_NO_THROW(store.remove(p));
    EXPECT_EQ(store.count(), 0u);
}

TEST_F(StoreTest, RemoveAllEvictsOnlyNamedPaths) {
    store.merge(StatusMap{{dir / "a", 'C'}, {dir / "b", 'C'}, {dir / "c", 'C'}});
    store.removeAll({dir / "a", dir / "c", dir / "never-cached"});

    EXPECT_EQ(store.count(), 1u);
    EXPECT_TRUE(store.contains(dir / "b"));
}

TEST_F(StoreTest, ReplaceDiscardsPreviousContents) {
    store.merge(StatusMap{{dir / "old", 'C'}});
    store.replace(Store::toRecords(StatusMap{{dir / "new", 'A'}}));

    EXPECT_FALSE(store.contains(dir / "old"));
    EXPECT_TRUE(store.contains(dir / "new"));
    EXPECT_EQ(store.count(), 1u);
}

TEST_F(StoreTest, ClearEmptiesStore) {
    store.merge(StatusMap{{dir / "a", 'C'}, {dir / "b", 'I'}});
    store.clear();
    EXPECT_EQ(store.count(), 0u);
    EXPECT_FALSE(store.get(dir / "a").has_value());
}

TEST(StoreConcurrencyTest, ReadersSeeWholeGenerationsDuringReplace) {
    StatusMap a, b;
    for (int i = 0; i < 20; ++i) a["/vcstatus-gen/f" + std::to_string(i)] = 'C';
    for (int i = 0; i < 30; ++i) b["/vcstatus-gen/f" + std::to_string(i)] = 'M';
    const auto genA = Store::toRecords(a);
    const auto genB = Store::toRecords(b);

    Store store;
    store.replace(RecordMap(genA));

    std::atomic<bool> done{false};
    std::atomic<int> torn{0};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            while (!done.load()) {
                const auto snap = store.snapshot();
                if (snap != genA && snap != genB) ++torn;

                const auto n = store.count();
                if (n != genA.size() && n != genB.size()) ++torn;

                const auto first = store.get("/vcstatus-gen/f0");
                if (!first || (first->state != 'C' && first->state != 'M')) ++torn;
            }
        });
    }

    for (int i = 0; i < 500; ++i) store.replace(RecordMap(i % 2 == 0 ? genB : genA));
    done = true;
    for (auto& t : readers) t.join();

    EXPECT_EQ(torn.load(), 0);
    EXPECT_EQ(store.snapshot(), genA);
}

TEST(StoreConcurrencyTest, ConcurrentMergeRemoveAndGet) {
    Store store;
    std::atomic<bool> done{false};
    std::atomic<int> bad{0};

    std::thread reader([&] {
        while (!done.load()) {
            for (int i = 0; i < 50; ++i) {
                const auto kept = store.get("/vcstatus-mix/kept" + std::to_string(i));
                if (kept && kept->state != 'A') ++bad;
                const auto gone = store.get("/vcstatus-mix/gone" + std::to_string(i));
                if (gone && gone->state != '?') ++bad;
            }
        }
    });

    std::thread merger([&] {
        for (int i = 0; i < 200; ++i) store.merge(StatusMap{{"/vcstatus-mix/kept" + std::to_string(i), 'A'}});
    });

    std::thread remover([&] {
        for (int i = 0; i < 200; ++i) {
            const fs::path p = "/vcstatus-mix/gone" + std::to_string(i);
            store.merge(StatusMap{{p, '?'}});
            store.remove(p);
        }
    });

    merger.join();
    remover.join();
    done = true;
    reader.join();

    EXPECT_EQ(bad.load(), 0);
    EXPECT_EQ(store.count(), 200u);
    EXPECT_FALSE(store.contains("/vcstatus-mix/gone0"));
}

TEST(FileStatusTest, StateCharacterMapping) {
    EXPECT_EQ(fromStateChar('C'), FileStatus::Controlled);
    EXPECT_EQ(fromStateChar('M'), FileStatus::Modified);
    EXPECT_EQ(fromStateChar('A'), FileStatus::Added);
    EXPECT_EQ(fromStateChar('R'), FileStatus::Removed);
    EXPECT_EQ(fromStateChar('N'), FileStatus::Renamed);
    EXPECT_EQ(fromStateChar('I'), FileStatus::Ignored);
    EXPECT_EQ(fromStateChar('?'), FileStatus::Uncontrolled);
}

TEST(FileStatusTest, UnknownCharacterIsUncontrolled) {
    EXPECT_EQ(fromStateChar('x'), FileStatus::Uncontrolled);
    EXPECT_EQ(fromStateChar('\0'), FileStatus::Uncontrolled);
    EXPECT_EQ(toStateChar(FileStatus::Uncontrolled), '?');
}

TEST(FileStatusTest, ToStateCharInvertsMapping) {
    for (const char c : {'C', 'M', 'A', 'R', 'N', 'I', '?'})
        EXPECT_EQ(toStateChar(fromStateChar(c)), c);
    EXPECT_EQ(to_string(FileStatus::Renamed), "renamed");
}
