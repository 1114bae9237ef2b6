#include "fmp/upload/dedup_index.hpp"

#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <fstream>
#include <thread>
#include <vector>

using namespace fmp;
using namespace fmp::upload;
using storage::StorageMode;

TEST(DedupIndexTest, FirstRegistrationWins) {
    DedupIndex index;
    auto first = index.register_if_absent("h1", StorageMode::Local, "objects/a");
    EXPECT_TRUE(first.inserted);
    EXPECT_EQ(first.location, "objects/a");

    auto second = index.register_if_absent("h1", StorageMode::Local, "objects/b");
    EXPECT_FALSE(second.inserted);
    EXPECT_EQ(second.location, "objects/a");
    EXPECT_EQ(index.lookup("h1", StorageMode::Local), std::optional<std::string>("objects/a"));
}

TEST(DedupIndexTest, ModesAreSeparateNamespaces) {
    DedupIndex index;
    index.register_if_absent("h1", StorageMode::Local, "objects/a");
    EXPECT_FALSE(index.lookup("h1", StorageMode::Remote).has_value());
    EXPECT_TRUE(index.register_if_absent("h1", StorageMode::Remote, "uploads/a").inserted);
    EXPECT_EQ(index.size(), 2u);
}

TEST(DedupIndexTest, ConcurrentRegistrationHasOneWinner) {
    DedupIndex index;
    std::atomic<int> winners{0};
    std::vector<std::string> seen(8);
    std::vector<std::thread> threads;

    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&, i]() {
            auto reg = index.register_if_absent("same", StorageMode::Local, "loc-" + std::to_string(i));
            if (reg.inserted) {
                ++winners;
            }
            seen[i] = reg.location;
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners.load(), 1);
    for (const auto& location : seen) {
        EXPECT_EQ(location, seen[0]);
    }
}

TEST(DedupIndexTest, PersistsAndReloads) {
    test::TempDir dir;
    const auto file = dir / "dedup.json";
    {
        DedupIndex index(file);
        index.register_if_absent("h1", StorageMode::Local, "objects/a");
        index.register_if_absent("h2", StorageMode::Remote, "uploads/b");
    }

    DedupIndex reloaded(file);
    ASSERT_TRUE(reloaded.load().is_ok());
    EXPECT_EQ(reloaded.size(), 2u);
    EXPECT_EQ(reloaded.lookup("h2", StorageMode::Remote), std::optional<std::string>("uploads/b"));
}

TEST(DedupIndexTest, MissingFileIsEmptyAndCorruptFileFails) {
    test::TempDir dir;
    DedupIndex empty(dir / "absent.json");
    EXPECT_TRUE(empty.load().is_ok());
    EXPECT_EQ(empty.size(), 0u);

    std::ofstream(dir / "corrupt.json") << "{]";
    DedupIndex corrupt(dir / "corrupt.json");
    auto res = corrupt.load();
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code, ErrorCode::BackendIOError);
}
