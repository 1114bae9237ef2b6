#include "fmp/upload/merge_coordinator.hpp"
#include "fmp/core/hash.hpp"
#include "fmp/storage/local_backend.hpp"
#include "fmp/storage/memory_object_store.hpp"
#include "fmp/storage/remote_backend.hpp"

#include "support/manual_clock.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace fmp;
using namespace fmp::upload;

namespace {

MergePlan stage(storage::StorageBackend& backend,
                const std::string& session_id,
                const std::vector<std::string>& chunks) {
    MergePlan plan;
    plan.session_id = session_id;
    plan.staging = backend.open_staging_area(session_id, "text/plain").value();
    plan.total_chunks = static_cast<std::uint32_t>(chunks.size());
    for (std::uint32_t i = 0; i < chunks.size(); ++i) {
        const std::vector<std::uint8_t> data(chunks[i].begin(), chunks[i].end());
        plan.ordered.push_back(backend.write_chunk(plan.staging, i, data, crypto::sha256_hex(data)).value());
    }
    return plan;
}

} // namespace

class LocalMergeTest : public ::testing::Test {
protected:
    LocalMergeTest() : backend(dir.path()), coordinator(backend, dedup) {}

    test::TempDir dir;
    storage::LocalBackend backend;
    DedupIndex dedup;
    MergeCoordinator coordinator;
};

TEST_F(LocalMergeTest, MergesAndRegisters) {
    auto plan = stage(backend, "aa01", {"hello ", "world"});
    plan.declared_hash = crypto::sha256_hex(std::string("hello world"));

    auto outcome = coordinator.merge(plan);
    ASSERT_TRUE(outcome.is_ok()) << outcome.error().message;
    EXPECT_EQ(outcome.value().location, "objects/aa/aa01");
    EXPECT_EQ(outcome.value().size, 11u);
    EXPECT_FALSE(outcome.value().deduplicated);
    EXPECT_EQ(dedup.lookup(*plan.declared_hash, storage::StorageMode::Local),
              std::optional<std::string>("objects/aa/aa01"));
}

TEST_F(LocalMergeTest, HashMismatchDiscardsOutput) {
    auto plan = stage(backend, "bb02", {"abc"});
    plan.declared_hash = std::string(64, '0');

    auto outcome = coordinator.merge(plan);
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().code, ErrorCode::HashMismatch);
    EXPECT_FALSE(std::filesystem::exists(dir / "objects" / "bb" / "bb02"));
    EXPECT_EQ(dedup.size(), 0u);
}

TEST_F(LocalMergeTest, SecondIdenticalUploadAdoptsFirstObject) {
    auto first = coordinator.merge(stage(backend, "cc03", {"same", "bytes"}));
    ASSERT_TRUE(first.is_ok());

    auto second = coordinator.merge(stage(backend, "dd04", {"same", "bytes"}));
    ASSERT_TRUE(second.is_ok());
    EXPECT_TRUE(second.value().deduplicated);
    EXPECT_EQ(second.value().location, first.value().location);
    EXPECT_EQ(second.value().content_hash, first.value().content_hash);
    EXPECT_FALSE(std::filesystem::exists(dir / "objects" / "dd" / "dd04"));
}

TEST_F(LocalMergeTest, IncompletePlanIsRejected) {
    auto plan = stage(backend, "ee05", {"a", "b"});
    plan.ordered.pop_back();

    auto outcome = coordinator.merge(plan);
    ASSERT_TRUE(outcome.is_error());
    EXPECT_EQ(outcome.error().code, ErrorCode::InvalidRequest);
}

TEST(RemoteMergeTest, DedupHitSkipsCompletion) {
    auto clock = std::make_shared<test::ManualClock>();
    auto store = std::make_shared<storage::MemoryObjectStore>(clock, 1);
    storage::RemoteBackendOptions options;
    options.min_part_size = 1;
    storage::RemoteBackend backend(store, options);
    DedupIndex dedup;
    MergeCoordinator coordinator(backend, dedup);

    auto first = coordinator.merge(stage(backend, "r1", {"part-one", "part-two"}));
    ASSERT_TRUE(first.is_ok()) << first.error().message;
    EXPECT_EQ(store->complete_calls(), 1u);

    auto second = coordinator.merge(stage(backend, "r2", {"part-one", "part-two"}));
    ASSERT_TRUE(second.is_ok());
    EXPECT_TRUE(second.value().deduplicated);
    EXPECT_EQ(second.value().location, "uploads/r1");
    EXPECT_EQ(store->complete_calls(), 1u);
    EXPECT_EQ(store->open_upload_count(), 0u);
    EXPECT_EQ(store->object_count(), 1u);
}

TEST(RemoteMergeTest, DeclaredHashIsNotComparedToPartDigest) {
    auto clock = std::make_shared<test::ManualClock>();
    auto store = std::make_shared<storage::MemoryObjectStore>(clock, 1);
    storage::RemoteBackendOptions options;
    options.min_part_size = 1;
    storage::RemoteBackend backend(store, options);
    DedupIndex dedup;
    MergeCoordinator coordinator(backend, dedup);

    auto plan = stage(backend, "r3", {"xyz"});
    plan.declared_hash = crypto::sha256_hex(std::string("xyz"));

    auto outcome = coordinator.merge(plan);
    ASSERT_TRUE(outcome.is_ok());
    EXPECT_EQ(outcome.value().content_hash.rfind("sha256-parts:", 0), 0u);
}
