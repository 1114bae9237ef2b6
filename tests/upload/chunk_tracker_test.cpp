#include "fmp/upload/chunk_tracker.hpp"

#include <gtest/gtest.h>

using namespace fmp;
using namespace fmp::upload;

namespace {

storage::ChunkRef ref(std::uint32_t index, const std::string& digest) {
    return storage::ChunkRef{index, 10, digest, "r" + std::to_string(index)};
}

} // namespace

TEST(ChunkTrackerTest, OutOfOrderMarks) {
    ChunkTracker tracker(3);
    EXPECT_EQ(tracker.missing(), (std::vector<std::uint32_t>{0, 1, 2}));

    EXPECT_EQ(tracker.mark(ref(1, "b")), ChunkTracker::MarkOutcome::Added);
    EXPECT_EQ(tracker.missing(), (std::vector<std::uint32_t>{0, 2}));
    EXPECT_EQ(tracker.mark(ref(0, "a")), ChunkTracker::MarkOutcome::Added);
    EXPECT_EQ(tracker.missing(), (std::vector<std::uint32_t>{2}));
    EXPECT_EQ(tracker.uploaded(), (std::vector<std::uint32_t>{0, 1}));
    EXPECT_FALSE(tracker.complete());

    EXPECT_EQ(tracker.mark(ref(2, "c")), ChunkTracker::MarkOutcome::Added);
    EXPECT_TRUE(tracker.complete());
    EXPECT_TRUE(tracker.missing().empty());
    EXPECT_DOUBLE_EQ(tracker.progress_percent(), 100.0);
}

TEST(ChunkTrackerTest, DuplicateAndConflict) {
    ChunkTracker tracker(2);
    tracker.mark(ref(0, "a"));

    EXPECT_EQ(tracker.mark(ref(0, "a")), ChunkTracker::MarkOutcome::Duplicate);
    EXPECT_EQ(tracker.mark(ref(0, "z")), ChunkTracker::MarkOutcome::Conflict);
    EXPECT_EQ(tracker.received_count(), 1u);
    EXPECT_EQ(tracker.receipt(0)->digest, "a");

    EXPECT_EQ(tracker.check(1, "x"), ChunkTracker::MarkOutcome::Added);
    EXPECT_EQ(tracker.receipt(1), nullptr);
}

TEST(ChunkTrackerTest, ReservationsAreExclusive) {
    ChunkTracker tracker(4);
    EXPECT_TRUE(tracker.reserve(2));
    EXPECT_FALSE(tracker.reserve(2));
    EXPECT_TRUE(tracker.in_flight(2));
    EXPECT_TRUE(tracker.any_in_flight());

    tracker.release(2);
    EXPECT_FALSE(tracker.in_flight(2));
    EXPECT_FALSE(tracker.any_in_flight());
    // Reservation alone does not count as received
    EXPECT_EQ(tracker.received_count(), 0u);
}

TEST(ChunkTrackerTest, OrderedReceiptsAndProgress) {
    ChunkTracker tracker(4);
    tracker.mark(ref(3, "d"));
    tracker.mark(ref(1, "b"));

    const auto ordered = tracker.ordered_receipts();
    ASSERT_EQ(ordered.size(), 2u);
    EXPECT_EQ(ordered[0].index, 1u);
    EXPECT_EQ(ordered[1].index, 3u);
    EXPECT_DOUBLE_EQ(tracker.progress_percent(), 50.0);
}
