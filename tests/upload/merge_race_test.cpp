#include "fmp/upload/engine.hpp"
#include "fmp/storage/local_backend.hpp"

#include "support/manual_clock.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <mutex>
#include <set>
#include <thread>

using namespace fmp;
using namespace fmp::upload;
using namespace std::chrono_literals;

namespace {

/// Forwards to a real backend but parks finalize until released
class GatedBackend final : public storage::StorageBackend {
public:
    explicit GatedBackend(storage::StorageBackend& inner)
        : inner_(inner), entered_future_(entered_.get_future()), released_(release_.get_future().share()) {}

    bool wait_until_finalizing() { return entered_future_.wait_for(10s) == std::future_status::ready; }

    void release() {
        if (!released_flag_.exchange(true)) {
            release_.set_value();
        }
    }

    storage::StorageMode mode() const noexcept override { return inner_.mode(); }

    storage::BackendLimits limits() const noexcept override { return inner_.limits(); }

    Result<storage::StagingHandle> open_staging_area(const std::string& session_id,
                                                     const std::string& content_type) override {
        return inner_.open_staging_area(session_id, content_type);
    }

    Result<storage::ChunkRef> write_chunk(const storage::StagingHandle& handle,
                                          std::uint32_t index,
                                          const std::vector<std::uint8_t>& bytes,
                                          const std::string& digest) override {
        return inner_.write_chunk(handle, index, bytes, digest);
    }

    std::optional<std::string> digest_before_merge(const std::vector<storage::ChunkRef>& ordered) const override {
        return inner_.digest_before_merge(ordered);
    }

    Result<storage::MergeOutput> finalize(const storage::StagingHandle& handle,
                                          const std::vector<storage::ChunkRef>& ordered) override {
        entered_.set_value();
        released_.wait();
        return inner_.finalize(handle, ordered);
    }

    Result<void> abort(const storage::StagingHandle& handle) override { return inner_.abort(handle); }

    Result<bool> staging_exists(const storage::StagingHandle& handle) const override {
        return inner_.staging_exists(handle);
    }

    Result<storage::DownloadHandle> read_final(const std::string& location) override {
        return inner_.read_final(location);
    }

    Result<void> discard_final(const std::string& location) override { return inner_.discard_final(location); }

private:
    storage::StorageBackend& inner_;
    std::promise<void> entered_;
    std::future<void> entered_future_;
    std::promise<void> release_;
    std::shared_future<void> released_;
    std::atomic<bool> released_flag_{false};
};

std::vector<std::uint8_t> bytes(std::size_t size, std::uint8_t value) {
    return std::vector<std::uint8_t>(size, value);
}

} // namespace

class MergeRaceTest : public ::testing::Test {
protected:
    MergeRaceTest()
        : clock(std::make_shared<test::ManualClock>()),
          local(dir / "storage"),
          gated(local),
          engine(gated, ledger, dedup, bus, clock, options()) {
        bus.subscribe<events::UploadCompletedEvent>([this](const events::UploadCompletedEvent& e) {
            std::lock_guard lock(events_mutex);
            completed.insert(e.session_id);
        });
        bus.subscribe<events::UploadExpiredEvent>([this](const events::UploadExpiredEvent& e) {
            std::lock_guard lock(events_mutex);
            expired.insert(e.session_id);
        });
        bus.subscribe<events::UploadFailedEvent>([this](const events::UploadFailedEvent& e) {
            std::lock_guard lock(events_mutex);
            failed.insert(e.session_id);
        });
    }

    ~MergeRaceTest() override { gated.release(); }

    static EngineOptions options() {
        EngineOptions opts;
        opts.session_ttl = 1h;
        return opts;
    }

    static std::string init(UploadEngine& target) {
        UploadRequest request;
        request.owner_id = "42";
        request.total_size = 8;
        request.chunk_size = 4;
        request.filename = "notes.txt";
        return target.initialize_upload(request).value().session.id;
    }

    // Sends the last chunk on another thread; it parks inside finalize
    void send_final_chunk(const std::string& id) {
        pending = std::async(std::launch::async, [this, id] { return engine.accept_chunk("42", id, 1, bytes(4, 'b')); });
    }

    std::size_t count(const std::set<std::string>& ids, const std::string& id) {
        std::lock_guard lock(events_mutex);
        return ids.count(id);
    }

    test::TempDir dir;
    std::shared_ptr<test::ManualClock> clock;
    storage::LocalBackend local;
    GatedBackend gated;
    MemorySessionLedger ledger;
    DedupIndex dedup;
    events::EventBus bus;
    UploadEngine engine;
    std::future<Result<ChunkResult>> pending;

    std::mutex events_mutex;
    std::set<std::string> completed;
    std::set<std::string> expired;
    std::set<std::string> failed;
};

TEST_F(MergeRaceTest, SweepDuringMergeExpiresSession) {
    const auto id = init(engine);
    ASSERT_TRUE(engine.accept_chunk("42", id, 0, bytes(4, 'a')).is_ok());

    send_final_chunk(id);
    EXPECT_TRUE(gated.wait_until_finalizing());
    EXPECT_EQ(engine.get_session_status("42", id).value().status, SessionStatus::Merging);

    clock->advance(2h);
    EXPECT_EQ(engine.expire_stale(), 1u);
    EXPECT_EQ(engine.get_session_status("42", id).value().status, SessionStatus::Expired);
    EXPECT_EQ(count(expired, id), 1u);

    gated.release();
    auto result = pending.get();
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::Expired);

    // The late merge result never overrides the expiry
    EXPECT_EQ(engine.get_session_status("42", id).value().status, SessionStatus::Expired);
    EXPECT_EQ(count(completed, id), 0u);
    EXPECT_EQ(count(failed, id), 0u);
    EXPECT_EQ(engine.expire_stale(), 0u);
    EXPECT_EQ(ledger.load_all().value().front().status(), SessionStatus::Expired);
}

TEST_F(MergeRaceTest, MergeCommittedBeforeSweepIsNeverExpired) {
    const auto id = init(engine);
    ASSERT_TRUE(engine.accept_chunk("42", id, 0, bytes(4, 'a')).is_ok());

    send_final_chunk(id);
    EXPECT_TRUE(gated.wait_until_finalizing());

    // Before the deadline the sweep leaves the merging session alone
    EXPECT_EQ(engine.expire_stale(), 0u);

    gated.release();
    auto result = pending.get();
    ASSERT_TRUE(result.is_ok()) << result.error().message;
    EXPECT_EQ(result.value().status, SessionStatus::Completed);

    clock->advance(2h);
    EXPECT_EQ(engine.expire_stale(), 0u);
    EXPECT_EQ(engine.get_session_status("42", id).value().status, SessionStatus::Completed);
    EXPECT_EQ(count(completed, id), 1u);
    EXPECT_EQ(count(expired, id), 0u);
}

TEST_F(MergeRaceTest, ConcurrentSweepAndFinalChunkAgree) {
    MemorySessionLedger race_ledger;
    UploadEngine racing(local, race_ledger, dedup, bus, clock, options());

    for (std::uint8_t round = 0; round < 20; ++round) {
        const auto id = init(racing);
        ASSERT_TRUE(racing.accept_chunk("42", id, 0, bytes(4, round)).is_ok());

        std::thread sweeper([&] {
            clock->advance(2h);
            racing.expire_stale();
        });
        auto result = racing.accept_chunk("42", id, 1, bytes(4, static_cast<std::uint8_t>(round + 100)));
        sweeper.join();
        racing.expire_stale();

        const auto status = racing.get_session_status("42", id).value().status;
        if (status == SessionStatus::Completed) {
            EXPECT_TRUE(result.is_ok());
            EXPECT_EQ(count(completed, id), 1u);
            EXPECT_EQ(count(expired, id), 0u);
        } else {
            EXPECT_EQ(status, SessionStatus::Expired);
            ASSERT_TRUE(result.is_error());
            EXPECT_EQ(result.error().code, ErrorCode::Expired);
            EXPECT_EQ(count(completed, id), 0u);
            EXPECT_EQ(count(expired, id), 1u);
        }
    }
}
