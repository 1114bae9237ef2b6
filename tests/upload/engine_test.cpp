#include "fmp/upload/engine.hpp"
#include "fmp/core/hash.hpp"
#include "fmp/storage/local_backend.hpp"

#include "support/manual_clock.hpp"
#include "support/temp_dir.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <iterator>
#include <thread>

using namespace fmp;
using namespace fmp::upload;

namespace {

std::vector<std::uint8_t> pattern(std::size_t size, std::uint8_t seed) {
    std::vector<std::uint8_t> out(size);
    for (std::size_t i = 0; i < size; ++i) {
        out[i] = static_cast<std::uint8_t>((i * 31 + seed) & 0xFF);
    }
    return out;
}

std::vector<std::uint8_t> slice(const std::vector<std::uint8_t>& data, std::uint64_t chunk_size, std::uint32_t index) {
    const auto begin = std::min<std::uint64_t>(data.size(), index * chunk_size);
    const auto end = std::min<std::uint64_t>(data.size(), begin + chunk_size);
    return std::vector<std::uint8_t>(data.begin() + begin, data.begin() + end);
}

} // namespace

class UploadEngineTest : public ::testing::Test {
protected:
    UploadEngineTest()
        : clock(std::make_shared<test::ManualClock>()),
          backend(dir / "storage") {
        bus.subscribe<events::UploadCompletedEvent>([this](const events::UploadCompletedEvent& e) {
            ++completed_events;
            last_completed = e;
        });
        bus.subscribe<events::UploadExpiredEvent>([this](const events::UploadExpiredEvent&) { ++expired_events; });
        bus.subscribe<events::UploadFailedEvent>([this](const events::UploadFailedEvent&) { ++failed_events; });
        engine = make_engine();
    }

    std::unique_ptr<UploadEngine> make_engine() {
        EngineOptions options;
        options.session_ttl = std::chrono::hours(24);
        options.terminal_retention = std::chrono::hours(1);
        options.max_file_size = 64ull * 1024 * 1024;
        options.default_chunk_size = 1024;
        return std::make_unique<UploadEngine>(backend, ledger, dedup, bus, clock, options);
    }

    InitResult init(std::uint64_t total_size,
                    std::uint64_t chunk_size,
                    const std::string& owner = "42",
                    std::optional<std::string> declared_hash = std::nullopt) {
        UploadRequest request;
        request.owner_id = owner;
        request.total_size = total_size;
        request.chunk_size = chunk_size;
        request.declared_hash = std::move(declared_hash);
        request.filename = "report.pdf";
        request.content_type = "application/pdf";
        auto res = engine->initialize_upload(request);
        EXPECT_TRUE(res.is_ok()) << (res.is_error() ? res.error().message : "");
        return res.is_ok() ? res.value() : InitResult{};
    }

    std::string read_object(const std::string& location) {
        auto download = backend.read_final(location);
        EXPECT_TRUE(download.is_ok());
        if (download.is_error()) {
            return {};
        }
        return std::string((std::istreambuf_iterator<char>(*download.value().stream)),
                           std::istreambuf_iterator<char>());
    }

    test::TempDir dir;
    std::shared_ptr<test::ManualClock> clock;
    storage::LocalBackend backend;
    MemorySessionLedger ledger;
    DedupIndex dedup;
    events::EventBus bus;
    std::unique_ptr<UploadEngine> engine;

    std::atomic<int> completed_events{0};
    std::atomic<int> expired_events{0};
    std::atomic<int> failed_events{0};
    events::UploadCompletedEvent last_completed;
};

TEST_F(UploadEngineTest, OutOfOrderUploadCompletes) {
    const auto data = pattern(10'000'000, 7);
    const auto session = init(data.size(), 4'000'000).session;
    EXPECT_EQ(session.total_chunks, 3u);
    EXPECT_EQ(session.status, SessionStatus::Pending);
    EXPECT_EQ(session.filename, "report.pdf");

    auto r1 = engine->accept_chunk("42", session.id, 1, slice(data, 4'000'000, 1));
    ASSERT_TRUE(r1.is_ok());
    EXPECT_EQ(r1.value().status, SessionStatus::Uploading);
    EXPECT_EQ(r1.value().missing_chunks, (std::vector<std::uint32_t>{0, 2}));

    auto r0 = engine->accept_chunk("42", session.id, 0, slice(data, 4'000'000, 0));
    ASSERT_TRUE(r0.is_ok());
    EXPECT_EQ(r0.value().missing_chunks, (std::vector<std::uint32_t>{2}));

    auto r2 = engine->accept_chunk("42", session.id, 2, slice(data, 4'000'000, 2));
    ASSERT_TRUE(r2.is_ok()) << r2.error().message;
    EXPECT_EQ(r2.value().status, SessionStatus::Completed);
    EXPECT_DOUBLE_EQ(r2.value().progress_percent, 100.0);
    ASSERT_TRUE(r2.value().final_location.has_value());

    EXPECT_EQ(read_object(*r2.value().final_location), std::string(data.begin(), data.end()));
    EXPECT_EQ(completed_events.load(), 1);
    EXPECT_EQ(last_completed.content_hash, crypto::sha256_hex(data));
    EXPECT_EQ(last_completed.size, data.size());

    auto status = engine->get_session_status("42", session.id);
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value().status, SessionStatus::Completed);
    EXPECT_TRUE(status.value().completed_at.has_value());
}

TEST_F(UploadEngineTest, InitializationValidation) {
    UploadRequest request;
    request.owner_id = "42";
    request.total_size = 0;
    EXPECT_EQ(engine->initialize_upload(request).error().code, ErrorCode::InvalidRequest);

    request.total_size = 65ull * 1024 * 1024;
    EXPECT_EQ(engine->initialize_upload(request).error().code, ErrorCode::InvalidRequest);

    request.total_size = 100;
    request.declared_hash = "not-a-hash";
    EXPECT_EQ(engine->initialize_upload(request).error().code, ErrorCode::InvalidRequest);

    request.declared_hash.reset();
    request.owner_id.clear();
    EXPECT_EQ(engine->initialize_upload(request).error().code, ErrorCode::InvalidRequest);
}

TEST_F(UploadEngineTest, ChunkCountIsCapped) {
    UploadRequest request;
    request.owner_id = "42";
    request.total_size = 64ull * 1024 * 1024;
    request.chunk_size = 1;
    auto tiny = engine->initialize_upload(request);
    ASSERT_TRUE(tiny.is_error());
    EXPECT_EQ(tiny.error().code, ErrorCode::InvalidRequest);
    EXPECT_EQ(engine->session_count(), 0u);

    request.total_size = 10001;
    EXPECT_EQ(engine->initialize_upload(request).error().code, ErrorCode::InvalidRequest);

    request.total_size = 10000;
    auto at_limit = engine->initialize_upload(request);
    ASSERT_TRUE(at_limit.is_ok());
    EXPECT_EQ(at_limit.value().session.total_chunks, 10000u);

    EngineOptions tight;
    tight.max_chunks = 4;
    UploadEngine limited(backend, ledger, dedup, bus, clock, tight);
    request.total_size = 5;
    EXPECT_EQ(limited.initialize_upload(request).error().code, ErrorCode::InvalidRequest);
    request.chunk_size = 2;
    EXPECT_TRUE(limited.initialize_upload(request).is_ok());
}

TEST_F(UploadEngineTest, ContentTypeMustBeMediaType) {
    UploadRequest request;
    request.owner_id = "42";
    request.total_size = 10;
    request.content_type = "text/plain\r\nSet-Cookie: session=attacker";
    auto res = engine->initialize_upload(request);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code, ErrorCode::InvalidRequest);

    request.content_type = "text/plain; charset=utf-8";
    auto ok = engine->initialize_upload(request);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value().session.content_type, "text/plain; charset=utf-8");
}

TEST_F(UploadEngineTest, DefaultsApplied) {
    UploadRequest request;
    request.owner_id = "42";
    request.total_size = 3000;
    request.filename = "../../etc/passwd";
    auto res = engine->initialize_upload(request);
    ASSERT_TRUE(res.is_ok());

    const auto& view = res.value().session;
    EXPECT_EQ(view.chunk_size, 1024u);
    EXPECT_EQ(view.total_chunks, 3u);
    EXPECT_EQ(view.content_type, "application/octet-stream");
    EXPECT_EQ(view.filename.find('/'), std::string::npos);
    EXPECT_EQ(view.expires_at, clock->now() + std::chrono::hours(24));
    EXPECT_FALSE(res.value().resumed);
}

TEST_F(UploadEngineTest, ChunkValidationErrors) {
    const auto session = init(2500, 1000).session;

    EXPECT_EQ(engine->accept_chunk("42", "nope", 0, pattern(1000, 0)).error().code, ErrorCode::SessionNotFound);
    EXPECT_EQ(engine->accept_chunk("7", session.id, 0, pattern(1000, 0)).error().code, ErrorCode::Forbidden);
    EXPECT_EQ(engine->accept_chunk("42", session.id, 3, pattern(1000, 0)).error().code, ErrorCode::IndexOutOfRange);
    EXPECT_EQ(engine->accept_chunk("42", session.id, 0, pattern(999, 0)).error().code, ErrorCode::InvalidRequest);
    // Last chunk carries the remainder
    EXPECT_EQ(engine->accept_chunk("42", session.id, 2, pattern(1000, 0)).error().code, ErrorCode::InvalidRequest);
    EXPECT_TRUE(engine->accept_chunk("42", session.id, 2, pattern(500, 0)).is_ok());

    EXPECT_EQ(engine->get_session_status("7", session.id).error().code, ErrorCode::Forbidden);
}

TEST_F(UploadEngineTest, RepeatedChunkIsIdempotent) {
    const auto session = init(2000, 1000).session;
    const auto chunk = pattern(1000, 1);

    ASSERT_TRUE(engine->accept_chunk("42", session.id, 0, chunk).is_ok());
    const auto saves = ledger.save_count();

    auto again = engine->accept_chunk("42", session.id, 0, chunk);
    ASSERT_TRUE(again.is_ok());
    EXPECT_TRUE(again.value().duplicate);
    EXPECT_EQ(again.value().missing_chunks, (std::vector<std::uint32_t>{1}));
    EXPECT_EQ(ledger.save_count(), saves);
}

TEST_F(UploadEngineTest, ConflictingChunkKeepsOriginal) {
    const auto data = pattern(2000, 3);
    const auto session = init(data.size(), 1000).session;

    ASSERT_TRUE(engine->accept_chunk("42", session.id, 0, slice(data, 1000, 0)).is_ok());
    auto conflict = engine->accept_chunk("42", session.id, 0, pattern(1000, 99));
    ASSERT_TRUE(conflict.is_error());
    EXPECT_EQ(conflict.error().code, ErrorCode::ChunkConflict);

    auto last = engine->accept_chunk("42", session.id, 1, slice(data, 1000, 1));
    ASSERT_TRUE(last.is_ok());
    EXPECT_EQ(read_object(*last.value().final_location), std::string(data.begin(), data.end()));
}

TEST_F(UploadEngineTest, ClosedSessionRejectsChunks) {
    const auto session = init(1000, 1000).session;
    ASSERT_TRUE(engine->accept_chunk("42", session.id, 0, pattern(1000, 0)).is_ok());

    auto late = engine->accept_chunk("42", session.id, 0, pattern(1000, 0));
    ASSERT_TRUE(late.is_error());
    EXPECT_EQ(late.error().code, ErrorCode::SessionClosed);
}

TEST_F(UploadEngineTest, ConcurrentFinalChunksMergeOnce) {
    for (int round = 0; round < 10; ++round) {
        const auto data = pattern(4000, static_cast<std::uint8_t>(round));
        const auto session = init(data.size(), 1000).session;
        ASSERT_TRUE(engine->accept_chunk("42", session.id, 0, slice(data, 1000, 0)).is_ok());
        ASSERT_TRUE(engine->accept_chunk("42", session.id, 1, slice(data, 1000, 1)).is_ok());

        const int before = completed_events.load();
        std::atomic<int> saw_completed{0};
        std::vector<std::thread> senders;
        for (std::uint32_t index : {2u, 3u, 2u, 3u}) {
            senders.emplace_back([&, index]() {
                auto res = engine->accept_chunk("42", session.id, index, slice(data, 1000, index));
                if (res.is_ok() && res.value().status == SessionStatus::Completed) {
                    ++saw_completed;
                }
            });
        }
        for (auto& t : senders) {
            t.join();
        }

        EXPECT_EQ(completed_events.load() - before, 1);
        EXPECT_GE(saw_completed.load(), 1);
        EXPECT_EQ(engine->get_session_status("42", session.id).value().status, SessionStatus::Completed);
    }
}

TEST_F(UploadEngineTest, IdenticalContentIsDeduplicated) {
    const auto data = pattern(1500, 5);
    const auto first = init(data.size(), 1000).session;
    ASSERT_TRUE(engine->accept_chunk("42", first.id, 0, slice(data, 1000, 0)).is_ok());
    auto first_done = engine->accept_chunk("42", first.id, 1, slice(data, 1000, 1));
    ASSERT_TRUE(first_done.is_ok());

    const auto second = init(data.size(), 1000, "43").session;
    ASSERT_TRUE(engine->accept_chunk("43", second.id, 1, slice(data, 1000, 1)).is_ok());
    auto second_done = engine->accept_chunk("43", second.id, 0, slice(data, 1000, 0));
    ASSERT_TRUE(second_done.is_ok());

    EXPECT_EQ(second_done.value().final_location, first_done.value().final_location);
    EXPECT_TRUE(engine->get_session_status("43", second.id).value().deduplicated);
    EXPECT_TRUE(last_completed.deduplicated);
}

TEST_F(UploadEngineTest, DeclaredHashMismatchFailsSession) {
    const auto data = pattern(1000, 9);
    const auto session = init(data.size(), 1000, "42", std::string(64, 'f')).session;

    auto res = engine->accept_chunk("42", session.id, 0, data);
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code, ErrorCode::HashMismatch);
    EXPECT_EQ(engine->get_session_status("42", session.id).value().status, SessionStatus::Failed);
    EXPECT_EQ(failed_events.load(), 1);
    EXPECT_EQ(completed_events.load(), 0);

    // The failure is persisted and nothing is left staged
    auto stored = ledger.load_all().value();
    ASSERT_EQ(stored.size(), 1u);
    EXPECT_EQ(stored.front().status(), SessionStatus::Failed);
    EXPECT_FALSE(stored.front().data().last_error.empty());
    EXPECT_FALSE(backend.staging_exists(stored.front().data().staging).value());
    EXPECT_EQ(engine->expire_stale(), 0u);
}

TEST_F(UploadEngineTest, DeclaredHashIsNormalisedAndVerified) {
    const auto data = pattern(1000, 11);
    std::string hash = crypto::sha256_hex(data);
    std::transform(hash.begin(), hash.end(), hash.begin(), [](unsigned char c) { return std::toupper(c); });

    const auto session = init(data.size(), 1000, "42", hash).session;
    EXPECT_EQ(session.declared_hash, std::optional<std::string>(crypto::sha256_hex(data)));
    auto res = engine->accept_chunk("42", session.id, 0, data);
    ASSERT_TRUE(res.is_ok());
    EXPECT_EQ(res.value().status, SessionStatus::Completed);
}

TEST_F(UploadEngineTest, ResumeReturnsExistingSession) {
    const auto data = pattern(3000, 2);
    const auto hash = crypto::sha256_hex(data);
    const auto first = init(data.size(), 1000, "42", hash);
    ASSERT_TRUE(engine->accept_chunk("42", first.session.id, 1, slice(data, 1000, 1)).is_ok());

    const auto again = init(data.size(), 1000, "42", hash);
    EXPECT_TRUE(again.resumed);
    EXPECT_EQ(again.session.id, first.session.id);
    EXPECT_EQ(again.session.uploaded_chunks, (std::vector<std::uint32_t>{1}));

    // Different owner or geometry starts fresh
    EXPECT_NE(init(data.size(), 1000, "43", hash).session.id, first.session.id);
    EXPECT_NE(init(data.size(), 1500, "42", hash).session.id, first.session.id);
}

TEST_F(UploadEngineTest, AbortReclaimsStaging) {
    const auto session = init(2000, 1000).session;
    ASSERT_TRUE(engine->accept_chunk("42", session.id, 0, pattern(1000, 0)).is_ok());

    EXPECT_EQ(engine->abort_upload("7", session.id).error().code, ErrorCode::Forbidden);
    auto aborted = engine->abort_upload("42", session.id);
    ASSERT_TRUE(aborted.is_ok());
    EXPECT_EQ(aborted.value().status, SessionStatus::Failed);
    EXPECT_FALSE(std::filesystem::exists(dir / "storage" / "staging" / session.id));
    EXPECT_EQ(failed_events.load(), 1);

    EXPECT_EQ(engine->abort_upload("42", session.id).error().code, ErrorCode::SessionClosed);
    EXPECT_EQ(engine->accept_chunk("42", session.id, 1, pattern(1000, 0)).error().code, ErrorCode::SessionClosed);
}

TEST_F(UploadEngineTest, ExpiredSessionRejectsChunksAndReleasesStaging) {
    const auto session = init(2000, 1000).session;
    ASSERT_TRUE(engine->accept_chunk("42", session.id, 0, pattern(1000, 0)).is_ok());

    clock->advance(std::chrono::hours(25));
    auto res = engine->accept_chunk("42", session.id, 1, pattern(1000, 0));
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code, ErrorCode::Expired);
    EXPECT_EQ(expired_events.load(), 1);
    EXPECT_FALSE(std::filesystem::exists(dir / "storage" / "staging" / session.id));

    EXPECT_EQ(engine->accept_chunk("42", session.id, 1, pattern(1000, 0)).error().code, ErrorCode::Expired);
    EXPECT_EQ(engine->abort_upload("42", session.id).error().code, ErrorCode::Expired);
    EXPECT_EQ(expired_events.load(), 1);
}

TEST_F(UploadEngineTest, ExpireStaleSweepsOnlyLiveSessions) {
    const auto stale = init(2000, 1000).session;
    const auto done = init(1000, 1000).session;
    ASSERT_TRUE(engine->accept_chunk("42", done.id, 0, pattern(1000, 0)).is_ok());

    clock->advance(std::chrono::hours(23));
    const auto fresh = init(2000, 1000).session;
    clock->advance(std::chrono::hours(2));

    EXPECT_EQ(engine->expire_stale(), 1u);
    EXPECT_EQ(engine->get_session_status("42", stale.id).value().status, SessionStatus::Expired);
    EXPECT_EQ(engine->get_session_status("42", fresh.id).value().status, SessionStatus::Pending);
    EXPECT_EQ(engine->get_session_status("42", done.id).value().status, SessionStatus::Completed);
    EXPECT_EQ(engine->expire_stale(), 0u);
}

TEST_F(UploadEngineTest, PurgeDropsOldTerminalSessions) {
    const auto done = init(1000, 1000).session;
    ASSERT_TRUE(engine->accept_chunk("42", done.id, 0, pattern(1000, 0)).is_ok());
    const auto live = init(2000, 1000).session;

    clock->advance(std::chrono::minutes(30));
    EXPECT_EQ(engine->purge_terminal(), 0u);

    clock->advance(std::chrono::minutes(31));
    EXPECT_EQ(engine->purge_terminal(), 1u);
    EXPECT_EQ(engine->get_session_status("42", done.id).error().code, ErrorCode::SessionNotFound);
    EXPECT_FALSE(ledger.contains(done.id));
    EXPECT_TRUE(engine->get_session_status("42", live.id).is_ok());
}

TEST_F(UploadEngineTest, RestartResumesFromLedger) {
    const auto data = pattern(3000, 4);
    const auto hash = crypto::sha256_hex(data);
    const auto session = init(data.size(), 1000, "42", hash).session;
    ASSERT_TRUE(engine->accept_chunk("42", session.id, 0, slice(data, 1000, 0)).is_ok());
    ASSERT_TRUE(engine->accept_chunk("42", session.id, 2, slice(data, 1000, 2)).is_ok());

    engine = make_engine();
    auto restored = engine->recover();
    ASSERT_TRUE(restored.is_ok());
    EXPECT_EQ(restored.value(), 1u);

    auto status = engine->get_session_status("42", session.id);
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value().missing_chunks, (std::vector<std::uint32_t>{1}));

    // The resume index is rebuilt too
    EXPECT_EQ(init(data.size(), 1000, "42", hash).session.id, session.id);

    auto last = engine->accept_chunk("42", session.id, 1, slice(data, 1000, 1));
    ASSERT_TRUE(last.is_ok());
    EXPECT_EQ(read_object(*last.value().final_location), std::string(data.begin(), data.end()));
}

TEST_F(UploadEngineTest, CompletedUploadsCanBeReplayed) {
    const auto data = pattern(1500, 9);
    const auto done = init(data.size(), 1000).session;
    ASSERT_TRUE(engine->accept_chunk("42", done.id, 0, slice(data, 1000, 0)).is_ok());
    ASSERT_TRUE(engine->accept_chunk("42", done.id, 1, slice(data, 1000, 1)).is_ok());
    init(1000, 1000);

    engine = make_engine();
    ASSERT_TRUE(engine->recover().is_ok());

    const auto replay = engine->completed_uploads();
    ASSERT_EQ(replay.size(), 1u);
    EXPECT_EQ(replay[0].session_id, done.id);
    EXPECT_EQ(replay[0].owner_id, "42");
    EXPECT_EQ(replay[0].size, 1500u);
    EXPECT_EQ(replay[0].content_hash, crypto::sha256_hex(data));
    EXPECT_EQ(replay[0].final_location, last_completed.final_location);
    EXPECT_EQ(replay[0].filename, "report.pdf");
}

TEST_F(UploadEngineTest, RestartFailsInterruptedMerge) {
    const auto session = init(2000, 1000).session;
    ASSERT_TRUE(engine->accept_chunk("42", session.id, 0, pattern(1000, 0)).is_ok());

    // Simulate a crash after the merging state was recorded
    auto sessions = ledger.load_all().value();
    ASSERT_EQ(sessions.size(), 1u);
    ASSERT_TRUE(sessions[0].transition_to(SessionStatus::Merging, clock->now()).is_ok());
    ASSERT_TRUE(ledger.save(sessions[0]).is_ok());

    engine = make_engine();
    ASSERT_TRUE(engine->recover().is_ok());

    auto status = engine->get_session_status("42", session.id);
    ASSERT_TRUE(status.is_ok());
    EXPECT_EQ(status.value().status, SessionStatus::Failed);
    EXPECT_FALSE(std::filesystem::exists(dir / "storage" / "staging" / session.id));
}

TEST_F(UploadEngineTest, RestartFailsSessionWithLostStaging) {
    const auto session = init(2000, 1000).session;
    std::filesystem::remove_all(dir / "storage" / "staging" / session.id);

    engine = make_engine();
    ASSERT_TRUE(engine->recover().is_ok());
    EXPECT_EQ(engine->get_session_status("42", session.id).value().status, SessionStatus::Failed);
}

TEST_F(UploadEngineTest, BackendWriteFailureIsRetryable) {
    const auto session = init(2000, 1000).session;
    const auto staging = dir / "storage" / "staging" / session.id;
    std::filesystem::remove_all(staging);

    auto res = engine->accept_chunk("42", session.id, 0, pattern(1000, 0));
    ASSERT_TRUE(res.is_error());
    EXPECT_EQ(res.error().code, ErrorCode::BackendIOError);

    std::filesystem::create_directories(staging);
    EXPECT_TRUE(engine->accept_chunk("42", session.id, 0, pattern(1000, 0)).is_ok());
}
