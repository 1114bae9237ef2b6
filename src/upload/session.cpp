#include "fmp/upload/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace fmp::upload {
namespace {

bool is_forward(SessionStatus current, SessionStatus target) {
    static const std::unordered_map<SessionStatus, std::vector<SessionStatus>> transitions {
        {SessionStatus::Pending, {SessionStatus::Uploading}},
        {SessionStatus::Uploading, {SessionStatus::Merging}},
        {SessionStatus::Merging, {SessionStatus::Completed}},
    };

    // Any live session may fail or expire
    if (target == SessionStatus::Failed || target == SessionStatus::Expired) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

UploadSession::UploadSession(SessionData data, ChunkTracker tracker)
    : data_(std::move(data)), tracker_(std::move(tracker)) {}

std::uint64_t UploadSession::chunk_count(std::uint64_t total_size, std::uint64_t chunk_size) noexcept {
    if (chunk_size == 0) {
        return 0;
    }
    return total_size / chunk_size + (total_size % chunk_size != 0 ? 1 : 0);
}

std::uint64_t UploadSession::expected_chunk_length(std::uint32_t index) const noexcept {
    const std::uint64_t offset = static_cast<std::uint64_t>(index) * data_.chunk_size;
    if (offset >= data_.total_size) {
        return 0;
    }
    return std::min(data_.chunk_size, data_.total_size - offset);
}

Result<void> UploadSession::transition_to(SessionStatus next, Timestamp now) {
    if (data_.status == next) {
        return Ok();
    }
    if (!can_transition(next)) {
        return Err<void>(make_error(is_terminal(data_.status) ? ErrorCode::SessionClosed : ErrorCode::InvalidRequest,
                                    std::string("Illegal session transition ") + to_string(data_.status) +
                                        " -> " + to_string(next)));
    }
    data_.status = next;
    data_.updated_at = now;
    return Ok();
}

Result<void> UploadSession::mark_completed(std::string final_location,
                                           std::string content_hash,
                                           bool deduplicated,
                                           Timestamp now) {
    if (!tracker_.complete()) {
        return Err<void>(make_error(ErrorCode::InvalidRequest, "Cannot complete with missing chunks"));
    }
    if (auto res = transition_to(SessionStatus::Completed, now); res.is_error()) {
        return res;
    }
    data_.final_location = std::move(final_location);
    data_.content_hash = std::move(content_hash);
    data_.deduplicated = deduplicated;
    data_.completed_at = now;
    data_.last_error.clear();
    return Ok();
}

Result<void> UploadSession::mark_failed(std::string reason, Timestamp now) {
    if (auto res = transition_to(SessionStatus::Failed, now); res.is_error()) {
        return res;
    }
    data_.last_error = std::move(reason);
    return Ok();
}

Result<void> UploadSession::mark_expired(Timestamp now) {
    if (auto res = transition_to(SessionStatus::Expired, now); res.is_error()) {
        return res;
    }
    data_.last_error = "session expired";
    return Ok();
}

bool UploadSession::can_transition(SessionStatus target) const noexcept {
    if (data_.status == target) {
        return true;
    }
    if (is_terminal(data_.status)) {
        return false;
    }
    return is_forward(data_.status, target);
}

SessionView UploadSession::view() const {
    SessionView view;
    view.id = data_.id;
    view.owner_id = data_.owner_id;
    view.filename = data_.filename;
    view.content_type = data_.content_type;
    view.total_size = data_.total_size;
    view.chunk_size = data_.chunk_size;
    view.total_chunks = data_.total_chunks;
    view.uploaded_chunks = tracker_.uploaded();
    view.missing_chunks = tracker_.missing();
    view.progress_percent = tracker_.progress_percent();
    view.status = data_.status;
    view.mode = data_.staging.mode;
    view.declared_hash = data_.declared_hash;
    view.content_hash = data_.content_hash;
    view.final_location = data_.final_location;
    view.last_error = data_.last_error;
    view.deduplicated = data_.deduplicated;
    view.created_at = data_.created_at;
    view.updated_at = data_.updated_at;
    view.expires_at = data_.expires_at;
    view.completed_at = data_.completed_at;
    return view;
}

} // namespace fmp::upload
