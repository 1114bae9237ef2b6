#include "fmp/upload/types.hpp"

namespace fmp::upload {

const char* to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::Pending: return "pending";
        case SessionStatus::Uploading: return "uploading";
        case SessionStatus::Merging: return "merging";
        case SessionStatus::Completed: return "completed";
        case SessionStatus::Failed: return "failed";
        case SessionStatus::Expired: return "expired";
    }
    return "failed";
}

std::optional<SessionStatus> parse_session_status(const std::string& text) {
    for (auto status : {SessionStatus::Pending, SessionStatus::Uploading, SessionStatus::Merging,
                        SessionStatus::Completed, SessionStatus::Failed, SessionStatus::Expired}) {
        if (text == to_string(status)) {
            return status;
        }
    }
    return std::nullopt;
}

} // namespace fmp::upload
