#include "fmp/core/error.hpp"

namespace fmp {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SessionNotFound: return "session_not_found";
        case ErrorCode::Forbidden: return "forbidden";
        case ErrorCode::IndexOutOfRange: return "index_out_of_range";
        case ErrorCode::ChunkConflict: return "chunk_conflict";
        case ErrorCode::SessionClosed: return "session_closed";
        case ErrorCode::HashMismatch: return "hash_mismatch";
        case ErrorCode::BackendIOError: return "backend_io_error";
        case ErrorCode::Expired: return "expired";
        case ErrorCode::InvalidRequest: return "invalid_request";
        case ErrorCode::NotFound: return "not_found";
    }
    return "unknown";
}

int http_status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::SessionNotFound: return 404;
        case ErrorCode::NotFound: return 404;
        case ErrorCode::Forbidden: return 403;
        case ErrorCode::IndexOutOfRange: return 400;
        case ErrorCode::InvalidRequest: return 400;
        case ErrorCode::ChunkConflict: return 409;
        case ErrorCode::SessionClosed: return 409;
        case ErrorCode::HashMismatch: return 422;
        case ErrorCode::Expired: return 410;
        case ErrorCode::BackendIOError: return 502;
    }
    return 500;
}

const char* retry_hint_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::ChunkConflict:
        case ErrorCode::IndexOutOfRange:
        case ErrorCode::InvalidRequest:
        case ErrorCode::Forbidden:
        case ErrorCode::NotFound:
            return "none";
        case ErrorCode::SessionNotFound:
        case ErrorCode::SessionClosed:
        case ErrorCode::HashMismatch:
        case ErrorCode::Expired:
            return "restart";
        case ErrorCode::BackendIOError:
            return "chunk";
    }
    return "none";
}

} // namespace fmp
