#pragma once

/**
 * @file error.hpp
 * @brief Error taxonomy shared by the upload engine, storage and file layers
 *
 * Every failure that leaves a module is one of these codes plus a message.
 * The HTTP layer maps codes to statuses and to a retry hint so the client
 * can decide between resending a chunk and restarting the upload.
 */

#include <string>

namespace fmp {

enum class ErrorCode {
    SessionNotFound,   // No such upload session
    Forbidden,         // Caller is not the session/file owner
    IndexOutOfRange,   // Chunk index >= total chunks
    ChunkConflict,     // Same index re-sent with different bytes
    SessionClosed,     // Accept after completed/failed
    HashMismatch,      // Declared hash differs from computed hash
    BackendIOError,    // Staging write, merge or read failure
    Expired,           // Session passed its TTL
    InvalidRequest,    // Malformed parameters or chunk length
    NotFound           // File record lookup miss
};

struct Error {
    ErrorCode code = ErrorCode::InvalidRequest;
    std::string message;
};

/**
 * @brief Stable machine-readable name, e.g. "chunk_conflict"
 */
const char* to_string(ErrorCode code);

/**
 * @brief HTTP status a request handler should answer with
 */
int http_status_for(ErrorCode code);

/**
 * @brief What the client should do next: "chunk", "restart" or "none"
 *
 * "chunk"   - the same chunk can be sent again
 * "restart" - the session is unusable, start a new upload
 * "none"    - retrying will not help
 */
const char* retry_hint_for(ErrorCode code);

inline Error make_error(ErrorCode code, std::string message) {
    return Error{code, std::move(message)};
}

} // namespace fmp
