#pragma once

/**
 * @file session_ledger.hpp
 * @brief Durable storage of upload session state
 *
 * WHY THIS FILE EXISTS:
 * A client that disconnects halfway through a 2 GB upload must be able to
 * continue after the portal restarts. The ledger is what survives: every
 * state change of a session is saved before the caller is answered, and the
 * engine reloads the ledger at startup.
 *
 * Each session is one JSON document:
 *
 *   {
 *     "id": "9f2c...", "owner_id": "42", "status": "uploading",
 *     "total_size": 10000000, "chunk_size": 4000000, "total_chunks": 3,
 *     "staging": {"mode": "local", "location": "...", "upload_id": ""},
 *     "chunks": [{"index": 1, "size": 4000000, "digest": "ab..", "reference": "chunk-00000001"}],
 *     "created_at": 1700000000000, ...
 *   }
 *
 * Timestamps are unix milliseconds.
 */

#include "fmp/core/result.hpp"
#include "fmp/upload/session.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <mutex>
#include <vector>

namespace fmp::upload {

nlohmann::json session_to_json(const UploadSession& session);

Result<UploadSession> session_from_json(const nlohmann::json& document);

class SessionLedger {
public:
    virtual ~SessionLedger() = default;

    virtual Result<void> save(const UploadSession& session) = 0;

    /// Removing an unknown id succeeds
    virtual Result<void> remove(const std::string& session_id) = 0;

    virtual Result<std::vector<UploadSession>> load_all() = 0;
};

/**
 * @brief One file per session under a directory, replaced atomically
 *
 * Writes go to "<id>.json.tmp" and are renamed over "<id>.json", so a crash
 * leaves either the old or the new document. Unreadable documents are
 * skipped at load with an error log.
 */
class JsonFileSessionLedger final : public SessionLedger {
public:
    explicit JsonFileSessionLedger(std::filesystem::path directory);

    Result<void> save(const UploadSession& session) override;
    Result<void> remove(const std::string& session_id) override;
    Result<std::vector<UploadSession>> load_all() override;

    const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    std::filesystem::path path_for(const std::string& session_id) const;

    std::filesystem::path directory_;
};

/**
 * @brief In-process ledger; round-trips through the JSON codec like the file ledger
 */
class MemorySessionLedger final : public SessionLedger {
public:
    Result<void> save(const UploadSession& session) override;
    Result<void> remove(const std::string& session_id) override;
    Result<std::vector<UploadSession>> load_all() override;

    std::size_t size() const;
    std::size_t save_count() const;
    bool contains(const std::string& session_id) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, nlohmann::json> documents_;
    std::size_t saves_ = 0;
};

} // namespace fmp::upload
