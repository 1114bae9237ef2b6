#pragma once

/**
 * @file file_catalog.hpp
 * @brief Thread-safe FileRecord store with a JSON snapshot on disk
 *
 * CONCURRENCY MODEL:
 * - Reads (get, list, find_by_session): shared_lock
 * - Writes (insert, update): unique_lock, then the snapshot is rewritten
 *   before the lock is released, so the file never lags a reply
 *
 * The snapshot is a single JSON array written to "<file>.tmp" and renamed
 * over the old one. Without a snapshot path the catalog is memory-only.
 */

#include "fmp/core/result.hpp"
#include "fmp/files/file_record.hpp"

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fmp::files {

struct FilePage {
    std::vector<FileRecord> items;
    std::size_t total = 0;   ///< matching records before limit/offset
};

class FileCatalog {
public:
    FileCatalog() = default;
    explicit FileCatalog(std::filesystem::path snapshot_file);

    FileCatalog(const FileCatalog&) = delete;
    FileCatalog& operator=(const FileCatalog&) = delete;

    /**
     * @brief Add a record unless its session already produced one
     * @return the stored record and whether it was inserted now
     */
    Result<std::pair<FileRecord, bool>> insert_if_absent(const FileRecord& record);

    Result<FileRecord> get(const std::string& id) const;

    std::optional<FileRecord> find_by_session(const std::string& session_id) const;

    /// Replace an existing record (matched by id)
    Result<void> update(const FileRecord& record);

    /// Owner's non-deleted records, newest first
    FilePage list(const std::string& owner_id, std::size_t limit, std::size_t offset) const;

    std::size_t size() const;

    Result<void> load();

private:
    Result<void> persist_locked() const;

    std::optional<std::filesystem::path> snapshot_file_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, FileRecord> records_;          // id -> record
    std::unordered_map<std::string, std::string> by_session_;      // session id -> record id
};

} // namespace fmp::files
