#include "fmp/files/file_catalog.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <mutex>
#include <system_error>

namespace fmp::files {

namespace fs = std::filesystem;
using json = nlohmann::json;

FileCatalog::FileCatalog(fs::path snapshot_file) : snapshot_file_(std::move(snapshot_file)) {}

Result<std::pair<FileRecord, bool>> FileCatalog::insert_if_absent(const FileRecord& record) {
    std::unique_lock lock(mutex_);

    if (auto it = by_session_.find(record.session_id); it != by_session_.end()) {
        return Ok(std::make_pair(records_.at(it->second), false));
    }
    if (records_.count(record.id) != 0) {
        return Fail<std::pair<FileRecord, bool>>(ErrorCode::InvalidRequest, "Duplicate file id " + record.id);
    }

    records_.emplace(record.id, record);
    by_session_.emplace(record.session_id, record.id);

    if (auto res = persist_locked(); res.is_error()) {
        records_.erase(record.id);
        by_session_.erase(record.session_id);
        return Err<std::pair<FileRecord, bool>>(res.error());
    }
    return Ok(std::make_pair(record, true));
}

Result<FileRecord> FileCatalog::get(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return Fail<FileRecord>(ErrorCode::NotFound, "File not found: " + id);
    }
    return Ok(it->second);
}

std::optional<FileRecord> FileCatalog::find_by_session(const std::string& session_id) const {
    std::shared_lock lock(mutex_);
    auto it = by_session_.find(session_id);
    if (it == by_session_.end()) {
        return std::nullopt;
    }
    return records_.at(it->second);
}

Result<void> FileCatalog::update(const FileRecord& record) {
    std::unique_lock lock(mutex_);
    auto it = records_.find(record.id);
    if (it == records_.end()) {
        return Err<void>(make_error(ErrorCode::NotFound, "File not found: " + record.id));
    }

    FileRecord previous = it->second;
    it->second = record;
    if (auto res = persist_locked(); res.is_error()) {
        it->second = std::move(previous);
        return res;
    }
    return Ok();
}

FilePage FileCatalog::list(const std::string& owner_id, std::size_t limit, std::size_t offset) const {
    std::vector<FileRecord> matching;
    {
        std::shared_lock lock(mutex_);
        for (const auto& [id, record] : records_) {
            if (record.owner_id == owner_id && !record.deleted) {
                matching.push_back(record);
            }
        }
    }

    std::sort(matching.begin(), matching.end(), [](const FileRecord& a, const FileRecord& b) {
        if (a.uploaded_at != b.uploaded_at) {
            return a.uploaded_at > b.uploaded_at;
        }
        return a.id < b.id;
    });

    FilePage page;
    page.total = matching.size();
    if (offset >= matching.size()) {
        return page;
    }
    const auto end = std::min(matching.size(), offset + limit);
    page.items.assign(std::make_move_iterator(matching.begin() + static_cast<std::ptrdiff_t>(offset)),
                      std::make_move_iterator(matching.begin() + static_cast<std::ptrdiff_t>(end)));
    return page;
}

std::size_t FileCatalog::size() const {
    std::shared_lock lock(mutex_);
    return records_.size();
}

Result<void> FileCatalog::load() {
    if (!snapshot_file_) {
        return Ok();
    }
    std::unique_lock lock(mutex_);
    records_.clear();
    by_session_.clear();

    std::ifstream input(*snapshot_file_);
    if (!input) {
        return Ok();
    }
    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded() || !document.is_array()) {
        return Err<void>(make_error(ErrorCode::BackendIOError,
                                    "File catalog is corrupt: " + snapshot_file_->string()));
    }

    for (const auto& entry : document) {
        try {
            auto record = record_from_json(entry);
            by_session_.emplace(record.session_id, record.id);
            records_.emplace(record.id, std::move(record));
        } catch (const json::exception& e) {
            spdlog::error("[FileCatalog] skipping malformed record: {}", e.what());
        }
    }

    spdlog::info("[FileCatalog] loaded {} records from {}", records_.size(), snapshot_file_->string());
    return Ok();
}

Result<void> FileCatalog::persist_locked() const {
    if (!snapshot_file_) {
        return Ok();
    }

    json document = json::array();
    for (const auto& [id, record] : records_) {
        document.push_back(to_json(record));
    }

    const fs::path temp = snapshot_file_->string() + ".tmp";
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out) {
            return Err<void>(make_error(ErrorCode::BackendIOError, "Cannot write " + temp.string()));
        }
        out << document.dump();
        if (!out) {
            return Err<void>(make_error(ErrorCode::BackendIOError, "Short write to " + temp.string()));
        }
    }
    std::error_code ec;
    fs::rename(temp, *snapshot_file_, ec);
    if (ec) {
        return Err<void>(make_error(ErrorCode::BackendIOError, "Cannot replace file catalog: " + ec.message()));
    }
    return Ok();
}

} // namespace fmp::files
