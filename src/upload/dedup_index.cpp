#include "fmp/upload/dedup_index.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>

namespace fmp::upload {

namespace fs = std::filesystem;
using json = nlohmann::json;

DedupIndex::DedupIndex(fs::path persist_file) : persist_file_(std::move(persist_file)) {}

std::optional<std::string> DedupIndex::lookup(const std::string& content_hash, storage::StorageMode mode) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(Key{mode, content_hash});
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

DedupIndex::Registration DedupIndex::register_if_absent(const std::string& content_hash,
                                                        storage::StorageMode mode,
                                                        const std::string& location) {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = entries_.emplace(Key{mode, content_hash}, location);
    if (inserted && persist_file_) {
        // The in-memory entry stands either way; a lost write only costs dedup after restart
        if (auto res = persist_locked(); res.is_error()) {
            spdlog::warn("[DedupIndex] {}", res.error().message);
        }
    }
    return Registration{it->second, inserted};
}

std::size_t DedupIndex::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

Result<void> DedupIndex::load() {
    if (!persist_file_) {
        return Ok();
    }
    std::lock_guard lock(mutex_);
    entries_.clear();

    std::ifstream input(*persist_file_);
    if (!input) {
        return Ok();
    }
    auto document = json::parse(input, nullptr, false);
    if (document.is_discarded() || !document.is_array()) {
        return Err<void>(make_error(ErrorCode::BackendIOError,
                                    "Dedup index file is corrupt: " + persist_file_->string()));
    }

    try {
        for (const auto& entry : document) {
            auto mode = storage::parse_storage_mode(entry.at("mode").get<std::string>());
            if (!mode) {
                continue;
            }
            entries_.emplace(Key{*mode, entry.at("hash").get<std::string>()},
                             entry.at("location").get<std::string>());
        }
    } catch (const json::exception& e) {
        return Err<void>(make_error(ErrorCode::BackendIOError, std::string("Malformed dedup entry: ") + e.what()));
    }

    spdlog::info("[DedupIndex] loaded {} entries from {}", entries_.size(), persist_file_->string());
    return Ok();
}

Result<void> DedupIndex::persist_locked() const {
    json document = json::array();
    for (const auto& [key, location] : entries_) {
        document.push_back({
            {"mode", storage::to_string(key.first)},
            {"hash", key.second},
            {"location", location},
        });
    }

    const fs::path temp = persist_file_->string() + ".tmp";
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
    fs::rename(temp, *persist_file_, ec);
    if (ec) {
        return Err<void>(make_error(ErrorCode::BackendIOError, "Cannot replace dedup index: " + ec.message()));
    }
    return Ok();
}

} // namespace fmp::upload
