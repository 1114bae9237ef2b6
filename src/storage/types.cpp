#include "fmp/storage/types.hpp"

#include <algorithm>
#include <cctype>

namespace fmp::storage {

const char* to_string(StorageMode mode) {
    switch (mode) {
        case StorageMode::Local: return "local";
        case StorageMode::Remote: return "remote";
    }
    return "local";
}

std::optional<StorageMode> parse_storage_mode(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "local") {
        return StorageMode::Local;
    }
    // "supabase" and "s3" are accepted for compatibility with older deployments
    if (lowered == "remote" || lowered == "s3" || lowered == "supabase") {
        return StorageMode::Remote;
    }
    return std::nullopt;
}

} // namespace fmp::storage
