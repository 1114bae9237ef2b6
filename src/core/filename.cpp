#include "fmp/core/filename.hpp"

#include <cctype>

namespace fmp {

std::string sanitize_filename(const std::string& name) {
    const auto slash = name.find_last_of("/\\");
    const std::string base = slash == std::string::npos ? name : name.substr(slash + 1);

    std::string out;
    out.reserve(base.size());
    for (unsigned char c : base) {
        if (std::isalnum(c) || c == '.' || c == '-' || c == '_') {
            out.push_back(static_cast<char>(c));
        } else if (std::isspace(c)) {
            out.push_back('_');
        }
    }

    const auto first = out.find_first_not_of('.');
    if (first == std::string::npos) {
        return {};
    }
    return out.substr(first);
}

namespace {

constexpr std::size_t kMaxMediaTypeLength = 255;

bool is_tchar(unsigned char c) {
    if (std::isalnum(c)) {
        return true;
    }
    switch (c) {
        case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
        case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
            return true;
        default:
            return false;
    }
}

} // namespace

bool is_valid_media_type(const std::string& value) {
    if (value.empty() || value.size() > kMaxMediaTypeLength) {
        return false;
    }
    for (unsigned char c : value) {
        if (c < 0x20 || c > 0x7E) {
            return false;
        }
    }

    const auto params = value.find(';');
    const std::string essence = value.substr(0, params);
    const auto slash = essence.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == essence.size()) {
        return false;
    }
    for (std::size_t i = 0; i < essence.size(); ++i) {
        if (i != slash && !is_tchar(static_cast<unsigned char>(essence[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace fmp
