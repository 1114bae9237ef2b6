#include "fmp/network/http_types.hpp"

#include <strings.h>

#include <cctype>
#include <sstream>

namespace fmp::network {

std::string HttpRequest::get_header(const std::string& name) const {
    for (const auto& [key, value] : headers) {
        if (strcasecmp(key.c_str(), name.c_str()) == 0) {
            return value;
        }
    }
    return "";
}

HttpMethod HttpMethodUtils::from_string(const std::string& method) {
    if (method == "GET") return HttpMethod::GET;
    if (method == "POST") return HttpMethod::POST;
    if (method == "PUT") return HttpMethod::PUT;
    if (method == "PATCH") return HttpMethod::PATCH;
    if (method == "DELETE") return HttpMethod::DELETE_METHOD;
    if (method == "HEAD") return HttpMethod::HEAD;
    if (method == "OPTIONS") return HttpMethod::OPTIONS;
    return HttpMethod::UNKNOWN;
}

std::string HttpMethodUtils::to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::GET: return "GET";
        case HttpMethod::POST: return "POST";
        case HttpMethod::PUT: return "PUT";
        case HttpMethod::PATCH: return "PATCH";
        case HttpMethod::DELETE_METHOD: return "DELETE";
        case HttpMethod::HEAD: return "HEAD";
        case HttpMethod::OPTIONS: return "OPTIONS";
        default: return "UNKNOWN";
    }
}

std::string url_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < text.size() &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
                   std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
            out += static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

void split_target(const std::string& target,
                  std::string& path,
                  std::unordered_map<std::string, std::string>& query) {
    const auto mark = target.find('?');
    path = target.substr(0, mark);
    query.clear();
    if (mark == std::string::npos) {
        return;
    }

    std::stringstream ss(target.substr(mark + 1));
    std::string item;
    while (std::getline(ss, item, '&')) {
        if (item.empty()) {
            continue;
        }
        const auto eq = item.find('=');
        if (eq == std::string::npos) {
            query[url_decode(item)] = "";
        } else {
            query[url_decode(item.substr(0, eq))] = url_decode(item.substr(eq + 1));
        }
    }
}

} // namespace fmp::network
