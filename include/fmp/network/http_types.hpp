#pragma once

/**
 * @file http_types.hpp
 * @brief Transport-neutral HTTP request/response used by the router
 *
 * WHY THIS FILE EXISTS:
 * Route handlers should not depend on Boost.Beast types. The server converts
 * a Beast message into HttpRequest, the router produces an HttpResponse, and
 * the server converts that back. Tests drive the router with these structs
 * directly, no sockets involved.
 */

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace fmp::network {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    PATCH,
    DELETE_METHOD,   // DELETE collides with a Windows macro
    HEAD,
    OPTIONS,
    UNKNOWN
};

enum class HttpStatus {
    OK = 200,
    CREATED = 201,
    NO_CONTENT = 204,
    BAD_REQUEST = 400,
    UNAUTHORIZED = 401,
    FORBIDDEN = 403,
    NOT_FOUND = 404,
    METHOD_NOT_ALLOWED = 405,
    CONFLICT = 409,
    GONE = 410,
    PAYLOAD_TOO_LARGE = 413,
    UNPROCESSABLE_ENTITY = 422,
    INTERNAL_SERVER_ERROR = 500,
    BAD_GATEWAY = 502,
    SERVICE_UNAVAILABLE = 503
};

struct HttpRequest {
    HttpMethod method = HttpMethod::UNKNOWN;
    std::string path;                                       // "/api/files", no query
    std::unordered_map<std::string, std::string> query;     // decoded query parameters
    std::unordered_map<std::string, std::string> headers;
    std::vector<std::uint8_t> body;

    /// Case-insensitive lookup; empty when absent
    std::string get_header(const std::string& name) const;

    bool has_header(const std::string& name) const { return !get_header(name).empty(); }

    std::string get_query(const std::string& name, const std::string& default_value = "") const {
        auto it = query.find(name);
        return it != query.end() ? it->second : default_value;
    }

    std::string body_as_string() const { return std::string(body.begin(), body.end()); }
};

struct HttpResponse {
    int status_code = 200;
    std::unordered_map<std::string, std::string> headers;
    std::vector<std::uint8_t> body;

    HttpResponse() = default;

    explicit HttpResponse(HttpStatus status) : status_code(static_cast<int>(status)) {}

    void set_body(const std::string& content) { body.assign(content.begin(), content.end()); }

    void set_body(std::vector<std::uint8_t> data) { body = std::move(data); }

    void set_header(const std::string& name, const std::string& value) { headers[name] = value; }

    std::string body_as_string() const { return std::string(body.begin(), body.end()); }
};

class HttpMethodUtils {
public:
    static HttpMethod from_string(const std::string& method);
    static std::string to_string(HttpMethod method);
};

/// Percent-decoding with '+' as space; malformed escapes are kept verbatim
std::string url_decode(const std::string& text);

/**
 * @brief Split "/a/b?x=1&y=2" into path and decoded query map
 */
void split_target(const std::string& target, std::string& path, std::unordered_map<std::string, std::string>& query);

} // namespace fmp::network
