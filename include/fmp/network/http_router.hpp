#pragma once

/**
 * @file http_router.hpp
 * @brief Method + path pattern routing with middleware
 *
 * Patterns use ":name" for one path segment and "*" for the rest:
 *
 *   router.put("/api/uploads/:id/chunks/:index", handler);
 *   ctx.get_param("index")   // "3"
 *
 * Middleware runs before routing in registration order; returning false
 * short-circuits with the response it filled in. A handler that throws
 * std::exception is answered with a 500 JSON error.
 */

#include "fmp/network/http_types.hpp"

#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fmp::network {

struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;   // ":id" captures

    explicit HttpContext(const HttpRequest& req) : request(req) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }

    bool has_param(const std::string& name) const { return params.find(name) != params.end(); }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;
    std::vector<std::string> param_names;   // declared before regex, filled while compiling it
    std::regex regex;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches_path(const std::string& path) const;

    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void put(const std::string& pattern, RouteHandler handler);
    void patch(const std::string& pattern, RouteHandler handler);
    void delete_(const std::string& pattern, RouteHandler handler);

    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    void use(Middleware middleware);

    void set_not_found_handler(RouteHandler handler);

    /// Thread-safe once registration is finished
    HttpResponse handle_request(const HttpRequest& request) const;

    std::vector<std::string> list_routes() const;

    size_t route_count() const { return routes_.size(); }

private:
    static HttpResponse default_not_found_handler(const HttpContext& ctx);

    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    RouteHandler not_found_handler_;
};

/// {"error": code, "message": message, "retry": "none"} with the given status
HttpResponse json_error(HttpStatus status, const std::string& code, const std::string& message);

} // namespace fmp::network
