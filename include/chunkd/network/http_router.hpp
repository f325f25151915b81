#pragma once

#include "chunkd/network/http_types.hpp"

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chunkd {
namespace network {

/**
 * @brief Request context: route parameters and query string, both decoded
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;   // route parameters like :file_name
    std::unordered_map<std::string, std::string> query;    // ?key=value pairs

    explicit HttpContext(const HttpRequest& req)
        : request(req)
        , query(UrlUtils::parse_query(req.query())) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }

    bool has_param(const std::string& name) const {
        return params.find(name) != params.end();
    }

    std::string get_query(const std::string& name, const std::string& default_value = "") const {
        auto it = query.find(name);
        return (it != query.end()) ? it->second : default_value;
    }

    bool has_query(const std::string& name) const {
        return query.find(name) != query.end();
    }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/**
 * @brief Builds the response for router-level failures (no route, wrong
 * method, handler exception)
 */
using RouterErrorHandler = std::function<HttpResponse(HttpStatus status, const std::string& message)>;

/**
 * @brief Single route in the router
 */
struct Route {
    HttpMethod method;
    std::string pattern;                   // "/download/:file_name"
    std::vector<std::string> param_names;  // filled before regex is built
    std::regex regex;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches_path(const std::string& path) const;

    /// Extract and percent-decode route parameters
    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief Method + path router
 *
 * Routes match on the path only; the query string is parsed into
 * HttpContext::query. A path that matches some route under another method
 * answers 405, an unknown path 404.
 *
 * @code
 * HttpRouter router;
 * router.get("/download/:file_name", [](const HttpContext& ctx) {
 *     auto name = ctx.get_param("file_name");
 *     ...
 * });
 * router.get("/search/", [](const HttpContext& ctx) {
 *     auto query = ctx.get_query("file_name");
 *     ...
 * });
 * @endcode
 */
class HttpRouter {
public:
    HttpRouter();

    void get(const std::string& pattern, RouteHandler handler);
    void post(const std::string& pattern, RouteHandler handler);
    void put(const std::string& pattern, RouteHandler handler);
    void delete_(const std::string& pattern, RouteHandler handler);

    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    void set_error_handler(RouterErrorHandler handler);

    /**
     * @brief Dispatch to the matching route
     *
     * A handler that throws std::exception is logged and answered with 500.
     */
    HttpResponse handle_request(const HttpRequest& request) const;

    std::vector<std::string> list_routes() const;

    size_t route_count() const { return routes_.size(); }

private:
    static HttpResponse default_error_handler(HttpStatus status, const std::string& message);

    std::vector<Route> routes_;
    RouterErrorHandler error_handler_;
};

/**
 * @brief Convert URL pattern to regex
 *
 *   "/download/:file_name" -> "^/download/([^/]+)$"
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

} // namespace network
} // namespace chunkd
