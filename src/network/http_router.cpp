#include "chunkd/network/http_router.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <sstream>

namespace chunkd {
namespace network {

std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names) {
    std::string regex_pattern = "^";

    size_t i = 0;
    while (i < pattern.length()) {
        if (pattern[i] == ':') {
            ++i;
            std::string param_name;
            while (i < pattern.length() &&
                   (std::isalnum(static_cast<unsigned char>(pattern[i])) || pattern[i] == '_')) {
                param_name += pattern[i];
                ++i;
            }
            if (!param_name.empty()) {
                param_names.push_back(param_name);
                regex_pattern += "([^/]+)";
            }
        } else if (pattern[i] == '*') {
            regex_pattern += "(.*)";
            ++i;
        } else {
            char c = pattern[i];
            if (c == '.' || c == '+' || c == '?' || c == '^' || c == '$' ||
                c == '(' || c == ')' || c == '[' || c == ']' || c == '{' || c == '}' ||
                c == '|' || c == '\\') {
                regex_pattern += '\\';
            }
            regex_pattern += c;
            ++i;
        }
    }

    regex_pattern += "$";
    return regex_pattern;
}

Route::Route(HttpMethod m, const std::string& pat, RouteHandler h)
    : method(m)
    , pattern(pat)
    , param_names()
    , regex(pattern_to_regex(pat, param_names))
    , handler(std::move(h)) {
}

bool Route::matches_path(const std::string& path) const {
    return std::regex_match(path, regex);
}

std::unordered_map<std::string, std::string> Route::extract_params(const std::string& path) const {
    std::unordered_map<std::string, std::string> params;
    std::smatch match;
    if (std::regex_match(path, match, regex)) {
        for (size_t i = 0; i < param_names.size() && i + 1 < match.size(); ++i) {
            params[param_names[i]] = UrlUtils::decode(match[i + 1].str(), false);
        }
    }
    return params;
}

HttpRouter::HttpRouter()
    : error_handler_(default_error_handler) {
}

void HttpRouter::get(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::GET, pattern, std::move(handler));
}

void HttpRouter::post(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::POST, pattern, std::move(handler));
}

void HttpRouter::put(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::PUT, pattern, std::move(handler));
}

void HttpRouter::delete_(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::DELETE_METHOD, pattern, std::move(handler));
}

void HttpRouter::add_route(HttpMethod method, const std::string& pattern, RouteHandler handler) {
    routes_.emplace_back(method, pattern, std::move(handler));
    spdlog::debug("Registered route: {} {}", HttpMethodUtils::to_string(method), pattern);
}

void HttpRouter::set_error_handler(RouterErrorHandler handler) {
    error_handler_ = std::move(handler);
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request) const {
    const std::string path = request.path();

    const Route* route = nullptr;
    bool path_known = false;
    for (const auto& candidate : routes_) {
        if (!candidate.matches_path(path)) {
            continue;
        }
        path_known = true;
        if (candidate.method == request.method) {
            route = &candidate;
            break;
        }
    }

    if (route == nullptr) {
        if (path_known) {
            return error_handler_(HttpStatus::METHOD_NOT_ALLOWED,
                                  HttpMethodUtils::to_string(request.method) + " is not allowed for " + path);
        }
        return error_handler_(HttpStatus::NOT_FOUND, "No route for " + path);
    }

    HttpContext ctx(request);
    ctx.params = route->extract_params(path);

    try {
        return route->handler(ctx);
    } catch (const std::exception& e) {
        spdlog::error("Route handler for {} threw: {}", route->pattern, e.what());
        return error_handler_(HttpStatus::INTERNAL_SERVER_ERROR, "Internal server error");
    }
}

std::vector<std::string> HttpRouter::list_routes() const {
    std::vector<std::string> route_list;
    for (const auto& route : routes_) {
        std::ostringstream oss;
        oss << HttpMethodUtils::to_string(route.method) << " " << route.pattern;
        route_list.push_back(oss.str());
    }
    return route_list;
}

HttpResponse HttpRouter::default_error_handler(HttpStatus status, const std::string& message) {
    HttpResponse response(status);
    response.set_body(message + "\n");
    response.set_header("Content-Type", "text/plain");
    return response;
}

} // namespace network
} // namespace chunkd
