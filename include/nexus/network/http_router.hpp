#pragma once

#include "nexus/network/http_types.hpp"

#include <functional>
#include <regex>
#include <string>
#include <unordered_map>
#include <vector>

namespace nexus {
namespace network {

/**
 * @brief Request context with URL parameters extracted from route
 */
struct HttpContext {
    const HttpRequest& request;
    std::unordered_map<std::string, std::string> params;  // URL parameters like :id

    explicit HttpContext(const HttpRequest& req) : request(req) {}

    std::string get_param(const std::string& name, const std::string& default_value = "") const {
        auto it = params.find(name);
        return (it != params.end()) ? it->second : default_value;
    }
};

using RouteHandler = std::function<HttpResponse(const HttpContext&)>;

/**
 * @brief Middleware function type (returns false to short-circuit)
 */
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;                   // Original pattern like "/files/:id"
    std::regex regex;
    std::vector<std::string> param_names;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches(HttpMethod method, const std::string& path) const;
    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief HTTP Router for organizing request handlers
 *
 * Routes match against the request path (query string stripped).
 * When a path matches but the method does not, the router answers
 * 405 instead of 404.
 *
 * Example usage:
 * @code
 * HttpRouter router;
 * router.patch("/files/:id", [](const HttpContext& ctx) {
 *     std::string id = ctx.get_param("id");
 *     return HttpResponse(HttpStatus::NO_CONTENT);
 * });
 * @endcode
 */
class HttpRouter {
public:
    void post(const std::string& pattern, RouteHandler handler);
    void patch(const std::string& pattern, RouteHandler handler);
    void delete_(const std::string& pattern, RouteHandler handler);
    void head(const std::string& pattern, RouteHandler handler);
    void options(const std::string& pattern, RouteHandler handler);

    void add_route(HttpMethod method, const std::string& pattern, RouteHandler handler);

    /**
     * @brief Add middleware to run before route handlers
     *
     * Middleware is executed in the order it's added. If middleware returns
     * false, handling stops and the response it filled in is sent.
     */
    void use(Middleware middleware);

    HttpResponse handle_request(const HttpRequest& request);

    std::vector<std::string> list_routes() const;
    size_t route_count() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);

    const Route* find_route(HttpMethod method, const std::string& path) const;
    bool path_known(const std::string& path) const;
};

/**
 * @brief Convert URL pattern to regex
 *
 * Converts:
 *   "/files/:id"  → "^/files/([^/]+)$"
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

} // namespace network
} // namespace nexus
