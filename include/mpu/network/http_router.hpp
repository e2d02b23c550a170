#pragma once

#include "mpu/network/http_types.hpp"

#include <functional>
#include <memory>
#include <regex>
#include <unordered_map>
#include <vector>

namespace mpu {
namespace network {

/**
 * @brief Request context with path and query parameters extracted by the router
 */
struct HttpContext {
    const HttpRequest& request;
    std::string path;                                     // URL without the query string
    std::unordered_map<std::string, std::string> params;  // Decoded route parameters like :id
    std::unordered_map<std::string, std::string> query;   // Decoded query parameters

    explicit HttpContext(const HttpRequest& req) : request(req) {}

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
 * @brief Middleware function type (can modify request or short-circuit)
 */
using Middleware = std::function<bool(const HttpContext&, HttpResponse&)>;

/**
 * @brief Runs on every response before it leaves the router
 */
using ResponseHook = std::function<void(const HttpContext&, HttpResponse&)>;

struct Route {
    HttpMethod method;
    std::string pattern;                   // Original pattern like "/objects/*key"
    std::regex regex;
    std::vector<std::string> param_names;
    RouteHandler handler;

    Route(HttpMethod m, const std::string& pat, RouteHandler h);

    bool matches_path(const std::string& path) const;

    bool matches(HttpMethod method, const std::string& path) const;

    std::unordered_map<std::string, std::string> extract_params(const std::string& path) const;
};

/**
 * @brief HTTP Router for organizing request handlers
 *
 * Features:
 * - Method-based routing (GET, POST, PUT, OPTIONS, ...)
 * - Segment parameters (/users/:id) and tail parameters (/objects/*key)
 * - Query string parsing into HttpContext::query
 * - 405 with an Allow header when the path exists under another method
 * - Middleware before the handler and response hooks after it
 *
 * Parameters and query values are percent-decoded; an invalid escape is
 * answered with 400.
 *
 * Example usage:
 * @code
 * HttpRouter router;
 *
 * router.get("/objects/*key", [](const HttpContext& ctx) {
 *     std::string key = ctx.get_param("key");   // may contain '/'
 *     ...
 * });
 *
 * router.put("/upload/part/*key", [](const HttpContext& ctx) {
 *     std::string upload_id = ctx.get_query("uploadId");
 *     ...
 * });
 *
 * router.after([](const HttpContext&, HttpResponse& res) {
 *     res.set_header("Access-Control-Allow-Origin", "*");
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

    /**
     * @brief Add a hook that sees every response, including 404 and 405
     */
    void after(ResponseHook hook);

    void set_not_found_handler(RouteHandler handler);
    void set_method_not_allowed_handler(RouteHandler handler);

    /**
     * @brief Handle an HTTP request by finding matching route
     *
     * Exceptions escaping a handler become a 500.
     */
    HttpResponse handle_request(const HttpRequest& request);

    std::vector<std::string> list_routes() const;

    size_t route_count() const { return routes_.size(); }

private:
    std::vector<Route> routes_;
    std::vector<Middleware> middlewares_;
    std::vector<ResponseHook> hooks_;
    RouteHandler not_found_handler_;
    RouteHandler method_not_allowed_handler_;

    static HttpResponse default_not_found_handler(const HttpContext& ctx);
    static HttpResponse default_method_not_allowed_handler(const HttpContext& ctx);

    HttpResponse dispatch(HttpContext& ctx);

    const Route* find_route(HttpMethod method, const std::string& path) const;

    std::string allowed_methods(const std::string& path) const;
};

/**
 * @brief JSON error body shared by the router's fallbacks and the relay
 *
 * {"error": "<error>", "details": "<details>"}
 */
HttpResponse make_error_response(HttpStatus status, const std::string& error, const std::string& details);

/**
 * @brief Convert URL pattern to regex
 *
 * Converts:
 *   "/users/:id"           -> "^/users/([^/]+)$"
 *   "/objects/*key"        -> "^/objects/(.+)$"
 *   "*"                    -> "^(.*)$"
 */
std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names);

} // namespace network
} // namespace mpu
