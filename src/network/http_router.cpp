#include "mpu/network/http_router.hpp"

#include "mpu/util/encoding.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cctype>
#include <sstream>

namespace mpu {
namespace network {

// ────────────────────────────────────────────────────────────
// Helper: Convert URL pattern to regex
// ────────────────────────────────────────────────────────────

namespace {

std::string read_param_name(const std::string& pattern, size_t& i) {
    std::string name;
    while (i < pattern.length() &&
           (std::isalnum(static_cast<unsigned char>(pattern[i])) || pattern[i] == '_')) {
        name += pattern[i];
        ++i;
    }
    return name;
}

} // namespace

std::string pattern_to_regex(const std::string& pattern, std::vector<std::string>& param_names) {
    std::string regex_pattern = "^";
    size_t i = 0;

    while (i < pattern.length()) {
        if (pattern[i] == ':') {
            ++i;
            std::string param_name = read_param_name(pattern, i);
            if (!param_name.empty()) {
                param_names.push_back(param_name);
                regex_pattern += "([^/]+)";
            }
        } else if (pattern[i] == '*') {
            ++i;
            std::string param_name = read_param_name(pattern, i);
            if (param_name.empty()) {
                regex_pattern += "(?:.*)";
            } else {
                // Named tail captures the rest of the path, slashes included
                param_names.push_back(param_name);
                regex_pattern += "(.+)";
            }
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

HttpResponse make_error_response(HttpStatus status, const std::string& error, const std::string& details) {
    HttpResponse response(status);
    nlohmann::json body = {{"error", error}, {"details", details}};
    response.set_body(body.dump());
    response.set_header("Content-Type", "application/json");
    return response;
}

// ────────────────────────────────────────────────────────────
// Route Implementation
// ────────────────────────────────────────────────────────────

Route::Route(HttpMethod m, const std::string& pat, RouteHandler h)
    : method(m), pattern(pat), handler(std::move(h)) {

    std::string regex_str = pattern_to_regex(pattern, param_names);

    try {
        regex = std::regex(regex_str);
    } catch (const std::regex_error& e) {
        spdlog::error("Invalid route pattern '{}': {}", pattern, e.what());
        throw;
    }
}

bool Route::matches_path(const std::string& path) const {
    return std::regex_match(path, regex);
}

bool Route::matches(HttpMethod req_method, const std::string& path) const {
    if (method != req_method) {
        return false;
    }
    return matches_path(path);
}

std::unordered_map<std::string, std::string> Route::extract_params(const std::string& path) const {
    std::unordered_map<std::string, std::string> params;
    std::smatch match;

    if (std::regex_match(path, match, regex)) {
        // match[0] is the full string, match[1+] are capture groups
        for (size_t i = 0; i < param_names.size() && i + 1 < match.size(); ++i) {
            params[param_names[i]] = match[i + 1].str();
        }
    }

    return params;
}

// ────────────────────────────────────────────────────────────
// HttpRouter Implementation
// ────────────────────────────────────────────────────────────

HttpRouter::HttpRouter()
    : not_found_handler_(default_not_found_handler)
    , method_not_allowed_handler_(default_method_not_allowed_handler) {
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

void HttpRouter::head(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::HEAD, pattern, std::move(handler));
}

void HttpRouter::options(const std::string& pattern, RouteHandler handler) {
    add_route(HttpMethod::OPTIONS, pattern, std::move(handler));
}

void HttpRouter::add_route(HttpMethod method, const std::string& pattern, RouteHandler handler) {
    routes_.emplace_back(method, pattern, std::move(handler));

    spdlog::debug("Registered route: {} {}", HttpMethodUtils::to_string(method), pattern);
}

void HttpRouter::use(Middleware middleware) {
    middlewares_.push_back(std::move(middleware));
}

void HttpRouter::after(ResponseHook hook) {
    hooks_.push_back(std::move(hook));
}

void HttpRouter::set_not_found_handler(RouteHandler handler) {
    not_found_handler_ = std::move(handler);
}

void HttpRouter::set_method_not_allowed_handler(RouteHandler handler) {
    method_not_allowed_handler_ = std::move(handler);
}

HttpResponse HttpRouter::handle_request(const HttpRequest& request) {
    HttpContext ctx(request);

    std::string raw_query;
    auto question = request.url.find('?');
    if (question == std::string::npos) {
        ctx.path = request.url;
    } else {
        ctx.path = request.url.substr(0, question);
        raw_query = request.url.substr(question + 1);
    }
    ctx.query = util::parse_query(raw_query);

    HttpResponse response = dispatch(ctx);

    for (const auto& hook : hooks_) {
        hook(ctx, response);
    }

    return response;
}

HttpResponse HttpRouter::dispatch(HttpContext& ctx) {
    HttpResponse response(HttpStatus::OK);

    for (const auto& middleware : middlewares_) {
        if (!middleware(ctx, response)) {
            return response;
        }
    }

    const Route* route = find_route(ctx.request.method, ctx.path);
    if (!route) {
        std::string allow = allowed_methods(ctx.path);
        if (allow.empty()) {
            return not_found_handler_(ctx);
        }
        response = method_not_allowed_handler_(ctx);
        response.set_header("Allow", allow);
        return response;
    }

    for (auto& [name, raw] : route->extract_params(ctx.path)) {
        auto decoded = util::percent_decode(raw);
        if (!decoded) {
            return make_error_response(HttpStatus::BAD_REQUEST, "Invalid request",
                                       "Malformed percent-encoding in '" + name + "'");
        }
        ctx.params[name] = std::move(*decoded);
    }

    try {
        response = route->handler(ctx);
    } catch (const std::exception& e) {
        spdlog::error("Route handler for {} threw exception: {}", route->pattern, e.what());
        response = make_error_response(HttpStatus::INTERNAL_SERVER_ERROR, "Internal server error", e.what());
    }

    return response;
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

HttpResponse HttpRouter::default_not_found_handler(const HttpContext& ctx) {
    return make_error_response(HttpStatus::NOT_FOUND, "Not found", ctx.path);
}

HttpResponse HttpRouter::default_method_not_allowed_handler(const HttpContext& ctx) {
    return make_error_response(HttpStatus::METHOD_NOT_ALLOWED, "Method not allowed",
                               HttpMethodUtils::to_string(ctx.request.method) + " " + ctx.path);
}

const Route* HttpRouter::find_route(HttpMethod method, const std::string& path) const {
    for (const auto& route : routes_) {
        if (route.matches(method, path)) {
            return &route;
        }
    }
    return nullptr;
}

std::string HttpRouter::allowed_methods(const std::string& path) const {
    std::string allow;
    for (const auto& route : routes_) {
        // Catch-all OPTIONS routes say nothing about the resource
        if (route.method == HttpMethod::OPTIONS || !route.matches_path(path)) {
            continue;
        }
        std::string name = HttpMethodUtils::to_string(route.method);
        if (allow.find(name) != std::string::npos) {
            continue;
        }
        if (!allow.empty()) {
            allow += ", ";
        }
        allow += name;
    }
    return allow;
}

} // namespace network
} // namespace mpu
