#include "mpu/network/http_router.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using mpu::network::HttpContext;
using mpu::network::HttpMethod;
using mpu::network::HttpRequest;
using mpu::network::HttpResponse;
using mpu::network::HttpRouter;
using mpu::network::HttpStatus;

namespace {

HttpRequest make_request(HttpMethod method, const std::string& url) {
    HttpRequest request;
    request.method = method;
    request.url = url;
    return request;
}

HttpResponse text(const std::string& body) {
    HttpResponse response(HttpStatus::OK);
    response.set_body(body);
    return response;
}

} // namespace

TEST(HttpRouterTest, SegmentParameter) {
    HttpRouter router;
    router.get("/users/:id", [](const HttpContext& ctx) { return text("user " + ctx.get_param("id")); });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/users/42"));
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.body_as_string(), "user 42");

    auto nested = router.handle_request(make_request(HttpMethod::GET, "/users/42/posts"));
    EXPECT_EQ(nested.status_code, 404);
}

TEST(HttpRouterTest, TailParameterKeepsSlashesAndDecodes) {
    HttpRouter router;
    router.get("/objects/*key", [](const HttpContext& ctx) { return text(ctx.get_param("key")); });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/objects/a/b%20c.txt"));
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.body_as_string(), "a/b c.txt");

    auto encoded_slash = router.handle_request(make_request(HttpMethod::GET, "/objects/a%2Fb"));
    EXPECT_EQ(encoded_slash.body_as_string(), "a/b");
}

TEST(HttpRouterTest, MalformedEscapeIsBadRequest) {
    HttpRouter router;
    router.get("/objects/*key", [](const HttpContext& ctx) { return text(ctx.get_param("key")); });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/objects/bad%zz"));
    EXPECT_EQ(response.status_code, 400);
    EXPECT_EQ(response.get_header("Content-Type"), "application/json");
}

TEST(HttpRouterTest, QueryStringIsSplitAndDecoded) {
    HttpRouter router;
    router.put("/upload/part/*key", [](const HttpContext& ctx) {
        return text(ctx.path + "|" + ctx.get_query("uploadId") + "|" + ctx.get_query("partNumber") + "|" +
                    (ctx.has_query("missing") ? "yes" : "no"));
    });

    auto response = router.handle_request(make_request(HttpMethod::PUT, "/upload/part/k?uploadId=a%2Fb&partNumber=2"));
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(response.body_as_string(), "/upload/part/k|a/b|2|no");
}

TEST(HttpRouterTest, UnknownPathIsJsonNotFound) {
    HttpRouter router;
    router.get("/objects", [](const HttpContext&) { return text("[]"); });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/nowhere"));
    EXPECT_EQ(response.status_code, 404);
    EXPECT_EQ(response.get_header("Content-Type"), "application/json");
    EXPECT_NE(response.body_as_string().find("\"error\""), std::string::npos);
}

TEST(HttpRouterTest, WrongMethodIs405WithAllow) {
    HttpRouter router;
    router.get("/objects/*key", [](const HttpContext&) { return text("get"); });
    router.head("/objects/*key", [](const HttpContext&) { return text(""); });
    router.options("*", [](const HttpContext&) { return HttpResponse(HttpStatus::NO_CONTENT); });

    auto response = router.handle_request(make_request(HttpMethod::DELETE_METHOD, "/objects/a"));
    EXPECT_EQ(response.status_code, 405);
    EXPECT_EQ(response.get_header("Allow"), "GET, HEAD");

    auto preflight = router.handle_request(make_request(HttpMethod::OPTIONS, "/objects/a"));
    EXPECT_EQ(preflight.status_code, 204);
}

TEST(HttpRouterTest, MiddlewareCanShortCircuit) {
    HttpRouter router;
    bool handler_called = false;
    router.get("/secret", [&](const HttpContext&) {
        handler_called = true;
        return text("secret");
    });
    router.use([](const HttpContext&, HttpResponse& res) {
        res = HttpResponse(HttpStatus::SERVICE_UNAVAILABLE);
        return false;
    });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/secret"));
    EXPECT_EQ(response.status_code, 503);
    EXPECT_FALSE(handler_called);
}

TEST(HttpRouterTest, HooksSeeEveryResponse) {
    HttpRouter router;
    router.get("/ok", [](const HttpContext&) { return text("ok"); });
    router.after([](const HttpContext&, HttpResponse& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
    });

    EXPECT_EQ(router.handle_request(make_request(HttpMethod::GET, "/ok"))
                  .get_header("Access-Control-Allow-Origin"), "*");
    EXPECT_EQ(router.handle_request(make_request(HttpMethod::GET, "/missing"))
                  .get_header("Access-Control-Allow-Origin"), "*");
}

TEST(HttpRouterTest, ThrowingHandlerBecomes500) {
    HttpRouter router;
    router.get("/boom", [](const HttpContext&) -> HttpResponse {
        throw std::runtime_error("kaboom");
    });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/boom"));
    EXPECT_EQ(response.status_code, 500);
    EXPECT_NE(response.body_as_string().find("kaboom"), std::string::npos);
}

TEST(HttpRouterTest, FirstMatchingRouteWins) {
    HttpRouter router;
    router.get("/objects", [](const HttpContext&) { return text("list"); });
    router.get("/objects/*key", [](const HttpContext&) { return text("one"); });

    EXPECT_EQ(router.handle_request(make_request(HttpMethod::GET, "/objects")).body_as_string(), "list");
    EXPECT_EQ(router.handle_request(make_request(HttpMethod::GET, "/objects/x")).body_as_string(), "one");
    EXPECT_EQ(router.route_count(), 2u);
}

TEST(HttpRouterTest, PatternToRegex) {
    std::vector<std::string> names;
    EXPECT_EQ(mpu::network::pattern_to_regex("/users/:id", names), "^/users/([^/]+)$");
    EXPECT_EQ(mpu::network::pattern_to_regex("/objects/*key", names), "^/objects/(.+)$");
    EXPECT_EQ(names, (std::vector<std::string>{"id", "key"}));
}
