#include "nexus/network/http_router.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace nexus::network;

namespace {

HttpRequest make_request(HttpMethod method, const std::string& url) {
    HttpRequest request;
    request.method = method;
    request.url = url;
    return request;
}

} // namespace

TEST(HttpRouterTest, ExtractsRouteParams) {
    HttpRouter router;
    std::string seen;
    router.head("/api/upload/tus/:id", [&](const HttpContext& ctx) {
        seen = ctx.get_param("id");
        return HttpResponse(HttpStatus::OK);
    });

    auto response = router.handle_request(make_request(HttpMethod::HEAD, "/api/upload/tus/7f3a?ignored=1"));
    EXPECT_EQ(response.status_code, 200);
    EXPECT_EQ(seen, "7f3a");
}

TEST(HttpRouterTest, WrongMethodOnKnownPathIs405) {
    HttpRouter router;
    router.post("/api/upload/tus", [](const HttpContext&) { return HttpResponse(HttpStatus::CREATED); });

    EXPECT_EQ(router.handle_request(make_request(HttpMethod::PUT, "/api/upload/tus")).status_code, 405);
    EXPECT_EQ(router.handle_request(make_request(HttpMethod::POST, "/elsewhere")).status_code, 404);
}

TEST(HttpRouterTest, UnknownPathGetsPlainTextNotFound) {
    HttpRouter router;
    router.options("/api/upload/tus", [](const HttpContext&) { return HttpResponse(HttpStatus::NO_CONTENT); });

    auto response = router.handle_request(make_request(HttpMethod::GET, "/favicon.ico"));
    EXPECT_EQ(response.status_code, 404);
    EXPECT_EQ(response.get_header("Content-Type"), "text/plain");
    EXPECT_EQ(std::string(response.body.begin(), response.body.end()), "Not Found: /favicon.ico");
}

TEST(HttpRouterTest, ParamDoesNotSpanSegments) {
    HttpRouter router;
    router.patch("/u/:id", [](const HttpContext&) { return HttpResponse(HttpStatus::NO_CONTENT); });

    EXPECT_EQ(router.handle_request(make_request(HttpMethod::PATCH, "/u/a")).status_code, 204);
    EXPECT_EQ(router.handle_request(make_request(HttpMethod::PATCH, "/u/a/b")).status_code, 404);
}

TEST(HttpRouterTest, MiddlewareCanShortCircuit) {
    HttpRouter router;
    bool handler_ran = false;
    router.post("/u", [&](const HttpContext&) {
        handler_ran = true;
        return HttpResponse(HttpStatus::CREATED);
    });
    router.use([](const HttpContext& ctx, HttpResponse& response) {
        if (ctx.request.get_header("Tus-Resumable") != "1.0.0") {
            response = HttpResponse(HttpStatus::PRECONDITION_FAILED);
            return false;
        }
        return true;
    });

    EXPECT_EQ(router.handle_request(make_request(HttpMethod::POST, "/u")).status_code, 412);
    EXPECT_FALSE(handler_ran);

    auto request = make_request(HttpMethod::POST, "/u");
    request.headers["Tus-Resumable"] = "1.0.0";
    EXPECT_EQ(router.handle_request(request).status_code, 201);
    EXPECT_TRUE(handler_ran);
}

TEST(HttpRouterTest, ThrowingHandlerBecomes500) {
    HttpRouter router;
    router.delete_("/u/:id", [](const HttpContext&) -> HttpResponse {
        throw std::runtime_error("boom");
    });

    EXPECT_EQ(router.handle_request(make_request(HttpMethod::DELETE_METHOD, "/u/1")).status_code, 500);
}

TEST(HttpRouterTest, ListsRoutes) {
    HttpRouter router;
    router.options("/u", [](const HttpContext&) { return HttpResponse(HttpStatus::NO_CONTENT); });
    router.options("/u/:id", [](const HttpContext&) { return HttpResponse(HttpStatus::NO_CONTENT); });

    EXPECT_EQ(router.route_count(), 2u);
    EXPECT_EQ(router.list_routes()[1], "OPTIONS /u/:id");
}

TEST(PatternToRegexTest, EscapesLiteralCharacters) {
    std::vector<std::string> names;
    EXPECT_EQ(pattern_to_regex("/v1.0/:id", names), "^/v1\\.0/([^/]+)$");
    ASSERT_EQ(names.size(), 1u);
    EXPECT_EQ(names[0], "id");
}
