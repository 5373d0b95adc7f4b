#include "shoal/core/router.hpp"

#include <array>
#include <gtest/gtest.h>

using namespace shoal;
using namespace shoal::http;

namespace {

request make_request(method m, std::string uri) {
    request req;
    req.http_method = m;
    req.method_token = std::string(method_to_string(m));
    req.uri = std::move(uri);
    return req;
}

constexpr auto COLLECTION = path_pattern::from_literal<"/api/users">();
constexpr auto ITEM = path_pattern::from_literal<"/api/users/{id}">();
constexpr auto ME = path_pattern::from_literal<"/api/users/me">();

} // namespace

TEST(SplitPath, SkipsEmptySegments) {
    auto split = split_path("//api/users/");
    ASSERT_EQ(split.count, 2U);
    EXPECT_EQ(split.parts[0], "api");
    EXPECT_EQ(split.parts[1], "users");
    EXPECT_FALSE(split.overflow);
}

TEST(SplitPath, Overflow) {
    std::string path;
    for (size_t i = 0; i <= MAX_ROUTE_SEGMENTS; ++i) {
        path += "/s";
    }
    EXPECT_TRUE(split_path(path).overflow);
}

TEST(PathPattern, ParsesLiteralsAndParameters) {
    EXPECT_EQ(ITEM.segment_count, 3U);
    EXPECT_EQ(ITEM.param_count, 1U);
    EXPECT_EQ(ITEM.param_names[0], "id");
    EXPECT_GT(ME.specificity_score(), ITEM.specificity_score());
}

TEST(PathPattern, MatchesPrefix) {
    auto split = split_path("/api/users/1/extra");
    EXPECT_TRUE(COLLECTION.matches_prefix(split.segments()));
    EXPECT_TRUE(ITEM.matches_prefix(split.segments()));

    auto other = split_path("/api/orders");
    EXPECT_FALSE(COLLECTION.matches_prefix(other.segments()));
}

TEST(Router, DispatchesWithParams) {
    std::string seen_id;
    std::array<route_entry, 2> routes{{
        {method::get, COLLECTION,
         [](const request&, request_context&) { return response::ok("list"); }},
        {method::get, ITEM,
         [&seen_id](const request&, request_context& ctx) {
             seen_id = std::string(ctx.params.get("id").value_or(""));
             return response::ok("item");
         }},
    }};
    router r(routes);

    request_context ctx;
    auto res = r.dispatch(make_request(method::get, "/api/users/abc?x=1"), ctx);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->body, "item");
    EXPECT_EQ(seen_id, "abc");

    auto trailing = r.dispatch(make_request(method::get, "/api/users/"), ctx);
    ASSERT_TRUE(trailing.has_value());
    EXPECT_EQ(trailing->body, "list");
}

TEST(Router, PrefersMoreSpecificRoute) {
    std::array<route_entry, 2> routes{{
        {method::get, ITEM, [](const request&, request_context&) { return response::ok("item"); }},
        {method::get, ME, [](const request&, request_context&) { return response::ok("me"); }},
    }};
    router r(routes);

    request_context ctx;
    auto res = r.dispatch(make_request(method::get, "/api/users/me"), ctx);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->body, "me");
}

TEST(Router, NotFoundAndMethodNotAllowed) {
    std::array<route_entry, 1> routes{{
        {method::get, COLLECTION,
         [](const request&, request_context&) { return response::ok("list"); }},
    }};
    router r(routes);
    request_context ctx;

    auto missing = r.dispatch_with_info(make_request(method::get, "/nope"), ctx);
    ASSERT_FALSE(missing.route_response.has_value());
    EXPECT_EQ(missing.route_response.error(), make_error_code(error_code::not_found));
    EXPECT_FALSE(missing.path_matched);

    auto wrong_method = r.dispatch_with_info(make_request(method::patch, "/api/users"), ctx);
    ASSERT_FALSE(wrong_method.route_response.has_value());
    EXPECT_EQ(wrong_method.route_response.error(), make_error_code(error_code::method_not_allowed));
    EXPECT_TRUE(wrong_method.path_matched);
}
