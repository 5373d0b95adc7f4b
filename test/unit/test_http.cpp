#include "shoal/core/http.hpp"

#include <gtest/gtest.h>

using namespace shoal;
using namespace shoal::http;

TEST(HttpParser, ParseSimpleGetRequest) {
    parser p;

    std::string request = "GET /api/users HTTP/1.1\r\nHost: example.com\r\n\r\n";

    auto result = p.parse(as_bytes(request));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, parser::state::complete);

    const auto& req = p.get_request();
    EXPECT_EQ(req.http_method, method::get);
    EXPECT_EQ(req.method_token, "GET");
    EXPECT_EQ(req.uri, "/api/users");
    EXPECT_EQ(req.header("Host").value_or(""), "example.com");
    EXPECT_TRUE(req.body.empty());
}

TEST(HttpParser, ParsePostRequestWithBody) {
    parser p;

    std::string request = "POST /api/users HTTP/1.1\r\n"
                          "Host: api.example.com\r\n"
                          "Content-Type: application/json\r\n"
                          "Content-Length: 13\r\n"
                          "\r\n"
                          "{\"key\":\"val\"}";

    auto result = p.parse(as_bytes(request));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, parser::state::complete);

    const auto& req = p.get_request();
    EXPECT_EQ(req.http_method, method::post);
    EXPECT_EQ(req.body, "{\"key\":\"val\"}");
    EXPECT_EQ(req.header("content-type").value_or(""), "application/json");
}

TEST(HttpParser, IncrementalParsing) {
    parser p;

    std::string part1 = "PUT /api/users/1 HTTP/1.1\r\nContent-";
    std::string part2 = "Length: 2\r\n\r\n{";
    std::string part3 = "}";

    auto r1 = p.parse(as_bytes(part1));
    ASSERT_TRUE(r1.has_value());
    EXPECT_NE(*r1, parser::state::complete);

    auto r2 = p.parse(as_bytes(part2));
    ASSERT_TRUE(r2.has_value());
    EXPECT_EQ(*r2, parser::state::body);

    auto r3 = p.parse(as_bytes(part3));
    ASSERT_TRUE(r3.has_value());
    EXPECT_EQ(*r3, parser::state::complete);
    EXPECT_EQ(p.get_request().body, "{}");
}

TEST(HttpParser, ChunkedBody) {
    parser p;

    std::string request = "POST /api/users HTTP/1.1\r\n"
                          "Transfer-Encoding: chunked\r\n"
                          "\r\n"
                          "5\r\nHello\r\n"
                          "7\r\n, World\r\n"
                          "0\r\n"
                          "\r\n";

    auto result = p.parse(as_bytes(request));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(p.is_complete());
    EXPECT_EQ(p.get_request().body, "Hello, World");
}

TEST(HttpParser, AcceptsHttp10) {
    parser p;
    std::string request = "GET / HTTP/1.0\r\n\r\n";
    auto result = p.parse(as_bytes(request));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(p.is_complete());
}

TEST(HttpParser, KeepsUnknownMethodToken) {
    parser p;
    std::string request = "PURGE /api/users HTTP/1.1\r\n\r\n";
    auto result = p.parse(as_bytes(request));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(p.get_request().http_method, method::unknown);
    EXPECT_EQ(p.get_request().method_token, "PURGE");
}

TEST(HttpParser, PathStripsQueryAndFragment) {
    request req;
    req.uri = "/api/users?limit=5#top";
    EXPECT_EQ(req.path(), "/api/users");
}

TEST(HttpParser, RejectsUnsupportedVersion) {
    parser p;
    std::string request = "GET / HTTP/2.0\r\n\r\n";
    auto result = p.parse(as_bytes(request));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), make_error_code(error_code::malformed_request));
}

TEST(HttpParser, RejectsBareLineFeed) {
    parser p;
    std::string request = "GET / HTTP/1.1\nHost: x\n\n";
    EXPECT_FALSE(p.parse(as_bytes(request)).has_value());
}

TEST(HttpParser, RejectsTransferEncodingWithContentLength) {
    parser p;
    std::string request = "POST / HTTP/1.1\r\n"
                          "Transfer-Encoding: chunked\r\n"
                          "Content-Length: 5\r\n"
                          "\r\n";
    auto result = p.parse(as_bytes(request));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), make_error_code(error_code::malformed_request));
}

TEST(HttpParser, RejectsConflictingContentLength) {
    parser p;
    std::string request = "POST / HTTP/1.1\r\n"
                          "Content-Length: 5\r\n"
                          "Content-Length: 6\r\n"
                          "\r\n";
    EXPECT_FALSE(p.parse(as_bytes(request)).has_value());
}

TEST(HttpParser, AcceptsRepeatedIdenticalContentLength) {
    parser p;
    std::string request = "POST / HTTP/1.1\r\n"
                          "Content-Length: 2\r\n"
                          "Content-Length: 2\r\n"
                          "\r\n"
                          "{}";
    auto result = p.parse(as_bytes(request));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(p.is_complete());
}

TEST(HttpParser, RejectsNonNumericContentLength) {
    parser p;
    std::string request = "POST / HTTP/1.1\r\nContent-Length: 1x\r\n\r\n";
    EXPECT_FALSE(p.parse(as_bytes(request)).has_value());
}

TEST(HttpParser, OversizedBodyIsTooLarge) {
    parser p;
    std::string request = "POST / HTTP/1.1\r\nContent-Length: " +
                          std::to_string(MAX_BODY_SIZE + 1) + "\r\n\r\n";
    auto result = p.parse(as_bytes(request));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), make_error_code(error_code::message_too_large));
}

TEST(HttpParser, OversizedUriIsTooLarge) {
    parser p;
    std::string request = "GET /" + std::string(MAX_URI_LENGTH + 10, 'a') + " HTTP/1.1\r\n\r\n";
    auto result = p.parse(as_bytes(request));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), make_error_code(error_code::message_too_large));
}

TEST(HttpParser, OversizedHeaderBlockIsTooLarge) {
    parser p;
    std::string request = "GET / HTTP/1.1\r\nX-Fill: " + std::string(MAX_HEADER_SIZE, 'a');
    auto result = p.parse(as_bytes(request));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), make_error_code(error_code::message_too_large));
}

TEST(HttpParser, TooManyHeaders) {
    parser p;
    std::string request = "GET / HTTP/1.1\r\n";
    for (size_t i = 0; i <= MAX_HEADER_COUNT; ++i) {
        request += "X-" + std::to_string(i) + ": v\r\n";
    }
    request += "\r\n";
    EXPECT_FALSE(p.parse(as_bytes(request)).has_value());
}

TEST(HttpParser, ResetAllowsReuse) {
    parser p;
    std::string first = "GET /a HTTP/1.1\r\n\r\n";
    ASSERT_TRUE(p.parse(as_bytes(first)).has_value());
    p.reset();
    std::string second = "DELETE /b HTTP/1.1\r\n\r\n";
    ASSERT_TRUE(p.parse(as_bytes(second)).has_value());
    EXPECT_EQ(p.get_request().http_method, method::del);
    EXPECT_EQ(p.get_request().uri, "/b");
}

TEST(HttpResponse, SerializeJson) {
    auto resp = response::json("{\"a\":1}", 201);
    std::string out = resp.serialize();

    EXPECT_EQ(out.rfind("HTTP/1.1 201 Created\r\n", 0), 0U);
    EXPECT_NE(out.find("Content-Type: application/json\r\n"), std::string::npos);
    EXPECT_NE(out.find("Content-Length: 7\r\n"), std::string::npos);
    EXPECT_EQ(out.substr(out.size() - 7), "{\"a\":1}");
}

TEST(HttpResponse, NoContentHasNoBodyOrLength) {
    auto resp = response::no_content();
    resp.body = "ignored";
    std::string out = resp.serialize();

    EXPECT_EQ(out.rfind("HTTP/1.1 204 No Content\r\n", 0), 0U);
    EXPECT_EQ(out.find("Content-Length"), std::string::npos);
    EXPECT_EQ(out.substr(out.size() - 4), "\r\n\r\n");
}

TEST(HttpResponse, ErrorCarriesProblemMessage) {
    auto resp = response::error(problem_details::not_found("User with id x not found."));
    EXPECT_EQ(resp.status, 404);
    EXPECT_EQ(resp.reason, "Not Found");
    EXPECT_EQ(resp.body, "{\"message\":\"User with id x not found.\"}");
}

TEST(HttpResponse, FromPartsWithoutContentType) {
    auto resp = response::from_parts(504, "", "");
    EXPECT_EQ(resp.status, 504);
    EXPECT_EQ(resp.reason, "Gateway Timeout");
    EXPECT_FALSE(resp.headers.contains("Content-Type"));
}

TEST(HttpMethod, RoundTripNames) {
    EXPECT_EQ(parse_method("DELETE"), method::del);
    EXPECT_EQ(method_to_string(method::put), "PUT");
    EXPECT_EQ(parse_method("get"), method::unknown);
}
