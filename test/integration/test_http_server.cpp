#include "shoal/core/epoll_reactor.hpp"
#include "shoal/core/http_server.hpp"
#include "support/http_client.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using namespace shoal;
using namespace shoal::test_support;
using namespace std::chrono_literals;

class HttpServerTest : public ::testing::Test {
protected:
    void start(http::request_handler handler) {
        server_ = std::make_unique<http::server>(
            reactor_, tcp_listener(0, bind_scope::loopback), std::move(handler));
        server_->on_request([this](const http::request&, const http::response&) { ++observed_; });
        ASSERT_TRUE(server_->start().has_value());
        auto port = server_->port();
        ASSERT_TRUE(port.has_value());
        port_ = *port;
        loop_ = std::thread([this] { (void)reactor_.run(); });
    }

    void TearDown() override {
        reactor_.stop();
        if (loop_.joinable()) {
            loop_.join();
        }
        server_.reset();
    }

    epoll_reactor reactor_;
    std::unique_ptr<http::server> server_;
    std::thread loop_;
    uint16_t port_ = 0;
    std::atomic<int> observed_{0};
};

TEST_F(HttpServerTest, AnswersAndClosesConnection) {
    start([](http::request req, http::responder reply) {
        reply.send(http::response::ok(req.method_token + " " + req.uri));
    });

    auto resp = request(port_, "GET", "/hello?x=1");
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->status, 200);
    EXPECT_EQ(resp->body, "GET /hello?x=1");
    EXPECT_EQ(resp->header("Connection").value_or(""), "close");
    EXPECT_TRUE(wait_until([this] { return observed_.load() == 1; }));
}

TEST_F(HttpServerTest, DeferredResponse) {
    start([this](http::request, http::responder reply) {
        reactor_.schedule_after(50ms, [reply]() mutable {
            EXPECT_TRUE(reply.is_open());
            reply.send(http::response::json("{\"late\":true}", 201));
        });
    });

    auto resp = request(port_, "POST", "/api/users", "{}");
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->status, 201);
    EXPECT_EQ(resp->body, "{\"late\":true}");
}

TEST_F(HttpServerTest, OnlyFirstSendIsDelivered) {
    start([](http::request, http::responder reply) {
        EXPECT_TRUE(reply.send(http::response::ok("first")));
        EXPECT_FALSE(reply.send(http::response::ok("second")));
    });

    auto resp = request(port_, "GET", "/");
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->body, "first");
}

TEST_F(HttpServerTest, MalformedRequestIsBadRequest) {
    start([](http::request, http::responder reply) { reply.send(http::response::ok()); });

    auto resp = send_raw(port_, "GARBAGE\r\n\r\n");
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->status, 400);
    EXPECT_EQ(resp->body, "{\"message\":\"Malformed HTTP request.\"}");
}

TEST_F(HttpServerTest, OversizedRequestIsContentTooLarge) {
    start([](http::request, http::responder reply) { reply.send(http::response::ok()); });

    std::string raw = "POST /api/users HTTP/1.1\r\nContent-Length: " +
                      std::to_string(http::MAX_BODY_SIZE + 1) + "\r\n\r\n";
    auto resp = send_raw(port_, raw);
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->status, 413);
    EXPECT_EQ(resp->body, "{\"message\":\"Request is too large.\"}");
}

TEST_F(HttpServerTest, NoContentHasNoBody) {
    start([](http::request, http::responder reply) { reply.send(http::response::no_content()); });

    auto resp = request(port_, "DELETE", "/api/users/x");
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->status, 204);
    EXPECT_TRUE(resp->body.empty());
    EXPECT_FALSE(resp->header("Content-Length").has_value());
}

TEST_F(HttpServerTest, ConcurrentClients) {
    start([](http::request req, http::responder reply) { reply.send(http::response::ok(req.uri)); });

    std::vector<std::thread> clients;
    std::atomic<int> ok{0};
    for (int i = 0; i < 8; ++i) {
        clients.emplace_back([this, i, &ok] {
            auto resp = request(port_, "GET", "/c/" + std::to_string(i));
            if (resp && resp->body == "/c/" + std::to_string(i)) {
                ++ok;
            }
        });
    }
    for (auto& t : clients) {
        t.join();
    }
    EXPECT_EQ(ok.load(), 8);
}
