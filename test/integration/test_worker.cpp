#include "shoal/cluster/worker.hpp"
#include "shoal/core/json.hpp"
#include "support/frame_io.hpp"
#include "support/http_client.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace shoal;
using namespace shoal::cluster;
using namespace shoal::test_support;
using namespace std::chrono_literals;

class WorkerTest : public ::testing::Test {
protected:
    void start(std::optional<uint16_t> http_port) {
        int fds[2];
        ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds), 0);
        peer_fd_ = fds[1];

        worker_config config;
        config.ordinal = 1;
        config.http_port = http_port;
        config.scope = bind_scope::loopback;
        config.install_signal_handlers = false;
        config.tick_interval = 20ms;

        worker_ = std::make_unique<worker>(config, tcp_socket(fds[0]));
        thread_ = std::thread([this] { exit_status_ = worker_->run(); });
        ASSERT_TRUE(wait_until([this] { return worker_->state() == worker_state::listening; }));
    }

    void TearDown() override {
        if (worker_) {
            worker_->stop();
        }
        if (thread_.joinable()) {
            thread_.join();
        }
        if (peer_fd_ >= 0) {
            ::close(peer_fd_);
        }
    }

    std::unique_ptr<worker> worker_;
    std::thread thread_;
    int peer_fd_ = -1;
    std::atomic<int> exit_status_{-1};
};

TEST(WorkerState, Names) {
    EXPECT_EQ(to_string(worker_state::starting), "starting");
    EXPECT_EQ(to_string(worker_state::terminated), "terminated");
}

TEST_F(WorkerTest, ServesDispatchedRequests) {
    start(std::nullopt);
    blocking_frame_io io(peer_fd_);

    ASSERT_TRUE(io.write(request_envelope{
        1, http::method::post, "/api/users", R"({"name":"John Doe","age":30,"hobbies":[]})"}));
    auto created = io.read();
    ASSERT_TRUE(created.has_value());
    auto& resp = std::get<response_envelope>(*created);
    EXPECT_EQ(resp.correlation_id, 1U);
    EXPECT_EQ(resp.status, 201);
    EXPECT_EQ(resp.content_type, "application/json");

    ASSERT_TRUE(io.write(request_envelope{2, http::method::get, "/api/users/not-a-uuid", ""}));
    auto bad = io.read();
    ASSERT_TRUE(bad.has_value());
    EXPECT_EQ(std::get<response_envelope>(*bad).status, 400);
    EXPECT_EQ(std::get<response_envelope>(*bad).body, "{\"message\":\"Invalid userId format\"}");
}

TEST_F(WorkerTest, HttpAndChannelShareTheStore) {
    start(uint16_t{0});
    ASSERT_TRUE(wait_until([this] { return worker_->http_port().has_value(); }));
    uint16_t port = *worker_->http_port();

    auto created = request(port, "POST", "/api/users",
                           R"({"name":"Jane Doe","age":25,"hobbies":["x"]})");
    ASSERT_TRUE(created.has_value());
    ASSERT_EQ(created->status, 201);
    auto id = json::parse(created->body)->find("id")->as_string();

    blocking_frame_io io(peer_fd_);
    ASSERT_TRUE(io.write(request_envelope{7, http::method::get, "/api/users/" + id, ""}));
    auto fetched = io.read();
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(std::get<response_envelope>(*fetched).status, 200);
    EXPECT_EQ(std::get<response_envelope>(*fetched).body, created->body);
}

TEST_F(WorkerTest, BusyPortLeavesChannelServing) {
    uint16_t busy = free_loopback_port();
    ASSERT_NE(busy, 0);
    tcp_listener occupant(busy, bind_scope::loopback);

    start(busy);
    EXPECT_FALSE(worker_->http_port().has_value());

    blocking_frame_io io(peer_fd_);
    ASSERT_TRUE(io.write(request_envelope{1, http::method::get, "/api/users", ""}));
    auto listed = io.read();
    ASSERT_TRUE(listed.has_value());
    EXPECT_EQ(std::get<response_envelope>(*listed).body, "[]");
}

TEST_F(WorkerTest, ExitsWhenCoordinatorChannelCloses) {
    start(std::nullopt);

    ::close(peer_fd_);
    peer_fd_ = -1;

    ASSERT_TRUE(wait_until([this] { return worker_->state() == worker_state::terminated; }));
    thread_.join();
    EXPECT_EQ(exit_status_.load(), 0);
}
