#include "shoal/core/epoll_reactor.hpp"
#include "shoal/core/fd_watch.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace shoal;
using namespace std::chrono_literals;

class ReactorTest : public ::testing::Test {
protected:
    void SetUp() override { reactor_ = std::make_unique<epoll_reactor>(); }

    void TearDown() override { reactor_.reset(); }

    std::unique_ptr<epoll_reactor> reactor_;
};

TEST_F(ReactorTest, StopReactor) {
    reactor_->schedule([this]() { reactor_->stop(); });

    auto result = reactor_->run();
    EXPECT_TRUE(result.has_value());
    EXPECT_FALSE(reactor_->is_running());
}

TEST_F(ReactorTest, ScheduleTask) {
    bool executed = false;

    reactor_->schedule([&executed, this]() {
        executed = true;
        reactor_->stop();
    });

    ASSERT_TRUE(reactor_->run().has_value());
    EXPECT_TRUE(executed);
}

TEST_F(ReactorTest, ScheduleAfter) {
    bool executed = false;
    auto start = std::chrono::steady_clock::now();

    reactor_->schedule_after(100ms, [&executed, this]() {
        executed = true;
        reactor_->stop();
    });

    ASSERT_TRUE(reactor_->run().has_value());
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(executed);
    EXPECT_GE(elapsed, 100ms);
}

TEST_F(ReactorTest, TimersFireInDeadlineOrder) {
    std::vector<int> order;

    reactor_->schedule_after(60ms, [&] {
        order.push_back(3);
        reactor_->stop();
    });
    reactor_->schedule_after(20ms, [&] { order.push_back(1); });
    reactor_->schedule_after(20ms, [&] { order.push_back(2); });

    ASSERT_TRUE(reactor_->run().has_value());
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST_F(ReactorTest, StopFromAnotherThread) {
    std::thread stopper([this] {
        std::this_thread::sleep_for(50ms);
        reactor_->stop();
    });

    auto result = reactor_->run();
    stopper.join();
    EXPECT_TRUE(result.has_value());
}

TEST_F(ReactorTest, RunTwiceConcurrentlyFails) {
    reactor_->schedule([this] {
        auto nested = reactor_->run();
        EXPECT_FALSE(nested.has_value());
        reactor_->stop();
    });
    EXPECT_TRUE(reactor_->run().has_value());
}

TEST_F(ReactorTest, ReadableCallbackAndSelfUnregister) {
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK, 0, fds), 0);

    int calls = 0;
    auto res = reactor_->register_fd(fds[0], event_type::readable, [&](event_type ev) {
        ++calls;
        EXPECT_TRUE(has_flag(ev, event_type::readable));
        char buf[8];
        EXPECT_EQ(::read(fds[0], buf, sizeof(buf)), 1);
        EXPECT_TRUE(reactor_->unregister_fd(fds[0]).has_value());
        reactor_->stop();
    });
    ASSERT_TRUE(res.has_value());

    ASSERT_EQ(::write(fds[1], "x", 1), 1);
    ASSERT_TRUE(reactor_->run().has_value());
    EXPECT_EQ(calls, 1);

    ::close(fds[0]);
    ::close(fds[1]);
}

TEST_F(ReactorTest, InvalidFdOperations) {
    EXPECT_FALSE(reactor_->register_fd(-1, event_type::readable, [](event_type) {}).has_value());
    EXPECT_FALSE(reactor_->modify_fd(1000, event_type::readable).has_value());
    EXPECT_FALSE(reactor_->unregister_fd(1000).has_value());
}

TEST_F(ReactorTest, ExceptionInTaskReachesHandler) {
    std::string location;
    reactor_->set_exception_handler([&](const exception_context& ctx) {
        location = std::string(ctx.location);
    });

    reactor_->schedule([] { throw std::runtime_error("boom"); });
    reactor_->schedule([this] { reactor_->stop(); });

    ASSERT_TRUE(reactor_->run().has_value());
    EXPECT_EQ(location, "scheduled_task");
}

TEST_F(ReactorTest, FdWatchUnregistersOnDestruction) {
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK, 0, fds), 0);

    {
        fd_watch watch(*reactor_, fds[0], event_type::readable, [](event_type) {});
        ASSERT_TRUE(watch.is_registered());
    }

    // Registering again only works if the watch removed the first registration.
    fd_watch again(*reactor_, fds[0], event_type::readable, [](event_type) {});
    EXPECT_TRUE(again.is_registered());
    again.unregister();

    ::close(fds[0]);
    ::close(fds[1]);
}

TEST_F(ReactorTest, TasksQueuedAtStopStillRunButTimersDoNot) {
    bool task_ran = false;
    bool timer_ran = false;

    reactor_->schedule([&] {
        reactor_->schedule_after(0ms, [&] { timer_ran = true; });
        reactor_->schedule([&] { task_ran = true; });
        reactor_->stop();
    });

    ASSERT_TRUE(reactor_->run().has_value());
    EXPECT_TRUE(task_ran);
    EXPECT_FALSE(timer_ran);
}

TEST_F(ReactorTest, ImmediateTasksRunBeforeDueTimers) {
    std::vector<int> order;

    reactor_->schedule_after(0ms, [&] {
        order.push_back(3);
        reactor_->stop();
    });
    reactor_->schedule([&] { order.push_back(1); });
    reactor_->schedule([&] { order.push_back(2); });

    ASSERT_TRUE(reactor_->run().has_value());
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST_F(ReactorTest, ExceptionInTimerReachesHandler) {
    std::string location;
    reactor_->set_exception_handler([&](const exception_context& ctx) {
        location = std::string(ctx.location);
    });

    reactor_->schedule_after(1ms, [] { throw std::runtime_error("late"); });
    reactor_->schedule_after(20ms, [this] { reactor_->stop(); });

    ASSERT_TRUE(reactor_->run().has_value());
    EXPECT_EQ(location, "delayed_task");
}
