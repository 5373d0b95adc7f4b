#include "shoal/core/shutdown.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using namespace shoal;
using namespace std::chrono_literals;

class ShutdownManagerTest : public ::testing::Test {
protected:
    void SetUp() override { shutdown_manager::instance().reset(); }

    void TearDown() override { shutdown_manager::instance().reset(); }
};

TEST_F(ShutdownManagerTest, Singleton) {
    EXPECT_EQ(&shutdown_manager::instance(), &shutdown_manager::instance());
}

TEST_F(ShutdownManagerTest, RequestShutdown) {
    auto& mgr = shutdown_manager::instance();
    EXPECT_FALSE(mgr.is_shutdown_requested());

    mgr.request_shutdown();
    EXPECT_TRUE(mgr.is_shutdown_requested());
}

TEST_F(ShutdownManagerTest, CallbackRunsOnce) {
    auto& mgr = shutdown_manager::instance();
    int calls = 0;
    mgr.set_shutdown_callback([&calls] { ++calls; });

    mgr.trigger_shutdown();
    mgr.trigger_shutdown();

    EXPECT_TRUE(mgr.is_shutdown_requested());
    EXPECT_EQ(calls, 1);
}

TEST_F(ShutdownManagerTest, DeadlineNotExceededBeforeRequest) {
    EXPECT_FALSE(shutdown_manager::instance().is_deadline_exceeded(0ms));
}

TEST_F(ShutdownManagerTest, DeadlineExceeded) {
    auto& mgr = shutdown_manager::instance();
    mgr.request_shutdown();
    mgr.record_shutdown_time();

    EXPECT_FALSE(mgr.is_deadline_exceeded(10s));
    std::this_thread::sleep_for(20ms);
    EXPECT_TRUE(mgr.is_deadline_exceeded(10ms));
}

TEST_F(ShutdownManagerTest, ResetClearsState) {
    auto& mgr = shutdown_manager::instance();
    int calls = 0;
    mgr.set_shutdown_callback([&calls] { ++calls; });
    mgr.trigger_shutdown();
    mgr.reset();

    EXPECT_FALSE(mgr.is_shutdown_requested());
    mgr.trigger_shutdown();
    EXPECT_EQ(calls, 1);
}
