#pragma once

#include "reactor.hpp"
#include "scoped_fd.hpp"

#include <sys/epoll.h>

#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <queue>
#include <vector>

namespace shoal {

// One loop per process. Immediate tasks and timers share a single queue:
// immediate tasks sort before any timer and, among equals, by submission order.
class epoll_reactor : public reactor {
public:
    static constexpr size_t MAX_TRACKED_FDS = 65536;
    static constexpr size_t MAX_EVENTS = 128;

    epoll_reactor();

    epoll_reactor(const epoll_reactor&) = delete;
    epoll_reactor& operator=(const epoll_reactor&) = delete;

    result<void> run() override;
    void stop() override;

    result<void> register_fd(int32_t fd, event_type events, event_callback callback) override;
    result<void> modify_fd(int32_t fd, event_type events) override;
    result<void> unregister_fd(int32_t fd) override;

    bool schedule(task_fn task) override;
    bool schedule_after(std::chrono::milliseconds delay, task_fn task) override;

    void set_exception_handler(exception_handler handler) override;

    [[nodiscard]] bool is_running() const noexcept {
        return running_.load(std::memory_order_relaxed);
    }

private:
    using clock = std::chrono::steady_clock;

    static constexpr clock::time_point IMMEDIATE = clock::time_point::min();

    struct queued_task {
        clock::time_point due;
        uint64_t sequence = 0;
        task_fn task;

        bool operator>(const queued_task& other) const {
            return due != other.due ? due > other.due : sequence > other.sequence;
        }
    };

    bool enqueue(clock::time_point due, task_fn task);
    void collect_incoming();
    void run_due(clock::time_point now);
    void dispatch_ready(int32_t count);
    [[nodiscard]] int32_t wait_timeout();
    [[nodiscard]] event_callback* callback_for(int32_t fd) noexcept;
    void wake() noexcept;
    void report(std::string_view location, std::exception_ptr ex, int32_t fd = -1) noexcept;

    scoped_fd epoll_fd_;
    scoped_fd wakeup_fd_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    std::vector<event_callback> callbacks_;
    std::array<epoll_event, MAX_EVENTS> ready_{};

    std::mutex incoming_mutex_;
    std::vector<queued_task> incoming_;
    uint64_t next_sequence_ = 0;
    std::priority_queue<queued_task, std::vector<queued_task>, std::greater<queued_task>> queue_;

    exception_handler exception_handler_;
};

} // namespace shoal
