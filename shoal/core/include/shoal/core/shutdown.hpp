#pragma once

#include <atomic>
#include <chrono>
#include <functional>

namespace shoal {

// Process-wide shutdown flag. Signal handlers only set the flag; reactors poll
// it from a periodic tick and run the shutdown callback on their own thread.
class shutdown_manager {
public:
    using shutdown_callback = std::function<void()>;
    using clock = std::chrono::steady_clock;
    using time_point = clock::time_point;
    using duration = std::chrono::milliseconds;

    static shutdown_manager& instance() {
        static shutdown_manager mgr;
        return mgr;
    }

    void request_shutdown() noexcept { shutdown_requested_.store(true, std::memory_order_release); }

    [[nodiscard]] bool is_shutdown_requested() const noexcept {
        return shutdown_requested_.load(std::memory_order_acquire);
    }

    void record_shutdown_time() noexcept { shutdown_time_ = clock::now(); }

    [[nodiscard]] bool is_deadline_exceeded(duration deadline) noexcept {
        if (!is_shutdown_requested()) {
            return false;
        }
        if (shutdown_time_ == time_point{}) {
            shutdown_time_ = clock::now();
        }
        return clock::now() - shutdown_time_ >= deadline;
    }

    void set_shutdown_callback(shutdown_callback cb) { callback_ = std::move(cb); }

    // Sets the flag and runs the callback; the callback runs at most once.
    void trigger_shutdown();

    // Installs SIGINT/SIGTERM handlers that call request_shutdown() and
    // ignores SIGPIPE.
    void setup_signal_handlers();

    // Clears the flag and the callback. Forked workers start from a clean state.
    void reset() noexcept;

private:
    shutdown_manager() = default;

    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> callback_ran_{false};
    time_point shutdown_time_;
    shutdown_callback callback_;
};

} // namespace shoal
