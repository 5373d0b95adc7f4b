#include "shoal/core/shutdown.hpp"

#include <cerrno>
#include <csignal>
#include <system_error>

namespace shoal {

namespace {

void handle_termination_signal(int) {
    shutdown_manager::instance().request_shutdown();
}

} // namespace

void shutdown_manager::trigger_shutdown() {
    request_shutdown();
    if (callback_ran_.exchange(true)) {
        return;
    }
    if (shutdown_time_ == time_point{}) {
        record_shutdown_time();
    }
    if (callback_) {
        callback_();
    }
}

void shutdown_manager::setup_signal_handlers() {
    struct sigaction sa {};
    sa.sa_handler = handle_termination_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    if (sigaction(SIGINT, &sa, nullptr) < 0 || sigaction(SIGTERM, &sa, nullptr) < 0) {
        throw std::system_error(errno, std::system_category(), "sigaction failed");
    }

    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    if (sigaction(SIGPIPE, &ignore, nullptr) < 0) {
        throw std::system_error(errno, std::system_category(), "sigaction failed");
    }
}

void shutdown_manager::reset() noexcept {
    shutdown_requested_.store(false, std::memory_order_release);
    callback_ran_.store(false, std::memory_order_release);
    shutdown_time_ = time_point{};
    callback_ = nullptr;
}

} // namespace shoal
