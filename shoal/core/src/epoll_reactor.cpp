#include "shoal/core/epoll_reactor.hpp"

#include <sys/epoll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <iostream>

namespace shoal {

namespace {

constexpr int32_t MAX_WAIT_MS = 1000;

std::error_code last_error() {
    return std::error_code(errno, std::system_category());
}

uint32_t epoll_interest(event_type events) noexcept {
    uint32_t mask = 0;
    if (has_flag(events, event_type::readable)) {
        mask |= EPOLLIN | EPOLLRDHUP;
    }
    if (has_flag(events, event_type::writable)) {
        mask |= EPOLLOUT;
    }
    return mask;
}

event_type readiness(uint32_t mask) noexcept {
    event_type ev = event_type::none;
    if (mask & EPOLLIN) {
        ev = ev | event_type::readable;
    }
    if (mask & EPOLLOUT) {
        ev = ev | event_type::writable;
    }
    if (mask & EPOLLERR) {
        ev = ev | event_type::error;
    }
    if (mask & (EPOLLHUP | EPOLLRDHUP)) {
        ev = ev | event_type::hup;
    }
    return ev;
}

void log_exception(const exception_context& ctx) {
    std::cerr << "[reactor] Exception in " << ctx.location;
    if (ctx.fd >= 0) {
        std::cerr << " (fd=" << ctx.fd << ")";
    }
    try {
        if (ctx.exception) {
            std::rethrow_exception(ctx.exception);
        }
        std::cerr << "\n";
    } catch (const std::exception& e) {
        std::cerr << ": " << e.what() << "\n";
    } catch (...) {
        std::cerr << ": unknown exception\n";
    }
}

} // namespace

epoll_reactor::epoll_reactor()
    : epoll_fd_(::epoll_create1(EPOLL_CLOEXEC)), exception_handler_(log_exception) {
    if (epoll_fd_.get() < 0) {
        throw std::system_error(last_error(), "epoll_create1 failed");
    }

    wakeup_fd_ = scoped_fd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC));
    if (wakeup_fd_.get() < 0) {
        throw std::system_error(last_error(), "eventfd failed");
    }

    epoll_event ev{};
    ev.events = EPOLLIN | EPOLLET;
    ev.data.fd = wakeup_fd_.get();
    if (::epoll_ctl(epoll_fd_.get(), EPOLL_CTL_ADD, wakeup_fd_.get(), &ev) < 0) {
        throw std::system_error(last_error(), "failed to watch the wakeup fd");
    }
}

result<void> epoll_reactor::run() {
    if (running_.exchange(true)) {
        return std::unexpected(make_error_code(error_code::reactor_stopped));
    }

    while (!stop_requested_.load(std::memory_order_acquire)) {
        collect_incoming();
        run_due(clock::now());
        if (stop_requested_.load(std::memory_order_acquire)) {
            break;
        }

        int32_t count = ::epoll_wait(epoll_fd_.get(), ready_.data(), static_cast<int>(MAX_EVENTS),
                                     wait_timeout());
        if (count < 0) {
            if (errno == EINTR) {
                continue;
            }
            auto err = last_error();
            running_ = false;
            return std::unexpected(err);
        }
        dispatch_ready(count);
    }

    // Tasks posted by whoever stopped the loop still run; pending timers do not.
    collect_incoming();
    run_due(IMMEDIATE);
    running_ = false;
    stop_requested_ = false;
    return {};
}

void epoll_reactor::stop() {
    stop_requested_.store(true, std::memory_order_release);
    wake();
}

event_callback* epoll_reactor::callback_for(int32_t fd) noexcept {
    if (fd < 0 || static_cast<size_t>(fd) >= callbacks_.size()) {
        return nullptr;
    }
    auto& cb = callbacks_[static_cast<size_t>(fd)];
    return cb ? &cb : nullptr;
}

result<void> epoll_reactor::register_fd(int32_t fd, event_type events, event_callback callback) {
    if (fd < 0 || static_cast<size_t>(fd) >= MAX_TRACKED_FDS || !callback) {
        return std::unexpected(make_error_code(error_code::invalid_fd));
    }

    epoll_event ev{};
    ev.events = epoll_interest(events);
    ev.data.fd = fd;
    if (::epoll_ctl(epoll_fd_.get(), EPOLL_CTL_ADD, fd, &ev) < 0) {
        return std::unexpected(last_error());
    }

    if (static_cast<size_t>(fd) >= callbacks_.size()) {
        callbacks_.resize(static_cast<size_t>(fd) + 1);
    }
    callbacks_[static_cast<size_t>(fd)] = std::move(callback);
    return {};
}

result<void> epoll_reactor::modify_fd(int32_t fd, event_type events) {
    if (!callback_for(fd)) {
        return std::unexpected(make_error_code(error_code::invalid_fd));
    }

    epoll_event ev{};
    ev.events = epoll_interest(events);
    ev.data.fd = fd;
    if (::epoll_ctl(epoll_fd_.get(), EPOLL_CTL_MOD, fd, &ev) < 0) {
        return std::unexpected(last_error());
    }
    return {};
}

result<void> epoll_reactor::unregister_fd(int32_t fd) {
    auto* cb = callback_for(fd);
    if (!cb) {
        return std::unexpected(make_error_code(error_code::invalid_fd));
    }

    *cb = nullptr;
    if (::epoll_ctl(epoll_fd_.get(), EPOLL_CTL_DEL, fd, nullptr) < 0) {
        return std::unexpected(last_error());
    }
    return {};
}

bool epoll_reactor::schedule(task_fn task) {
    return enqueue(IMMEDIATE, std::move(task));
}

bool epoll_reactor::schedule_after(std::chrono::milliseconds delay, task_fn task) {
    return enqueue(clock::now() + delay, std::move(task));
}

bool epoll_reactor::enqueue(clock::time_point due, task_fn task) {
    {
        std::lock_guard<std::mutex> lock(incoming_mutex_);
        incoming_.push_back(queued_task{due, next_sequence_++, std::move(task)});
    }
    wake();
    return true;
}

void epoll_reactor::set_exception_handler(exception_handler handler) {
    exception_handler_ = std::move(handler);
}

void epoll_reactor::wake() noexcept {
    uint64_t one = 1;
    [[maybe_unused]] auto n = ::write(wakeup_fd_.get(), &one, sizeof(one));
}

void epoll_reactor::collect_incoming() {
    std::lock_guard<std::mutex> lock(incoming_mutex_);
    for (auto& entry : incoming_) {
        queue_.push(std::move(entry));
    }
    incoming_.clear();
}

// Runs everything due at `now`. Work queued meanwhile waits for the next pass.
void epoll_reactor::run_due(clock::time_point now) {
    while (!queue_.empty() && queue_.top().due <= now) {
        auto entry = std::move(const_cast<queued_task&>(queue_.top()));
        queue_.pop();
        try {
            entry.task();
        } catch (...) {
            report(entry.due == IMMEDIATE ? "scheduled_task" : "delayed_task",
                   std::current_exception());
        }
    }
}

void epoll_reactor::dispatch_ready(int32_t count) {
    for (int32_t i = 0; i < count; ++i) {
        const auto& item = ready_[static_cast<size_t>(i)];
        int32_t fd = item.data.fd;
        if (fd == wakeup_fd_.get()) {
            uint64_t drained;
            [[maybe_unused]] auto n = ::read(fd, &drained, sizeof(drained));
            continue;
        }

        auto* cb = callback_for(fd);
        if (!cb) {
            continue;
        }
        // A copy: the callback may unregister its own fd or register others.
        auto callback = *cb;
        try {
            callback(readiness(item.events));
        } catch (...) {
            report("fd_callback", std::current_exception(), fd);
        }
    }
}

int32_t epoll_reactor::wait_timeout() {
    {
        std::lock_guard<std::mutex> lock(incoming_mutex_);
        if (!incoming_.empty()) {
            return 0;
        }
    }
    if (queue_.empty()) {
        return MAX_WAIT_MS;
    }

    auto now = clock::now();
    auto due = queue_.top().due;
    if (due <= now) {
        return 0;
    }
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(due - now).count();
    // Rounded up so a timer is never polled a millisecond early.
    return static_cast<int32_t>(std::min<int64_t>(ms + 1, MAX_WAIT_MS));
}

void epoll_reactor::report(std::string_view location, std::exception_ptr ex, int32_t fd) noexcept {
    if (!exception_handler_) {
        return;
    }
    try {
        exception_handler_(exception_context{location, ex, fd});
    } catch (...) {
        std::cerr << "[reactor] Exception handler threw\n";
    }
}

} // namespace shoal
