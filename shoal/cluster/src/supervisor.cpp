#include "shoal/cluster/supervisor.hpp"

#include "shoal/core/scoped_fd.hpp"
#include "shoal/core/shutdown.hpp"

#include <fcntl.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <iostream>
#include <thread>

namespace shoal::cluster {

namespace {

constexpr auto STOP_POLL_INTERVAL = std::chrono::milliseconds(10);

void close_inherited_fds(int first) noexcept {
    if (::close_range(static_cast<unsigned>(first), ~0U, 0) == 0) {
        return;
    }
    rlimit limit{};
    int max_fd = 1024;
    if (::getrlimit(RLIMIT_NOFILE, &limit) == 0 && limit.rlim_cur != RLIM_INFINITY) {
        max_fd = static_cast<int>(limit.rlim_cur);
    }
    for (int fd = first; fd < max_fd; ++fd) {
        ::close(fd);
    }
}

void log_exit(int ordinal, pid_t pid, int status) {
    std::cout << "[supervisor] Worker " << ordinal << " (pid " << pid << ") ";
    if (WIFEXITED(status)) {
        std::cout << "exited with status " << WEXITSTATUS(status) << "\n";
    } else if (WIFSIGNALED(status)) {
        std::cout << "was killed by signal " << WTERMSIG(status) << "\n";
    } else {
        std::cout << "stopped\n";
    }
}

} // namespace

std::optional<restart_policy> parse_restart_policy(std::string_view text) noexcept {
    if (text == "restart") {
        return restart_policy::restart;
    }
    if (text == "fail-fast" || text == "fail_fast") {
        return restart_policy::fail_fast;
    }
    if (text == "none") {
        return restart_policy::none;
    }
    return std::nullopt;
}

std::string_view to_string(restart_policy policy) noexcept {
    switch (policy) {
    case restart_policy::restart:
        return "restart";
    case restart_policy::fail_fast:
        return "fail-fast";
    case restart_policy::none:
        return "none";
    }
    return "unknown";
}

supervisor::supervisor(reactor& r, supervisor_config config, child_entry entry)
    : reactor_(r), config_(config), entry_(std::move(entry)) {}

supervisor::~supervisor() {
    for (const auto& [ordinal, slot] : slots_) {
        if (slot.pid > 0) {
            stop_all();
            break;
        }
    }
}

result<void> supervisor::spawn(int ordinal) {
    auto& slot = slots_[ordinal];
    if (slot.pid > 0) {
        return std::unexpected(make_error_code(error_code::spawn_failed));
    }

    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) < 0) {
        return std::unexpected(std::error_code(errno, std::system_category()));
    }
    scoped_fd parent_end(fds[0]);
    scoped_fd child_end(fds[1]);

    // Buffered output would otherwise be written twice.
    std::cout.flush();
    std::cerr.flush();

    pid_t parent = ::getpid();
    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(std::error_code(errno, std::system_category()));
    }
    if (pid == 0) {
        run_child(ordinal, child_end.get(), parent);
    }

    child_end.reset();

    slot.pid = pid;
    slot.channel = std::make_unique<dispatch_channel>(reactor_, tcp_socket(parent_end.release()));
    auto started = slot.channel->start(
        [this, ordinal](frame f) {
            if (auto* resp = std::get_if<response_envelope>(&f)) {
                if (events_.on_response) {
                    events_.on_response(ordinal, std::move(*resp));
                }
                return;
            }
            std::cerr << "[supervisor] Worker " << ordinal << " sent a request frame, ignored\n";
        },
        [this, ordinal](std::error_code ec) {
            auto it = slots_.find(ordinal);
            if (it == slots_.end()) {
                return;
            }
            if (!stopping_) {
                std::cerr << "[supervisor] Lost channel to worker " << ordinal << ": "
                          << ec.message() << "\n";
            }
            mark_lost(ordinal, it->second);
        });
    if (!started) {
        ::kill(pid, SIGKILL);
        ::waitpid(pid, nullptr, 0);
        slot.pid = -1;
        slot.channel.reset();
        return std::unexpected(started.error());
    }

    slot.dispatchable = true;
    slot.restart_scheduled = false;
    std::cout << "[supervisor] Worker " << ordinal << " started (pid " << pid << ")\n";

    if (events_.on_worker_started) {
        events_.on_worker_started(ordinal);
    }
    return {};
}

void supervisor::run_child(int ordinal, int channel_fd, pid_t parent) {
    if (channel_fd != CHILD_CHANNEL_FD) {
        if (::dup2(channel_fd, CHILD_CHANNEL_FD) < 0) {
            ::_exit(127);
        }
    } else if (::fcntl(channel_fd, F_SETFD, 0) < 0) {
        ::_exit(127);
    }
    // Drops the parent's epoll instance, listeners and other channels.
    close_inherited_fds(CHILD_CHANNEL_FD + 1);

    ::prctl(PR_SET_PDEATHSIG, SIGTERM);
    if (::getppid() != parent) {
        ::_exit(0);
    }

    ::signal(SIGINT, SIG_DFL);
    ::signal(SIGTERM, SIG_DFL);
    shutdown_manager::instance().reset();

    int status = 1;
    try {
        status = entry_(ordinal, CHILD_CHANNEL_FD);
    } catch (const std::exception& e) {
        std::cerr << "[worker " << ordinal << "] Fatal error: " << e.what() << "\n";
    } catch (...) {
        std::cerr << "[worker " << ordinal << "] Fatal error: unknown exception\n";
    }

    std::cout.flush();
    std::cerr.flush();
    ::_exit(status);
}

void supervisor::mark_lost(int ordinal, worker_slot& slot) {
    if (!slot.dispatchable) {
        return;
    }
    slot.dispatchable = false;

    if (slot.pid > 0 && !stopping_) {
        ::kill(slot.pid, SIGTERM);
    }
    if (events_.on_worker_lost) {
        events_.on_worker_lost(ordinal);
    }
}

void supervisor::reap() {
    for (auto& [ordinal, slot] : slots_) {
        if (slot.pid <= 0) {
            continue;
        }
        int status = 0;
        pid_t res = ::waitpid(slot.pid, &status, WNOHANG);
        if (res == slot.pid || (res < 0 && errno == ECHILD)) {
            handle_exit(ordinal, status);
        }
    }
}

void supervisor::handle_exit(int ordinal, int status) {
    auto& slot = slots_[ordinal];
    log_exit(ordinal, slot.pid, status);

    slot.pid = -1;
    mark_lost(ordinal, slot);
    slot.channel.reset();

    if (stopping_) {
        return;
    }

    switch (config_.policy) {
    case restart_policy::restart: {
        if (slot.restarts >= config_.max_restarts) {
            std::cerr << "[supervisor] Worker " << ordinal << " reached the restart limit ("
                      << config_.max_restarts << "), leaving it down\n";
            return;
        }
        ++slot.restarts;
        slot.restart_scheduled = true;
        std::cout << "[supervisor] Restarting worker " << ordinal << " in "
                  << config_.restart_delay.count() << " ms (attempt " << slot.restarts << "/"
                  << config_.max_restarts << ")\n";
        reactor_.schedule_after(config_.restart_delay, [this, ordinal] {
            auto it = slots_.find(ordinal);
            if (stopping_ || it == slots_.end() || !it->second.restart_scheduled) {
                return;
            }
            it->second.restart_scheduled = false;
            auto res = spawn(ordinal);
            if (!res) {
                std::cerr << "[supervisor] Failed to restart worker " << ordinal << ": "
                          << res.error().message() << "\n";
            }
        });
        break;
    }
    case restart_policy::fail_fast:
        std::cerr << "[supervisor] Worker " << ordinal << " died, shutting down (fail-fast)\n";
        if (events_.on_fatal_exit) {
            events_.on_fatal_exit(ordinal);
        }
        break;
    case restart_policy::none:
        std::cout << "[supervisor] Worker " << ordinal << " will not be restarted\n";
        break;
    }
}

void supervisor::stop_all() {
    stopping_ = true;

    for (auto& [ordinal, slot] : slots_) {
        slot.dispatchable = false;
        slot.restart_scheduled = false;
        if (slot.pid > 0) {
            ::kill(slot.pid, SIGTERM);
        }
    }

    auto deadline = std::chrono::steady_clock::now() + config_.stop_grace;
    while (true) {
        bool remaining = false;
        for (auto& [ordinal, slot] : slots_) {
            if (slot.pid <= 0) {
                continue;
            }
            int status = 0;
            pid_t res = ::waitpid(slot.pid, &status, WNOHANG);
            if (res == slot.pid || (res < 0 && errno == ECHILD)) {
                log_exit(ordinal, slot.pid, status);
                slot.pid = -1;
            } else {
                remaining = true;
            }
        }
        if (!remaining || std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(STOP_POLL_INTERVAL);
    }

    for (auto& [ordinal, slot] : slots_) {
        if (slot.pid > 0) {
            std::cerr << "[supervisor] Worker " << ordinal
                      << " did not stop within the grace period, sending SIGKILL\n";
            ::kill(slot.pid, SIGKILL);
            int status = 0;
            pid_t res;
            do {
                res = ::waitpid(slot.pid, &status, 0);
            } while (res < 0 && errno == EINTR);
            log_exit(ordinal, slot.pid, status);
            slot.pid = -1;
        }
        slot.channel.reset();
    }
}

dispatch_channel* supervisor::channel(int ordinal) noexcept {
    auto it = slots_.find(ordinal);
    if (it == slots_.end() || !it->second.dispatchable || !it->second.channel) {
        return nullptr;
    }
    return it->second.channel.get();
}

std::vector<int> supervisor::live_ordinals() const {
    std::vector<int> live;
    live.reserve(slots_.size());
    for (const auto& [ordinal, slot] : slots_) {
        if (slot.dispatchable) {
            live.push_back(ordinal);
        }
    }
    return live;
}

std::optional<pid_t> supervisor::pid_of(int ordinal) const noexcept {
    auto it = slots_.find(ordinal);
    if (it == slots_.end() || it->second.pid <= 0) {
        return std::nullopt;
    }
    return it->second.pid;
}

int supervisor::restart_count(int ordinal) const noexcept {
    auto it = slots_.find(ordinal);
    return it == slots_.end() ? 0 : it->second.restarts;
}

} // namespace shoal::cluster
