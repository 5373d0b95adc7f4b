#pragma once

#include "shoal/cluster/channel.hpp"
#include "shoal/core/epoll_reactor.hpp"
#include "shoal/core/http_server.hpp"
#include "shoal/core/tcp_listener.hpp"
#include "shoal/users/user_api.hpp"
#include "shoal/users/user_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace shoal::cluster {

enum class worker_state : uint8_t { starting, listening, handling, terminated };

std::string_view to_string(worker_state state) noexcept;

struct worker_config {
    int ordinal = 1;
    // Direct HTTP port; nullopt serves the channel only.
    std::optional<uint16_t> http_port;
    bind_scope scope = bind_scope::any;
    bool install_signal_handlers = true;
    std::chrono::milliseconds tick_interval{100};
};

/// One worker process: a user store served over HTTP on its own port and
/// over the dispatch channel from the coordinator.
///
/// Stops on SIGTERM/SIGINT (through shutdown_manager), on stop(), or when the
/// coordinator side of the channel closes.
class worker {
public:
    // channel may be empty for a standalone worker.
    worker(worker_config config, tcp_socket channel);
    worker(worker_config config, tcp_socket channel, users::id_generator ids);

    worker(const worker&) = delete;
    worker& operator=(const worker&) = delete;

    // Runs until stopped; returns the process exit status.
    int run();

    // Thread-safe.
    void stop();

    [[nodiscard]] worker_state state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::optional<uint16_t> http_port() const noexcept;

private:
    void handle_frame(frame f);
    void schedule_tick();
    void log_access(const http::request& req, const http::response& resp, std::string_view via);

    worker_config config_;
    epoll_reactor reactor_;
    users::user_store store_;
    users::user_api api_;
    tcp_socket pending_channel_;
    std::unique_ptr<dispatch_channel> channel_;
    std::unique_ptr<http::server> server_;
    std::atomic<worker_state> state_{worker_state::starting};
    std::atomic<uint16_t> bound_port_{0};
};

// Entry point used in forked children: wraps channel_fd and runs a worker on
// base_port + ordinal.
int run_worker_process(int ordinal, int channel_fd, uint16_t base_port, bind_scope scope);

} // namespace shoal::cluster
