#pragma once

#include "shoal/cluster/balancer.hpp"
#include "shoal/cluster/supervisor.hpp"
#include "shoal/cluster/wire.hpp"
#include "shoal/core/epoll_reactor.hpp"
#include "shoal/core/http_server.hpp"
#include "shoal/core/tcp_listener.hpp"
#include "shoal/users/user_api.hpp"
#include "shoal/users/user_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <unordered_map>

namespace shoal::cluster {

struct coordinator_config {
    uint16_t port = 4000;
    // 0 serves every request from the coordinator's own store.
    size_t worker_count = 0;
    std::chrono::milliseconds dispatch_timeout{5000};
    supervisor_config supervision;
    balancing balance = balancing::round_robin;
    bind_scope scope = bind_scope::any;
    bool install_signal_handlers = true;
    std::chrono::milliseconds tick_interval{100};
    // Body of each forked worker; empty runs a regular worker on port + ordinal.
    child_entry worker_entry;
};

// Default worker count: one per hardware thread, minus the coordinator.
size_t default_worker_count() noexcept;

/// Primary process: owns the public listener and forwards each request to a
/// worker over its dispatch channel.
///
/// Every dispatched request has a deadline. A worker that misses it yields
/// 504, a worker that dies with requests in flight yields 502 for each of
/// them. With no live worker the coordinator answers from its own store.
class coordinator {
public:
    explicit coordinator(coordinator_config config);
    ~coordinator();

    coordinator(const coordinator&) = delete;
    coordinator& operator=(const coordinator&) = delete;

    // Spawns the workers, serves until shutdown and returns the exit status.
    int run();

    // Thread-safe.
    void stop();

    [[nodiscard]] bool is_ready() const noexcept { return ready_.load(std::memory_order_acquire); }

    [[nodiscard]] size_t live_worker_count() const noexcept {
        return live_workers_.load(std::memory_order_acquire);
    }

    [[nodiscard]] size_t pending_count() const noexcept {
        return pending_size_.load(std::memory_order_acquire);
    }

private:
    struct pending_dispatch {
        int ordinal = 0;
        http::responder reply;
    };

    void handle_request(http::request req, http::responder reply);
    void handle_response(int ordinal, response_envelope env);
    void expire(uint64_t correlation_id);
    void fail_worker_requests(int ordinal);
    void fail_all_pending();
    void begin_shutdown();
    void schedule_tick();
    void refresh_live_count();
    void sync_pending_size();

    coordinator_config config_;
    epoll_reactor reactor_;
    users::user_store direct_store_;
    users::user_api direct_api_;
    std::unique_ptr<balancing_policy> policy_;
    std::unique_ptr<supervisor> supervisor_;
    std::unique_ptr<http::server> server_;
    std::unordered_map<uint64_t, pending_dispatch> pending_;
    uint64_t next_correlation_id_ = 1;
    bool shutting_down_ = false;
    int exit_status_ = 0;
    std::atomic<bool> ready_{false};
    std::atomic<size_t> live_workers_{0};
    std::atomic<size_t> pending_size_{0};
};

} // namespace shoal::cluster
