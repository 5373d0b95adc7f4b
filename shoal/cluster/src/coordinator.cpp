#include "shoal/cluster/coordinator.hpp"

#include "shoal/cluster/worker.hpp"
#include "shoal/core/problem.hpp"
#include "shoal/core/shutdown.hpp"

#include <iostream>
#include <thread>

namespace shoal::cluster {

namespace {

constexpr std::string_view WORKER_UNAVAILABLE = "Worker is unavailable.";
constexpr std::string_view WORKER_TIMEOUT = "Worker did not respond in time.";

http::response worker_unavailable() {
    return http::response::error(problem_details::bad_gateway(WORKER_UNAVAILABLE));
}

} // namespace

size_t default_worker_count() noexcept {
    unsigned hw = std::thread::hardware_concurrency();
    return hw > 1 ? hw - 1 : 0;
}

coordinator::coordinator(coordinator_config config)
    : config_(std::move(config)), direct_api_(direct_store_),
      policy_(make_balancing_policy(config_.balance)) {
    child_entry entry = config_.worker_entry;
    if (!entry) {
        entry = [port = config_.port, scope = config_.scope](int ordinal, int channel_fd) {
            return run_worker_process(ordinal, channel_fd, port, scope);
        };
    }
    supervisor_ = std::make_unique<supervisor>(reactor_, config_.supervision, std::move(entry));

    supervisor::events handlers;
    handlers.on_response = [this](int ordinal, response_envelope env) {
        handle_response(ordinal, std::move(env));
    };
    handlers.on_worker_lost = [this](int ordinal) {
        refresh_live_count();
        fail_worker_requests(ordinal);
    };
    handlers.on_worker_started = [this](int) { refresh_live_count(); };
    handlers.on_fatal_exit = [this](int) {
        exit_status_ = 1;
        begin_shutdown();
    };
    supervisor_->set_events(std::move(handlers));
}

coordinator::~coordinator() {
    server_.reset();
    supervisor_.reset();
}

int coordinator::run() {
    if (config_.install_signal_handlers) {
        shutdown_manager::instance().setup_signal_handlers();
    }

    for (size_t i = 1; i <= config_.worker_count; ++i) {
        auto res = supervisor_->spawn(static_cast<int>(i));
        if (!res) {
            std::cerr << "[coordinator] Failed to spawn worker " << i << ": "
                      << res.error().message() << "\n";
            supervisor_->stop_all();
            return 1;
        }
    }

    try {
        tcp_listener listener(config_.port, config_.scope);
        server_ = std::make_unique<http::server>(
            reactor_, std::move(listener), [this](http::request req, http::responder reply) {
                handle_request(std::move(req), std::move(reply));
            });
    } catch (const std::system_error& e) {
        std::cerr << "[coordinator] " << e.what() << "\n";
        supervisor_->stop_all();
        return 1;
    }

    server_->on_request([](const http::request& req, const http::response& resp) {
        std::cout << "[coordinator] " << req.method_token << " " << req.uri << " -> "
                  << resp.status << "\n";
    });

    auto started = server_->start();
    if (!started) {
        std::cerr << "[coordinator] Failed to watch listener: " << started.error().message()
                  << "\n";
        supervisor_->stop_all();
        return 1;
    }

    std::cout << "[coordinator] Load balancer listening on http://localhost:" << config_.port
              << " with " << config_.worker_count << " worker(s), " << to_string(config_.balance)
              << " balancing, restart policy " << to_string(config_.supervision.policy) << "\n";

    schedule_tick();
    ready_.store(true, std::memory_order_release);

    auto res = reactor_.run();
    ready_.store(false, std::memory_order_release);

    if (!res) {
        std::cerr << "[coordinator] Event loop failed: " << res.error().message() << "\n";
        exit_status_ = 1;
    }

    fail_all_pending();
    server_->stop_accepting();
    supervisor_->stop_all();
    refresh_live_count();

    std::cout << "[coordinator] Stopped\n";
    return exit_status_;
}

void coordinator::stop() {
    reactor_.schedule([this] { begin_shutdown(); });
}

void coordinator::handle_request(http::request req, http::responder reply) {
    auto live = supervisor_->live_ordinals();
    if (live.empty()) {
        reply.send(direct_api_.handle(req));
        return;
    }

    auto chosen = policy_->select(live, req.path());
    dispatch_channel* channel = chosen ? supervisor_->channel(*chosen) : nullptr;
    if (!channel) {
        reply.send(worker_unavailable());
        return;
    }

    uint64_t id = next_correlation_id_++;
    auto sent = channel->send(make_request_envelope(id, req));
    if (!sent) {
        std::cerr << "[coordinator] Dispatch to worker " << *chosen
                  << " failed: " << sent.error().message() << "\n";
        reply.send(worker_unavailable());
        return;
    }

    pending_.emplace(id, pending_dispatch{*chosen, std::move(reply)});
    sync_pending_size();

    // Timers are not cancelled; expire() ignores ids that were answered.
    reactor_.schedule_after(config_.dispatch_timeout, [this, id] { expire(id); });
}

void coordinator::handle_response(int ordinal, response_envelope env) {
    auto it = pending_.find(env.correlation_id);
    if (it == pending_.end()) {
        std::cerr << "[coordinator] Dropping late reply " << env.correlation_id << " from worker "
                  << ordinal << "\n";
        return;
    }

    auto reply = std::move(it->second.reply);
    pending_.erase(it);
    sync_pending_size();
    reply.send(to_http_response(env));
}

void coordinator::expire(uint64_t correlation_id) {
    auto it = pending_.find(correlation_id);
    if (it == pending_.end()) {
        return;
    }

    std::cerr << "[coordinator] Worker " << it->second.ordinal << " did not answer request "
              << correlation_id << " within " << config_.dispatch_timeout.count() << " ms\n";
    auto reply = std::move(it->second.reply);
    pending_.erase(it);
    sync_pending_size();
    reply.send(http::response::error(problem_details::gateway_timeout(WORKER_TIMEOUT)));
}

void coordinator::fail_worker_requests(int ordinal) {
    size_t failed = 0;
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->second.ordinal != ordinal) {
            ++it;
            continue;
        }
        auto reply = std::move(it->second.reply);
        it = pending_.erase(it);
        reply.send(worker_unavailable());
        ++failed;
    }
    sync_pending_size();

    if (failed > 0) {
        std::cerr << "[coordinator] Worker " << ordinal << " lost with " << failed
                  << " request(s) in flight\n";
    }
}

void coordinator::fail_all_pending() {
    auto pending = std::move(pending_);
    pending_.clear();
    for (auto& [id, entry] : pending) {
        entry.reply.send(worker_unavailable());
    }
    sync_pending_size();
}

void coordinator::begin_shutdown() {
    if (shutting_down_) {
        return;
    }
    shutting_down_ = true;
    std::cout << "[coordinator] Shutting down\n";
    if (server_) {
        server_->stop_accepting();
    }
    reactor_.stop();
}

void coordinator::schedule_tick() {
    reactor_.schedule_after(config_.tick_interval, [this] {
        supervisor_->reap();
        refresh_live_count();
        if (shutdown_manager::instance().is_shutdown_requested()) {
            begin_shutdown();
            return;
        }
        schedule_tick();
    });
}

void coordinator::refresh_live_count() {
    live_workers_.store(supervisor_->live_ordinals().size(), std::memory_order_release);
}

void coordinator::sync_pending_size() {
    pending_size_.store(pending_.size(), std::memory_order_release);
}

} // namespace shoal::cluster
