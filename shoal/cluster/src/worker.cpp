#include "shoal/cluster/worker.hpp"

#include "shoal/core/shutdown.hpp"

#include <iostream>
#include <variant>

namespace shoal::cluster {

std::string_view to_string(worker_state state) noexcept {
    switch (state) {
    case worker_state::starting:
        return "starting";
    case worker_state::listening:
        return "listening";
    case worker_state::handling:
        return "handling";
    case worker_state::terminated:
        return "terminated";
    }
    return "unknown";
}

worker::worker(worker_config config, tcp_socket channel)
    : config_(config), api_(store_), pending_channel_(std::move(channel)) {}

worker::worker(worker_config config, tcp_socket channel, users::id_generator ids)
    : config_(config), store_(std::move(ids)), api_(store_), pending_channel_(std::move(channel)) {}

std::optional<uint16_t> worker::http_port() const noexcept {
    auto port = bound_port_.load(std::memory_order_acquire);
    if (port == 0) {
        return std::nullopt;
    }
    return port;
}

int worker::run() {
    state_.store(worker_state::starting, std::memory_order_release);

    if (config_.install_signal_handlers) {
        shutdown_manager::instance().setup_signal_handlers();
    }

    if (pending_channel_) {
        channel_ = std::make_unique<dispatch_channel>(reactor_, std::move(pending_channel_));
        auto started = channel_->start([this](frame f) { handle_frame(std::move(f)); },
                                       [this](std::error_code ec) {
                                           std::cout << "[worker " << config_.ordinal
                                                     << "] Coordinator channel closed ("
                                                     << ec.message() << "), exiting\n";
                                           reactor_.stop();
                                       });
        if (!started) {
            std::cerr << "[worker " << config_.ordinal
                      << "] Failed to watch coordinator channel: " << started.error().message()
                      << "\n";
            state_.store(worker_state::terminated, std::memory_order_release);
            return 1;
        }
    }

    if (config_.http_port) {
        try {
            tcp_listener listener(*config_.http_port, config_.scope);
            server_ = std::make_unique<http::server>(
                reactor_, std::move(listener), [this](http::request req, http::responder reply) {
                    state_.store(worker_state::handling, std::memory_order_release);
                    reply.send(api_.handle(req));
                    state_.store(worker_state::listening, std::memory_order_release);
                });
            server_->on_request([this](const http::request& req, const http::response& resp) {
                log_access(req, resp, "http");
            });
            auto res = server_->start();
            if (!res) {
                throw std::system_error(res.error(), "failed to watch listener");
            }
            auto port = server_->port();
            bound_port_.store(port ? *port : *config_.http_port, std::memory_order_release);
            std::cout << "[worker " << config_.ordinal << "] Listening on http://localhost:"
                      << bound_port_.load() << "\n";
        } catch (const std::system_error& e) {
            // The channel alone keeps the worker useful to the coordinator.
            std::cerr << "[worker " << config_.ordinal << "] HTTP listener unavailable: "
                      << e.what() << "\n";
            server_.reset();
        }
    }

    schedule_tick();
    state_.store(worker_state::listening, std::memory_order_release);

    auto res = reactor_.run();

    if (server_) {
        server_->stop_accepting();
    }
    if (channel_) {
        channel_->close();
    }
    state_.store(worker_state::terminated, std::memory_order_release);

    if (!res) {
        std::cerr << "[worker " << config_.ordinal << "] Event loop failed: "
                  << res.error().message() << "\n";
        return 1;
    }
    return 0;
}

void worker::stop() {
    reactor_.stop();
}

void worker::schedule_tick() {
    reactor_.schedule_after(config_.tick_interval, [this] {
        if (shutdown_manager::instance().is_shutdown_requested()) {
            std::cout << "[worker " << config_.ordinal << "] Shutdown requested\n";
            reactor_.stop();
            return;
        }
        schedule_tick();
    });
}

void worker::handle_frame(frame f) {
    auto* env = std::get_if<request_envelope>(&f);
    if (!env) {
        std::cerr << "[worker " << config_.ordinal << "] Unexpected response frame ignored\n";
        return;
    }

    state_.store(worker_state::handling, std::memory_order_release);
    auto req = to_http_request(*env);
    auto resp = api_.handle(req);
    log_access(req, resp, "dispatch");

    auto sent = channel_->send(make_response_envelope(env->correlation_id, resp));
    if (!sent) {
        std::cerr << "[worker " << config_.ordinal << "] Failed to send response "
                  << env->correlation_id << ": " << sent.error().message() << "\n";
    }
    state_.store(worker_state::listening, std::memory_order_release);
}

void worker::log_access(const http::request& req,
                        const http::response& resp,
                        std::string_view via) {
    std::cout << "[worker " << config_.ordinal << "] " << req.method_token << " " << req.uri
              << " -> " << resp.status << " (" << via << ")\n";
}

int run_worker_process(int ordinal, int channel_fd, uint16_t base_port, bind_scope scope) {
    worker_config config;
    config.ordinal = ordinal;
    config.http_port = static_cast<uint16_t>(base_port + ordinal);
    config.scope = scope;
    worker w(config, tcp_socket(channel_fd));
    return w.run();
}

} // namespace shoal::cluster
