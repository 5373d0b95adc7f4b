#include "shoal/core/http_server.hpp"
#include "shoal/core/problem.hpp"

#include <cerrno>
#include <iostream>

namespace shoal {
namespace http {

namespace {

constexpr size_t READ_CHUNK_SIZE = 4096;

bool would_block(const std::error_code& ec) noexcept {
    return ec.category() == std::system_category() &&
           (ec.value() == EAGAIN || ec.value() == EWOULDBLOCK);
}

} // namespace

struct responder::connection_state {
    tcp_socket socket;
    io_buffer read_buffer;
    std::string write_buffer;
    size_t write_offset = 0;
    parser http_parser;
    fd_watch watch;
    // Method token and URI of the parsed request, kept for the observer.
    request summary;
    bool responded = false;

    explicit connection_state(tcp_socket sock) : socket(std::move(sock)) {}
};

bool responder::send(response resp) {
    auto conn = conn_.lock();
    if (!owner_ || !conn || conn->responded) {
        return false;
    }
    return owner_->deliver(conn, std::move(resp));
}

bool responder::is_open() const noexcept {
    auto conn = conn_.lock();
    return conn && !conn->responded;
}

server::server(reactor& r, tcp_listener listener, request_handler handler)
    : reactor_(r), listener_(std::move(listener)), handler_(std::move(handler)) {}

server::~server() {
    accept_watch_.unregister();
    connections_.clear();
}

result<void> server::start() {
    if (!listener_) {
        return std::unexpected(make_error_code(error_code::invalid_fd));
    }

    accept_watch_ = fd_watch(reactor_, listener_.native_handle(), event_type::readable,
                             [this](event_type) { accept_connections(); });
    if (!accept_watch_.is_registered()) {
        return std::unexpected(make_error_code(error_code::epoll_ctl_failed));
    }
    return {};
}

void server::stop_accepting() noexcept {
    accept_watch_.unregister();
    listener_.close();
}

void server::accept_connections() {
    while (true) {
        auto accepted = listener_.accept();
        if (!accepted) {
            if (!would_block(accepted.error()) && accepted.error() != std::errc::connection_aborted) {
                std::cerr << "[http] accept failed: " << accepted.error().message() << "\n";
            }
            return;
        }

        int32_t fd = accepted->native_handle();
        auto conn = std::make_shared<connection_state>(std::move(*accepted));
        conn->watch = fd_watch(reactor_, fd, event_type::readable, [this, fd](event_type ev) {
            auto it = connections_.find(fd);
            if (it == connections_.end()) {
                return;
            }
            if (it->second->responded) {
                handle_writable(fd, ev);
            } else {
                handle_readable(fd, ev);
            }
        });

        if (!conn->watch.is_registered()) {
            std::cerr << "[http] failed to watch connection fd=" << fd << "\n";
            continue;
        }
        connections_[fd] = std::move(conn);
    }
}

void server::handle_readable(int32_t fd, event_type events) {
    auto conn = connections_.at(fd);

    if (conn->http_parser.is_complete()) {
        // Waiting for a deferred response; only a vanished client matters now.
        if (has_flag(events, event_type::hup) || has_flag(events, event_type::error)) {
            close_connection(fd);
        }
        return;
    }

    while (true) {
        auto buf = conn->read_buffer.writable_span(READ_CHUNK_SIZE);
        auto read_result = conn->socket.read(buf);

        if (!read_result) {
            // EOF or reset before a full request arrived.
            close_connection(fd);
            return;
        }

        if (read_result->empty()) {
            return;
        }

        conn->read_buffer.commit(read_result->size());
        auto parse_result = conn->http_parser.parse(conn->read_buffer.readable_span());
        conn->read_buffer.clear();

        if (!parse_result) {
            auto problem = parse_result.error() == error_code::message_too_large
                               ? problem_details::content_too_large("Request is too large.")
                               : problem_details::bad_request("Malformed HTTP request.");
            conn->summary.method_token = "-";
            conn->summary.uri = "-";
            deliver(conn, response::error(problem));
            return;
        }

        if (conn->http_parser.is_complete()) {
            break;
        }
    }

    // Stop read interest; hangups are still reported by epoll.
    (void)conn->watch.modify(event_type::none);

    request req = conn->http_parser.take_request();
    conn->summary.http_method = req.http_method;
    conn->summary.method_token = req.method_token;
    conn->summary.uri = req.uri;

    handler_(std::move(req), responder(this, conn));
}

bool server::deliver(const std::shared_ptr<connection_state>& conn, response resp) {
    conn->responded = true;
    resp.set_header("Connection", "close");

    if (on_request_callback_) {
        on_request_callback_(conn->summary, resp);
    }

    resp.serialize_into(conn->write_buffer);
    flush(conn);
    return true;
}

void server::handle_writable(int32_t fd, event_type events) {
    auto it = connections_.find(fd);
    if (it == connections_.end()) {
        return;
    }
    if (has_flag(events, event_type::error)) {
        close_connection(fd);
        return;
    }
    flush(it->second);
}

void server::flush(const std::shared_ptr<connection_state>& conn) {
    int32_t fd = conn->socket.native_handle();

    while (conn->write_offset < conn->write_buffer.size()) {
        std::string_view pending(conn->write_buffer);
        pending.remove_prefix(conn->write_offset);
        auto written = conn->socket.write(as_bytes(pending));

        if (!written) {
            close_connection(fd);
            return;
        }
        if (*written == 0) {
            (void)conn->watch.modify(event_type::writable);
            return;
        }
        conn->write_offset += *written;
    }

    conn->socket.shutdown_write();
    close_connection(fd);
}

void server::close_connection(int32_t fd) {
    auto it = connections_.find(fd);
    if (it == connections_.end()) {
        return;
    }
    auto conn = std::move(it->second);
    connections_.erase(it);
    conn->watch.unregister();
    conn->socket.close();
}

} // namespace http
} // namespace shoal
