#pragma once

#include "shoal/core/fd_watch.hpp"
#include "shoal/core/http.hpp"
#include "shoal/core/io_buffer.hpp"
#include "shoal/core/reactor.hpp"
#include "shoal/core/tcp_listener.hpp"
#include "shoal/core/tcp_socket.hpp"

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace shoal {
namespace http {

class server;

/// Reply handle for one request.
///
/// Handlers may answer synchronously or keep the responder and call send()
/// later from the same reactor thread (after a worker replied, for instance).
/// Only the first send() is delivered; a responder whose client went away
/// drops the response.
class responder {
public:
    responder() = default;

    bool send(response resp);

    [[nodiscard]] bool is_open() const noexcept;

private:
    friend class server;

    struct connection_state;

    responder(server* owner, std::weak_ptr<connection_state> conn)
        : owner_(owner), conn_(std::move(conn)) {}

    server* owner_ = nullptr;
    std::weak_ptr<connection_state> conn_;
};

using request_handler = std::function<void(request, responder)>;
using request_observer = std::function<void(const request&, const response&)>;

/// HTTP/1.1 server bound to an existing reactor.
///
/// One request per connection: every response carries Connection: close and
/// the socket is closed once the response has been flushed.
class server {
public:
    server(reactor& r, tcp_listener listener, request_handler handler);
    ~server();

    server(const server&) = delete;
    server& operator=(const server&) = delete;

    /// Called with each request and its response just before it is written.
    server& on_request(request_observer callback) {
        on_request_callback_ = std::move(callback);
        return *this;
    }

    /// Starts accepting connections.
    result<void> start();

    /// Closes the listener. Connections in flight are still answered.
    void stop_accepting() noexcept;

    [[nodiscard]] size_t connection_count() const noexcept { return connections_.size(); }

    [[nodiscard]] result<uint16_t> port() const { return listener_.local_port(); }

private:
    friend class responder;
    using connection_state = responder::connection_state;

    void accept_connections();
    void handle_readable(int32_t fd, event_type events);
    void handle_writable(int32_t fd, event_type events);
    bool deliver(const std::shared_ptr<connection_state>& conn, response resp);
    void flush(const std::shared_ptr<connection_state>& conn);
    void close_connection(int32_t fd);

    reactor& reactor_;
    tcp_listener listener_;
    request_handler handler_;
    request_observer on_request_callback_;
    fd_watch accept_watch_;
    std::unordered_map<int32_t, std::shared_ptr<connection_state>> connections_;
};

} // namespace http
} // namespace shoal
