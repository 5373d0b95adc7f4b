#pragma once

#include "shoal/cluster/wire.hpp"
#include "shoal/core/fd_watch.hpp"
#include "shoal/core/reactor.hpp"
#include "shoal/core/result.hpp"
#include "shoal/core/tcp_socket.hpp"

#include <functional>
#include <string>
#include <system_error>

namespace shoal::cluster {

/// Framed, bidirectional link over one end of a socketpair.
///
/// Incoming frames are delivered to the frame handler in arrival order.
/// End of stream, a socket error or a protocol violation closes the channel
/// and invokes the close handler once; the close handler may destroy the
/// channel, the frame handler must not.
class dispatch_channel {
public:
    using frame_handler = std::function<void(frame)>;
    using close_handler = std::function<void(std::error_code)>;

    dispatch_channel(reactor& r, tcp_socket socket);
    ~dispatch_channel();

    dispatch_channel(const dispatch_channel&) = delete;
    dispatch_channel& operator=(const dispatch_channel&) = delete;

    result<void> start(frame_handler on_frame, close_handler on_close);

    // Queues the frame and writes as much as the socket accepts. Fails with
    // error_code::channel_closed once closed, or with the socket error.
    result<void> send(const request_envelope& env);
    result<void> send(const response_envelope& env);

    // Closes without invoking the close handler.
    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return static_cast<bool>(socket_); }

    [[nodiscard]] size_t pending_bytes() const noexcept { return out_.size() - out_offset_; }

private:
    result<void> flush();
    void handle_events(event_type events);
    void fail(std::error_code ec);

    reactor& reactor_;
    tcp_socket socket_;
    fd_watch watch_;
    frame_decoder decoder_;
    std::string out_;
    size_t out_offset_ = 0;
    bool want_write_ = false;
    frame_handler on_frame_;
    close_handler on_close_;
};

} // namespace shoal::cluster
