#pragma once

#include "result.hpp"
#include "tcp_socket.hpp"

#include <cstdint>
#include <system_error>

namespace shoal {

enum class bind_scope : uint8_t { any, loopback };

class tcp_listener {
public:
    tcp_listener() = default;

    // Binds and listens; throws std::system_error when the port is unavailable.
    // Port 0 picks an ephemeral port, see local_port().
    explicit tcp_listener(uint16_t port, bind_scope scope = bind_scope::any);

    tcp_listener(tcp_listener&& other) noexcept
        : socket_(std::move(other.socket_)), backlog_(other.backlog_) {}

    tcp_listener& operator=(tcp_listener&& other) noexcept {
        if (this != &other) {
            socket_ = std::move(other.socket_);
            backlog_ = other.backlog_;
        }
        return *this;
    }

    tcp_listener(const tcp_listener&) = delete;
    tcp_listener& operator=(const tcp_listener&) = delete;

    result<tcp_socket> accept();

    [[nodiscard]] result<uint16_t> local_port() const;

    [[nodiscard]] int32_t native_handle() const noexcept { return socket_.native_handle(); }

    [[nodiscard]] explicit operator bool() const noexcept { return static_cast<bool>(socket_); }

    void close() noexcept { socket_.close(); }

private:
    result<void> create_and_bind(uint16_t port, bind_scope scope);

    tcp_socket socket_;
    int32_t backlog_{1024};
};

} // namespace shoal
