#include "shoal/core/tcp_listener.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace shoal {

tcp_listener::tcp_listener(uint16_t port, bind_scope scope) {
    auto res = create_and_bind(port, scope);
    if (!res) {
        socket_ = tcp_socket{};
        throw std::system_error(res.error(), "failed to bind port " + std::to_string(port));
    }

    if (::listen(socket_.native_handle(), backlog_) < 0) {
        auto err = errno;
        socket_ = tcp_socket{};
        throw std::system_error(err, std::system_category(), "listen failed");
    }
}

result<void> tcp_listener::create_and_bind(uint16_t port, bind_scope scope) {
    int32_t fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        return std::unexpected(std::error_code(errno, std::system_category()));
    }

    socket_ = tcp_socket(fd);

    int opt = 1;
    if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return std::unexpected(std::error_code(errno, std::system_category()));
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(scope == bind_scope::loopback ? INADDR_LOOPBACK : INADDR_ANY);
    addr.sin_port = htons(port);

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        return std::unexpected(std::error_code(errno, std::system_category()));
    }

    return {};
}

result<tcp_socket> tcp_listener::accept() {
    int32_t fd;
    do {
        fd = ::accept4(socket_.native_handle(), nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0) {
        return std::unexpected(std::error_code(errno, std::system_category()));
    }

    int opt = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt));
    return tcp_socket(fd);
}

result<uint16_t> tcp_listener::local_port() const {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(socket_.native_handle(), reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return std::unexpected(std::error_code(errno, std::system_category()));
    }
    return ntohs(addr.sin_port);
}

} // namespace shoal
