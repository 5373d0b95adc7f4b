#include "shoal/core/tcp_socket.hpp"

#include <cerrno>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace shoal {

result<std::span<uint8_t>> tcp_socket::read(std::span<uint8_t> buf) {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(error_code::invalid_fd));
    }

    ssize_t n;
    do {
        n = ::read(fd_, buf.data(), buf.size());
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return std::span<uint8_t>{};
        }
        return std::unexpected(std::error_code(errno, std::system_category()));
    }

    if (n == 0 && !buf.empty()) {
        return std::unexpected(make_error_code(error_code::channel_closed));
    }

    return buf.subspan(0, static_cast<size_t>(n));
}

result<size_t> tcp_socket::write(std::span<const uint8_t> data) {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(error_code::invalid_fd));
    }

    size_t total_written = 0;
    while (total_written < data.size()) {
        ssize_t n;
        do {
            n = ::send(fd_, data.data() + total_written, data.size() - total_written,
                       MSG_NOSIGNAL);
        } while (n < 0 && errno == EINTR);

        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                break;
            }
            return std::unexpected(std::error_code(errno, std::system_category()));
        }
        if (n == 0) {
            break;
        }

        total_written += static_cast<size_t>(n);
    }

    return total_written;
}

void tcp_socket::shutdown_write() noexcept {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_WR);
    }
}

void tcp_socket::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace shoal
