#pragma once

#include <cstdint>
#include <utility>

#include <unistd.h>

namespace shoal {

// Owns a raw descriptor that has not yet been handed to a tcp_socket, such as
// one end of a worker socketpair during spawn. Closes it unless released.
class scoped_fd {
public:
    scoped_fd() noexcept = default;

    explicit scoped_fd(int32_t fd) noexcept : fd_(fd) {}

    ~scoped_fd() noexcept { close_fd(); }

    scoped_fd(scoped_fd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    scoped_fd& operator=(scoped_fd&& other) noexcept {
        if (this != &other) {
            close_fd();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    scoped_fd(const scoped_fd&) = delete;
    scoped_fd& operator=(const scoped_fd&) = delete;

    [[nodiscard]] int32_t release() noexcept { return std::exchange(fd_, -1); }

    [[nodiscard]] int32_t get() const noexcept { return fd_; }

    void reset() noexcept { close_fd(); }

private:
    void close_fd() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    int32_t fd_{-1};
};

} // namespace shoal
