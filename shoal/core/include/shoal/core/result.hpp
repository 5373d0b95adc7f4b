#pragma once

#include <expected>
#include <string>
#include <system_error>

namespace shoal {

template <typename T> using result = std::expected<T, std::error_code>;

enum class error_code : int {
    ok = 0,
    epoll_create_failed = 1,
    epoll_ctl_failed = 2,
    epoll_wait_failed = 3,
    invalid_fd = 4,
    reactor_stopped = 5,
    timeout = 6,
    malformed_request = 7,
    message_too_large = 8,
    malformed_frame = 9,
    channel_closed = 10,
    spawn_failed = 11,
    not_found = 12,
    method_not_allowed = 13,
};

class error_category : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "shoal"; }

    [[nodiscard]] std::string message(int ev) const override {
        using ec = error_code;
        switch (static_cast<ec>(ev)) {
        case ec::ok:
            return "success";
        case ec::epoll_create_failed:
            return "epoll_create failed";
        case ec::epoll_ctl_failed:
            return "epoll_ctl failed";
        case ec::epoll_wait_failed:
            return "epoll_wait failed";
        case ec::invalid_fd:
            return "invalid file descriptor";
        case ec::reactor_stopped:
            return "reactor is stopped";
        case ec::timeout:
            return "operation timed out";
        case ec::malformed_request:
            return "malformed HTTP request";
        case ec::message_too_large:
            return "message exceeds size limit";
        case ec::malformed_frame:
            return "malformed dispatch frame";
        case ec::channel_closed:
            return "dispatch channel closed";
        case ec::spawn_failed:
            return "failed to spawn worker process";
        case ec::not_found:
            return "route not found";
        case ec::method_not_allowed:
            return "method not allowed";
        default:
            return "unknown error";
        }
    }
};

inline const error_category& get_error_category() {
    static error_category const instance;
    return instance;
}

inline std::error_code make_error_code(error_code e) {
    return {static_cast<int>(e), get_error_category()};
}

} // namespace shoal

namespace std {
template <> struct is_error_code_enum<shoal::error_code> : true_type {};
} // namespace std
