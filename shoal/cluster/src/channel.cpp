#include "shoal/cluster/channel.hpp"

#include <fcntl.h>

#include <cerrno>

namespace shoal::cluster {

namespace {

constexpr size_t READ_CHUNK_SIZE = 16384;
constexpr size_t COMPACT_THRESHOLD = 64UL * 1024UL;

} // namespace

dispatch_channel::dispatch_channel(reactor& r, tcp_socket socket)
    : reactor_(r), socket_(std::move(socket)) {}

dispatch_channel::~dispatch_channel() {
    close();
}

result<void> dispatch_channel::start(frame_handler on_frame, close_handler on_close) {
    if (!socket_) {
        return std::unexpected(make_error_code(error_code::channel_closed));
    }

    int flags = ::fcntl(socket_.native_handle(), F_GETFL, 0);
    if (flags < 0 || ::fcntl(socket_.native_handle(), F_SETFL, flags | O_NONBLOCK) < 0) {
        return std::unexpected(std::error_code(errno, std::system_category()));
    }

    on_frame_ = std::move(on_frame);
    on_close_ = std::move(on_close);
    watch_ = fd_watch(reactor_, socket_.native_handle(), event_type::readable,
                      [this](event_type events) { handle_events(events); });
    if (!watch_.is_registered()) {
        return std::unexpected(make_error_code(error_code::epoll_ctl_failed));
    }
    return {};
}

result<void> dispatch_channel::send(const request_envelope& env) {
    if (!socket_) {
        return std::unexpected(make_error_code(error_code::channel_closed));
    }
    encode_into(env, out_);
    return flush();
}

result<void> dispatch_channel::send(const response_envelope& env) {
    if (!socket_) {
        return std::unexpected(make_error_code(error_code::channel_closed));
    }
    encode_into(env, out_);
    return flush();
}

void dispatch_channel::close() noexcept {
    watch_.unregister();
    socket_.close();
    out_.clear();
    out_offset_ = 0;
}

result<void> dispatch_channel::flush() {
    while (out_offset_ < out_.size()) {
        std::string_view pending(out_);
        pending.remove_prefix(out_offset_);
        auto written = socket_.write(http::as_bytes(pending));
        if (!written) {
            // The read side reports the hangup and closes the channel.
            return std::unexpected(written.error());
        }
        if (*written == 0) {
            break;
        }
        out_offset_ += *written;
    }

    if (out_offset_ == out_.size()) {
        out_.clear();
        out_offset_ = 0;
    } else if (out_offset_ > COMPACT_THRESHOLD) {
        out_.erase(0, out_offset_);
        out_offset_ = 0;
    }

    bool need_write = !out_.empty();
    if (need_write != want_write_ && watch_.is_registered()) {
        auto events = need_write ? event_type::readable | event_type::writable : event_type::readable;
        auto res = watch_.modify(events);
        if (!res) {
            return res;
        }
        want_write_ = need_write;
    }
    return {};
}

void dispatch_channel::handle_events(event_type events) {
    if (has_flag(events, event_type::writable)) {
        auto res = flush();
        if (!res) {
            fail(res.error());
            return;
        }
    }

    if (!has_flag(events, event_type::readable) && !has_flag(events, event_type::hup) &&
        !has_flag(events, event_type::error)) {
        return;
    }

    while (socket_) {
        uint8_t chunk[READ_CHUNK_SIZE];
        auto read_result = socket_.read(std::span<uint8_t>(chunk, sizeof(chunk)));
        if (!read_result) {
            fail(read_result.error());
            return;
        }
        if (read_result->empty()) {
            break;
        }
        decoder_.append(*read_result);

        while (true) {
            auto next = decoder_.next();
            if (!next) {
                fail(next.error());
                return;
            }
            if (!*next) {
                break;
            }
            if (on_frame_) {
                on_frame_(std::move(**next));
            }
            if (!socket_) {
                return;
            }
        }
    }
}

void dispatch_channel::fail(std::error_code ec) {
    auto handler = std::move(on_close_);
    on_close_ = nullptr;
    close();
    if (handler) {
        handler(ec);
    }
}

} // namespace shoal::cluster
