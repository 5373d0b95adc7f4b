#include "shoal/core/io_buffer.hpp"

#include <algorithm>
#include <cstring>

namespace shoal {

io_buffer::io_buffer(size_t capacity) : buffer_(capacity) {}

void io_buffer::append(std::span<const uint8_t> data) {
    if (data.empty()) {
        return;
    }
    ensure_writable(data.size());
    std::memcpy(buffer_.data() + write_pos_, data.data(), data.size());
    write_pos_ += data.size();
}

void io_buffer::append(std::string_view str) {
    append(std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(str.data()), str.size()));
}

std::span<uint8_t> io_buffer::writable_span(size_t size) {
    ensure_writable(size);
    return std::span<uint8_t>(buffer_.data() + write_pos_, size);
}

void io_buffer::commit(size_t bytes) {
    write_pos_ = std::min(write_pos_ + bytes, buffer_.size());
}

std::span<const uint8_t> io_buffer::readable_span() const noexcept {
    return std::span<const uint8_t>(buffer_.data() + read_pos_, size());
}

std::string_view io_buffer::view() const noexcept {
    return std::string_view(reinterpret_cast<const char*>(buffer_.data() + read_pos_), size());
}

void io_buffer::consume(size_t bytes) {
    read_pos_ += std::min(bytes, size());
    if (read_pos_ == write_pos_) {
        read_pos_ = 0;
        write_pos_ = 0;
    }
}

void io_buffer::clear() noexcept {
    read_pos_ = 0;
    write_pos_ = 0;
}

void io_buffer::ensure_writable(size_t bytes) {
    if (buffer_.size() - write_pos_ >= bytes) {
        return;
    }

    // Slide unread bytes to the front before growing.
    size_t data_size = size();
    if (read_pos_ > 0) {
        if (data_size > 0) {
            std::memmove(buffer_.data(), buffer_.data() + read_pos_, data_size);
        }
        read_pos_ = 0;
        write_pos_ = data_size;
    }

    if (buffer_.size() - write_pos_ < bytes) {
        size_t new_cap = std::max(buffer_.size() * 2, INITIAL_CAPACITY);
        new_cap = std::max(new_cap, write_pos_ + bytes);
        buffer_.resize(new_cap);
    }
}

} // namespace shoal
