#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace shoal {

// Growable byte queue: producers append at the tail, consumers read from the
// head and consume what they processed.
class io_buffer {
public:
    static constexpr size_t INITIAL_CAPACITY = 4096;

    io_buffer() = default;
    explicit io_buffer(size_t capacity);

    void append(std::span<const uint8_t> data);
    void append(std::string_view str);

    // Space for a direct read(); call commit() with the byte count received.
    std::span<uint8_t> writable_span(size_t size);
    void commit(size_t bytes);

    [[nodiscard]] std::span<const uint8_t> readable_span() const noexcept;
    [[nodiscard]] std::string_view view() const noexcept;
    void consume(size_t bytes);

    [[nodiscard]] size_t size() const noexcept { return write_pos_ - read_pos_; }
    [[nodiscard]] size_t capacity() const noexcept { return buffer_.size(); }
    [[nodiscard]] bool empty() const noexcept { return read_pos_ == write_pos_; }

    void clear() noexcept;

private:
    void ensure_writable(size_t bytes);

    std::vector<uint8_t> buffer_;
    size_t read_pos_ = 0;
    size_t write_pos_ = 0;
};

} // namespace shoal
