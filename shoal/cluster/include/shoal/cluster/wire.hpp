#pragma once

#include "shoal/core/http.hpp"
#include "shoal/core/io_buffer.hpp"
#include "shoal/core/result.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>

namespace shoal::cluster {

// Frames exchanged between the coordinator and a worker over their private
// stream socket. All integers are big-endian.
//
//   frame    := u32 payload_length | payload
//   payload  := u8 kind | u64 correlation_id | body
//   request  := u8 method | str uri | str body
//   response := u16 status | str content_type | str body
//   str      := u32 length | bytes
constexpr size_t MAX_FRAME_SIZE = 16UL * 1024UL * 1024UL;
constexpr size_t FRAME_LENGTH_SIZE = 4;

enum class frame_kind : uint8_t { request = 1, response = 2 };

struct request_envelope {
    uint64_t correlation_id = 0;
    http::method method = http::method::unknown;
    std::string uri;
    std::string body;

    bool operator==(const request_envelope&) const = default;
};

struct response_envelope {
    uint64_t correlation_id = 0;
    uint16_t status = 0;
    std::string content_type;
    std::string body;

    bool operator==(const response_envelope&) const = default;
};

using frame = std::variant<request_envelope, response_envelope>;

void encode_into(const request_envelope& env, std::string& out);
void encode_into(const response_envelope& env, std::string& out);

template <typename Envelope> std::string encode(const Envelope& env) {
    std::string out;
    encode_into(env, out);
    return out;
}

// Decodes one payload (without its length prefix).
result<frame> decode_payload(std::span<const uint8_t> payload);

// Reassembles frames from a byte stream.
class frame_decoder {
public:
    void append(std::span<const uint8_t> data) { buffer_.append(data); }

    // Next complete frame, nullopt when more bytes are needed. An oversized
    // or malformed frame is an error and leaves the stream unusable.
    result<std::optional<frame>> next();

    [[nodiscard]] size_t buffered() const noexcept { return buffer_.size(); }

private:
    io_buffer buffer_;
};

request_envelope make_request_envelope(uint64_t correlation_id, const http::request& req);
response_envelope make_response_envelope(uint64_t correlation_id, const http::response& resp);

http::request to_http_request(const request_envelope& env);
http::response to_http_response(const response_envelope& env);

} // namespace shoal::cluster
