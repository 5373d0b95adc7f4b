#include "shoal/cluster/wire.hpp"

namespace shoal::cluster {

namespace {

void put_u8(std::string& out, uint8_t v) {
    out.push_back(static_cast<char>(v));
}

void put_u16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v >> 8));
    out.push_back(static_cast<char>(v));
}

void put_u32(std::string& out, uint32_t v) {
    for (int shift = 24; shift >= 0; shift -= 8) {
        out.push_back(static_cast<char>(v >> shift));
    }
}

void put_u64(std::string& out, uint64_t v) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<char>(v >> shift));
    }
}

void put_str(std::string& out, std::string_view s) {
    put_u32(out, static_cast<uint32_t>(s.size()));
    out.append(s);
}

// Reserves the length prefix and patches it once the payload is written.
class frame_writer {
public:
    explicit frame_writer(std::string& out) : out_(out), start_(out.size()) { put_u32(out_, 0); }

    void finish() {
        auto length = static_cast<uint32_t>(out_.size() - start_ - FRAME_LENGTH_SIZE);
        for (size_t i = 0; i < FRAME_LENGTH_SIZE; ++i) {
            out_[start_ + i] = static_cast<char>(length >> (24 - 8 * i));
        }
    }

private:
    std::string& out_;
    size_t start_;
};

class payload_reader {
public:
    explicit payload_reader(std::span<const uint8_t> data) : data_(data) {}

    bool u8(uint8_t& v) {
        if (remaining() < 1) {
            return false;
        }
        v = data_[pos_++];
        return true;
    }

    bool u16(uint16_t& v) {
        uint64_t wide = 0;
        if (!big_endian(2, wide)) {
            return false;
        }
        v = static_cast<uint16_t>(wide);
        return true;
    }

    bool u32(uint32_t& v) {
        uint64_t wide = 0;
        if (!big_endian(4, wide)) {
            return false;
        }
        v = static_cast<uint32_t>(wide);
        return true;
    }

    bool u64(uint64_t& v) { return big_endian(8, v); }

    bool str(std::string& v) {
        uint32_t length = 0;
        if (!u32(length) || remaining() < length) {
            return false;
        }
        v.assign(reinterpret_cast<const char*>(data_.data() + pos_), length);
        pos_ += length;
        return true;
    }

    [[nodiscard]] size_t remaining() const noexcept { return data_.size() - pos_; }

private:
    bool big_endian(size_t width, uint64_t& v) {
        if (remaining() < width) {
            return false;
        }
        v = 0;
        for (size_t i = 0; i < width; ++i) {
            v = (v << 8) | data_[pos_++];
        }
        return true;
    }

    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

std::unexpected<std::error_code> malformed_frame() {
    return std::unexpected(make_error_code(error_code::malformed_frame));
}

} // namespace

void encode_into(const request_envelope& env, std::string& out) {
    frame_writer writer(out);
    put_u8(out, static_cast<uint8_t>(frame_kind::request));
    put_u64(out, env.correlation_id);
    put_u8(out, static_cast<uint8_t>(env.method));
    put_str(out, env.uri);
    put_str(out, env.body);
    writer.finish();
}

void encode_into(const response_envelope& env, std::string& out) {
    frame_writer writer(out);
    put_u8(out, static_cast<uint8_t>(frame_kind::response));
    put_u64(out, env.correlation_id);
    put_u16(out, env.status);
    put_str(out, env.content_type);
    put_str(out, env.body);
    writer.finish();
}

result<frame> decode_payload(std::span<const uint8_t> payload) {
    payload_reader reader(payload);

    uint8_t kind = 0;
    uint64_t correlation_id = 0;
    if (!reader.u8(kind) || !reader.u64(correlation_id)) {
        return malformed_frame();
    }

    switch (static_cast<frame_kind>(kind)) {
    case frame_kind::request: {
        request_envelope env;
        env.correlation_id = correlation_id;
        uint8_t method = 0;
        if (!reader.u8(method) || !reader.str(env.uri) || !reader.str(env.body)) {
            return malformed_frame();
        }
        if (method > static_cast<uint8_t>(http::method::unknown)) {
            return malformed_frame();
        }
        env.method = static_cast<http::method>(method);
        if (reader.remaining() != 0) {
            return malformed_frame();
        }
        return frame{std::move(env)};
    }
    case frame_kind::response: {
        response_envelope env;
        env.correlation_id = correlation_id;
        if (!reader.u16(env.status) || !reader.str(env.content_type) || !reader.str(env.body)) {
            return malformed_frame();
        }
        if (reader.remaining() != 0) {
            return malformed_frame();
        }
        return frame{std::move(env)};
    }
    default:
        return malformed_frame();
    }
}

result<std::optional<frame>> frame_decoder::next() {
    auto readable = buffer_.readable_span();
    if (readable.size() < FRAME_LENGTH_SIZE) {
        return std::optional<frame>{};
    }

    uint32_t length = 0;
    for (size_t i = 0; i < FRAME_LENGTH_SIZE; ++i) {
        length = (length << 8) | readable[i];
    }
    if (length > MAX_FRAME_SIZE) {
        return std::unexpected(make_error_code(error_code::message_too_large));
    }
    if (readable.size() < FRAME_LENGTH_SIZE + length) {
        return std::optional<frame>{};
    }

    auto decoded = decode_payload(readable.subspan(FRAME_LENGTH_SIZE, length));
    buffer_.consume(FRAME_LENGTH_SIZE + length);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }
    return std::optional<frame>{std::move(*decoded)};
}

request_envelope make_request_envelope(uint64_t correlation_id, const http::request& req) {
    request_envelope env;
    env.correlation_id = correlation_id;
    env.method = req.http_method;
    env.uri = req.uri;
    env.body = req.body;
    return env;
}

response_envelope make_response_envelope(uint64_t correlation_id, const http::response& resp) {
    response_envelope env;
    env.correlation_id = correlation_id;
    env.status = static_cast<uint16_t>(resp.status);
    env.content_type = std::string(resp.headers.get("Content-Type").value_or(""));
    env.body = resp.body;
    return env;
}

http::request to_http_request(const request_envelope& env) {
    http::request req;
    req.http_method = env.method;
    req.method_token = std::string(http::method_to_string(env.method));
    req.uri = env.uri;
    req.body = env.body;
    return req;
}

http::response to_http_response(const response_envelope& env) {
    return http::response::from_parts(env.status, env.content_type, env.body);
}

} // namespace shoal::cluster
