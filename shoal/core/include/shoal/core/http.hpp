#pragma once

#include "http_headers.hpp"
#include "problem.hpp"
#include "result.hpp"

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace shoal::http {

// Security limits for HTTP parsing
constexpr size_t MAX_HEADER_SIZE = 8192UL;
constexpr size_t MAX_BODY_SIZE = 10UL * 1024UL * 1024UL;
constexpr size_t MAX_URI_LENGTH = 2048UL;
constexpr size_t MAX_HEADER_COUNT = 100;
constexpr size_t MAX_BUFFER_SIZE = MAX_HEADER_SIZE + 2 * MAX_BODY_SIZE;

enum class method : uint8_t { get, post, put, del, patch, head, options, unknown };

struct request {
    method http_method = method::unknown;
    // Verbatim request-line token; differs from the enum for unknown methods.
    std::string method_token;
    std::string uri;
    headers_map headers;
    std::string body;

    [[nodiscard]] std::optional<std::string_view> header(std::string_view name) const {
        return headers.get(name);
    }

    // The URI without query string and fragment.
    [[nodiscard]] std::string_view path() const noexcept;
};

struct response {
    int32_t status = 200;
    std::string reason;
    headers_map headers;
    std::string body;

    void set_header(std::string_view name, std::string_view value) { headers.set(name, value); }

    // Adds Content-Length when the handler did not set it.
    void serialize_into(std::string& out) const;
    [[nodiscard]] std::string serialize() const;

    static response ok(std::string body = "", std::string content_type = "text/plain");
    static response json(std::string body, int32_t status = 200);
    static response no_content();
    static response error(const problem_details& problem);
    // Rebuilds a response from its transport form; an empty content type sets no header.
    static response from_parts(int32_t status, std::string_view content_type, std::string body);
};

class parser {
public:
    enum class state : uint8_t {
        request_line,
        headers,
        body,
        chunk_size,
        chunk_data,
        chunk_trailer,
        complete
    };

    // Feeds more bytes. Fails with error_code::malformed_request on framing
    // errors and error_code::message_too_large when a limit is exceeded. Bytes
    // past a complete request are ignored.
    [[nodiscard]] result<state> parse(std::span<const uint8_t> data);

    [[nodiscard]] bool is_complete() const noexcept { return state_ == state::complete; }
    [[nodiscard]] state current_state() const noexcept { return state_; }
    [[nodiscard]] const request& get_request() const noexcept { return request_; }
    request take_request() { return std::move(request_); }
    void reset();

private:
    result<state> parse_request_line_state();
    result<state> parse_headers_state();
    result<state> parse_body_state();
    result<state> parse_chunk_size_state();
    result<state> parse_chunk_data_state();
    result<state> parse_chunk_trailer_state();

    result<void> process_request_line(std::string_view line);
    result<void> process_header_line(std::string_view line);
    result<state> finish_headers();
    result<std::optional<std::string_view>> next_line();
    result<void> check_header_limits() const;

    state state_ = state::request_line;
    request request_;
    std::string buffer_;
    size_t parse_pos_ = 0;
    size_t content_length_ = 0;
    size_t current_chunk_size_ = 0;
    size_t header_count_ = 0;
};

method parse_method(std::string_view str) noexcept;
std::string_view method_to_string(method m) noexcept;
std::string_view reason_phrase(int32_t status) noexcept;

inline std::span<const uint8_t> as_bytes(std::string_view sv) noexcept {
    return std::span<const uint8_t>(
        static_cast<const uint8_t*>(static_cast<const void*>(sv.data())), sv.size());
}

} // namespace shoal::http
