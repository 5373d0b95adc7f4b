#include "shoal/core/http.hpp"

#include <charconv>
#include <cstring>

namespace shoal::http {

namespace {

constexpr std::string_view HTTP_VERSION_PREFIX = "HTTP/1.1 ";
constexpr std::string_view HEADER_SEPARATOR = ": ";
constexpr std::string_view CRLF = "\r\n";

constexpr bool is_token_char(unsigned char c) noexcept {
    if (c >= '0' && c <= '9') {
        return true;
    }
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
        return true;
    }
    switch (c) {
    case '!': case '#': case '$': case '%': case '&': case '\'': case '*':
    case '+': case '-': case '.': case '^': case '_': case '`': case '|': case '~':
        return true;
    default:
        return false;
    }
}

constexpr bool is_ctl(unsigned char c) noexcept {
    return c < 0x20 || c == 0x7f;
}

bool is_token(std::string_view s) noexcept {
    if (s.empty()) {
        return false;
    }
    for (char ch : s) {
        if (!is_token_char(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return true;
}

std::string_view trim_ows(std::string_view value) noexcept {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    return value;
}

bool contains_invalid_header_value(std::string_view value) noexcept {
    for (char ch : value) {
        auto c = static_cast<unsigned char>(ch);
        if (c != '\t' && is_ctl(c)) {
            return true;
        }
    }
    return false;
}

bool contains_invalid_uri_char(std::string_view uri) noexcept {
    for (char ch : uri) {
        auto c = static_cast<unsigned char>(ch);
        if (c == ' ' || is_ctl(c) || c >= 0x80) {
            return true;
        }
    }
    return false;
}

bool status_allows_body(int32_t status) noexcept {
    return status >= 200 && status != 204 && status != 304;
}

std::unexpected<std::error_code> malformed() {
    return std::unexpected(make_error_code(error_code::malformed_request));
}

std::unexpected<std::error_code> too_large() {
    return std::unexpected(make_error_code(error_code::message_too_large));
}

} // namespace

method parse_method(std::string_view str) noexcept {
    if (str == "GET") return method::get;
    if (str == "POST") return method::post;
    if (str == "PUT") return method::put;
    if (str == "DELETE") return method::del;
    if (str == "PATCH") return method::patch;
    if (str == "HEAD") return method::head;
    if (str == "OPTIONS") return method::options;
    return method::unknown;
}

std::string_view method_to_string(method m) noexcept {
    switch (m) {
        case method::get: return "GET";
        case method::post: return "POST";
        case method::put: return "PUT";
        case method::del: return "DELETE";
        case method::patch: return "PATCH";
        case method::head: return "HEAD";
        case method::options: return "OPTIONS";
        default: return "UNKNOWN";
    }
}

std::string_view reason_phrase(int32_t status) noexcept {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Content Too Large";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "Unknown";
    }
}

std::string_view request::path() const noexcept {
    std::string_view p = uri;
    auto cut = p.find_first_of("?#");
    if (cut != std::string_view::npos) {
        p = p.substr(0, cut);
    }
    return p;
}

void response::serialize_into(std::string& out) const {
    out.reserve(out.size() + 64 + reason.size() + body.size() + headers.size() * 32);

    char status_buf[16];
    auto [ptr, ec] = std::to_chars(status_buf, status_buf + sizeof(status_buf), status);

    out.append(HTTP_VERSION_PREFIX);
    out.append(status_buf, static_cast<size_t>(ptr - status_buf));
    out.push_back(' ');
    out.append(reason.empty() ? reason_phrase(status) : std::string_view(reason));
    out.append(CRLF);

    for (const auto& [name, value] : headers) {
        out.append(name);
        out.append(HEADER_SEPARATOR);
        out.append(value);
        out.append(CRLF);
    }

    if (status_allows_body(status) && !headers.contains("Content-Length")) {
        out.append("Content-Length: ");
        out.append(std::to_string(body.size()));
        out.append(CRLF);
    }

    out.append(CRLF);
    if (status_allows_body(status)) {
        out.append(body);
    }
}

std::string response::serialize() const {
    std::string out;
    serialize_into(out);
    return out;
}

response response::ok(std::string body, std::string content_type) {
    response res;
    res.status = 200;
    res.reason = "OK";
    res.body = std::move(body);
    res.set_header("Content-Type", content_type);
    return res;
}

response response::json(std::string body, int32_t status) {
    response res;
    res.status = status;
    res.reason = std::string(reason_phrase(status));
    res.body = std::move(body);
    res.set_header("Content-Type", "application/json");
    return res;
}

response response::no_content() {
    response res;
    res.status = 204;
    res.reason = "No Content";
    res.set_header("Content-Type", "application/json");
    return res;
}

response response::error(const problem_details& problem) {
    response res;
    res.status = problem.status;
    res.reason = problem.title;
    res.body = problem.to_json();
    res.set_header("Content-Type", "application/json");
    return res;
}

response response::from_parts(int32_t status, std::string_view content_type, std::string body) {
    response res;
    res.status = status;
    res.reason = std::string(reason_phrase(status));
    res.body = std::move(body);
    if (!content_type.empty()) {
        res.set_header("Content-Type", content_type);
    }
    return res;
}

result<parser::state> parser::parse(std::span<const uint8_t> data) {
    if (state_ == state::complete) {
        return state_;
    }

    if (data.size() > MAX_BUFFER_SIZE - buffer_.size()) [[unlikely]] {
        return too_large();
    }
    buffer_.append(reinterpret_cast<const char*>(data.data()), data.size());

    if (state_ == state::request_line || state_ == state::headers) {
        auto limits = check_header_limits();
        if (!limits) {
            return std::unexpected(limits.error());
        }
    }

    while (state_ != state::complete) {
        size_t old_parse_pos = parse_pos_;
        state old_state = state_;
        result<state> next_state = [&]() -> result<state> {
            switch (state_) {
                case state::request_line:
                    return parse_request_line_state();
                case state::headers:
                    return parse_headers_state();
                case state::body:
                    return parse_body_state();
                case state::chunk_size:
                    return parse_chunk_size_state();
                case state::chunk_data:
                    return parse_chunk_data_state();
                case state::chunk_trailer:
                    return parse_chunk_trailer_state();
                default:
                    return state_;
            }
        }();

        if (!next_state) {
            return std::unexpected(next_state.error());
        }

        state_ = *next_state;

        if (parse_pos_ == old_parse_pos && state_ == old_state) {
            break;
        }
    }

    return state_;
}

result<void> parser::check_header_limits() const {
    auto header_end = buffer_.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        if (buffer_.size() > MAX_HEADER_SIZE) {
            return too_large();
        }
    } else if (header_end + 4 > MAX_HEADER_SIZE) {
        return too_large();
    }
    return {};
}

result<std::optional<std::string_view>> parser::next_line() {
    auto pos = buffer_.find(CRLF, parse_pos_);
    if (pos == std::string::npos) {
        // A bare LF can never be completed into a valid line.
        if (buffer_.find('\n', parse_pos_) != std::string::npos) {
            return malformed();
        }
        return std::optional<std::string_view>{};
    }

    std::string_view line(buffer_.data() + parse_pos_, pos - parse_pos_);
    for (char ch : line) {
        auto c = static_cast<unsigned char>(ch);
        if (c == '\0' || c == '\r' || c == '\n') {
            return malformed();
        }
    }

    parse_pos_ = pos + CRLF.size();
    return std::optional<std::string_view>{line};
}

result<parser::state> parser::parse_request_line_state() {
    auto line = next_line();
    if (!line) {
        return std::unexpected(line.error());
    }
    if (!*line) {
        return state::request_line;
    }

    auto res = process_request_line(**line);
    if (!res) {
        return std::unexpected(res.error());
    }
    return state::headers;
}

result<parser::state> parser::parse_headers_state() {
    auto line = next_line();
    if (!line) {
        return std::unexpected(line.error());
    }
    if (!*line) {
        return state::headers;
    }

    std::string_view text = **line;
    if (text.empty()) {
        return finish_headers();
    }

    if (text.front() == ' ' || text.front() == '\t') {
        // Obsolete line folding continues the previous field value.
        if (header_count_ == 0) {
            return malformed();
        }
        auto folded = trim_ows(text);
        if (contains_invalid_header_value(folded)) {
            return malformed();
        }
        request_.headers.append_to_last(folded);
        return state::headers;
    }

    auto res = process_header_line(text);
    if (!res) {
        return std::unexpected(res.error());
    }
    return state::headers;
}

result<parser::state> parser::finish_headers() {
    auto te = request_.headers.get("Transfer-Encoding");
    auto cl = request_.headers.get("Content-Length");

    if (te) {
        if (cl) {
            return malformed();
        }
        std::string_view coding = *te;
        auto comma = coding.rfind(',');
        if (comma != std::string_view::npos) {
            coding = coding.substr(comma + 1);
        }
        if (!ci_equal(trim_ows(coding), "chunked")) {
            return malformed();
        }
        return state::chunk_size;
    }

    if (cl) {
        std::string_view digits = *cl;
        if (digits.empty()) {
            return malformed();
        }
        unsigned long long val = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), val);
        if (ec == std::errc::result_out_of_range) {
            return too_large();
        }
        if (ec != std::errc() || ptr != digits.data() + digits.size()) {
            return malformed();
        }
        if (val > MAX_BODY_SIZE) {
            return too_large();
        }
        content_length_ = static_cast<size_t>(val);
        return content_length_ == 0 ? state::complete : state::body;
    }

    return state::complete;
}

result<parser::state> parser::parse_body_state() {
    size_t remaining = buffer_.size() - parse_pos_;
    if (remaining >= content_length_) {
        request_.body.assign(buffer_, parse_pos_, content_length_);
        parse_pos_ += content_length_;
        return state::complete;
    }
    return state::body;
}

result<parser::state> parser::parse_chunk_size_state() {
    auto line = next_line();
    if (!line) {
        return std::unexpected(line.error());
    }
    if (!*line) {
        return state::chunk_size;
    }

    std::string_view chunk_line = **line;
    auto semicolon = chunk_line.find(';');
    if (semicolon != std::string_view::npos) {
        chunk_line = chunk_line.substr(0, semicolon);
    }
    chunk_line = trim_ows(chunk_line);
    if (chunk_line.empty()) {
        return malformed();
    }

    unsigned long long chunk_val = 0;
    auto [ptr, ec] =
        std::from_chars(chunk_line.data(), chunk_line.data() + chunk_line.size(), chunk_val, 16);
    if (ec == std::errc::result_out_of_range) {
        return too_large();
    }
    if (ec != std::errc() || ptr != chunk_line.data() + chunk_line.size()) {
        return malformed();
    }
    if (chunk_val > MAX_BODY_SIZE - request_.body.size()) {
        return too_large();
    }

    current_chunk_size_ = static_cast<size_t>(chunk_val);
    return current_chunk_size_ == 0 ? state::chunk_trailer : state::chunk_data;
}

result<parser::state> parser::parse_chunk_data_state() {
    size_t remaining = buffer_.size() - parse_pos_;
    if (remaining < current_chunk_size_ + CRLF.size()) {
        return state::chunk_data;
    }

    const char* chunk_start = buffer_.data() + parse_pos_;
    if (chunk_start[current_chunk_size_] != '\r' || chunk_start[current_chunk_size_ + 1] != '\n') {
        return malformed();
    }

    request_.body.append(chunk_start, current_chunk_size_);
    parse_pos_ += current_chunk_size_ + CRLF.size();
    return state::chunk_size;
}

result<parser::state> parser::parse_chunk_trailer_state() {
    auto line = next_line();
    if (!line) {
        return std::unexpected(line.error());
    }
    if (!*line) {
        return state::chunk_trailer;
    }

    // Trailer fields are read and discarded; an empty line ends the message.
    return (*line)->empty() ? state::complete : state::chunk_trailer;
}

result<void> parser::process_request_line(std::string_view line) {
    auto method_end = line.find(' ');
    if (method_end == std::string_view::npos) {
        return malformed();
    }

    auto method_str = line.substr(0, method_end);
    if (!is_token(method_str)) {
        return malformed();
    }

    auto uri_start = method_end + 1;
    auto uri_end = line.find(' ', uri_start);
    if (uri_end == std::string_view::npos) {
        return malformed();
    }

    auto uri = line.substr(uri_start, uri_end - uri_start);
    if (uri.empty() || contains_invalid_uri_char(uri)) {
        return malformed();
    }
    if (uri.size() > MAX_URI_LENGTH) {
        return too_large();
    }

    auto version = line.substr(uri_end + 1);
    if (version != "HTTP/1.1" && version != "HTTP/1.0") {
        return malformed();
    }

    request_.http_method = parse_method(method_str);
    request_.method_token = std::string(method_str);
    request_.uri = std::string(uri);
    return {};
}

result<void> parser::process_header_line(std::string_view line) {
    if (header_count_ >= MAX_HEADER_COUNT) {
        return too_large();
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos) {
        return malformed();
    }

    auto name = line.substr(0, colon);
    auto value = trim_ows(line.substr(colon + 1));

    if (!is_token(name) || contains_invalid_header_value(value)) {
        return malformed();
    }

    if (ci_equal(name, "Content-Length")) {
        auto existing = request_.headers.get(name);
        if (existing && *existing != value) {
            return malformed();
        }
    }

    request_.headers.set(name, value);
    ++header_count_;
    return {};
}

void parser::reset() {
    state_ = state::request_line;
    request_ = request{};
    buffer_.clear();
    parse_pos_ = 0;
    content_length_ = 0;
    current_chunk_size_ = 0;
    header_count_ = 0;
}

} // namespace shoal::http
