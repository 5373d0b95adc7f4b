#include "shoal/core/json.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <unordered_map>

namespace shoal::json {

namespace {

constexpr std::string_view HEX_DIGITS = "0123456789abcdef";

struct cursor {
    const char* ptr;
    const char* end;
    const char* start;
    std::string error;

    cursor(const char* p, const char* e) : ptr(p), end(e), start(p) {}

    [[nodiscard]] bool eof() const noexcept { return ptr >= end; }
    [[nodiscard]] size_t pos() const noexcept { return static_cast<size_t>(ptr - start); }

    void skip_ws() noexcept {
        while (!eof() && (*ptr == ' ' || *ptr == '\t' || *ptr == '\n' || *ptr == '\r')) {
            ++ptr;
        }
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (eof() || *ptr != c) {
            return false;
        }
        ++ptr;
        return true;
    }

    bool fail(std::string_view what) {
        if (error.empty()) {
            error = std::string(what) + " at offset " + std::to_string(pos());
        }
        return false;
    }
};

bool parse_value(cursor& cur, value& out, size_t depth);

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

bool read_hex4(cursor& cur, uint32_t& out) {
    if (cur.end - cur.ptr < 4) {
        return cur.fail("truncated unicode escape");
    }
    uint32_t v = 0;
    for (int i = 0; i < 4; ++i) {
        int h = hex_value(cur.ptr[i]);
        if (h < 0) {
            return cur.fail("invalid unicode escape");
        }
        v = (v << 4) | static_cast<uint32_t>(h);
    }
    cur.ptr += 4;
    out = v;
    return true;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

bool parse_string(cursor& cur, std::string& out) {
    if (!cur.consume('"')) {
        return cur.fail("expected string");
    }
    out.clear();
    while (true) {
        if (cur.eof()) {
            return cur.fail("unterminated string");
        }
        auto c = static_cast<unsigned char>(*cur.ptr);
        if (c == '"') {
            ++cur.ptr;
            return true;
        }
        if (c < 0x20) {
            return cur.fail("control character in string");
        }
        if (c != '\\') {
            out.push_back(static_cast<char>(c));
            ++cur.ptr;
            continue;
        }

        ++cur.ptr;
        if (cur.eof()) {
            return cur.fail("unterminated escape");
        }
        char esc = *cur.ptr++;
        switch (esc) {
        case '"':
            out.push_back('"');
            break;
        case '\\':
            out.push_back('\\');
            break;
        case '/':
            out.push_back('/');
            break;
        case 'b':
            out.push_back('\b');
            break;
        case 'f':
            out.push_back('\f');
            break;
        case 'n':
            out.push_back('\n');
            break;
        case 'r':
            out.push_back('\r');
            break;
        case 't':
            out.push_back('\t');
            break;
        case 'u': {
            uint32_t cp = 0;
            if (!read_hex4(cur, cp)) {
                return false;
            }
            if (cp >= 0xD800 && cp <= 0xDBFF) {
                if (cur.end - cur.ptr < 2 || cur.ptr[0] != '\\' || cur.ptr[1] != 'u') {
                    return cur.fail("unpaired surrogate");
                }
                cur.ptr += 2;
                uint32_t low = 0;
                if (!read_hex4(cur, low)) {
                    return false;
                }
                if (low < 0xDC00 || low > 0xDFFF) {
                    return cur.fail("invalid low surrogate");
                }
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
            } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                return cur.fail("unpaired surrogate");
            }
            append_utf8(out, cp);
            break;
        }
        default:
            return cur.fail("invalid escape");
        }
    }
}

bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

bool parse_number(cursor& cur, value& out) {
    const char* begin = cur.ptr;
    const char* p = begin;
    if (p < cur.end && *p == '-') {
        ++p;
    }
    if (p >= cur.end || !is_digit(*p)) {
        return cur.fail("invalid number");
    }
    if (*p == '0') {
        ++p;
    } else {
        while (p < cur.end && is_digit(*p)) {
            ++p;
        }
    }
    if (p < cur.end && *p == '.') {
        ++p;
        if (p >= cur.end || !is_digit(*p)) {
            return cur.fail("invalid fraction");
        }
        while (p < cur.end && is_digit(*p)) {
            ++p;
        }
    }
    if (p < cur.end && (*p == 'e' || *p == 'E')) {
        ++p;
        if (p < cur.end && (*p == '+' || *p == '-')) {
            ++p;
        }
        if (p >= cur.end || !is_digit(*p)) {
            return cur.fail("invalid exponent");
        }
        while (p < cur.end && is_digit(*p)) {
            ++p;
        }
    }

    double number = 0.0;
    auto [ptr, ec] = std::from_chars(begin, p, number);
    if (ec == std::errc::result_out_of_range) {
        // Magnitude overflow saturates to infinity; underflow rounds to zero.
        std::string_view literal(begin, static_cast<size_t>(p - begin));
        bool negative = literal.front() == '-';
        auto exp = literal.find_first_of("eE");
        bool tiny = exp != std::string_view::npos && exp + 1 < literal.size() &&
                    literal[exp + 1] == '-';
        if (tiny) {
            number = negative ? -0.0 : 0.0;
        } else {
            number = negative ? -std::numeric_limits<double>::infinity()
                              : std::numeric_limits<double>::infinity();
        }
    } else if (ec != std::errc() || ptr != p) {
        return cur.fail("invalid number");
    }

    cur.ptr = p;
    out = value(number);
    return true;
}

bool parse_literal(cursor& cur, std::string_view literal) {
    if (static_cast<size_t>(cur.end - cur.ptr) < literal.size() ||
        std::string_view(cur.ptr, literal.size()) != literal) {
        return cur.fail("invalid literal");
    }
    cur.ptr += literal.size();
    return true;
}

bool parse_array(cursor& cur, value& out, size_t depth) {
    ++cur.ptr; // '['
    out = value::array();
    if (cur.consume(']')) {
        return true;
    }
    while (true) {
        value item;
        if (!parse_value(cur, item, depth + 1)) {
            return false;
        }
        out.push_back(std::move(item));
        if (cur.consume(',')) {
            continue;
        }
        if (cur.consume(']')) {
            return true;
        }
        return cur.fail("expected ',' or ']'");
    }
}

bool parse_object(cursor& cur, value& out, size_t depth) {
    ++cur.ptr; // '{'
    value::object_type members;
    std::unordered_map<std::string, size_t> index;
    if (cur.consume('}')) {
        out = value::object();
        return true;
    }
    while (true) {
        std::string key;
        if (!parse_string(cur, key)) {
            return false;
        }
        if (!cur.consume(':')) {
            return cur.fail("expected ':'");
        }
        value member;
        if (!parse_value(cur, member, depth + 1)) {
            return false;
        }
        // Duplicate keys: the last value wins, the first position is kept.
        auto [it, inserted] = index.try_emplace(key, members.size());
        if (inserted) {
            members.emplace_back(std::move(key), std::move(member));
        } else {
            members[it->second].second = std::move(member);
        }
        if (cur.consume(',')) {
            continue;
        }
        if (cur.consume('}')) {
            out = value::object(std::move(members));
            return true;
        }
        return cur.fail("expected ',' or '}'");
    }
}

bool parse_value(cursor& cur, value& out, size_t depth) {
    if (depth > MAX_NESTING_DEPTH) {
        return cur.fail("nesting too deep");
    }
    cur.skip_ws();
    if (cur.eof()) {
        return cur.fail("unexpected end of input");
    }
    switch (*cur.ptr) {
    case '{':
        return parse_object(cur, out, depth);
    case '[':
        return parse_array(cur, out, depth);
    case '"': {
        std::string s;
        if (!parse_string(cur, s)) {
            return false;
        }
        out = value(std::move(s));
        return true;
    }
    case 't':
        if (!parse_literal(cur, "true")) {
            return false;
        }
        out = value(true);
        return true;
    case 'f':
        if (!parse_literal(cur, "false")) {
            return false;
        }
        out = value(false);
        return true;
    case 'n':
        if (!parse_literal(cur, "null")) {
            return false;
        }
        out = value(nullptr);
        return true;
    default:
        return parse_number(cur, out);
    }
}

} // namespace

const value* value::find(std::string_view key) const noexcept {
    if (kind_ != kind::object) {
        return nullptr;
    }
    for (const auto& [name, member_value] : object_) {
        if (name == key) {
            return &member_value;
        }
    }
    return nullptr;
}

value& value::set(std::string key, value v) {
    kind_ = kind::object;
    for (auto& [name, member_value] : object_) {
        if (name == key) {
            member_value = std::move(v);
            return member_value;
        }
    }
    object_.emplace_back(std::move(key), std::move(v));
    return object_.back().second;
}

value& value::push_back(value v) {
    kind_ = kind::array;
    array_.push_back(std::move(v));
    return array_.back();
}

size_t value::size() const noexcept {
    switch (kind_) {
    case kind::array:
        return array_.size();
    case kind::object:
        return object_.size();
    case kind::string:
        return string_.size();
    default:
        return 0;
    }
}

std::optional<value> parse(std::string_view text, std::string* error) {
    cursor cur{text.data(), text.data() + text.size()};
    value root;
    if (!parse_value(cur, root, 0)) {
        if (error) {
            *error = cur.error;
        }
        return std::nullopt;
    }
    cur.skip_ws();
    if (!cur.eof()) {
        cur.fail("trailing characters");
        if (error) {
            *error = cur.error;
        }
        return std::nullopt;
    }
    return root;
}

void append_quoted(std::string& out, std::string_view sv) {
    out.reserve(out.size() + sv.size() + 2);
    out.push_back('"');
    for (char ch : sv) {
        auto c = static_cast<unsigned char>(ch);
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        case '\b':
            out.append("\\b");
            break;
        case '\f':
            out.append("\\f");
            break;
        default:
            if (c < 0x20) {
                out.append("\\u00");
                out.push_back(HEX_DIGITS[c >> 4]);
                out.push_back(HEX_DIGITS[c & 0x0F]);
            } else {
                out.push_back(ch);
            }
            break;
        }
    }
    out.push_back('"');
}

void append_number(std::string& out, double number) {
    if (!std::isfinite(number)) {
        out.append("null");
        return;
    }
    if (number == 0.0) {
        out.push_back('0');
        return;
    }
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), number);
    out.append(buf, static_cast<size_t>(ptr - buf));
}

void serialize_into(const value& v, std::string& out) {
    switch (v.type()) {
    case kind::null:
        out.append("null");
        break;
    case kind::boolean:
        out.append(v.as_bool() ? "true" : "false");
        break;
    case kind::number:
        append_number(out, v.as_number());
        break;
    case kind::string:
        append_quoted(out, v.as_string());
        break;
    case kind::array: {
        out.push_back('[');
        bool first = true;
        for (const auto& item : v.as_array()) {
            if (!first) {
                out.push_back(',');
            }
            serialize_into(item, out);
            first = false;
        }
        out.push_back(']');
        break;
    }
    case kind::object: {
        out.push_back('{');
        bool first = true;
        for (const auto& [name, member_value] : v.as_object()) {
            if (!first) {
                out.push_back(',');
            }
            append_quoted(out, name);
            out.push_back(':');
            serialize_into(member_value, out);
            first = false;
        }
        out.push_back('}');
        break;
    }
    }
}

std::string serialize(const value& v) {
    std::string out;
    serialize_into(v, out);
    return out;
}

} // namespace shoal::json
