#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shoal::json {

constexpr size_t MAX_NESTING_DEPTH = 128;

enum class kind : uint8_t { null, boolean, number, string, array, object };

// Owning JSON document node. Object members keep their insertion order so that
// serialized output follows the order the fields were set in.
class value {
public:
    using array_type = std::vector<value>;
    using member = std::pair<std::string, value>;
    using object_type = std::vector<member>;

    value() = default;
    value(std::nullptr_t) {}
    value(bool b) : kind_(kind::boolean), bool_(b) {}
    value(double n) : kind_(kind::number), number_(n) {}
    value(int n) : kind_(kind::number), number_(n) {}
    value(std::string s) : kind_(kind::string), string_(std::move(s)) {}
    value(std::string_view s) : kind_(kind::string), string_(s) {}
    value(const char* s) : kind_(kind::string), string_(s) {}

    static value array() {
        value v;
        v.kind_ = kind::array;
        return v;
    }

    static value object() {
        value v;
        v.kind_ = kind::object;
        return v;
    }

    // Takes members as given; keys must already be unique.
    static value object(object_type members) {
        value v = object();
        v.object_ = std::move(members);
        return v;
    }

    [[nodiscard]] kind type() const noexcept { return kind_; }
    [[nodiscard]] bool is_null() const noexcept { return kind_ == kind::null; }
    [[nodiscard]] bool is_bool() const noexcept { return kind_ == kind::boolean; }
    [[nodiscard]] bool is_number() const noexcept { return kind_ == kind::number; }
    [[nodiscard]] bool is_string() const noexcept { return kind_ == kind::string; }
    [[nodiscard]] bool is_array() const noexcept { return kind_ == kind::array; }
    [[nodiscard]] bool is_object() const noexcept { return kind_ == kind::object; }

    [[nodiscard]] bool as_bool() const noexcept { return bool_; }
    [[nodiscard]] double as_number() const noexcept { return number_; }
    [[nodiscard]] const std::string& as_string() const noexcept { return string_; }
    [[nodiscard]] const array_type& as_array() const noexcept { return array_; }
    [[nodiscard]] const object_type& as_object() const noexcept { return object_; }

    // Lookup on objects; nullptr when absent or when this is not an object.
    [[nodiscard]] const value* find(std::string_view key) const noexcept;

    [[nodiscard]] bool contains(std::string_view key) const noexcept {
        return find(key) != nullptr;
    }

    // Replaces an existing member or appends a new one.
    value& set(std::string key, value v);
    value& push_back(value v);

    [[nodiscard]] size_t size() const noexcept;

private:
    kind kind_ = kind::null;
    bool bool_ = false;
    double number_ = 0.0;
    std::string string_;
    array_type array_;
    object_type object_;
};

// Strict RFC 8259 parser. On failure returns nullopt and, when error is given,
// stores a short description including the byte offset.
std::optional<value> parse(std::string_view text, std::string* error = nullptr);

std::string serialize(const value& v);
void serialize_into(const value& v, std::string& out);

void append_quoted(std::string& out, std::string_view sv);
void append_number(std::string& out, double number);

} // namespace shoal::json
