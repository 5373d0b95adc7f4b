#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shoal::http {

inline bool ci_char_equal(char a, char b) noexcept {
    return std::tolower(static_cast<unsigned char>(a)) ==
           std::tolower(static_cast<unsigned char>(b));
}

inline bool ci_equal(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), ci_char_equal);
}

// Header fields in arrival order. Lookups are case-insensitive; set() replaces
// the first field with the same name.
class headers_map {
public:
    using entry = std::pair<std::string, std::string>;
    using const_iterator = std::vector<entry>::const_iterator;

    [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept {
        for (const auto& [key, value] : entries_) {
            if (ci_equal(key, name)) {
                return std::string_view(value);
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] bool contains(std::string_view name) const noexcept {
        return get(name).has_value();
    }

    void set(std::string_view name, std::string_view value) {
        for (auto& [key, existing] : entries_) {
            if (ci_equal(key, name)) {
                existing.assign(value);
                return;
            }
        }
        entries_.emplace_back(std::string(name), std::string(value));
    }

    void append_to_last(std::string_view continuation) {
        if (!entries_.empty()) {
            auto& value = entries_.back().second;
            value.push_back(' ');
            value.append(continuation);
        }
    }

    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.end(); }

    void clear() noexcept { entries_.clear(); }

private:
    std::vector<entry> entries_;
};

} // namespace shoal::http
