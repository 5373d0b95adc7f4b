#pragma once

#include "http.hpp"
#include "result.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <utility>

namespace shoal::http {

constexpr size_t MAX_ROUTE_SEGMENTS = 16;
constexpr size_t MAX_PATH_PARAMS = 16;

template <size_t N> struct fixed_string {
    constexpr fixed_string(const char (&str)[N]) { std::copy_n(str, N, value); }
    constexpr operator std::string_view() const { return std::string_view{value, N - 1}; }
    char value[N];
};

enum class segment_kind : uint8_t { literal, parameter };

struct path_segment {
    segment_kind kind{segment_kind::literal};
    std::string_view value{};
};

struct path_params {
    using param_entry = std::pair<std::string_view, std::string_view>;

    void add(std::string_view name, std::string_view value) noexcept {
        if (size_ < MAX_PATH_PARAMS) {
            entries_[size_] = param_entry{name, value};
            ++size_;
        }
    }

    [[nodiscard]] std::optional<std::string_view> get(std::string_view name) const noexcept {
        for (size_t i = 0; i < size_; ++i) {
            if (entries_[i].first == name) {
                return entries_[i].second;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] size_t size() const noexcept { return size_; }

private:
    std::array<param_entry, MAX_PATH_PARAMS> entries_{};
    size_t size_{0};
};

struct request_context {
    path_params params{};
};

struct split_result {
    std::array<std::string_view, MAX_ROUTE_SEGMENTS> parts{};
    size_t count{0};
    bool overflow{false};

    [[nodiscard]] std::span<const std::string_view> segments() const noexcept {
        return std::span<const std::string_view>(parts.data(), count);
    }
};

// Splits a path into its non-empty segments: "//api/users/" gives {"api", "users"}.
[[nodiscard]] inline split_result split_path(std::string_view path) noexcept {
    split_result out{};
    size_t pos = 0;
    while (pos < path.size()) {
        if (path[pos] == '/') {
            ++pos;
            continue;
        }
        size_t next = path.find('/', pos);
        if (next == std::string_view::npos) {
            next = path.size();
        }
        if (out.count >= MAX_ROUTE_SEGMENTS) {
            out.overflow = true;
            return out;
        }
        out.parts[out.count++] = path.substr(pos, next - pos);
        pos = next;
    }
    return out;
}

struct path_pattern {
    std::array<path_segment, MAX_ROUTE_SEGMENTS> segments{};
    std::array<std::string_view, MAX_PATH_PARAMS> param_names{};
    size_t segment_count{0};
    size_t param_count{0};
    size_t literal_count{0};

    template <fixed_string Str> static consteval path_pattern from_literal() {
        path_pattern pattern{};
        constexpr auto raw = std::string_view(Str);

        if (raw.empty()) {
            throw "route path cannot be empty";
        }
        if (raw.front() != '/') {
            throw "route path must start with '/'";
        }

        size_t pos = 1;
        size_t param_index = 0;
        size_t segment_index = 0;

        while (pos < raw.size()) {
            size_t next_slash = raw.size();
            for (size_t i = pos; i < raw.size(); ++i) {
                if (raw[i] == '/') {
                    next_slash = i;
                    break;
                }
            }

            const size_t len = next_slash - pos;
            if (len == 0) {
                throw "empty path segment is not allowed";
            }
            if (segment_index >= MAX_ROUTE_SEGMENTS) {
                throw "too many path segments";
            }

            std::string_view segment = raw.substr(pos, len);
            if (segment.front() == '{') {
                if (segment.back() != '}') {
                    throw "parameter segment must end with '}'";
                }
                if (segment.size() <= 2) {
                    throw "parameter name cannot be empty";
                }
                if (param_index >= MAX_PATH_PARAMS) {
                    throw "too many path parameters";
                }

                auto name = segment.substr(1, segment.size() - 2);
                pattern.segments[segment_index] = path_segment{segment_kind::parameter, name};
                pattern.param_names[param_index] = name;
                ++param_index;
                ++pattern.param_count;
            } else {
                pattern.segments[segment_index] = path_segment{segment_kind::literal, segment};
                ++pattern.literal_count;
            }

            ++segment_index;
            pos = next_slash + 1;
        }

        pattern.segment_count = segment_index;
        return pattern;
    }

    [[nodiscard]] bool match_segments(std::span<const std::string_view> path_segments,
                                      path_params& out) const noexcept {
        if (path_segments.size() != segment_count) {
            return false;
        }

        size_t param_index = 0;
        for (size_t i = 0; i < segment_count; ++i) {
            const auto& segment = segments[i];
            const auto& actual = path_segments[i];

            if (segment.kind == segment_kind::literal) {
                if (segment.value != actual) {
                    return false;
                }
            } else {
                out.add(param_names[param_index], actual);
                ++param_index;
            }
        }
        return true;
    }

    // True when the leading literal segments of this pattern prefix the path.
    [[nodiscard]] bool matches_prefix(std::span<const std::string_view> path_segments) const noexcept {
        size_t i = 0;
        for (; i < segment_count && segments[i].kind == segment_kind::literal; ++i) {
            if (i >= path_segments.size() || segments[i].value != path_segments[i]) {
                return false;
            }
        }
        return i > 0;
    }

    [[nodiscard]] int specificity_score() const noexcept {
        return static_cast<int>(literal_count * 16 + (MAX_ROUTE_SEGMENTS - param_count));
    }
};

using handler_fn = std::function<response(const request&, request_context&)>;

struct route_entry {
    http::method method;
    path_pattern pattern;
    handler_fn handler;
};

struct dispatch_result {
    // error_code::not_found or error_code::method_not_allowed when no route ran.
    result<response> route_response;
    bool path_matched{false};
};

class router {
public:
    explicit router(std::span<const route_entry> routes) : routes_(routes) {}

    dispatch_result dispatch_with_info(const request& req, request_context& ctx) const {
        auto split = split_path(req.path());
        if (split.overflow) {
            return dispatch_result{std::unexpected(make_error_code(error_code::not_found)), false};
        }

        const route_entry* best_route = nullptr;
        path_params best_params;
        int best_score = -1;
        bool path_matched = false;

        for (const auto& entry : routes_) {
            path_params candidate_params{};
            if (!entry.pattern.match_segments(split.segments(), candidate_params)) {
                continue;
            }

            path_matched = true;
            if (entry.method != req.http_method) {
                continue;
            }

            int score = entry.pattern.specificity_score();
            if (!best_route || score > best_score) {
                best_route = &entry;
                best_score = score;
                best_params = candidate_params;
            }
        }

        if (!best_route) {
            auto ec = path_matched ? error_code::method_not_allowed : error_code::not_found;
            return dispatch_result{std::unexpected(make_error_code(ec)), path_matched};
        }

        ctx.params = best_params;
        return dispatch_result{best_route->handler(req, ctx), true};
    }

    result<response> dispatch(const request& req, request_context& ctx) const {
        return dispatch_with_info(req, ctx).route_response;
    }

private:
    std::span<const route_entry> routes_;
};

} // namespace shoal::http
