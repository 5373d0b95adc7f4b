#pragma once

#include <string>
#include <string_view>

namespace shoal {

// Error payload carried by every non-2xx API response. Rendered as
// {"message":"..."}; the title becomes the HTTP reason phrase.
struct problem_details {
    int status = 500;
    std::string title;
    std::string message;

    problem_details() = default;
    problem_details(problem_details&&) noexcept = default;
    problem_details& operator=(problem_details&&) noexcept = default;
    problem_details(const problem_details&) = default;
    problem_details& operator=(const problem_details&) = default;

    [[nodiscard]] std::string to_json() const;

    static problem_details bad_request(std::string_view message);
    static problem_details not_found(std::string_view message);
    static problem_details content_too_large(std::string_view message);
    static problem_details internal_server_error(std::string_view message = "");
    static problem_details bad_gateway(std::string_view message);
    static problem_details gateway_timeout(std::string_view message);
};

} // namespace shoal
