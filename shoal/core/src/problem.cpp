#include "shoal/core/problem.hpp"
#include "shoal/core/json.hpp"

namespace shoal {

namespace {

constexpr std::string_view GENERIC_INTERNAL_MESSAGE =
    "An unexpected error occurred. Please try again later.";

problem_details make_problem(int status, std::string_view title, std::string_view message) {
    problem_details p;
    p.status = status;
    p.title = std::string(title);
    p.message = std::string(message);
    return p;
}

} // namespace

std::string problem_details::to_json() const {
    std::string out;
    out.reserve(message.size() + 16);
    out.append("{\"message\":");
    json::append_quoted(out, message);
    out.push_back('}');
    return out;
}

problem_details problem_details::bad_request(std::string_view message) {
    return make_problem(400, "Bad Request", message);
}

problem_details problem_details::not_found(std::string_view message) {
    return make_problem(404, "Not Found", message);
}

problem_details problem_details::content_too_large(std::string_view message) {
    return make_problem(413, "Content Too Large", message);
}

problem_details problem_details::internal_server_error(std::string_view message) {
    return make_problem(
        500, "Internal Server Error", message.empty() ? GENERIC_INTERNAL_MESSAGE : message);
}

problem_details problem_details::bad_gateway(std::string_view message) {
    return make_problem(502, "Bad Gateway", message);
}

problem_details problem_details::gateway_timeout(std::string_view message) {
    return make_problem(504, "Gateway Timeout", message);
}

} // namespace shoal
