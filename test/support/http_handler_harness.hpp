#pragma once

#include "shoal/core/http.hpp"

#include <functional>
#include <stdexcept>
#include <string>

namespace shoal::test_support {

// Runs a request handler on raw HTTP text without a socket or a reactor.
class http_handler_harness {
public:
    using handler = std::function<http::response(const http::request&)>;

    explicit http_handler_harness(handler h) : handler_(std::move(h)) {}

    http::response run_raw(const std::string& raw_request) const {
        http::parser parser;
        auto result = parser.parse(http::as_bytes(raw_request));
        if (!result.has_value() || *result != http::parser::state::complete) {
            throw std::runtime_error("Failed to parse HTTP request in harness");
        }
        return handler_(parser.get_request());
    }

    http::response run(http::method m, std::string uri, std::string body = "") const {
        http::request req;
        req.http_method = m;
        req.method_token = std::string(http::method_to_string(m));
        req.uri = std::move(uri);
        req.body = std::move(body);
        return handler_(req);
    }

private:
    handler handler_;
};

} // namespace shoal::test_support
