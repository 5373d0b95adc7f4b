#pragma once

#include "shoal/core/json.hpp"
#include "shoal/core/problem.hpp"
#include "shoal/users/user.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace shoal::users {

enum class validation_error_code : uint8_t {
    invalid_json,
    not_an_object,
    id_not_allowed,
    required_field_missing,
    invalid_type,
    empty_string,
    non_finite_number,
    invalid_array_item,
};

struct validation_error {
    std::string_view field; // empty for whole-body errors
    validation_error_code code;

    // Client-facing text, naming the field where there is one.
    [[nodiscard]] std::string message() const;

    [[nodiscard]] problem_details to_problem() const {
        return problem_details::bad_request(message());
    }
};

template <typename T> using validated = std::expected<T, validation_error>;

// Parses a request body that must be a JSON object.
validated<json::value> parse_object_body(std::string_view body);

// All of name, age and hobbies are required; id must be absent.
validated<user_fields> validate_create(const json::value& body);

// Only supplied fields are checked; unknown fields are ignored and an empty
// object is a valid no-op patch. id must be absent.
validated<user_patch> validate_update(const json::value& body);

} // namespace shoal::users
