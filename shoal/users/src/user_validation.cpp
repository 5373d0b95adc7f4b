#include "shoal/users/user_validation.hpp"

#include <cctype>
#include <cmath>

namespace shoal::users {

namespace {

constexpr std::string_view FIELD_ID = "id";
constexpr std::string_view FIELD_NAME = "name";
constexpr std::string_view FIELD_AGE = "age";
constexpr std::string_view FIELD_HOBBIES = "hobbies";

std::unexpected<validation_error> fail(std::string_view field, validation_error_code code) {
    return std::unexpected(validation_error{field, code});
}

bool is_blank(std::string_view s) noexcept {
    for (char ch : s) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return true;
}

validated<std::string> check_name(const json::value& v) {
    if (!v.is_string()) {
        return fail(FIELD_NAME, validation_error_code::invalid_type);
    }
    if (is_blank(v.as_string())) {
        return fail(FIELD_NAME, validation_error_code::empty_string);
    }
    return v.as_string();
}

validated<double> check_age(const json::value& v) {
    if (!v.is_number()) {
        return fail(FIELD_AGE, validation_error_code::invalid_type);
    }
    // Literals such as 1e999 parse to infinity.
    if (!std::isfinite(v.as_number())) {
        return fail(FIELD_AGE, validation_error_code::non_finite_number);
    }
    return v.as_number();
}

validated<std::vector<std::string>> check_hobbies(const json::value& v) {
    if (!v.is_array()) {
        return fail(FIELD_HOBBIES, validation_error_code::invalid_type);
    }
    std::vector<std::string> out;
    out.reserve(v.size());
    for (const auto& item : v.as_array()) {
        if (!item.is_string()) {
            return fail(FIELD_HOBBIES, validation_error_code::invalid_array_item);
        }
        out.push_back(item.as_string());
    }
    return out;
}

} // namespace

std::string validation_error::message() const {
    std::string f(field);
    switch (code) {
    case validation_error_code::invalid_json:
        return "Invalid JSON format.";
    case validation_error_code::not_an_object:
        return "Request body must be a JSON object.";
    case validation_error_code::id_not_allowed:
        return "Field '" + f + "' must not be supplied.";
    case validation_error_code::required_field_missing:
        return "Field '" + f + "' is required.";
    case validation_error_code::invalid_type:
        if (field == FIELD_AGE) {
            return "Field 'age' must be a number.";
        }
        if (field == FIELD_HOBBIES) {
            return "Field 'hobbies' must be an array of strings.";
        }
        return "Field '" + f + "' must be a string.";
    case validation_error_code::empty_string:
        return "Field '" + f + "' must not be empty.";
    case validation_error_code::non_finite_number:
        return "Field '" + f + "' must be a finite number.";
    case validation_error_code::invalid_array_item:
        return "Field '" + f + "' must contain only strings.";
    }
    return "Invalid user data.";
}

validated<json::value> parse_object_body(std::string_view body) {
    auto parsed = json::parse(body);
    if (!parsed) {
        return fail({}, validation_error_code::invalid_json);
    }
    if (!parsed->is_object()) {
        return fail({}, validation_error_code::not_an_object);
    }
    return std::move(*parsed);
}

validated<user_fields> validate_create(const json::value& body) {
    if (body.contains(FIELD_ID)) {
        return fail(FIELD_ID, validation_error_code::id_not_allowed);
    }

    const auto* name = body.find(FIELD_NAME);
    if (!name) {
        return fail(FIELD_NAME, validation_error_code::required_field_missing);
    }
    auto checked_name = check_name(*name);
    if (!checked_name) {
        return std::unexpected(checked_name.error());
    }

    const auto* age = body.find(FIELD_AGE);
    if (!age) {
        return fail(FIELD_AGE, validation_error_code::required_field_missing);
    }
    auto checked_age = check_age(*age);
    if (!checked_age) {
        return std::unexpected(checked_age.error());
    }

    const auto* hobbies = body.find(FIELD_HOBBIES);
    if (!hobbies) {
        return fail(FIELD_HOBBIES, validation_error_code::required_field_missing);
    }
    auto checked_hobbies = check_hobbies(*hobbies);
    if (!checked_hobbies) {
        return std::unexpected(checked_hobbies.error());
    }

    return user_fields{std::move(*checked_name), *checked_age, std::move(*checked_hobbies)};
}

validated<user_patch> validate_update(const json::value& body) {
    if (body.contains(FIELD_ID)) {
        return fail(FIELD_ID, validation_error_code::id_not_allowed);
    }

    user_patch patch;

    if (const auto* name = body.find(FIELD_NAME)) {
        auto checked = check_name(*name);
        if (!checked) {
            return std::unexpected(checked.error());
        }
        patch.name = std::move(*checked);
    }

    if (const auto* age = body.find(FIELD_AGE)) {
        auto checked = check_age(*age);
        if (!checked) {
            return std::unexpected(checked.error());
        }
        patch.age = *checked;
    }

    if (const auto* hobbies = body.find(FIELD_HOBBIES)) {
        auto checked = check_hobbies(*hobbies);
        if (!checked) {
            return std::unexpected(checked.error());
        }
        patch.hobbies = std::move(*checked);
    }

    return patch;
}

} // namespace shoal::users
