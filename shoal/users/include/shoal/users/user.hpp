#pragma once

#include "shoal/core/json.hpp"

#include <optional>
#include <string>
#include <vector>

namespace shoal::users {

struct user {
    std::string id;
    std::string name;
    double age = 0.0;
    std::vector<std::string> hobbies;

    [[nodiscard]] json::value to_json() const;

    bool operator==(const user&) const = default;
};

// Validated input of a create request.
struct user_fields {
    std::string name;
    double age = 0.0;
    std::vector<std::string> hobbies;
};

// Validated input of an update request; absent members keep their value.
struct user_patch {
    std::optional<std::string> name;
    std::optional<double> age;
    std::optional<std::vector<std::string>> hobbies;

    [[nodiscard]] bool empty() const noexcept { return !name && !age && !hobbies; }

    void apply_to(user& target) const;
};

std::string serialize(const user& u);
std::string serialize(const std::vector<user>& list);

} // namespace shoal::users
