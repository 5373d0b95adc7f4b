#pragma once

#include "shoal/users/user.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace shoal::users {

using id_generator = std::function<std::string()>;

/// In-memory user collection owned by one process.
///
/// Records keep insertion order. Not thread-safe: each reactor thread owns its
/// own store.
class user_store {
public:
    static constexpr int MAX_ID_ATTEMPTS = 8;

    /// Uses random version 4 UUIDs as ids.
    user_store();
    explicit user_store(id_generator generator);

    [[nodiscard]] const std::vector<user>& list_all() const noexcept { return users_; }

    [[nodiscard]] std::optional<user> find_by_id(std::string_view id) const;

    /// Assigns a fresh id and appends the record. A generated id that is
    /// already taken is regenerated; throws std::runtime_error when the
    /// generator keeps colliding.
    user create(user_fields fields);

    /// Merges the patch into the record; nullopt when the id is unknown.
    std::optional<user> replace(std::string_view id, const user_patch& patch);

    bool remove(std::string_view id);

    [[nodiscard]] size_t size() const noexcept { return users_.size(); }

private:
    std::vector<user>::iterator locate(std::string_view id);
    std::string next_id() const;

    std::vector<user> users_;
    id_generator generate_id_;
};

} // namespace shoal::users
