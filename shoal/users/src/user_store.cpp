#include "shoal/users/user_store.hpp"

#include "shoal/core/uuid.hpp"

#include <algorithm>
#include <stdexcept>

namespace shoal::users {

user_store::user_store() : generate_id_([] { return uuid::generate_v4(); }) {}

user_store::user_store(id_generator generator) : generate_id_(std::move(generator)) {
    if (!generate_id_) {
        throw std::invalid_argument("user_store requires an id generator");
    }
}

std::optional<user> user_store::find_by_id(std::string_view id) const {
    auto it = std::find_if(users_.begin(), users_.end(), [id](const user& u) { return u.id == id; });
    if (it == users_.end()) {
        return std::nullopt;
    }
    return *it;
}

user user_store::create(user_fields fields) {
    user created;
    created.id = next_id();
    created.name = std::move(fields.name);
    created.age = fields.age;
    created.hobbies = std::move(fields.hobbies);

    users_.push_back(created);
    return created;
}

std::optional<user> user_store::replace(std::string_view id, const user_patch& patch) {
    auto it = locate(id);
    if (it == users_.end()) {
        return std::nullopt;
    }

    // A failed merge leaves the stored record untouched.
    user merged = *it;
    patch.apply_to(merged);
    *it = merged;
    return merged;
}

bool user_store::remove(std::string_view id) {
    auto it = locate(id);
    if (it == users_.end()) {
        return false;
    }
    users_.erase(it);
    return true;
}

std::vector<user>::iterator user_store::locate(std::string_view id) {
    return std::find_if(users_.begin(), users_.end(), [id](const user& u) { return u.id == id; });
}

std::string user_store::next_id() const {
    for (int attempt = 0; attempt < MAX_ID_ATTEMPTS; ++attempt) {
        auto id = generate_id_();
        if (!find_by_id(id)) {
            return id;
        }
    }
    throw std::runtime_error("unable to generate a unique user id");
}

} // namespace shoal::users
