#include "shoal/users/user.hpp"

namespace shoal::users {

json::value user::to_json() const {
    auto list = json::value::array();
    for (const auto& hobby : hobbies) {
        list.push_back(hobby);
    }

    auto obj = json::value::object();
    obj.set("id", id);
    obj.set("name", name);
    obj.set("age", age);
    obj.set("hobbies", std::move(list));
    return obj;
}

void user_patch::apply_to(user& target) const {
    if (name) {
        target.name = *name;
    }
    if (age) {
        target.age = *age;
    }
    if (hobbies) {
        target.hobbies = *hobbies;
    }
}

std::string serialize(const user& u) {
    return json::serialize(u.to_json());
}

std::string serialize(const std::vector<user>& list) {
    std::string out;
    out.push_back('[');
    for (size_t i = 0; i < list.size(); ++i) {
        if (i > 0) {
            out.push_back(',');
        }
        json::serialize_into(list[i].to_json(), out);
    }
    out.push_back(']');
    return out;
}

} // namespace shoal::users
