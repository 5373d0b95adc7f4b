#pragma once

#include "shoal/core/http.hpp"
#include "shoal/core/router.hpp"
#include "shoal/users/user_store.hpp"

#include <array>
#include <string_view>

namespace shoal::users {

/// REST surface of a user_store.
///
///   GET    /api/users        list
///   GET    /api/users/{id}   fetch
///   POST   /api/users        create
///   PUT    /api/users/{id}   partial update
///   DELETE /api/users/{id}   delete
///
/// Every failure is rendered as {"message": ...}. handle() never throws:
/// unexpected exceptions become a generic 500.
class user_api {
public:
    explicit user_api(user_store& store);

    user_api(const user_api&) = delete;
    user_api& operator=(const user_api&) = delete;

    http::response handle(const http::request& req);

    [[nodiscard]] user_store& store() noexcept { return store_; }

private:
    http::response list_users();
    http::response get_user(std::string_view id);
    http::response create_user(const http::request& req);
    http::response update_user(std::string_view id, const http::request& req);
    http::response delete_user(std::string_view id);

    http::response route_not_found(const http::request& req) const;

    user_store& store_;
    std::array<http::route_entry, 5> routes_;
    http::router router_;
};

} // namespace shoal::users
