#include "shoal/users/user_api.hpp"

#include "shoal/core/problem.hpp"
#include "shoal/core/uuid.hpp"
#include "shoal/users/user_validation.hpp"

#include <iostream>

namespace shoal::users {

namespace {

constexpr auto USERS_COLLECTION = http::path_pattern::from_literal<"/api/users">();
constexpr auto USERS_ITEM = http::path_pattern::from_literal<"/api/users/{id}">();

constexpr std::string_view INVALID_ID_MESSAGE = "Invalid userId format";

http::response bad_request(std::string_view message) {
    return http::response::error(problem_details::bad_request(message));
}

http::response user_not_found(std::string_view id) {
    std::string message = "User with id ";
    message.append(id);
    message.append(" not found.");
    return http::response::error(problem_details::not_found(message));
}

std::string_view id_param(const http::request_context& ctx) {
    return ctx.params.get("id").value_or(std::string_view{});
}

} // namespace

user_api::user_api(user_store& store)
    : store_(store),
      routes_{{
          {http::method::get, USERS_COLLECTION,
           [this](const http::request&, http::request_context&) { return list_users(); }},
          {http::method::get, USERS_ITEM,
           [this](const http::request&, http::request_context& ctx) {
               return get_user(id_param(ctx));
           }},
          {http::method::post, USERS_COLLECTION,
           [this](const http::request& req, http::request_context&) { return create_user(req); }},
          {http::method::put, USERS_ITEM,
           [this](const http::request& req, http::request_context& ctx) {
               return update_user(id_param(ctx), req);
           }},
          {http::method::del, USERS_ITEM,
           [this](const http::request&, http::request_context& ctx) {
               return delete_user(id_param(ctx));
           }},
      }},
      router_(routes_) {}

http::response user_api::handle(const http::request& req) {
    try {
        http::request_context ctx;
        auto dispatched = router_.dispatch_with_info(req, ctx);
        if (dispatched.route_response) {
            return std::move(*dispatched.route_response);
        }
        return route_not_found(req);
    } catch (const std::exception& e) {
        std::cerr << "[api] Internal server error: " << e.what() << "\n";
    } catch (...) {
        std::cerr << "[api] Internal server error: unknown exception\n";
    }
    return http::response::error(problem_details::internal_server_error());
}

http::response user_api::route_not_found(const http::request& req) const {
    // A path too deep to split fully still keeps its leading segments.
    auto split = http::split_path(req.path());
    if (USERS_COLLECTION.matches_prefix(split.segments())) {
        return http::response::error(problem_details::not_found("Endpoint not found."));
    }
    return http::response::error(problem_details::not_found("Resource not found."));
}

http::response user_api::list_users() {
    return http::response::json(serialize(store_.list_all()));
}

http::response user_api::get_user(std::string_view id) {
    if (!uuid::is_valid(id)) {
        return bad_request(INVALID_ID_MESSAGE);
    }

    auto found = store_.find_by_id(id);
    if (!found) {
        return user_not_found(id);
    }
    return http::response::json(serialize(*found));
}

http::response user_api::create_user(const http::request& req) {
    auto body = parse_object_body(req.body);
    if (!body) {
        return http::response::error(body.error().to_problem());
    }

    auto fields = validate_create(*body);
    if (!fields) {
        return http::response::error(fields.error().to_problem());
    }

    auto created = store_.create(std::move(*fields));
    return http::response::json(serialize(created), 201);
}

http::response user_api::update_user(std::string_view id, const http::request& req) {
    if (!uuid::is_valid(id)) {
        return bad_request(INVALID_ID_MESSAGE);
    }

    auto body = parse_object_body(req.body);
    if (!body) {
        return http::response::error(body.error().to_problem());
    }

    auto patch = validate_update(*body);
    if (!patch) {
        return http::response::error(patch.error().to_problem());
    }

    auto updated = store_.replace(id, *patch);
    if (!updated) {
        return user_not_found(id);
    }
    return http::response::json(serialize(*updated));
}

http::response user_api::delete_user(std::string_view id) {
    if (!uuid::is_valid(id)) {
        return bad_request(INVALID_ID_MESSAGE);
    }

    if (!store_.remove(id)) {
        return user_not_found(id);
    }
    return http::response::no_content();
}

} // namespace shoal::users
