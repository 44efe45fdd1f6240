/**
 * @file record_endpoints.cpp
 * @brief Record collection REST API endpoints implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any thumbcache headers to avoid
// forward declaration conflicts
#include "crow.h"

// Workaround for Windows: DELETE is defined as a macro in <winnt.h>
// which conflicts with crow::HTTPMethod::DELETE
#ifdef DELETE
#undef DELETE
#endif

#include "thumbcache/integration/logger_adapter.hpp"
#include "thumbcache/storage/record_store.hpp"
#include "thumbcache/web/endpoints/record_endpoints.hpp"
#include "thumbcache/web/endpoints/system_endpoints.hpp"
#include "thumbcache/web/rest_config.hpp"
#include "thumbcache/web/rest_types.hpp"

#include <memory>
#include <string>

namespace thumbcache::web::endpoints {

using integration::logger_adapter;
using storage::collection;

namespace {

/**
 * @brief Add CORS headers to response
 */
void add_cors_headers(crow::response& res, const rest_server_context& ctx) {
    if (ctx.config != nullptr && ctx.config->enable_cors &&
        !ctx.config->cors_allowed_origins.empty()) {
        res.add_header("Access-Control-Allow-Origin",
                       ctx.config->cors_allowed_origins);
    }
}

crow::response json_response(int code, std::string body,
                             const rest_server_context& ctx) {
    crow::response res;
    res.code = code;
    res.add_header("Content-Type", std::string(json_content_type));
    res.body = std::move(body);
    add_cors_headers(res, ctx);
    return res;
}

int status_for(const error_info& error) {
    switch (error.code) {
        case error_codes::record_not_found:
            return static_cast<int>(http_status::not_found);
        case error_codes::invalid_record:
            return static_cast<int>(http_status::bad_request);
        default:
            return static_cast<int>(http_status::internal_server_error);
    }
}

crow::response error_response(const error_info& error,
                              const rest_server_context& ctx) {
    if (error.code == error_codes::store_io_error) {
        logger_adapter::error("Record store failure: {}", error.message);
    }
    return json_response(status_for(error), make_error_json(error.message), ctx);
}

/**
 * @brief GET and POST on /{collection}
 */
crow::response handle_collection(const rest_server_context& ctx, collection c,
                                 const crow::request& req) {
    auto& store = *ctx.records;

    if (req.method == crow::HTTPMethod::POST) {
        auto created = store.create(c, req.body);
        if (created.is_err()) {
            return error_response(created.error(), ctx);
        }
        logger_adapter::debug("Created record in {}", storage::collection_name(c));
        return json_response(static_cast<int>(http_status::created),
                             std::move(created.value()), ctx);
    }

    storage::record_store::filter_map filters;
    for (auto field : storage::filter_fields(c)) {
        std::string name(field);
        const char* value = req.url_params.get(name);
        if (value != nullptr) {
            filters.emplace(name, value);
        }
    }

    auto listed = store.list(c, filters);
    if (listed.is_err()) {
        return error_response(listed.error(), ctx);
    }
    return json_response(static_cast<int>(http_status::ok),
                         std::move(listed.value()), ctx);
}

/**
 * @brief GET, PUT and DELETE on /{collection}/{id}
 */
crow::response handle_record(const rest_server_context& ctx, collection c,
                             const crow::request& req, const std::string& id) {
    auto& store = *ctx.records;

    if (req.method == crow::HTTPMethod::DELETE) {
        auto removed = store.remove(c, id);
        if (removed.is_err()) {
            return error_response(removed.error(), ctx);
        }
        crow::response res(static_cast<int>(http_status::no_content));
        add_cors_headers(res, ctx);
        return res;
    }

    if (req.method == crow::HTTPMethod::PUT) {
        auto replaced = store.replace(c, id, req.body);
        if (replaced.is_err()) {
            return error_response(replaced.error(), ctx);
        }
        return json_response(static_cast<int>(http_status::ok),
                             std::move(replaced.value()), ctx);
    }

    auto found = store.get(c, id);
    if (found.is_err()) {
        return error_response(found.error(), ctx);
    }
    return json_response(static_cast<int>(http_status::ok),
                         std::move(found.value()), ctx);
}

}  // namespace

// Internal implementation function called from rest_server.cpp
void register_record_endpoints_impl(crow::SimpleApp& app,
                                    std::shared_ptr<rest_server_context> ctx) {
    if (ctx->records == nullptr) {
        return;
    }

    // /users
    CROW_ROUTE(app, "/users")
        .methods(crow::HTTPMethod::GET, crow::HTTPMethod::POST)(
            [ctx](const crow::request& req) {
                return handle_collection(*ctx, collection::users, req);
            });
    CROW_ROUTE(app, "/users/<string>")
        .methods(crow::HTTPMethod::GET, crow::HTTPMethod::PUT,
                 crow::HTTPMethod::DELETE)(
            [ctx](const crow::request& req, const std::string& id) {
                return handle_record(*ctx, collection::users, req, id);
            });

    // /vehicles
    CROW_ROUTE(app, "/vehicles")
        .methods(crow::HTTPMethod::GET, crow::HTTPMethod::POST)(
            [ctx](const crow::request& req) {
                return handle_collection(*ctx, collection::vehicles, req);
            });
    CROW_ROUTE(app, "/vehicles/<string>")
        .methods(crow::HTTPMethod::GET, crow::HTTPMethod::PUT,
                 crow::HTTPMethod::DELETE)(
            [ctx](const crow::request& req, const std::string& id) {
                return handle_record(*ctx, collection::vehicles, req, id);
            });

    // /bookings
    CROW_ROUTE(app, "/bookings")
        .methods(crow::HTTPMethod::GET, crow::HTTPMethod::POST)(
            [ctx](const crow::request& req) {
                return handle_collection(*ctx, collection::bookings, req);
            });
    CROW_ROUTE(app, "/bookings/<string>")
        .methods(crow::HTTPMethod::GET, crow::HTTPMethod::PUT,
                 crow::HTTPMethod::DELETE)(
            [ctx](const crow::request& req, const std::string& id) {
                return handle_record(*ctx, collection::bookings, req, id);
            });
}

}  // namespace thumbcache::web::endpoints
