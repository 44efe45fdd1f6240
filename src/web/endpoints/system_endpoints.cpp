/**
 * @file system_endpoints.cpp
 * @brief System API endpoints implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any thumbcache headers to avoid
// forward declaration conflicts
#include "crow.h"

#include "thumbcache/web/endpoints/system_endpoints.hpp"
#include "thumbcache/web/rest_config.hpp"
#include "thumbcache/web/rest_types.hpp"

namespace thumbcache::web::endpoints {

namespace {

/**
 * @brief Add CORS headers to response
 */
void add_cors_headers(crow::response &res, const rest_server_context &ctx) {
  if (ctx.config && ctx.config->enable_cors &&
      !ctx.config->cors_allowed_origins.empty()) {
    res.add_header("Access-Control-Allow-Origin",
                   ctx.config->cors_allowed_origins);
  }
}

} // namespace

// Internal implementation function called from rest_server.cpp
void register_system_endpoints_impl(crow::SimpleApp &app,
                                    std::shared_ptr<rest_server_context> ctx) {
  // GET / - Server information
  CROW_ROUTE(app, "/").methods(crow::HTTPMethod::GET)([ctx]() {
    crow::json::wvalue endpoints_json;
    endpoints_json["users"] = "/users";
    endpoints_json["vehicles"] = "/vehicles";
    endpoints_json["bookings"] = "/bookings";
    endpoints_json["thumbnail"] = "/thumbnail?url=<url>&width=<50-2000>";

    crow::json::wvalue body;
    body["message"] = "thumbcache API Server";
    body["version"] = server_version;
    body["endpoints"] = std::move(endpoints_json);

    crow::response res(static_cast<int>(http_status::ok), body.dump());
    res.set_header("Content-Type", std::string(json_content_type));
    add_cors_headers(res, *ctx);
    return res;
  });
}

} // namespace thumbcache::web::endpoints
