/**
 * @file thumbnail_endpoints.cpp
 * @brief Thumbnail REST API endpoints implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any thumbcache headers to avoid
// forward declaration conflicts
#include "crow.h"

#include "thumbcache/integration/logger_adapter.hpp"
#include "thumbcache/thumbnail/response_emitter.hpp"
#include "thumbcache/thumbnail/thumbnail_request.hpp"
#include "thumbcache/thumbnail/thumbnail_service.hpp"
#include "thumbcache/web/endpoints/system_endpoints.hpp"
#include "thumbcache/web/endpoints/thumbnail_endpoints.hpp"
#include "thumbcache/web/rest_config.hpp"
#include "thumbcache/web/rest_types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string_view>

namespace thumbcache::web::endpoints {

using integration::logger_adapter;
using integration::request_outcome;

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

std::optional<std::string_view> query_param(const crow::request& req,
                                            const char* name) {
    const char* value = req.url_params.get(name);
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string_view(value);
}

request_outcome outcome_of(thumbnail::thumbnail_source source) {
    switch (source) {
        case thumbnail::thumbnail_source::cache:
            return request_outcome::cache_hit;
        case thumbnail::thumbnail_source::coalesced:
            return request_outcome::coalesced;
        case thumbnail::thumbnail_source::generated:
        default:
            return request_outcome::generated;
    }
}

crow::response to_crow_response(thumbnail::http_reply reply,
                                 const rest_server_context& ctx) {
    crow::response res;
    res.code = reply.status;
    res.set_header("Content-Type", reply.content_type);
    res.body = std::move(reply.body);
    add_cors_headers(res, ctx);
    return res;
}

}  // namespace

// Internal implementation function called from rest_server.cpp
void register_thumbnail_endpoints_impl(crow::SimpleApp& app,
                                       std::shared_ptr<rest_server_context> ctx) {
    // GET /thumbnail?url={url}&width={width}
    CROW_ROUTE(app, "/thumbnail")
        .methods(crow::HTTPMethod::GET)([ctx](const crow::request& req) {
            auto started = std::chrono::steady_clock::now();
            auto url = query_param(req, "url");
            auto width = query_param(req, "width");

            thumbnail::http_reply reply;
            request_outcome outcome = request_outcome::failed;
            int logged_width = 0;

            auto request = thumbnail::validate_request(url, width);
            if (request.is_err()) {
                reply = thumbnail::response_emitter::emit_error(request.error());
                outcome = request_outcome::rejected;
            } else if (ctx->thumbnails == nullptr) {
                reply.status = static_cast<int>(http_status::internal_server_error);
                reply.content_type = std::string(json_content_type);
                reply.body = make_error_json(
                    "Image processing failed: thumbnail service not configured");
            } else {
                logged_width = request.value().width;
                try {
                    auto result = ctx->thumbnails->get_thumbnail(request.value());
                    if (result.is_ok()) {
                        outcome = outcome_of(result.value().source);
                    }
                    reply = thumbnail::response_emitter::emit(result);
                } catch (const std::exception& e) {
                    logger_adapter::error("Unhandled error serving thumbnail: {}",
                                          e.what());
                    reply = thumbnail::response_emitter::emit_exception(e);
                }
            }

            auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            logger_adapter::log_thumbnail_request(
                url ? std::string(*url) : std::string(), logged_width, outcome,
                reply.status, latency);

            return to_crow_response(std::move(reply), *ctx);
        });

    // GET /thumbnail/stats
    CROW_ROUTE(app, "/thumbnail/stats")
        .methods(crow::HTTPMethod::GET)([ctx]() {
            crow::response res;
            res.add_header("Content-Type", std::string(json_content_type));
            add_cors_headers(res, *ctx);

            if (ctx->thumbnails == nullptr) {
                res.code = static_cast<int>(http_status::internal_server_error);
                res.body = make_error_json("Thumbnail service not configured");
                return res;
            }

            auto cache = ctx->thumbnails->cache_statistics();
            auto stats = ctx->thumbnails->statistics();

            crow::json::wvalue body;
            body["entries"] = static_cast<std::uint64_t>(cache.entry_count);
            body["bytes"] = static_cast<std::uint64_t>(cache.total_bytes);
            body["hits"] = stats.hits;
            body["misses"] = stats.misses;
            body["fetches"] = stats.fetches;
            body["coalesced"] = stats.coalesced;
            body["failures"] = stats.failures;
            body["digest"] = ctx->thumbnails->key_deriver().digest().name();

            res.code = static_cast<int>(http_status::ok);
            res.body = body.dump();
            return res;
        });
}

}  // namespace thumbcache::web::endpoints
