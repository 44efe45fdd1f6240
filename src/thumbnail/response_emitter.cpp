/**
 * @file response_emitter.cpp
 * @brief Implementation of thumbnail reply mapping
 */

#include <thumbcache/thumbnail/response_emitter.hpp>

#include <thumbcache/web/rest_types.hpp>

#include <exception>

namespace thumbcache::thumbnail {

namespace {

auto processing_failed(const std::string& detail) -> std::string {
    return "Image processing failed: " + detail;
}

auto json_reply(int status, const std::string& message) -> http_reply {
    http_reply reply;
    reply.status = status;
    reply.content_type = std::string(web::json_content_type);
    reply.body = web::make_error_json(message);
    return reply;
}

}  // namespace

http_reply response_emitter::emit(const Result<thumbnail_result>& result) {
    if (result.is_err()) {
        return emit_error(result.error());
    }

    const auto& data = result.value().data;
    http_reply reply;
    reply.status = static_cast<int>(web::http_status::ok);
    reply.content_type = std::string(web::jpeg_content_type);
    reply.body.assign(reinterpret_cast<const char*>(data.data()), data.size());
    return reply;
}

http_reply response_emitter::emit_error(const error_info& error) {
    return json_reply(status_for(error.code), message_for(error));
}

http_reply response_emitter::emit_exception(const std::exception& e) {
    return json_reply(static_cast<int>(web::http_status::internal_server_error),
                      processing_failed(e.what()));
}

int response_emitter::status_for(int error_code) noexcept {
    switch (error_code) {
        case error_codes::missing_parameter:
        case error_codes::invalid_parameter:
        case error_codes::out_of_range:
            return static_cast<int>(web::http_status::bad_request);
        case error_codes::fetch_failure:
            return static_cast<int>(web::http_status::not_found);
        case error_codes::fetch_timeout:
            return static_cast<int>(web::http_status::gateway_timeout);
        default:
            return static_cast<int>(web::http_status::internal_server_error);
    }
}

std::string response_emitter::message_for(const error_info& error) {
    switch (error.code) {
        case error_codes::missing_parameter:
            return "Missing 'url' parameter";
        case error_codes::invalid_parameter:
            return "Invalid width parameter";
        case error_codes::out_of_range:
            return "Width must be between 50 and 2000";
        case error_codes::fetch_failure:
            return "Failed to fetch image";
        case error_codes::fetch_timeout:
            return "Request timeout while fetching image";
        default:
            return processing_failed(error.message);
    }
}

}  // namespace thumbcache::thumbnail
