/**
 * @file response_emitter.hpp
 * @brief Mapping of thumbnail outcomes to HTTP replies
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <thumbcache/core/result.hpp>
#include <thumbcache/thumbnail/thumbnail_service.hpp>

#include <exception>
#include <string>

namespace thumbcache::thumbnail {

/**
 * @brief Transport-independent HTTP reply
 */
struct http_reply {
    int status{200};
    std::string content_type;
    std::string body;
};

/**
 * @class response_emitter
 * @brief Builds replies for the thumbnail endpoint
 *
 * Success replies carry raw JPEG bytes and are the same whether the
 * thumbnail came from the cache or was generated. Failure replies are
 * JSON objects with a single `error` field:
 *
 * | error code                          | status | message                                  |
 * |-------------------------------------|--------|------------------------------------------|
 * | missing_parameter                   | 400    | Missing 'url' parameter                  |
 * | invalid_parameter                   | 400    | Invalid width parameter                  |
 * | out_of_range                        | 400    | Width must be between 50 and 2000        |
 * | fetch_failure                       | 404    | Failed to fetch image                    |
 * | fetch_timeout                       | 504    | Request timeout while fetching image     |
 * | anything else                       | 500    | Image processing failed: <message>       |
 */
class response_emitter {
public:
    /**
     * @brief Build the reply for a thumbnail lookup
     */
    [[nodiscard]] static http_reply emit(const Result<thumbnail_result>& result);

    /**
     * @brief Build the error reply for an error
     */
    [[nodiscard]] static http_reply emit_error(const error_info& error);

    /**
     * @brief Build the reply for an exception that escaped the pipeline
     */
    [[nodiscard]] static http_reply emit_exception(const std::exception& e);

    /**
     * @brief HTTP status for an error code
     */
    [[nodiscard]] static int status_for(int error_code) noexcept;

    /**
     * @brief Client-facing message for an error
     */
    [[nodiscard]] static std::string message_for(const error_info& error);
};

}  // namespace thumbcache::thumbnail
