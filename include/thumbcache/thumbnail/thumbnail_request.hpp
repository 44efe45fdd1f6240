/**
 * @file thumbnail_request.hpp
 * @brief Thumbnail request parameters and query validation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <thumbcache/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace thumbcache::thumbnail {

/// Smallest accepted thumbnail width in pixels
constexpr int min_width = 50;

/// Largest accepted thumbnail width in pixels
constexpr int max_width = 2000;

/// Width used when the request does not carry one
constexpr int default_width = 400;

/**
 * @brief Validated thumbnail request
 */
struct thumbnail_request {
    /// Source image URL (never empty once validated)
    std::string url;

    /// Target width in pixels, within [min_width, max_width]
    int width{default_width};
};

/**
 * @brief Validate raw query parameters into a thumbnail request
 *
 * Checks run in order: url presence, width integer syntax, width range.
 * Performs no I/O.
 *
 * @param url Value of the `url` query parameter, nullopt if absent
 * @param width Value of the `width` query parameter, nullopt if absent
 * @return Validated request, or an error with code
 *         missing_parameter, invalid_parameter or out_of_range
 */
[[nodiscard]] Result<thumbnail_request> validate_request(
    std::optional<std::string_view> url,
    std::optional<std::string_view> width);

}  // namespace thumbcache::thumbnail
