/**
 * @file image_fetcher.hpp
 * @brief Abstract remote image fetcher
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <thumbcache/core/result.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace thumbcache::network {

/**
 * @brief Retrieves raw bytes for a source image URL
 *
 * Implementations must be safe to call from several threads at once.
 */
class image_fetcher {
public:
    virtual ~image_fetcher() = default;

    /**
     * @brief Fetch the full response body for a URL
     *
     * The body is returned as-is; whether it is an image is decided later
     * by the decoder.
     *
     * @return The body, or an error with code fetch_timeout, fetch_failure
     *         (non-2xx status) or network_error
     */
    [[nodiscard]] virtual auto fetch(const std::string& url)
        -> Result<std::vector<std::uint8_t>> = 0;
};

}  // namespace thumbcache::network
