/**
 * @file curl_image_fetcher.hpp
 * @brief libcurl-based image fetcher
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "image_fetcher.hpp"

#include <chrono>
#include <cstddef>

namespace thumbcache::network {

/**
 * @brief Configuration for curl_image_fetcher
 */
struct fetcher_config {
    /// Total time allowed for one fetch
    std::chrono::milliseconds timeout{10000};

    /// Time allowed for the connection phase
    std::chrono::milliseconds connect_timeout{5000};

    /// Maximum number of redirects followed
    long max_redirects{5};

    /// User-Agent header sent with every request
    std::string user_agent{"thumbcache/1.0"};

    /// Largest accepted body in bytes (0 = unlimited)
    std::size_t max_body_size{50 * 1024 * 1024};
};

/**
 * @brief Fetches images over HTTP(S) with the libcurl easy interface
 *
 * Each fetch uses its own easy handle, so one instance can serve all
 * worker threads.
 *
 * Error mapping:
 * - CURLE_OPERATION_TIMEDOUT -> fetch_timeout
 * - HTTP status outside 200-299 -> fetch_failure
 * - any other transport failure -> network_error
 */
class curl_image_fetcher final : public image_fetcher {
public:
    explicit curl_image_fetcher(fetcher_config config = {});

    [[nodiscard]] auto fetch(const std::string& url)
        -> Result<std::vector<std::uint8_t>> override;

    [[nodiscard]] auto config() const noexcept -> const fetcher_config& {
        return config_;
    }

private:
    fetcher_config config_;
};

}  // namespace thumbcache::network
