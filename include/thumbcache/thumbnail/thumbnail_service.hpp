/**
 * @file thumbnail_service.hpp
 * @brief Thumbnail generation pipeline with persistent caching
 *
 * Serves thumbnails for (url, width) requests. A cached thumbnail is
 * returned as stored; otherwise the source image is fetched, normalized to
 * opaque RGB, resized with Lanczos-3, encoded as JPEG and written to the
 * cache store before it is returned.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <thumbcache/core/result.hpp>
#include <thumbcache/image/jpeg_encoder.hpp>
#include <thumbcache/network/image_fetcher.hpp>
#include <thumbcache/storage/cache_store.hpp>
#include <thumbcache/thumbnail/cache_key.hpp>
#include <thumbcache/thumbnail/inflight_registry.hpp>
#include <thumbcache/thumbnail/thumbnail_request.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace thumbcache::thumbnail {

/**
 * @brief How a thumbnail was obtained
 */
enum class thumbnail_source {
    cache,      ///< Read from the cache store
    generated,  ///< Produced by this request
    coalesced   ///< Produced by a concurrent request for the same key
};

/**
 * @brief Pipeline settings
 */
struct thumbnail_config {
    /// JPEG encoder settings (quality 85, optimized Huffman tables)
    image::jpeg_options jpeg;
};

/**
 * @brief Successful thumbnail lookup
 */
struct thumbnail_result {
    /// JPEG bytes
    std::vector<std::uint8_t> data;

    /// Where the bytes came from
    thumbnail_source source{thumbnail_source::generated};

    /// Cache key of the request
    std::string cache_key;
};

/**
 * @brief Counters since service construction
 */
struct thumbnail_statistics {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t fetches{0};
    std::uint64_t coalesced{0};
    std::uint64_t failures{0};
};

/**
 * @class thumbnail_service
 * @brief Thumbnail pipeline coordinator
 *
 * For every key at most one fetch runs at a time: concurrent misses join
 * the running generation through an inflight_registry. A failed
 * generation never writes to the cache store.
 *
 * Thread Safety: get_thumbnail() may be called from any number of threads.
 *
 * @par Example
 * @code
 * auto store = std::make_shared<storage::file_cache_store>(
 *     storage::file_cache_config{"cache"});
 * auto fetcher = std::make_shared<network::curl_image_fetcher>();
 * thumbnail_service service(store, fetcher);
 *
 * auto request = validate_request("https://example.com/a.png", "200");
 * if (request.is_ok()) {
 *     auto result = service.get_thumbnail(request.value());
 * }
 * @endcode
 */
class thumbnail_service {
public:
    /**
     * @brief Construct the service
     * @param store Cache store (shared with other components)
     * @param fetcher Remote image fetcher
     * @param deriver Cache key deriver
     * @param config Pipeline settings
     * @throws std::invalid_argument if store or fetcher is null
     */
    thumbnail_service(std::shared_ptr<storage::cache_store> store,
                      std::shared_ptr<network::image_fetcher> fetcher,
                      cache_key_deriver deriver = {},
                      thumbnail_config config = {});

    /// Non-copyable
    thumbnail_service(const thumbnail_service&) = delete;
    thumbnail_service& operator=(const thumbnail_service&) = delete;

    /**
     * @brief Get or generate the thumbnail for a validated request
     * @return The thumbnail, or an error with a fetch, decode, encode or
     *         store error code
     */
    [[nodiscard]] Result<thumbnail_result> get_thumbnail(
        const thumbnail_request& request);

    /**
     * @brief Request counters
     */
    [[nodiscard]] thumbnail_statistics statistics() const;

    /**
     * @brief Cache store statistics
     */
    [[nodiscard]] storage::cache_statistics cache_statistics() const;

    /**
     * @brief Key deriver in use
     */
    [[nodiscard]] const cache_key_deriver& key_deriver() const noexcept {
        return deriver_;
    }

private:
    using bytes = std::vector<std::uint8_t>;

    /// Run as leader for a key and publish the outcome to waiters
    [[nodiscard]] Result<bytes> lead(const thumbnail_request& request,
                                     const std::string& key,
                                     bool& from_cache);

    /// Re-check the store, then fetch, process and store
    [[nodiscard]] Result<bytes> load_or_generate(const thumbnail_request& request,
                                                 const std::string& key,
                                                 bool& from_cache);

    /// Fetch -> decode -> normalize -> resize -> encode
    [[nodiscard]] Result<bytes> generate(const thumbnail_request& request);

    std::shared_ptr<storage::cache_store> store_;
    std::shared_ptr<network::image_fetcher> fetcher_;
    cache_key_deriver deriver_;
    thumbnail_config config_;
    inflight_registry inflight_;

    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> fetches_{0};
    std::atomic<std::uint64_t> coalesced_{0};
    std::atomic<std::uint64_t> failures_{0};
};

}  // namespace thumbcache::thumbnail
