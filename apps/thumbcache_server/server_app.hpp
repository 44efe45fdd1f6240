/**
 * @file server_app.hpp
 * @brief thumbcache server application class
 *
 * Provides the main server application class that wires the cache store,
 * image fetcher, thumbnail pipeline, record store and HTTP server.
 */

#ifndef THUMBCACHE_SERVER_SERVER_APP_HPP
#define THUMBCACHE_SERVER_SERVER_APP_HPP

#include "config.hpp"

#include <thumbcache/network/image_fetcher.hpp>
#include <thumbcache/storage/cache_store.hpp>
#include <thumbcache/storage/record_store.hpp>
#include <thumbcache/thumbnail/thumbnail_service.hpp>
#include <thumbcache/web/rest_server.hpp>

#include <atomic>
#include <memory>
#include <string>

namespace thumbcache::server {

/**
 * @brief Complete thumbcache server application
 *
 * ## Architecture
 *
 * ```
 * +---------------------------------------------+
 * |            thumbcache_server_app            |
 * +---------------------------------------------+
 * |                                             |
 * |  +----------------+   +------------------+  |
 * |  | rest_server    |-->| record_store     |  |
 * |  +-------+--------+   +------------------+  |
 * |          |                                  |
 * |  +-------v-----------+   +---------------+  |
 * |  | thumbnail_service |-->| cache_store   |  |
 * |  +-------+-----------+   +---------------+  |
 * |          |                                  |
 * |  +-------v-----------+                      |
 * |  | curl_image_fetcher|                      |
 * |  +-------------------+                      |
 * +---------------------------------------------+
 * ```
 *
 * @example Usage
 * @code
 * thumbcache_server_config config;
 * config.server.port = 3000;
 * config.cache.directory = "/data/thumbs";
 *
 * thumbcache_server_app app{config};
 *
 * if (!app.initialize() || !app.start()) {
 *     return 1;
 * }
 *
 * // Wait for shutdown signal
 * app.wait_for_shutdown();
 * @endcode
 */
class thumbcache_server_app {
public:
    // =========================================================================
    // Construction / Destruction
    // =========================================================================

    explicit thumbcache_server_app(const thumbcache_server_config& config);

    /**
     * @brief Destructor - stops server if running
     */
    ~thumbcache_server_app();

    // Non-copyable, non-movable
    thumbcache_server_app(const thumbcache_server_app&) = delete;
    thumbcache_server_app& operator=(const thumbcache_server_app&) = delete;
    thumbcache_server_app(thumbcache_server_app&&) = delete;
    thumbcache_server_app& operator=(thumbcache_server_app&&) = delete;

    // =========================================================================
    // Lifecycle Management
    // =========================================================================

    /**
     * @brief Initialize all components
     *
     * Sets up logging, the cache store, the fetcher, the thumbnail
     * pipeline and the record store. Must be called before start().
     *
     * @return true if initialization succeeded
     */
    [[nodiscard]] bool initialize();

    /**
     * @brief Start the HTTP server in the background
     * @return true if the server started
     */
    [[nodiscard]] bool start();

    /**
     * @brief Stop the server gracefully
     */
    void stop();

    /**
     * @brief Wait for server shutdown
     *
     * Blocks until request_shutdown() is called or the HTTP server exits,
     * then stops the server.
     */
    void wait_for_shutdown();

    /**
     * @brief Request shutdown
     *
     * Only sets a flag, so it may be called from a signal handler.
     */
    void request_shutdown() noexcept;

    // =========================================================================
    // Status Queries
    // =========================================================================

    [[nodiscard]] bool is_running() const noexcept;

    /**
     * @brief Print thumbnail and cache statistics
     */
    void print_statistics() const;

private:
    /// Set up logger_system
    void setup_logging();

    /// Set up the thumbnail cache backend
    [[nodiscard]] bool setup_cache();

    /// Set up the fetcher and the thumbnail pipeline
    [[nodiscard]] bool setup_pipeline();

    /// Load the record database
    [[nodiscard]] bool setup_database();

    /// Set up the HTTP server
    [[nodiscard]] bool setup_server();

    // =========================================================================
    // Member Variables
    // =========================================================================

    thumbcache_server_config config_;

    std::shared_ptr<storage::cache_store> cache_;
    std::shared_ptr<network::image_fetcher> fetcher_;
    std::shared_ptr<thumbnail::thumbnail_service> thumbnails_;
    std::shared_ptr<storage::record_store> records_;
    std::unique_ptr<web::rest_server> server_;

    /// Shutdown flag
    std::atomic<bool> shutdown_requested_{false};

    /// Initialization flag
    bool initialized_{false};
};

}  // namespace thumbcache::server

#endif  // THUMBCACHE_SERVER_SERVER_APP_HPP
