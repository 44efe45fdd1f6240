/**
 * @file rest_server.hpp
 * @brief REST API server for the thumbnail service
 *
 * This file provides the rest_server class that exposes the thumbnail
 * pipeline and the record store over HTTP using the Crow framework.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "rest_config.hpp"

#include <cstdint>
#include <memory>

namespace thumbcache::storage {
class record_store;
} // namespace thumbcache::storage

namespace thumbcache::thumbnail {
class thumbnail_service;
} // namespace thumbcache::thumbnail

namespace thumbcache::web {

/**
 * @class rest_server
 * @brief HTTP front end for thumbnails and records
 *
 * Routes:
 * - GET /thumbnail, GET /thumbnail/stats
 * - /users, /vehicles, /bookings and their /{id} routes
 * - GET / (server information)
 * - OPTIONS on any path (CORS preflight) when CORS is enabled
 *
 * @par Example
 * @code
 * #include <thumbcache/web/rest_server.hpp>
 *
 * rest_server_config config;
 * config.port = 3000;
 * config.concurrency = 8;
 *
 * rest_server server(config);
 * server.set_thumbnail_service(service);
 * server.set_record_store(records);
 *
 * server.start_async();  // Non-blocking
 * // ... do other work ...
 * server.stop();
 * @endcode
 */
class rest_server {
public:
  /**
   * @brief Construct REST server with default configuration
   */
  rest_server();

  /**
   * @brief Construct REST server with custom configuration
   * @param config Server configuration
   */
  explicit rest_server(const rest_server_config &config);

  /**
   * @brief Destructor - stops server if running
   */
  ~rest_server();

  /// Non-copyable
  rest_server(const rest_server &) = delete;
  rest_server &operator=(const rest_server &) = delete;

  /// Movable
  rest_server(rest_server &&other) noexcept;
  rest_server &operator=(rest_server &&other) noexcept;

  // =========================================================================
  // Configuration
  // =========================================================================

  /**
   * @brief Get current configuration
   * @return Current server configuration
   */
  [[nodiscard]] const rest_server_config &config() const noexcept;

  /**
   * @brief Update configuration (requires restart to apply)
   * @param config New configuration
   */
  void set_config(const rest_server_config &config);

  // =========================================================================
  // Integration
  // =========================================================================

  /**
   * @brief Set the thumbnail pipeline for /thumbnail
   * @param service Thumbnail service instance
   */
  void set_thumbnail_service(
      std::shared_ptr<thumbnail::thumbnail_service> service);

  /**
   * @brief Set the record store for the collection endpoints
   * @param store Record store instance
   */
  void set_record_store(std::shared_ptr<storage::record_store> store);

  // =========================================================================
  // Lifecycle
  // =========================================================================

  /**
   * @brief Start the server (blocking)
   *
   * This method blocks until stop() is called from another thread.
   */
  void start();

  /**
   * @brief Start the server (non-blocking)
   *
   * Starts the server in a background thread and returns immediately.
   */
  void start_async();

  /**
   * @brief Stop the server
   *
   * Gracefully shuts down the server. Safe to call multiple times.
   */
  void stop();

  /**
   * @brief Check if server is currently running
   * @return true if server is running
   */
  [[nodiscard]] bool is_running() const noexcept;

  /**
   * @brief Wait for server to stop
   *
   * Blocks until the server has completely stopped.
   * Only valid after start_async() was called.
   */
  void wait();

  /**
   * @brief Get the port the server is listening on
   * @return Port number, or 0 if not running
   */
  [[nodiscard]] std::uint16_t port() const noexcept;

private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

} // namespace thumbcache::web
