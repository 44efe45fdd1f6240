/**
 * @file system_endpoints.hpp
 * @brief System API endpoints for REST server
 *
 * This file provides the shared endpoint context and the server
 * information endpoint.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <memory>

namespace thumbcache::storage {
class record_store;
} // namespace thumbcache::storage

namespace thumbcache::thumbnail {
class thumbnail_service;
} // namespace thumbcache::thumbnail

namespace thumbcache::web {

struct rest_server_config;

/// Version reported by GET /
inline constexpr const char *server_version = "1.0.0";

/**
 * @struct rest_server_context
 * @brief Shared context for REST endpoints
 */
struct rest_server_context {
  /// Current server configuration (read-only)
  const rest_server_config *config{nullptr};

  /// Thumbnail pipeline for /thumbnail
  std::shared_ptr<thumbnail::thumbnail_service> thumbnails;

  /// Record store for /users, /vehicles and /bookings
  std::shared_ptr<storage::record_store> records;
};

namespace endpoints {

// Internal function - implementation in cpp file
// Registers GET / (server information)
// Called from rest_server.cpp

} // namespace endpoints

} // namespace thumbcache::web
