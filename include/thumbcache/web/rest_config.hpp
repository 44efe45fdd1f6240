/**
 * @file rest_config.hpp
 * @brief Configuration for REST API server
 *
 * This file provides configuration options for the REST API server
 * including bind address, port, concurrency and CORS settings.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace thumbcache::web {

/**
 * @struct rest_server_config
 * @brief Configuration options for the REST server
 */
struct rest_server_config {
  /// Address to bind the server to
  std::string bind_address{"0.0.0.0"};

  /// Port to listen on
  std::uint16_t port{3000};

  /// Number of worker threads for handling requests
  std::size_t concurrency{4};

  /// Enable CORS (Cross-Origin Resource Sharing) headers
  bool enable_cors{true};

  /// Value of Access-Control-Allow-Origin
  std::string cors_allowed_origins{"*"};
};

} // namespace thumbcache::web
