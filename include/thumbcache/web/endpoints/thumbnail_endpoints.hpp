/**
 * @file thumbnail_endpoints.hpp
 * @brief Thumbnail REST API endpoints
 *
 * Provides GET /thumbnail?url=&width= and GET /thumbnail/stats.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <memory>

namespace thumbcache::web {

struct rest_server_context;

namespace endpoints {

// Internal function - implementation in cpp file
// Registers thumbnail endpoints with the Crow app
// Called from rest_server.cpp

}  // namespace endpoints

}  // namespace thumbcache::web
