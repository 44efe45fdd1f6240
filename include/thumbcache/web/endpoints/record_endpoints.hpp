/**
 * @file record_endpoints.hpp
 * @brief Record collection REST API endpoints
 *
 * Provides list, get, create, replace and delete routes for the users,
 * vehicles and bookings collections.
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
// Registers record endpoints with the Crow app
// Called from rest_server.cpp

}  // namespace endpoints

}  // namespace thumbcache::web
