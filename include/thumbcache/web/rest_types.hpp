/**
 * @file rest_types.hpp
 * @brief Common types and utilities for REST API
 *
 * This file provides common types, JSON utilities, and error response
 * helpers for the REST API server.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace thumbcache::web {

/**
 * @enum http_status
 * @brief HTTP status codes returned by the server
 */
enum class http_status : std::uint16_t {
  // Success
  ok = 200,
  created = 201,
  no_content = 204,

  // Client errors
  bad_request = 400,
  not_found = 404,

  // Server errors
  internal_server_error = 500,
  gateway_timeout = 504
};

/// MIME type of thumbnail bodies
inline constexpr std::string_view jpeg_content_type = "image/jpeg";

/// MIME type of JSON bodies
inline constexpr std::string_view json_content_type = "application/json";

/**
 * @brief Escape a string for JSON
 * @param s Input string
 * @return JSON-escaped string
 */
[[nodiscard]] inline std::string json_escape(std::string_view s) {
  static const char *hex = "0123456789abcdef";
  std::string result;
  result.reserve(s.size() + 10);
  for (char c : s) {
    switch (c) {
    case '"':
      result += "\\\"";
      break;
    case '\\':
      result += "\\\\";
      break;
    case '\b':
      result += "\\b";
      break;
    case '\f':
      result += "\\f";
      break;
    case '\n':
      result += "\\n";
      break;
    case '\r':
      result += "\\r";
      break;
    case '\t':
      result += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        result += "\\u00";
        result += hex[(c >> 4) & 0x0F];
        result += hex[c & 0x0F];
      } else {
        result += c;
      }
      break;
    }
  }
  return result;
}

/**
 * @brief Create JSON error response body
 * @param message Error message
 * @return `{"error": "<message>"}`
 */
[[nodiscard]] inline std::string make_error_json(std::string_view message) {
  return std::string(R"({"error": ")") + json_escape(message) + R"("})";
}

} // namespace thumbcache::web
