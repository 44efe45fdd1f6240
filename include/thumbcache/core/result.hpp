/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the thumbnail service
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for thumbcache, integrating with common_system's Result
 * pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace thumbcache {

/**
 * @brief Result type alias for thumbcache operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief thumbcache-specific error codes
 *
 * Error code range: -900 to -949
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int thumbcache_base = -900;

    // Request validation errors (-900 to -909)
    constexpr int missing_parameter = thumbcache_base - 0;
    constexpr int invalid_parameter = thumbcache_base - 1;
    constexpr int out_of_range = thumbcache_base - 2;

    // Remote fetch errors (-910 to -919)
    constexpr int fetch_timeout = thumbcache_base - 10;
    constexpr int fetch_failure = thumbcache_base - 11;
    constexpr int network_error = thumbcache_base - 12;

    // Image pipeline errors (-920 to -929)
    constexpr int decode_error = thumbcache_base - 20;
    constexpr int encode_error = thumbcache_base - 21;

    // Storage errors (-930 to -939)
    constexpr int store_io_error = thumbcache_base - 30;
    constexpr int entry_not_found = thumbcache_base - 31;
    constexpr int invalid_key = thumbcache_base - 32;

    // Record store errors (-940 to -949)
    constexpr int record_not_found = thumbcache_base - 40;
    constexpr int invalid_record = thumbcache_base - 41;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create a thumbcache error result with module context
 * @tparam T The result value type
 * @param code Error code from thumbcache::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> thumbcache_error(int code, const std::string& message,
                                  const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "thumbcache");
    }
    return kcenon::common::make_error<T>(code, message, "thumbcache", details);
}

/**
 * @brief Create a thumbcache void error result
 * @param code Error code from thumbcache::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult thumbcache_void_error(int code, const std::string& message,
                                        const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "thumbcache"});
    }
    return VoidResult(error_info{code, message, "thumbcache", details});
}

} // namespace thumbcache
