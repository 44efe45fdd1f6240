/**
 * @file format.hpp
 * @brief Compatibility header for std::format vs fmt::format
 *
 * Provides a unified interface for string formatting that works across
 * compilers and standard library implementations. Detection is based on the
 * __cpp_lib_format feature test macro.
 *
 * Usage:
 *   #include <thumbcache/compat/format.hpp>
 *   auto s = thumbcache::compat::format("Hello, {}!", name);
 */

#pragma once

#include <version>  // For feature test macros

#if defined(__cpp_lib_format) && __cpp_lib_format >= 201907L
    #define THUMBCACHE_HAS_STD_FORMAT 1
#elif defined(__APPLE__) && defined(__clang__) && __clang_major__ >= 15
    // Apple Clang 15+ with libc++ supports std::format
    #define THUMBCACHE_HAS_STD_FORMAT 1
#else
    #define THUMBCACHE_HAS_STD_FORMAT 0
#endif

#if THUMBCACHE_HAS_STD_FORMAT
    #include <format>
    namespace thumbcache::compat {
        using std::format;
        template <typename... Args>
        using format_string = std::format_string<Args...>;
    }
#else
    // Use fmt library as fallback
    #include <fmt/format.h>
    namespace thumbcache::compat {
        using fmt::format;
        template <typename... Args>
        using format_string = fmt::format_string<Args...>;
    }
#endif
