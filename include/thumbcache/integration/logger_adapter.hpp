/**
 * @file logger_adapter.hpp
 * @brief Adapter for service and access logging using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with the thumbnail service. It supports standard logging and a JSON-lines
 * access log that records every thumbnail request with its outcome.
 */

#pragma once

#include <thumbcache/compat/format.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace thumbcache::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Parse a log level name ("trace", "debug", "info", "warn",
 *        "warning", "error", "fatal", "critical", "off")
 * @return The level, or nullopt for an unknown name
 */
[[nodiscard]] auto parse_log_level(std::string_view name)
    -> std::optional<log_level>;

/**
 * @enum request_outcome
 * @brief How a thumbnail request was served
 */
enum class request_outcome {
    cache_hit,   ///< Served from the cache store
    generated,   ///< Fetched and processed by this request
    coalesced,   ///< Reused the result of a concurrent request
    rejected,    ///< Failed input validation
    failed       ///< Failed in fetch, decode, encode or store
};

// ─────────────────────────────────────────────────────
// Configuration
// ─────────────────────────────────────────────────────

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable file output
    bool enable_file{true};

    /// Enable separate JSON-lines access log
    bool enable_access_log{true};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{100};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{10};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

// ─────────────────────────────────────────────────────
// Logger Adapter Class
// ─────────────────────────────────────────────────────

/**
 * @class logger_adapter
 * @brief Process-wide logging facade backed by logger_system
 *
 * Messages logged before initialize() or after shutdown() are dropped.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.log_directory = "/var/log/thumbcache";
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Server started on port {}", 3000);
 * logger_adapter::log_thumbnail_request("https://example.com/a.png", 200,
 *     request_outcome::generated, 200, std::chrono::milliseconds{42});
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    // ─────────────────────────────────────────────────────
    // Initialization
    // ─────────────────────────────────────────────────────

    /**
     * @brief Initialize the logger with configuration
     *
     * Sets up console and file writers and the access log path. Calling it
     * a second time without shutdown() has no effect.
     *
     * @param config Configuration options
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Shutdown the logger
     *
     * Flushes all pending messages and releases resources.
     */
    static void shutdown();

    /**
     * @brief Check if the logger is initialized
     */
    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    // ─────────────────────────────────────────────────────
    // Standard Logging
    // ─────────────────────────────────────────────────────

    template <typename... Args>
    static void trace(thumbcache::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, thumbcache::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(thumbcache::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, thumbcache::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(thumbcache::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, thumbcache::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(thumbcache::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, thumbcache::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(thumbcache::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, thumbcache::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(thumbcache::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, thumbcache::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     * @param level Log severity level
     * @param message The message to log
     */
    static void log(log_level level, const std::string& message);

    /**
     * @brief Check if a log level is enabled
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    /**
     * @brief Flush all pending log messages
     */
    static void flush();

    // ─────────────────────────────────────────────────────
    // Access Logging
    // ─────────────────────────────────────────────────────

    /**
     * @brief Record one thumbnail request
     *
     * Writes a debug/warn line to the main log and, when enabled, a JSON
     * line to access.json in the log directory.
     *
     * @param url Source image URL (may be empty for rejected requests)
     * @param width Requested width, 0 when it could not be parsed
     * @param outcome How the request was served
     * @param http_status Status code returned to the client
     * @param latency Time spent serving the request
     */
    static void log_thumbnail_request(const std::string& url,
                                      int width,
                                      request_outcome outcome,
                                      int http_status,
                                      std::chrono::milliseconds latency);

    // ─────────────────────────────────────────────────────
    // Configuration
    // ─────────────────────────────────────────────────────

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

    /**
     * @brief Convert an outcome to its access log name
     */
    [[nodiscard]] static auto outcome_to_string(request_outcome outcome)
        -> std::string;

private:
    class impl;
    static std::unique_ptr<impl> pimpl_;
};

}  // namespace thumbcache::integration
