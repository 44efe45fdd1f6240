/**
 * @file config.hpp
 * @brief Configuration management for the thumbcache server
 *
 * Provides configuration structures and command line parsing for the
 * thumbcache server application.
 */

#ifndef THUMBCACHE_SERVER_CONFIG_HPP
#define THUMBCACHE_SERVER_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace thumbcache::server {

/**
 * @brief HTTP listener configuration
 */
struct server_network_config {
    /// Address to bind to
    std::string bind_address{"0.0.0.0"};

    /// Port to listen on
    uint16_t port{3000};

    /// Number of HTTP worker threads
    size_t threads{4};
};

/**
 * @brief Thumbnail cache configuration
 */
struct cache_config {
    /// Cache backend: "file" or "memory"
    std::string backend{"file"};

    /// Root directory of the file backend
    std::filesystem::path directory{"./cache"};

    /// Cache key digest: "md5" or "sha256"
    std::string digest{"md5"};
};

/**
 * @brief Remote fetch and encode configuration
 */
struct pipeline_config {
    /// Total time allowed for one image download
    std::chrono::milliseconds fetch_timeout{10000};

    /// JPEG quality of generated thumbnails (1-100)
    int jpeg_quality{85};
};

/**
 * @brief Record database configuration
 */
struct database_config {
    /// Path to the JSON document holding users, vehicles and bookings
    std::filesystem::path path{"./db.json"};
};

/**
 * @brief Logging configuration
 */
struct logging_config {
    /// Log level: "trace", "debug", "info", "warning", "error", "critical"
    std::string level{"info"};

    /// Directory for log files (empty for console only)
    std::filesystem::path directory{"./logs"};
};

/**
 * @brief Complete thumbcache server configuration
 */
struct thumbcache_server_config {
    /// HTTP listener settings
    server_network_config server;

    /// Cache settings
    cache_config cache;

    /// Fetch and encode settings
    pipeline_config pipeline;

    /// Record database settings
    database_config database;

    /// Logging settings
    logging_config logging;

    /**
     * @brief Parse configuration from command line arguments
     *
     * Supported options:
     *   --port <port>             Port to listen on (default: 3000)
     *   --bind <address>          Bind address (default: 0.0.0.0)
     *   --threads <n>             HTTP worker threads (default: 4)
     *   --cache-dir <path>        Cache directory (default: ./cache)
     *   --cache-backend <name>    file or memory (default: file)
     *   --digest <name>           md5 or sha256 (default: md5)
     *   --fetch-timeout <ms>      Download timeout (default: 10000)
     *   --jpeg-quality <q>        JPEG quality (default: 85)
     *   --db-path <path>          Record database (default: ./db.json)
     *   --log-level <level>       Log level (default: info)
     *   --log-dir <path>          Log directory (default: ./logs)
     *   --help                    Show help message
     *
     * @param argc Argument count
     * @param argv Argument vector
     * @return Configuration or nullopt if --help was requested or error
     */
    static auto parse_args(int argc, char* argv[])
        -> std::optional<thumbcache_server_config>;

    /**
     * @brief Print help message to stdout
     */
    static void print_help();
};

}  // namespace thumbcache::server

#endif  // THUMBCACHE_SERVER_CONFIG_HPP
