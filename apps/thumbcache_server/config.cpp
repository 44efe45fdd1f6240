/**
 * @file config.cpp
 * @brief Configuration management implementation for the thumbcache server
 */

#include "config.hpp"

#include <thumbcache/integration/logger_adapter.hpp>

#include <cstring>
#include <iostream>
#include <stdexcept>

namespace thumbcache::server {

namespace {

/// Fetch the value following an option, or report it missing
const char* take_value(int argc, char* argv[], int& i, std::string_view option) {
    if (i + 1 >= argc) {
        std::cerr << "Error: " << option << " requires a value\n";
        return nullptr;
    }
    return argv[++i];
}

}  // namespace

void thumbcache_server_config::print_help() {
    std::cout << R"(
thumbcache - Remote Image Thumbnail Server

Usage: thumbcache_server [OPTIONS]

Options:
  --port <port>           Port to listen on (default: 3000)
  --bind <address>        Address to bind to (default: 0.0.0.0)
  --threads <n>           HTTP worker threads (default: 4)
  --cache-dir <path>      Thumbnail cache directory (default: ./cache)
  --cache-backend <name>  Cache backend: file, memory (default: file)
  --digest <name>         Cache key digest: md5, sha256 (default: md5)
  --fetch-timeout <ms>    Remote image download timeout (default: 10000)
  --jpeg-quality <q>      JPEG quality 1-100 (default: 85)
  --db-path <path>        Record database document (default: ./db.json)
  --log-level <level>     Log level: trace, debug, info, warning, error, critical
                          (default: info)
  --log-dir <path>        Log directory, empty for console only (default: ./logs)
  --help, -h              Show this help message

Endpoints:
  GET /thumbnail?url=<url>&width=<50-2000>
  GET /thumbnail/stats
  /users, /vehicles, /bookings (GET, POST) and /<collection>/<id> (GET, PUT, DELETE)

Examples:
  # Start with default settings
  thumbcache_server

  # Serve on port 8080 with an in-memory cache
  thumbcache_server --port 8080 --cache-backend memory

  # Specify cache and database locations
  thumbcache_server --cache-dir /data/thumbs --db-path /data/db.json

)";
}

auto thumbcache_server_config::parse_args(int argc, char* argv[])
    -> std::optional<thumbcache_server_config> {

    thumbcache_server_config config;

    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_help();
            return std::nullopt;
        }

        if (arg == "--port") {
            const char* value = take_value(argc, argv, i, arg);
            if (value == nullptr) {
                return std::nullopt;
            }
            try {
                int port = std::stoi(value);
                if (port <= 0 || port > 65535) {
                    throw std::out_of_range("port");
                }
                config.server.port = static_cast<uint16_t>(port);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid port number\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--bind") {
            const char* value = take_value(argc, argv, i, arg);
            if (value == nullptr) {
                return std::nullopt;
            }
            config.server.bind_address = value;
            continue;
        }

        if (arg == "--threads") {
            const char* value = take_value(argc, argv, i, arg);
            if (value == nullptr) {
                return std::nullopt;
            }
            try {
                int threads = std::stoi(value);
                if (threads <= 0) {
                    throw std::out_of_range("threads");
                }
                config.server.threads = static_cast<size_t>(threads);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid threads value\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--cache-dir") {
            const char* value = take_value(argc, argv, i, arg);
            if (value == nullptr) {
                return std::nullopt;
            }
            config.cache.directory = value;
            continue;
        }

        if (arg == "--cache-backend") {
            const char* value = take_value(argc, argv, i, arg);
            if (value == nullptr) {
                return std::nullopt;
            }
            config.cache.backend = value;
            if (config.cache.backend != "file" && config.cache.backend != "memory") {
                std::cerr << "Error: Invalid cache backend: " << config.cache.backend
                          << "\n";
                std::cerr << "Valid backends: file, memory\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--digest") {
            const char* value = take_value(argc, argv, i, arg);
            if (value == nullptr) {
                return std::nullopt;
            }
            config.cache.digest = value;
            if (config.cache.digest != "md5" && config.cache.digest != "sha256") {
                std::cerr << "Error: Invalid digest: " << config.cache.digest << "\n";
                std::cerr << "Valid digests: md5, sha256\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--fetch-timeout") {
            const char* value = take_value(argc, argv, i, arg);
            if (value == nullptr) {
                return std::nullopt;
            }
            try {
                long ms = std::stol(value);
                if (ms <= 0) {
                    throw std::out_of_range("fetch-timeout");
                }
                config.pipeline.fetch_timeout = std::chrono::milliseconds{ms};
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid fetch-timeout value\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--jpeg-quality") {
            const char* value = take_value(argc, argv, i, arg);
            if (value == nullptr) {
                return std::nullopt;
            }
            try {
                int quality = std::stoi(value);
                if (quality < 1 || quality > 100) {
                    throw std::out_of_range("jpeg-quality");
                }
                config.pipeline.jpeg_quality = quality;
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid jpeg-quality value (1-100)\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--db-path") {
            const char* value = take_value(argc, argv, i, arg);
            if (value == nullptr) {
                return std::nullopt;
            }
            config.database.path = value;
            continue;
        }

        if (arg == "--log-level") {
            const char* value = take_value(argc, argv, i, arg);
            if (value == nullptr) {
                return std::nullopt;
            }
            config.logging.level = value;
            if (!integration::parse_log_level(config.logging.level)) {
                std::cerr << "Error: Invalid log level: " << config.logging.level << "\n";
                std::cerr << "Valid levels: trace, debug, info, warning, error, critical\n";
                return std::nullopt;
            }
            continue;
        }

        if (arg == "--log-dir") {
            const char* value = take_value(argc, argv, i, arg);
            if (value == nullptr) {
                return std::nullopt;
            }
            config.logging.directory = value;
            continue;
        }

        std::cerr << "Error: Unknown option: " << arg << "\n";
        std::cerr << "Use --help for usage information\n";
        return std::nullopt;
    }

    return config;
}

}  // namespace thumbcache::server
