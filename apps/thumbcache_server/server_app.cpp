/**
 * @file server_app.cpp
 * @brief thumbcache server application implementation
 */

#include "server_app.hpp"

#include <thumbcache/integration/logger_adapter.hpp>
#include <thumbcache/network/curl_image_fetcher.hpp>
#include <thumbcache/storage/file_cache_store.hpp>
#include <thumbcache/storage/memory_cache_store.hpp>
#include <thumbcache/thumbnail/cache_key.hpp>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <thread>

namespace thumbcache::server {

using integration::logger_adapter;

namespace {

/// Poll interval of wait_for_shutdown()
constexpr std::chrono::milliseconds shutdown_poll_interval{200};

}  // namespace

// =============================================================================
// Construction / Destruction
// =============================================================================

thumbcache_server_app::thumbcache_server_app(const thumbcache_server_config& config)
    : config_(config) {}

thumbcache_server_app::~thumbcache_server_app() {
    stop();
    logger_adapter::shutdown();
}

// =============================================================================
// Lifecycle Management
// =============================================================================

bool thumbcache_server_app::initialize() {
    setup_logging();
    logger_adapter::info("Initializing thumbcache server...");

    if (!setup_cache()) {
        return false;
    }

    if (!setup_pipeline()) {
        return false;
    }

    if (!setup_database()) {
        return false;
    }

    if (!setup_server()) {
        return false;
    }

    initialized_ = true;
    logger_adapter::info("thumbcache server initialized successfully");
    return true;
}

bool thumbcache_server_app::start() {
    if (!initialized_) {
        logger_adapter::error("Server not initialized");
        return false;
    }

    logger_adapter::info("Starting HTTP server...");
    logger_adapter::info("  Bind: {}:{}", config_.server.bind_address,
                         config_.server.port);
    logger_adapter::info("  Threads: {}", config_.server.threads);

    try {
        server_->start_async();
    } catch (const std::exception& e) {
        logger_adapter::error("Failed to start HTTP server: {}", e.what());
        return false;
    }

    std::cout << "Press Ctrl+C to stop\n";
    return true;
}

void thumbcache_server_app::stop() {
    if (server_ && server_->is_running()) {
        logger_adapter::info("Stopping HTTP server...");
        server_->stop();
        logger_adapter::info("HTTP server stopped");
    }
}

void thumbcache_server_app::wait_for_shutdown() {
    while (!shutdown_requested_.load() && is_running()) {
        std::this_thread::sleep_for(shutdown_poll_interval);
    }
    stop();
}

void thumbcache_server_app::request_shutdown() noexcept {
    shutdown_requested_ = true;
}

bool thumbcache_server_app::is_running() const noexcept {
    return server_ && server_->is_running();
}

void thumbcache_server_app::print_statistics() const {
    if (!thumbnails_) {
        return;
    }

    auto stats = thumbnails_->statistics();
    auto cache = thumbnails_->cache_statistics();

    std::cout << "\n";
    std::cout << "=== thumbcache Statistics ===\n";
    std::cout << "Cache Hits: " << stats.hits << "\n";
    std::cout << "Cache Misses: " << stats.misses << "\n";
    std::cout << "Remote Fetches: " << stats.fetches << "\n";
    std::cout << "Coalesced Requests: " << stats.coalesced << "\n";
    std::cout << "Failures: " << stats.failures << "\n";
    std::cout << "Cached Thumbnails: " << cache.entry_count << "\n";
    std::cout << "Cached Bytes: " << cache.total_bytes << "\n";
    std::cout << "=============================\n";
    std::cout << "\n";
}

// =============================================================================
// Private Setup Methods
// =============================================================================

void thumbcache_server_app::setup_logging() {
    integration::logger_config log_config;
    log_config.min_level = integration::parse_log_level(config_.logging.level)
                               .value_or(integration::log_level::info);
    log_config.enable_console = true;
    log_config.enable_file = !config_.logging.directory.empty();
    log_config.enable_access_log = log_config.enable_file;
    if (log_config.enable_file) {
        log_config.log_directory = config_.logging.directory;
    }
    logger_adapter::initialize(log_config);
}

bool thumbcache_server_app::setup_cache() {
    logger_adapter::info("Setting up thumbnail cache ({})...", config_.cache.backend);

    if (config_.cache.backend == "memory") {
        cache_ = std::make_shared<storage::memory_cache_store>();
        logger_adapter::info("In-memory cache ready");
        return true;
    }

    logger_adapter::info("  Directory: {}", config_.cache.directory.string());

    storage::file_cache_config cache_config;
    cache_config.root_path = config_.cache.directory;

    try {
        cache_ = std::make_shared<storage::file_cache_store>(cache_config);
    } catch (const std::exception& e) {
        logger_adapter::error("Failed to create cache directory: {}", e.what());
        return false;
    }

    auto stats = cache_->get_statistics();
    logger_adapter::info("File cache ready ({} entries, {} bytes)",
                         stats.entry_count, stats.total_bytes);
    return true;
}

bool thumbcache_server_app::setup_pipeline() {
    logger_adapter::info("Setting up thumbnail pipeline...");

    auto digest = thumbnail::make_digest(config_.cache.digest);
    if (!digest) {
        logger_adapter::error("Unknown cache key digest: {}", config_.cache.digest);
        return false;
    }

    network::fetcher_config fetch_config;
    fetch_config.timeout = config_.pipeline.fetch_timeout;
    fetcher_ = std::make_shared<network::curl_image_fetcher>(fetch_config);

    thumbnail::thumbnail_config pipeline;
    pipeline.jpeg.quality = config_.pipeline.jpeg_quality;

    thumbnails_ = std::make_shared<thumbnail::thumbnail_service>(
        cache_, fetcher_, thumbnail::cache_key_deriver(std::move(digest)), pipeline);

    logger_adapter::info("  Digest: {}", config_.cache.digest);
    logger_adapter::info("  Fetch timeout: {} ms",
                         config_.pipeline.fetch_timeout.count());
    logger_adapter::info("  JPEG quality: {}", config_.pipeline.jpeg_quality);
    return true;
}

bool thumbcache_server_app::setup_database() {
    logger_adapter::info("Loading record database...");
    logger_adapter::info("  Path: {}", config_.database.path.string());

    auto db_dir = config_.database.path.parent_path();
    if (!db_dir.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(db_dir, ec);
        if (ec) {
            logger_adapter::error("Failed to create database directory: {}",
                                  ec.message());
            return false;
        }
    }

    records_ = std::make_shared<storage::record_store>(
        storage::record_store_config{config_.database.path});

    auto result = records_->open();
    if (result.is_err()) {
        logger_adapter::error("Failed to open record database: {}",
                              result.error().message);
        return false;
    }

    logger_adapter::info("Record database ready ({} users, {} vehicles, {} bookings)",
                         records_->size(storage::collection::users),
                         records_->size(storage::collection::vehicles),
                         records_->size(storage::collection::bookings));
    return true;
}

bool thumbcache_server_app::setup_server() {
    web::rest_server_config server_config;
    server_config.bind_address = config_.server.bind_address;
    server_config.port = config_.server.port;
    server_config.concurrency = config_.server.threads;

    server_ = std::make_unique<web::rest_server>(server_config);
    server_->set_thumbnail_service(thumbnails_);
    server_->set_record_store(records_);
    return true;
}

}  // namespace thumbcache::server
