/**
 * @file rest_server.cpp
 * @brief REST API server implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any thumbcache headers to avoid
// forward declaration conflicts
#include "crow.h"

#include "thumbcache/integration/logger_adapter.hpp"
#include "thumbcache/web/endpoints/record_endpoints.hpp"
#include "thumbcache/web/endpoints/system_endpoints.hpp"
#include "thumbcache/web/endpoints/thumbnail_endpoints.hpp"
#include "thumbcache/web/rest_config.hpp"
#include "thumbcache/web/rest_server.hpp"
#include "thumbcache/web/rest_types.hpp"

#include <atomic>
#include <mutex>
#include <thread>

namespace thumbcache::web {

// Forward declare internal registration functions
namespace endpoints {
void register_system_endpoints_impl(crow::SimpleApp &app,
                                    std::shared_ptr<rest_server_context> ctx);
void register_thumbnail_endpoints_impl(crow::SimpleApp &app,
                                       std::shared_ptr<rest_server_context> ctx);
void register_record_endpoints_impl(crow::SimpleApp &app,
                                    std::shared_ptr<rest_server_context> ctx);
} // namespace endpoints

/**
 * @brief Implementation details for rest_server
 */
struct rest_server::impl {
  rest_server_config config;
  std::shared_ptr<rest_server_context> context;
  std::unique_ptr<crow::SimpleApp> app;
  std::thread server_thread;
  std::atomic<bool> running{false};
  std::mutex mutex;

  impl() : context(std::make_shared<rest_server_context>()) {
    context->config = &config;
  }

  explicit impl(const rest_server_config &cfg)
      : config(cfg), context(std::make_shared<rest_server_context>()) {
    context->config = &config;
  }

  /// Create the Crow app and register every route
  void build_app() {
    app = std::make_unique<crow::SimpleApp>();
    app->loglevel(crow::LogLevel::Warning);

    endpoints::register_system_endpoints_impl(*app, context);
    endpoints::register_thumbnail_endpoints_impl(*app, context);
    endpoints::register_record_endpoints_impl(*app, context);

    // Add CORS preflight handler
    if (config.enable_cors) {
      CROW_ROUTE((*app), "/<path>")
          .methods(crow::HTTPMethod::OPTIONS)(
              [this](const crow::request & /*req*/,
                     const std::string & /*path*/) {
                return preflight_response();
              });
    }
  }

  crow::response preflight_response() const {
    crow::response res(static_cast<int>(http_status::no_content));
    res.add_header("Access-Control-Allow-Origin", config.cors_allowed_origins);
    res.add_header("Access-Control-Allow-Methods",
                   "GET, POST, PUT, DELETE, OPTIONS");
    res.add_header("Access-Control-Allow-Headers", "Content-Type");
    res.add_header("Access-Control-Max-Age", "86400");
    return res;
  }

  void run() {
    integration::logger_adapter::info("HTTP server listening on {}:{}",
                                      config.bind_address, config.port);
    try {
      app->bindaddr(config.bind_address)
          .port(config.port)
          .concurrency(static_cast<std::uint16_t>(config.concurrency))
          .run();
    } catch (const std::exception &e) {
      integration::logger_adapter::error("HTTP server terminated: {}",
                                         e.what());
    }
    running = false;
  }
};

rest_server::rest_server() : impl_(std::make_unique<impl>()) {}

rest_server::rest_server(const rest_server_config &config)
    : impl_(std::make_unique<impl>(config)) {}

rest_server::~rest_server() {
  if (impl_) {
    stop();
  }
}

rest_server::rest_server(rest_server &&other) noexcept = default;
rest_server &rest_server::operator=(rest_server &&other) noexcept = default;

const rest_server_config &rest_server::config() const noexcept {
  return impl_->config;
}

void rest_server::set_config(const rest_server_config &config) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->config = config;
  impl_->context->config = &impl_->config;
}

void rest_server::set_thumbnail_service(
    std::shared_ptr<thumbnail::thumbnail_service> service) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->context->thumbnails = std::move(service);
}

void rest_server::set_record_store(
    std::shared_ptr<storage::record_store> store) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->context->records = std::move(store);
}

void rest_server::start() {
  if (impl_->running.exchange(true)) {
    return; // Already running
  }

  impl_->build_app();
  impl_->run();
}

void rest_server::start_async() {
  if (impl_->running.exchange(true)) {
    return; // Already running
  }

  // Reap a server thread that ended on its own (e.g. bind failure)
  if (impl_->server_thread.joinable()) {
    impl_->server_thread.join();
  }

  impl_->build_app();
  impl_->server_thread = std::thread([this]() { impl_->run(); });
}

void rest_server::stop() {
  // run() clears running when Crow exits by itself, but the thread
  // must still be joined
  if (impl_->running && impl_->app) {
    impl_->app->stop();
  }

  if (impl_->server_thread.joinable()) {
    impl_->server_thread.join();
  }

  impl_->running = false;
}

bool rest_server::is_running() const noexcept { return impl_->running; }

void rest_server::wait() {
  if (impl_->server_thread.joinable()) {
    impl_->server_thread.join();
  }
}

std::uint16_t rest_server::port() const noexcept {
  return impl_->running ? impl_->config.port : 0;
}

} // namespace thumbcache::web
