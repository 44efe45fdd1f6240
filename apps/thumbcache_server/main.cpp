/**
 * @file main.cpp
 * @brief Entry point for the thumbcache server
 *
 * Serves JPEG thumbnails of remote images over HTTP together with the
 * users, vehicles and bookings collections.
 *
 * Usage:
 *   thumbcache_server [OPTIONS]
 *
 * Run with --help for the list of options.
 */

#include "config.hpp"
#include "server_app.hpp"

#include <atomic>
#include <csignal>
#include <iostream>

namespace {

/// Global pointer to server app for signal handling
std::atomic<thumbcache::server::thumbcache_server_app*> g_server{nullptr};

/// Signal handler for graceful shutdown
void signal_handler(int /*signal*/) {
    auto* server = g_server.load();
    if (server) {
        server->request_shutdown();
    }
}

/// Install signal handlers
void install_signal_handlers() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
#ifndef _WIN32
    std::signal(SIGHUP, signal_handler);
#endif
}

}  // namespace

int main(int argc, char* argv[]) {
    std::cout << R"(
  _   _                     _                    _
 | |_| |__  _   _ _ __ ___ | |__   ___ __ _  ___| |__   ___
 | __| '_ \| | | | '_ ` _ \| '_ \ / __/ _` |/ __| '_ \ / _ \
 | |_| | | | |_| | | | | | | |_) | (_| (_| | (__| | | |  __/
  \__|_| |_|\__,_|_| |_| |_|_.__/ \___\__,_|\___|_| |_|\___|

                Remote Image Thumbnail Server
)" << "\n";

    // Parse command line arguments
    auto config = thumbcache::server::thumbcache_server_config::parse_args(argc, argv);
    if (!config) {
        return 1;
    }

    // Install signal handlers
    install_signal_handlers();

    // Create and initialize server
    thumbcache::server::thumbcache_server_app server(config.value());
    g_server = &server;

    if (!server.initialize()) {
        std::cerr << "Failed to initialize thumbcache server\n";
        g_server = nullptr;
        return 1;
    }

    // Start server
    if (!server.start()) {
        std::cerr << "Failed to start thumbcache server\n";
        g_server = nullptr;
        return 1;
    }

    // Wait for shutdown
    server.wait_for_shutdown();

    // Print final statistics
    server.print_statistics();

    g_server = nullptr;

    std::cout << "thumbcache server terminated\n";
    return 0;
}
