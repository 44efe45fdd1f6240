/**
 * @file curl_image_fetcher_test.cpp
 * @brief Unit tests for curl_image_fetcher against a loopback socket
 */

#include <thumbcache/network/curl_image_fetcher.hpp>

#include <catch2/catch_test_macros.hpp>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <thread>

using namespace thumbcache;
using namespace thumbcache::network;

namespace {

/**
 * @brief Listening TCP socket on 127.0.0.1 with a kernel-assigned port
 *
 * Connections complete through the listen backlog even when nothing
 * calls accept(), which is enough to make a client wait for a reply.
 */
class loopback_listener {
public:
    loopback_listener() {
        fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(fd_, 8);

        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
    }

    ~loopback_listener() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    loopback_listener(const loopback_listener&) = delete;
    loopback_listener& operator=(const loopback_listener&) = delete;

    [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

    [[nodiscard]] std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    /// Accept one connection, drain the request head and send a raw reply
    void serve_once(const std::string& reply) {
        int client = ::accept(fd_, nullptr, nullptr);
        if (client < 0) {
            return;
        }
        std::string request;
        char chunk[1024];
        while (request.find("\r\n\r\n") == std::string::npos) {
            auto n = ::recv(client, chunk, sizeof(chunk), 0);
            if (n <= 0) {
                break;
            }
            request.append(chunk, static_cast<std::size_t>(n));
        }
        ::send(client, reply.data(), reply.size(), MSG_NOSIGNAL);
        ::close(client);
    }

private:
    int fd_{-1};
    std::uint16_t port_{0};
};

}  // namespace

TEST_CASE("fetcher_config defaults", "[network][fetcher]") {
    fetcher_config config;
    CHECK(config.timeout == std::chrono::milliseconds{10000});
    CHECK(config.connect_timeout == std::chrono::milliseconds{5000});
    CHECK(config.max_redirects == 5);
    CHECK(config.user_agent == "thumbcache/1.0");
    CHECK(config.max_body_size == 50u * 1024u * 1024u);

    curl_image_fetcher fetcher;
    CHECK(fetcher.config().timeout == std::chrono::milliseconds{10000});
}

TEST_CASE("curl_image_fetcher returns the response body", "[network][fetcher]") {
    loopback_listener listener;
    REQUIRE(listener.port() != 0);

    std::thread server([&listener] {
        listener.serve_once(
            "HTTP/1.1 200 OK\r\n"
            "Content-Type: image/png\r\n"
            "Content-Length: 5\r\n"
            "Connection: close\r\n"
            "\r\n"
            "hello");
    });

    curl_image_fetcher fetcher;
    auto result = fetcher.fetch(listener.url("/a.png"));
    server.join();

    REQUIRE(result.is_ok());
    std::string body(result.value().begin(), result.value().end());
    CHECK(body == "hello");
}

TEST_CASE("curl_image_fetcher maps non-success status to fetch_failure",
          "[network][fetcher]") {
    loopback_listener listener;

    std::thread server([&listener] {
        listener.serve_once(
            "HTTP/1.1 404 Not Found\r\n"
            "Content-Length: 0\r\n"
            "Connection: close\r\n"
            "\r\n");
    });

    curl_image_fetcher fetcher;
    auto result = fetcher.fetch(listener.url("/missing.png"));
    server.join();

    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::fetch_failure);
    CHECK(result.error().message == "Failed to fetch image");
}

TEST_CASE("curl_image_fetcher maps an unanswered request to fetch_timeout",
          "[network][fetcher]") {
    loopback_listener listener;

    fetcher_config config;
    config.timeout = std::chrono::milliseconds{300};
    curl_image_fetcher fetcher(config);

    auto started = std::chrono::steady_clock::now();
    auto result = fetcher.fetch(listener.url("/slow.png"));
    auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::fetch_timeout);
    CHECK(result.error().message == "Request timeout while fetching image");
    CHECK(elapsed < std::chrono::seconds{5});
}

TEST_CASE("curl_image_fetcher maps transport failures to network_error",
          "[network][fetcher]") {
    curl_image_fetcher fetcher;

    SECTION("Connection refused") {
        std::uint16_t port = 0;
        {
            loopback_listener closed;
            port = closed.port();
        }
        auto result = fetcher.fetch("http://127.0.0.1:" + std::to_string(port) + "/a.png");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::network_error);
    }

    SECTION("Non-HTTP scheme is refused") {
        auto result = fetcher.fetch("file:///etc/hostname");
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::network_error);
    }
}

TEST_CASE("curl_image_fetcher enforces the body size limit", "[network][fetcher]") {
    loopback_listener listener;

    std::thread server([&listener] {
        listener.serve_once(
            "HTTP/1.1 200 OK\r\n"
            "Content-Length: 64\r\n"
            "Connection: close\r\n"
            "\r\n" +
            std::string(64, 'x'));
    });

    fetcher_config config;
    config.max_body_size = 16;
    curl_image_fetcher fetcher(config);
    auto result = fetcher.fetch(listener.url("/big.png"));
    server.join();

    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::network_error);
    CHECK(result.error().message.find("exceeds 16 bytes") != std::string::npos);
}
