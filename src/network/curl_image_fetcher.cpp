/**
 * @file curl_image_fetcher.cpp
 * @brief Implementation of the libcurl-based image fetcher
 */

#include <thumbcache/network/curl_image_fetcher.hpp>

#include <thumbcache/integration/logger_adapter.hpp>

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace thumbcache::network {

using integration::logger_adapter;

namespace {

/**
 * @brief RAII wrapper for CURL easy handles
 */
struct curl_easy_deleter {
    void operator()(CURL* handle) const {
        if (handle) curl_easy_cleanup(handle);
    }
};
using curl_easy_ptr = std::unique_ptr<CURL, curl_easy_deleter>;

/// Body accumulator passed to the write callback
struct body_buffer {
    std::vector<std::uint8_t> data;
    std::size_t limit{0};
    bool overflow{false};
};

std::size_t handle_curl_write(char* ptr, std::size_t size, std::size_t count,
                              void* userdata) {
    auto* buffer = static_cast<body_buffer*>(userdata);
    std::size_t bytes = size * count;

    if (buffer->limit != 0 && buffer->data.size() + bytes > buffer->limit) {
        buffer->overflow = true;
        return 0;  // aborts the transfer with CURLE_WRITE_ERROR
    }

    buffer->data.insert(buffer->data.end(),
                        reinterpret_cast<const std::uint8_t*>(ptr),
                        reinterpret_cast<const std::uint8_t*>(ptr) + bytes);
    return bytes;
}

void ensure_curl_global_init() {
    static std::once_flag flag;
    std::call_once(flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

}  // namespace

curl_image_fetcher::curl_image_fetcher(fetcher_config config)
    : config_(std::move(config)) {
    ensure_curl_global_init();
}

auto curl_image_fetcher::fetch(const std::string& url)
    -> Result<std::vector<std::uint8_t>> {
    curl_easy_ptr curl(curl_easy_init());
    if (!curl) {
        return thumbcache_error<std::vector<std::uint8_t>>(
            error_codes::network_error, "Failed to initialize HTTP client");
    }

    body_buffer buffer;
    buffer.limit = config_.max_body_size;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, config_.max_redirects);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS,
                     static_cast<long>(config_.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(config_.connect_timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &handle_curl_write);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buffer);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
#if LIBCURL_VERSION_NUM >= 0x075500
    curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
#else
    curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS,
                     CURLPROTO_HTTP | CURLPROTO_HTTPS);
    curl_easy_setopt(curl.get(), CURLOPT_REDIR_PROTOCOLS,
                     CURLPROTO_HTTP | CURLPROTO_HTTPS);
#endif

    CURLcode rc = curl_easy_perform(curl.get());

    if (rc == CURLE_OPERATION_TIMEDOUT) {
        logger_adapter::warn("Fetch timed out after {}ms: {}",
                             config_.timeout.count(), url);
        return thumbcache_error<std::vector<std::uint8_t>>(
            error_codes::fetch_timeout, "Request timeout while fetching image",
            url);
    }

    if (rc != CURLE_OK) {
        std::string reason = buffer.overflow
            ? "response body exceeds " + std::to_string(buffer.limit) + " bytes"
            : (error_buffer[0] != '\0' ? std::string(error_buffer)
                                       : std::string(curl_easy_strerror(rc)));
        logger_adapter::warn("Fetch failed: {} ({})", url, reason);
        return thumbcache_error<std::vector<std::uint8_t>>(
            error_codes::network_error, reason, url);
    }

    long http_status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
    if (http_status < 200 || http_status >= 300) {
        logger_adapter::debug("Fetch returned HTTP {}: {}", http_status, url);
        return thumbcache_error<std::vector<std::uint8_t>>(
            error_codes::fetch_failure, "Failed to fetch image",
            "HTTP " + std::to_string(http_status));
    }

    logger_adapter::debug("Fetched {} bytes from {}", buffer.data.size(), url);
    return std::move(buffer.data);
}

}  // namespace thumbcache::network
