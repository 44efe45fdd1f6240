/**
 * @file thumbnail_service_test.cpp
 * @brief Unit tests for the thumbnail pipeline
 *
 * Uses a mock fetcher serving in-memory PNG and JPEG files, so no network
 * access is needed.
 */

#include <thumbcache/thumbnail/thumbnail_service.hpp>

#include <thumbcache/image/image_decoder.hpp>
#include <thumbcache/storage/file_cache_store.hpp>
#include <thumbcache/storage/memory_cache_store.hpp>

#include "../fixtures/test_images.hpp"
#include "../mocks/mock_image_fetcher.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace thumbcache;
using namespace thumbcache::thumbnail;
using thumbcache::network::testing::mock_image_fetcher;

namespace {

using bytes = std::vector<std::uint8_t>;

auto make_request(const std::string& url, int width) -> thumbnail_request {
    thumbnail_request request;
    request.url = url;
    request.width = width;
    return request;
}

auto fetch_error(int code, const std::string& message) -> mock_image_fetcher::response_type {
    return thumbcache_error<bytes>(code, message);
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("thumbnail_service: construction requires collaborators",
          "[thumbnail][service]") {
    auto store = std::make_shared<storage::memory_cache_store>();
    auto fetcher = std::make_shared<mock_image_fetcher>(bytes{});

    REQUIRE_THROWS_AS(thumbnail_service(nullptr, fetcher), std::invalid_argument);
    REQUIRE_THROWS_AS(thumbnail_service(store, nullptr), std::invalid_argument);
    REQUIRE_NOTHROW(thumbnail_service(store, fetcher));
}

// ============================================================================
// Generation and caching
// ============================================================================

TEST_CASE("thumbnail_service: miss then hit", "[thumbnail][service]") {
    auto store = std::make_shared<storage::memory_cache_store>();
    auto fetcher = std::make_shared<mock_image_fetcher>(
        testing::solid_rgb_png(800, 600, 200, 10, 10));
    thumbnail_service service(store, fetcher);

    auto request = make_request("https://example.com/photo.png", 200);

    auto first = service.get_thumbnail(request);
    REQUIRE(first.is_ok());
    CHECK(first.value().source == thumbnail_source::generated);
    CHECK(fetcher->call_count() == 1);
    CHECK(first.value().cache_key ==
          service.key_deriver().derive(request.url, request.width));

    SECTION("the thumbnail is a JPEG at the requested width") {
        const auto& data = first.value().data;
        REQUIRE(image::detect_format(data) == image::image_format::jpeg);
        auto dims = testing::jpeg_dimensions(data);
        CHECK(dims.first == 200);
        CHECK(dims.second == 150);
    }

    SECTION("the entry is stored before the call returns") {
        CHECK(store->exists(first.value().cache_key));
        auto stored = store->get(first.value().cache_key);
        REQUIRE(stored.is_ok());
        CHECK(stored.value() == first.value().data);
    }

    SECTION("the second request is served from the cache") {
        auto second = service.get_thumbnail(request);
        REQUIRE(second.is_ok());
        CHECK(second.value().source == thumbnail_source::cache);
        CHECK(second.value().data == first.value().data);
        CHECK(fetcher->call_count() == 1);

        auto stats = service.statistics();
        CHECK(stats.hits == 1);
        CHECK(stats.misses == 1);
        CHECK(stats.fetches == 1);
        CHECK(stats.failures == 0);
    }

    SECTION("a different width is a different entry") {
        auto other = service.get_thumbnail(make_request(request.url, 100));
        REQUIRE(other.is_ok());
        CHECK(other.value().source == thumbnail_source::generated);
        CHECK(fetcher->call_count() == 2);
        CHECK(service.cache_statistics().entry_count == 2);
    }
}

TEST_CASE("thumbnail_service: pre-populated cache skips the fetch",
          "[thumbnail][service]") {
    auto store = std::make_shared<storage::memory_cache_store>();
    auto fetcher = std::make_shared<mock_image_fetcher>(bytes{});
    thumbnail_service service(store, fetcher);

    auto request = make_request("https://example.com/cached.jpg", 300);
    auto key = service.key_deriver().derive(request.url, request.width);
    REQUIRE(store->put(key, bytes{0xFF, 0xD8, 0xFF, 0xD9}).is_ok());

    auto result = service.get_thumbnail(request);
    REQUIRE(result.is_ok());
    CHECK(result.value().source == thumbnail_source::cache);
    CHECK(result.value().data == bytes{0xFF, 0xD8, 0xFF, 0xD9});
    CHECK(fetcher->call_count() == 0);
}

TEST_CASE("thumbnail_service: JPEG sources", "[thumbnail][service]") {
    auto store = std::make_shared<storage::memory_cache_store>();
    auto fetcher = std::make_shared<mock_image_fetcher>(
        testing::solid_rgb_jpeg(300, 100, 20, 120, 220));
    thumbnail_service service(store, fetcher);

    auto result = service.get_thumbnail(make_request("https://example.com/a.jpg", 60));
    REQUIRE(result.is_ok());
    auto dims = testing::jpeg_dimensions(result.value().data);
    CHECK(dims.first == 60);
    CHECK(dims.second == 20);
}

TEST_CASE("thumbnail_service: transparent PNG sources become white",
          "[thumbnail][service][alpha]") {
    auto store = std::make_shared<storage::memory_cache_store>();

    SECTION("fully transparent RGBA at width 200") {
        auto fetcher = std::make_shared<mock_image_fetcher>(
            testing::solid_rgba_png(1000, 500, 0, 0, 0, 0));
        thumbnail_service service(store, fetcher);

        auto result = service.get_thumbnail(make_request("https://example.com/a.png", 200));
        REQUIRE(result.is_ok());

        auto decoded = image::image_decoder::decode(result.value().data);
        REQUIRE(decoded.is_ok());
        CHECK(decoded.value().width == 200);
        CHECK(decoded.value().height == 100);
        CHECK(decoded.value().mode == image::color_mode::rgb);

        auto darkest = *std::min_element(decoded.value().pixels.begin(),
                                         decoded.value().pixels.end());
        CHECK(darkest >= 250);
    }

    SECTION("opaque RGBA keeps its color") {
        auto fetcher = std::make_shared<mock_image_fetcher>(
            testing::solid_rgba_png(400, 200, 200, 30, 30, 255));
        thumbnail_service service(store, fetcher);

        auto result = service.get_thumbnail(make_request("https://example.com/b.png", 100));
        REQUIRE(result.is_ok());

        auto decoded = image::image_decoder::decode(result.value().data);
        REQUIRE(decoded.is_ok());
        const auto& px = decoded.value().pixels;
        const std::size_t center = (50u * 100u + 50u) * 3u;
        CHECK(std::abs(int(px[center]) - 200) <= 12);
        CHECK(std::abs(int(px[center + 1]) - 30) <= 12);
        CHECK(std::abs(int(px[center + 2]) - 30) <= 12);
    }

    SECTION("palette with tRNS composites per entry") {
        auto fetcher = std::make_shared<mock_image_fetcher>(
            testing::two_color_palette_png(400, 200, png_color{0, 0, 255},
                                           png_color{0, 0, 0}, {255, 0}));
        thumbnail_service service(store, fetcher);

        auto result = service.get_thumbnail(make_request("https://example.com/c.png", 100));
        REQUIRE(result.is_ok());

        auto decoded = image::image_decoder::decode(result.value().data);
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value().width == 100);
        REQUIRE(decoded.value().height == 50);
        const auto& px = decoded.value().pixels;

        // Opaque blue on the left
        const std::size_t left = (25u * 100u + 10u) * 3u;
        CHECK(px[left] <= 20);
        CHECK(px[left + 2] >= 235);

        // Transparent black on the right turns white
        const std::size_t right = (25u * 100u + 90u) * 3u;
        CHECK(px[right] >= 240);
        CHECK(px[right + 1] >= 240);
        CHECK(px[right + 2] >= 240);
    }
}

TEST_CASE("thumbnail_service: file cache backend", "[thumbnail][service][storage]") {
    testing::temp_directory temp_dir;
    auto store = std::make_shared<storage::file_cache_store>(
        storage::file_cache_config{temp_dir.path() / "cache"});
    auto fetcher = std::make_shared<mock_image_fetcher>(
        testing::solid_rgb_png(64, 64, 0, 0, 0));
    thumbnail_service service(store, fetcher, cache_key_deriver(make_digest("sha256")));

    auto result = service.get_thumbnail(make_request("https://example.com/x.png", 50));
    REQUIRE(result.is_ok());
    CHECK(result.value().cache_key.size() == 64);

    auto path = store->entry_path(result.value().cache_key);
    CHECK(std::filesystem::exists(path));
    CHECK(std::filesystem::file_size(path) == result.value().data.size());
}

// ============================================================================
// Failures
// ============================================================================

TEST_CASE("thumbnail_service: failures are not cached", "[thumbnail][service]") {
    auto store = std::make_shared<storage::memory_cache_store>();
    auto fetcher = std::make_shared<mock_image_fetcher>(bytes{});
    thumbnail_service service(store, fetcher);

    SECTION("upstream failure") {
        fetcher->set_response("https://example.com/missing.png",
                              fetch_error(error_codes::fetch_failure,
                                          "Failed to fetch image"));
        auto request = make_request("https://example.com/missing.png", 200);

        auto result = service.get_thumbnail(request);
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::fetch_failure);
        CHECK(store->get_statistics().entry_count == 0);

        // The next request tries again
        auto retry = service.get_thumbnail(request);
        REQUIRE(retry.is_err());
        CHECK(fetcher->call_count() == 2);
        CHECK(service.statistics().failures == 2);
    }

    SECTION("timeout") {
        fetcher->set_response("https://example.com/slow.png",
                              fetch_error(error_codes::fetch_timeout,
                                          "Request timeout while fetching image"));
        auto result = service.get_thumbnail(make_request("https://example.com/slow.png", 200));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::fetch_timeout);
    }

    SECTION("body is not an image") {
        fetcher->set_response("https://example.com/page.html",
                              bytes{'<', 'h', 't', 'm', 'l', '>'});
        auto result = service.get_thumbnail(make_request("https://example.com/page.html", 200));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::decode_error);
        CHECK(store->get_statistics().entry_count == 0);
    }

    SECTION("truncated PNG") {
        auto png = testing::solid_rgb_png(32, 32, 1, 2, 3);
        png.resize(png.size() / 2);
        fetcher->set_response("https://example.com/cut.png", png);
        auto result = service.get_thumbnail(make_request("https://example.com/cut.png", 200));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::decode_error);
    }

    SECTION("fetcher throws") {
        fetcher->set_throw("boom");
        auto result = service.get_thumbnail(make_request("https://example.com/t.png", 200));
        REQUIRE(result.is_err());
        CHECK(result.error().code == error_codes::encode_error);
        CHECK(result.error().message == "Unexpected error: boom");
        CHECK(store->get_statistics().entry_count == 0);
    }
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("thumbnail_service: concurrent misses fetch once",
          "[thumbnail][service][concurrency]") {
    auto store = std::make_shared<storage::memory_cache_store>();
    auto fetcher = std::make_shared<mock_image_fetcher>(
        testing::solid_rgb_png(400, 400, 90, 160, 30));
    fetcher->set_delay(std::chrono::milliseconds(200));
    thumbnail_service service(store, fetcher);

    constexpr int kThreads = 8;
    auto request = make_request("https://example.com/popular.png", 120);

    std::promise<void> go;
    auto start = go.get_future().share();
    std::vector<std::future<Result<thumbnail_result>>> futures;
    futures.reserve(kThreads);
    for (int i = 0; i < kThreads; ++i) {
        futures.push_back(std::async(std::launch::async, [&service, &request, start]() {
            start.wait();
            return service.get_thumbnail(request);
        }));
    }
    go.set_value();

    std::vector<Result<thumbnail_result>> results;
    for (auto& f : futures) {
        results.push_back(f.get());
    }

    REQUIRE(fetcher->call_count() == 1);

    int generated = 0;
    for (const auto& r : results) {
        REQUIRE(r.is_ok());
        CHECK(r.value().data == results.front().value().data);
        if (r.value().source == thumbnail_source::generated) ++generated;
    }
    CHECK(generated == 1);
    CHECK(store->get_statistics().entry_count == 1);
}

TEST_CASE("thumbnail_service: concurrent failures are shared",
          "[thumbnail][service][concurrency]") {
    auto store = std::make_shared<storage::memory_cache_store>();
    auto fetcher = std::make_shared<mock_image_fetcher>(
        fetch_error(error_codes::fetch_failure, "Failed to fetch image"));
    fetcher->set_delay(std::chrono::milliseconds(200));
    thumbnail_service service(store, fetcher);

    constexpr int kThreads = 4;
    auto request = make_request("https://example.com/gone.png", 200);

    std::promise<void> go;
    auto start = go.get_future().share();
    std::vector<std::future<Result<thumbnail_result>>> futures;
    for (int i = 0; i < kThreads; ++i) {
        futures.push_back(std::async(std::launch::async, [&service, &request, start]() {
            start.wait();
            return service.get_thumbnail(request);
        }));
    }
    go.set_value();

    for (auto& f : futures) {
        auto r = f.get();
        REQUIRE(r.is_err());
        CHECK(r.error().code == error_codes::fetch_failure);
    }

    // Followers that joined during the fetch share its outcome; late
    // arrivals may start their own fetch after the failure was published
    CHECK(fetcher->call_count() >= 1);
    CHECK(fetcher->call_count() <= kThreads);
    CHECK(store->get_statistics().entry_count == 0);
}
