/**
 * @file logger_adapter_test.cpp
 * @brief Unit tests for logger_adapter
 */

#include <thumbcache/integration/logger_adapter.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

using namespace thumbcache::integration;

// =============================================================================
// Test Helpers
// =============================================================================

namespace {

/**
 * @brief Create a temporary directory for test logs
 */
auto create_temp_log_directory() -> std::filesystem::path {
    auto temp_dir = std::filesystem::temp_directory_path() / "thumbcache_logger_test";
    std::filesystem::create_directories(temp_dir);
    return temp_dir;
}

/**
 * @brief Clean up temporary log directory
 */
void cleanup_temp_directory(const std::filesystem::path& path) {
    if (std::filesystem::exists(path)) {
        std::filesystem::remove_all(path);
    }
}

/**
 * @brief Read file contents as string
 */
auto read_file_contents(const std::filesystem::path& path) -> std::string {
    std::ifstream file(path);
    if (!file) {
        return "";
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

/**
 * @brief RAII wrapper for logger initialization/shutdown
 */
class logger_test_fixture {
public:
    explicit logger_test_fixture(const logger_config& config) : log_dir_(config.log_directory) {
        logger_adapter::initialize(config);
    }

    ~logger_test_fixture() {
        logger_adapter::shutdown();
        cleanup_temp_directory(log_dir_);
    }

    logger_test_fixture(const logger_test_fixture&) = delete;
    logger_test_fixture& operator=(const logger_test_fixture&) = delete;

private:
    std::filesystem::path log_dir_;
};

}  // namespace

// =============================================================================
// Lifecycle
// =============================================================================

TEST_CASE("logger_adapter drops messages outside initialize/shutdown",
          "[logger_adapter][init]") {
    auto temp_dir = create_temp_log_directory();
    logger_adapter::shutdown();
    REQUIRE_FALSE(logger_adapter::is_initialized());

    // Not initialized: the access log is never created
    logger_adapter::log_thumbnail_request("https://example.com/early.png", 100,
                                          request_outcome::generated, 200,
                                          std::chrono::milliseconds{1});

    logger_config config;
    config.log_directory = temp_dir;
    config.enable_console = false;
    config.enable_file = false;
    config.enable_access_log = true;

    {
        logger_test_fixture fixture(config);
        REQUIRE(logger_adapter::is_initialized());
        logger_adapter::log_thumbnail_request("https://example.com/live.png", 100,
                                              request_outcome::generated, 200,
                                              std::chrono::milliseconds{1});
        auto content = read_file_contents(temp_dir / "access.json");
        CHECK(content.find("early.png") == std::string::npos);
        CHECK(content.find("live.png") != std::string::npos);
    }

    REQUIRE_FALSE(logger_adapter::is_initialized());
}

// =============================================================================
// Level Parsing
// =============================================================================

TEST_CASE("parse_log_level recognizes level names", "[logger_adapter][config]") {
    CHECK(parse_log_level("trace") == log_level::trace);
    CHECK(parse_log_level("debug") == log_level::debug);
    CHECK(parse_log_level("info") == log_level::info);
    CHECK(parse_log_level("warn") == log_level::warn);
    CHECK(parse_log_level("warning") == log_level::warn);
    CHECK(parse_log_level("error") == log_level::error);
    CHECK(parse_log_level("fatal") == log_level::fatal);
    CHECK(parse_log_level("critical") == log_level::fatal);
    CHECK(parse_log_level("off") == log_level::off);

    CHECK_FALSE(parse_log_level("verbose").has_value());
    CHECK_FALSE(parse_log_level("").has_value());
}

// =============================================================================
// Level Filtering
// =============================================================================

TEST_CASE("logger_adapter level filtering", "[logger_adapter][logging]") {
    auto temp_dir = create_temp_log_directory();
    logger_config config;
    config.log_directory = temp_dir;
    config.enable_console = false;
    config.enable_file = true;
    config.enable_access_log = false;
    config.min_level = log_level::trace;

    logger_test_fixture fixture(config);
    REQUIRE(logger_adapter::is_level_enabled(log_level::trace));

    logger_adapter::set_min_level(log_level::warn);
    REQUIRE(logger_adapter::get_min_level() == log_level::warn);

    REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::debug));
    REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::info));
    REQUIRE(logger_adapter::is_level_enabled(log_level::warn));
    REQUIRE(logger_adapter::is_level_enabled(log_level::fatal));

    logger_adapter::set_min_level(log_level::off);
    REQUIRE_FALSE(logger_adapter::is_level_enabled(log_level::fatal));
}

// =============================================================================
// Configuration Tests
// =============================================================================

TEST_CASE("logger_adapter keeps its configuration", "[logger_adapter][config]") {
    auto temp_dir = create_temp_log_directory();
    logger_config config;
    config.log_directory = temp_dir;
    config.min_level = log_level::debug;
    config.enable_console = false;
    config.enable_access_log = true;
    config.max_file_size_mb = 50;
    config.max_files = 5;

    logger_test_fixture fixture(config);

    const auto& retrieved = logger_adapter::get_config();
    REQUIRE(retrieved.min_level == log_level::debug);
    REQUIRE(retrieved.enable_access_log);
    REQUIRE(retrieved.max_file_size_mb == 50);
    REQUIRE(retrieved.max_files == 5);
    REQUIRE(logger_adapter::get_min_level() == log_level::debug);
}

// =============================================================================
// Access Log Tests
// =============================================================================

TEST_CASE("outcome_to_string names", "[logger_adapter][access]") {
    CHECK(logger_adapter::outcome_to_string(request_outcome::cache_hit) == "hit");
    CHECK(logger_adapter::outcome_to_string(request_outcome::generated) == "miss");
    CHECK(logger_adapter::outcome_to_string(request_outcome::coalesced) == "coalesced");
    CHECK(logger_adapter::outcome_to_string(request_outcome::rejected) == "rejected");
    CHECK(logger_adapter::outcome_to_string(request_outcome::failed) == "error");
}

TEST_CASE("logger_adapter access log JSON format", "[logger_adapter][access][json]") {
    auto temp_dir = create_temp_log_directory();
    logger_config config;
    config.log_directory = temp_dir;
    config.enable_console = false;
    config.enable_file = false;
    config.enable_access_log = true;

    logger_test_fixture fixture(config);

    logger_adapter::log_thumbnail_request("https://example.com/a.png", 200,
                                          request_outcome::cache_hit, 200,
                                          std::chrono::milliseconds{7});

    auto content = read_file_contents(temp_dir / "access.json");

    REQUIRE(content.find("{") != std::string::npos);
    REQUIRE(content.find("}\n") != std::string::npos);
    REQUIRE(content.find("\"timestamp\"") != std::string::npos);
    REQUIRE(content.find("\"url\":\"https://example.com/a.png\"") != std::string::npos);
    REQUIRE(content.find("\"width\":200,") != std::string::npos);
    REQUIRE(content.find("\"outcome\":\"hit\"") != std::string::npos);
    REQUIRE(content.find("\"status\":200,") != std::string::npos);
    REQUIRE(content.find("\"latency_ms\":7}") != std::string::npos);

    // UTC timestamp, e.g. "2025-01-31T12:00:00.123Z"
    auto ts = content.find("\"timestamp\":\"");
    REQUIRE(ts == 1);
    auto value = content.substr(ts + 13, 24);
    CHECK(value[4] == '-');
    CHECK(value[10] == 'T');
    CHECK(value[19] == '.');
    CHECK(value[23] == 'Z');
}

TEST_CASE("logger_adapter access log records rejections", "[logger_adapter][access]") {
    auto temp_dir = create_temp_log_directory();
    logger_config config;
    config.log_directory = temp_dir;
    config.enable_console = false;
    config.enable_file = false;
    config.enable_access_log = true;

    logger_test_fixture fixture(config);

    SECTION("Empty URL and zero width") {
        logger_adapter::log_thumbnail_request("", 0, request_outcome::rejected, 400,
                                              std::chrono::milliseconds{0});

        auto content = read_file_contents(temp_dir / "access.json");
        REQUIRE(content.find("\"url\":\"\"") != std::string::npos);
        REQUIRE(content.find("\"outcome\":\"rejected\"") != std::string::npos);
        REQUIRE(content.find("\"width\":0,") != std::string::npos);
        REQUIRE(content.find("\"status\":400,") != std::string::npos);
    }

    SECTION("Quotes in the URL are escaped") {
        logger_adapter::log_thumbnail_request("https://example.com/\"q\".png", 100,
                                              request_outcome::failed, 404,
                                              std::chrono::milliseconds{3});

        auto content = read_file_contents(temp_dir / "access.json");
        REQUIRE(content.find("example.com/\\\"q\\\".png") != std::string::npos);
        REQUIRE(content.find("\"outcome\":\"error\"") != std::string::npos);
    }
}

TEST_CASE("logger_adapter access log disabled", "[logger_adapter][access]") {
    auto temp_dir = create_temp_log_directory();
    logger_config config;
    config.log_directory = temp_dir;
    config.enable_console = false;
    config.enable_file = false;
    config.enable_access_log = false;

    logger_test_fixture fixture(config);

    logger_adapter::log_thumbnail_request("https://example.com/a.png", 200,
                                          request_outcome::generated, 200,
                                          std::chrono::milliseconds{12});

    REQUIRE_FALSE(std::filesystem::exists(temp_dir / "access.json"));
}

// =============================================================================
// Thread Safety Tests
// =============================================================================

TEST_CASE("logger_adapter thread safety", "[logger_adapter][thread]") {
    auto temp_dir = create_temp_log_directory();
    logger_config config;
    config.log_directory = temp_dir;
    config.enable_console = false;
    config.enable_file = true;
    config.enable_access_log = true;
    config.async_mode = true;

    logger_test_fixture fixture(config);

    constexpr int kNumThreads = 4;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kNumThreads);

    for (int t = 0; t < kNumThreads; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger_adapter::info("Thread {} message {}", t, i);
                logger_adapter::log_thumbnail_request(
                    "https://example.com/" + std::to_string(t) + ".png", 100 + i,
                    request_outcome::generated, 200, std::chrono::milliseconds{i});
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    logger_adapter::flush();

    auto content = read_file_contents(temp_dir / "access.json");
    std::size_t lines = 0;
    for (char c : content) {
        if (c == '\n') {
            ++lines;
        }
    }
    REQUIRE(lines == static_cast<std::size_t>(kNumThreads * kMessagesPerThread));
}
