/**
 * @file logger_adapter.cpp
 * @brief Implementation of the service and access logging adapter
 */

#include <thumbcache/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <mutex>
#include <string_view>

namespace thumbcache::integration {

namespace {

/// One line of access.json
struct access_record {
    std::string url;
    int width{0};
    std::string outcome;
    int status{0};
    std::int64_t latency_ms{0};
};

/// Quote and escape a string for a JSON line
void append_json_string(std::string& out, std::string_view value) {
    static constexpr char hex[] = "0123456789abcdef";
    out += '"';
    for (char c : value) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '"' || c == '\\') {
            out += '\\';
            out += c;
        } else if (c == '\n') {
            out += "\\n";
        } else if (c == '\r') {
            out += "\\r";
        } else if (c == '\t') {
            out += "\\t";
        } else if (uc < 0x20) {
            out += "\\u00";
            out += hex[uc >> 4];
            out += hex[uc & 0x0F];
        } else {
            out += c;
        }
    }
    out += '"';
}

/// UTC timestamp with millisecond precision, e.g. 2025-01-31T12:00:00.123Z
auto utc_timestamp() -> std::string {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    const auto len = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    return compat::format("{}.{:03}Z", std::string_view(buffer, len), millis);
}

auto to_json_line(const access_record& record) -> std::string {
    std::string line = "{\"timestamp\":";
    append_json_string(line, utc_timestamp());
    line += ",\"url\":";
    append_json_string(line, record.url);
    line += compat::format(",\"width\":{}", record.width);
    line += ",\"outcome\":";
    append_json_string(line, record.outcome);
    line += compat::format(",\"status\":{},\"latency_ms\":{}}}\n",
                           record.status, record.latency_ms);
    return line;
}

}  // namespace

auto parse_log_level(std::string_view name) -> std::optional<log_level> {
    if (name == "trace") return log_level::trace;
    if (name == "debug") return log_level::debug;
    if (name == "info") return log_level::info;
    if (name == "warn" || name == "warning") return log_level::warn;
    if (name == "error") return log_level::error;
    if (name == "fatal" || name == "critical") return log_level::fatal;
    if (name == "off") return log_level::off;
    return std::nullopt;
}

// =============================================================================
// Implementation Class
// =============================================================================

class logger_adapter::impl {
public:
    impl() = default;
    ~impl() { shutdown(); }

    void initialize(const logger_config& config) {
        std::lock_guard lock(mutex_);

        if (initialized_) {
            return;
        }

        config_ = config;
        min_level_.store(config.min_level);

        if (config.enable_file || config.enable_access_log) {
            std::error_code ec;
            std::filesystem::create_directories(config.log_directory, ec);
        }

        logger_ = std::make_unique<kcenon::logger::logger>(
            config.async_mode, config.buffer_size);
        logger_->set_min_level(convert_log_level(config.min_level));

        if (config.enable_console) {
            logger_->add_writer(std::make_unique<kcenon::logger::console_writer>());
        }

        if (config.enable_file) {
            auto log_path = config.log_directory / "thumbcache.log";
            auto writer = std::make_unique<kcenon::logger::rotating_file_writer>(
                log_path.string(),
                config.max_file_size_mb * 1024 * 1024,
                config.max_files);
            logger_->add_writer(std::move(writer));
        }

        logger_->start();

        if (config.enable_access_log) {
            std::lock_guard access_lock(access_mutex_);
            auto path = config.log_directory / "access.json";
            access_stream_.open(path, std::ios::app);
            if (!access_stream_) {
                logger_->log(kcenon::logger::log_level::warn,
                             "Access log disabled: cannot open " + path.string());
            }
        }

        initialized_ = true;
    }

    void shutdown() {
        std::lock_guard lock(mutex_);

        if (!initialized_) {
            return;
        }

        {
            std::lock_guard access_lock(access_mutex_);
            if (access_stream_.is_open()) {
                access_stream_.close();
            }
        }

        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }

        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const noexcept -> bool {
        return initialized_.load();
    }

    void log(log_level level, const std::string& message) {
        if (!initialized_ || !logger_) {
            return;
        }

        if (!is_level_enabled(level)) {
            return;
        }

        logger_->log(convert_log_level(level), message);
    }

    [[nodiscard]] auto is_level_enabled(log_level level) const noexcept -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void flush() {
        if (logger_) {
            logger_->flush();
        }
    }

    void set_min_level(log_level level) {
        min_level_.store(level);
        if (logger_) {
            logger_->set_min_level(convert_log_level(level));
        }
    }

    [[nodiscard]] auto get_min_level() const noexcept -> log_level {
        return min_level_.load();
    }

    [[nodiscard]] auto get_config() const -> const logger_config& { return config_; }

    void record_access(const access_record& record) {
        if (!initialized_) {
            return;
        }

        auto line = to_json_line(record);

        std::lock_guard lock(access_mutex_);
        if (!access_stream_.is_open()) {
            return;
        }
        // Flushed per line so the file can be tailed
        access_stream_ << line << std::flush;
    }

private:
    [[nodiscard]] static auto convert_log_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace:
                return kcenon::logger::log_level::trace;
            case log_level::debug:
                return kcenon::logger::log_level::debug;
            case log_level::info:
                return kcenon::logger::log_level::info;
            case log_level::warn:
                return kcenon::logger::log_level::warn;
            case log_level::error:
                return kcenon::logger::log_level::error;
            case log_level::fatal:
                return kcenon::logger::log_level::fatal;
            case log_level::off:
            default:
                return kcenon::logger::log_level::off;
        }
    }

    mutable std::mutex mutex_;
    mutable std::mutex access_mutex_;
    std::atomic<bool> initialized_{false};
    std::atomic<log_level> min_level_{log_level::info};
    logger_config config_;
    std::unique_ptr<kcenon::logger::logger> logger_;
    std::ofstream access_stream_;
};

// =============================================================================
// Static Member Initialization
// =============================================================================

std::unique_ptr<logger_adapter::impl> logger_adapter::pimpl_ =
    std::make_unique<logger_adapter::impl>();

// =============================================================================
// Initialization
// =============================================================================

void logger_adapter::initialize(const logger_config& config) {
    pimpl_->initialize(config);
}

void logger_adapter::shutdown() { pimpl_->shutdown(); }

auto logger_adapter::is_initialized() noexcept -> bool {
    return pimpl_->is_initialized();
}

// =============================================================================
// Standard Logging
// =============================================================================

void logger_adapter::log(log_level level, const std::string& message) {
    pimpl_->log(level, message);
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    return pimpl_->is_level_enabled(level);
}

void logger_adapter::flush() { pimpl_->flush(); }

// =============================================================================
// Access Logging
// =============================================================================

void logger_adapter::log_thumbnail_request(const std::string& url,
                                           int width,
                                           request_outcome outcome,
                                           int http_status,
                                           std::chrono::milliseconds latency) {
    access_record record{url, width, outcome_to_string(outcome), http_status,
                         static_cast<std::int64_t>(latency.count())};

    if (outcome == request_outcome::failed) {
        warn("GET /thumbnail url={} width={} -> {} ({}) in {}ms", record.url,
             record.width, record.status, record.outcome, record.latency_ms);
    } else {
        debug("GET /thumbnail url={} width={} -> {} ({}) in {}ms", record.url,
              record.width, record.status, record.outcome, record.latency_ms);
    }

    pimpl_->record_access(record);
}

// =============================================================================
// Configuration
// =============================================================================

void logger_adapter::set_min_level(log_level level) {
    pimpl_->set_min_level(level);
}

auto logger_adapter::get_min_level() noexcept -> log_level {
    return pimpl_->get_min_level();
}

auto logger_adapter::get_config() -> const logger_config& {
    return pimpl_->get_config();
}

auto logger_adapter::outcome_to_string(request_outcome outcome) -> std::string {
    switch (outcome) {
        case request_outcome::cache_hit:
            return "hit";
        case request_outcome::generated:
            return "miss";
        case request_outcome::coalesced:
            return "coalesced";
        case request_outcome::rejected:
            return "rejected";
        case request_outcome::failed:
        default:
            return "error";
    }
}

}  // namespace thumbcache::integration
