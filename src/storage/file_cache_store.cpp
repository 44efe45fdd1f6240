/**
 * @file file_cache_store.cpp
 * @brief Implementation of the filesystem-backed thumbnail cache
 */

#include <thumbcache/storage/file_cache_store.hpp>

#include <fstream>
#include <iterator>
#include <random>

namespace thumbcache::storage {

namespace {

/// Generate a unique temporary filename next to the target
auto generate_temp_filename(const std::filesystem::path& base)
    -> std::filesystem::path {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    static thread_local std::uniform_int_distribution<uint64_t> dist;

    auto temp_name = base.filename().string() + ".tmp." +
                     std::to_string(dist(gen));
    return base.parent_path() / temp_name;
}

auto invalid_key_error(std::string_view key) -> VoidResult {
    return thumbcache_void_error(error_codes::invalid_key,
                                 "Invalid cache key", std::string{key});
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

file_cache_store::file_cache_store(file_cache_config config)
    : config_(std::move(config)) {
    std::filesystem::create_directories(config_.root_path);
}

// ============================================================================
// cache_store Implementation
// ============================================================================

auto file_cache_store::exists(std::string_view key) const -> bool {
    if (!is_valid_key(key)) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_regular_file(entry_path(key), ec);
}

auto file_cache_store::get(std::string_view key) const
    -> Result<std::vector<std::uint8_t>> {
    if (!is_valid_key(key)) {
        return thumbcache_error<std::vector<std::uint8_t>>(
            error_codes::invalid_key, "Invalid cache key", std::string{key});
    }

    auto path = entry_path(key);
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return thumbcache_error<std::vector<std::uint8_t>>(
                error_codes::entry_not_found,
                "Cache entry not found: " + std::string{key});
        }
        return thumbcache_error<std::vector<std::uint8_t>>(
            error_codes::store_io_error,
            "Failed to open cache entry: " + path.string());
    }

    std::vector<std::uint8_t> bytes{std::istreambuf_iterator<char>(file),
                                    std::istreambuf_iterator<char>()};
    if (file.bad()) {
        return thumbcache_error<std::vector<std::uint8_t>>(
            error_codes::store_io_error,
            "Failed to read cache entry: " + path.string());
    }

    return bytes;
}

auto file_cache_store::put(std::string_view key,
                           const std::vector<std::uint8_t>& bytes)
    -> VoidResult {
    if (!is_valid_key(key)) {
        return invalid_key_error(key);
    }

    auto file_path = entry_path(key);
    auto temp_path = generate_temp_filename(file_path);

    // Write to temporary file first
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return thumbcache_void_error(
                error_codes::store_io_error,
                "Failed to create temp file: " + temp_path.string());
        }
        file.write(reinterpret_cast<const char*>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file) {
            file.close();
            std::error_code ec;
            std::filesystem::remove(temp_path, ec);
            return thumbcache_void_error(
                error_codes::store_io_error,
                "Failed to write temp file: " + temp_path.string());
        }
    }

    // Atomic rename
    std::error_code ec;
    std::filesystem::rename(temp_path, file_path, ec);
    if (ec) {
        std::error_code remove_ec;
        std::filesystem::remove(temp_path, remove_ec);
        return thumbcache_void_error(
            error_codes::store_io_error,
            "Failed to rename temp file: " + ec.message());
    }

    return ok();
}

auto file_cache_store::get_statistics() const -> cache_statistics {
    cache_statistics stats;

    std::error_code ec;
    for (const auto& entry :
         std::filesystem::directory_iterator(config_.root_path, ec)) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        if (entry.path().extension() != config_.file_extension) {
            continue;
        }
        auto size = entry.file_size(ec);
        if (ec) {
            continue;
        }
        ++stats.entry_count;
        stats.total_bytes += static_cast<std::size_t>(size);
    }

    return stats;
}

// ============================================================================
// Paths
// ============================================================================

auto file_cache_store::entry_path(std::string_view key) const
    -> std::filesystem::path {
    return config_.root_path / (std::string{key} + config_.file_extension);
}

auto file_cache_store::root_path() const -> const std::filesystem::path& {
    return config_.root_path;
}

auto file_cache_store::is_valid_key(std::string_view key) -> bool {
    if (key.empty()) {
        return false;
    }
    for (char c : key) {
        bool allowed = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
                       (c >= 'A' && c <= 'Z') || c == '-' || c == '_';
        if (!allowed) {
            return false;
        }
    }
    return true;
}

}  // namespace thumbcache::storage
