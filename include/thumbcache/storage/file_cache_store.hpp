/**
 * @file file_cache_store.hpp
 * @brief Filesystem-backed thumbnail cache
 *
 * Entries live in a single flat directory as `<key>.jpg` files holding raw
 * JPEG bytes. There is no index file; the directory listing is the index.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "cache_store.hpp"

#include <filesystem>
#include <string>

namespace thumbcache::storage {

/**
 * @brief Configuration for file_cache_store
 */
struct file_cache_config {
    /// Directory holding cache entries
    std::filesystem::path root_path{"cache"};

    /// File extension appended to the key
    std::string file_extension{".jpg"};
};

/**
 * @brief Flat-directory cache store with atomic writes
 *
 * put() writes to a uniquely named temporary file in the cache directory
 * and renames it over `<key>.jpg`, so concurrent readers see either the
 * old entry, the new entry, or no entry.
 */
class file_cache_store final : public cache_store {
public:
    /**
     * @brief Construct a store, creating the directory if needed
     *
     * @param config Store configuration
     * @throws std::filesystem::filesystem_error if the directory cannot be
     *         created
     */
    explicit file_cache_store(file_cache_config config);

    [[nodiscard]] auto exists(std::string_view key) const -> bool override;

    [[nodiscard]] auto get(std::string_view key) const
        -> Result<std::vector<std::uint8_t>> override;

    [[nodiscard]] auto put(std::string_view key,
                           const std::vector<std::uint8_t>& bytes)
        -> VoidResult override;

    /**
     * @brief Count `*.jpg` entries and their sizes
     *
     * Scans the directory; temporary files are not counted.
     */
    [[nodiscard]] auto get_statistics() const -> cache_statistics override;

    /**
     * @brief Path an entry is stored at
     */
    [[nodiscard]] auto entry_path(std::string_view key) const
        -> std::filesystem::path;

    /**
     * @brief Root directory of this store
     */
    [[nodiscard]] auto root_path() const -> const std::filesystem::path&;

private:
    /// Keys must be non-empty and contain only letters, digits, '-' and '_'
    [[nodiscard]] static auto is_valid_key(std::string_view key) -> bool;

    file_cache_config config_;
};

}  // namespace thumbcache::storage
