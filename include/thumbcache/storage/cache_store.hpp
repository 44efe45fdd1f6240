/**
 * @file cache_store.hpp
 * @brief Abstract key-value store for encoded thumbnails
 *
 * This file defines the cache_store interface. Entries are immutable byte
 * sequences addressed by cache key. Concrete implementations
 * (file_cache_store, memory_cache_store) must inherit from this interface.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <thumbcache/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace thumbcache::storage {

/**
 * @brief Cache store statistics
 */
struct cache_statistics {
    /// Number of stored entries
    std::size_t entry_count{0};

    /// Sum of stored entry sizes in bytes
    std::size_t total_bytes{0};
};

/**
 * @brief Abstract thumbnail cache store
 *
 * Thread Safety:
 * - All methods must be thread-safe in concrete implementations
 * - A reader never observes a partially written entry
 *
 * @example
 * @code
 * std::shared_ptr<cache_store> store =
 *     std::make_shared<file_cache_store>(file_cache_config{"/var/cache/thumbs"});
 *
 * if (!store->exists(key)) {
 *     auto put_result = store->put(key, jpeg_bytes);
 * }
 * auto bytes = store->get(key);
 * @endcode
 */
class cache_store {
public:
    virtual ~cache_store() = default;

    /**
     * @brief Check whether an entry exists
     *
     * May touch local storage, never the network.
     */
    [[nodiscard]] virtual auto exists(std::string_view key) const -> bool = 0;

    /**
     * @brief Read an entry
     *
     * @return The stored bytes, entry_not_found if absent, or
     *         store_io_error if the entry could not be read
     */
    [[nodiscard]] virtual auto get(std::string_view key) const
        -> Result<std::vector<std::uint8_t>> = 0;

    /**
     * @brief Write an entry
     *
     * Writing the same key twice is allowed. A later write replaces the
     * earlier one as a whole.
     *
     * @return Success, invalid_key, or store_io_error
     */
    [[nodiscard]] virtual auto put(std::string_view key,
                                   const std::vector<std::uint8_t>& bytes)
        -> VoidResult = 0;

    /**
     * @brief Get store statistics
     */
    [[nodiscard]] virtual auto get_statistics() const -> cache_statistics = 0;
};

}  // namespace thumbcache::storage
