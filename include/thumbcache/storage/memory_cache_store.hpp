/**
 * @file memory_cache_store.hpp
 * @brief In-process thumbnail cache
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "cache_store.hpp"

#include <map>
#include <shared_mutex>
#include <string>

namespace thumbcache::storage {

/**
 * @brief Cache store backed by an in-memory map
 *
 * Contents are lost when the process exits.
 */
class memory_cache_store final : public cache_store {
public:
    memory_cache_store() = default;

    [[nodiscard]] auto exists(std::string_view key) const -> bool override;

    [[nodiscard]] auto get(std::string_view key) const
        -> Result<std::vector<std::uint8_t>> override;

    [[nodiscard]] auto put(std::string_view key,
                           const std::vector<std::uint8_t>& bytes)
        -> VoidResult override;

    [[nodiscard]] auto get_statistics() const -> cache_statistics override;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::vector<std::uint8_t>, std::less<>> entries_;
};

}  // namespace thumbcache::storage
