/**
 * @file memory_cache_store.cpp
 * @brief Implementation of the in-process thumbnail cache
 */

#include <thumbcache/storage/memory_cache_store.hpp>

#include <mutex>

namespace thumbcache::storage {

auto memory_cache_store::exists(std::string_view key) const -> bool {
    std::shared_lock lock(mutex_);
    return entries_.find(key) != entries_.end();
}

auto memory_cache_store::get(std::string_view key) const
    -> Result<std::vector<std::uint8_t>> {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return thumbcache_error<std::vector<std::uint8_t>>(
            error_codes::entry_not_found,
            "Cache entry not found: " + std::string{key});
    }
    return it->second;
}

auto memory_cache_store::put(std::string_view key,
                             const std::vector<std::uint8_t>& bytes)
    -> VoidResult {
    if (key.empty()) {
        return thumbcache_void_error(error_codes::invalid_key,
                                     "Invalid cache key");
    }

    std::unique_lock lock(mutex_);
    entries_.insert_or_assign(std::string{key}, bytes);
    return ok();
}

auto memory_cache_store::get_statistics() const -> cache_statistics {
    std::shared_lock lock(mutex_);

    cache_statistics stats;
    stats.entry_count = entries_.size();
    for (const auto& [key, bytes] : entries_) {
        stats.total_bytes += bytes.size();
    }
    return stats;
}

}  // namespace thumbcache::storage
