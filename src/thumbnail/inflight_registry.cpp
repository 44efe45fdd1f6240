/**
 * @file inflight_registry.cpp
 * @brief Implementation of in-flight generation coalescing
 */

#include <thumbcache/thumbnail/inflight_registry.hpp>

namespace thumbcache::thumbnail {

auto inflight_registry::join(const std::string& key) -> ticket {
    std::lock_guard lock(mutex_);

    auto it = entries_.find(key);
    if (it != entries_.end()) {
        return ticket{false, it->second.future};
    }

    entry e;
    e.future = e.promise.get_future().share();
    auto future = e.future;
    entries_.emplace(key, std::move(e));
    return ticket{true, std::move(future)};
}

void inflight_registry::publish(const std::string& key, result_type result) {
    std::lock_guard lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }
    it->second.promise.set_value(std::move(result));
    entries_.erase(it);
}

void inflight_registry::abandon(const std::string& key, std::exception_ptr error) {
    std::lock_guard lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return;
    }
    it->second.promise.set_exception(std::move(error));
    entries_.erase(it);
}

auto inflight_registry::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

}  // namespace thumbcache::thumbnail
