/**
 * @file inflight_registry.hpp
 * @brief Coalescing of concurrent thumbnail generations per cache key
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <thumbcache/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace thumbcache::thumbnail {

/**
 * @class inflight_registry
 * @brief Tracks thumbnails currently being generated
 *
 * The first caller to join() a key becomes its leader and must finish with
 * publish() or abandon(). Callers that join while the leader works receive
 * the leader's shared future and observe the same result, success or
 * failure.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @par Example
 * @code
 * auto ticket = registry.join(key);
 * if (!ticket.leader) {
 *     return ticket.future.get();
 * }
 * auto result = generate(key);
 * registry.publish(key, result);
 * @endcode
 */
class inflight_registry {
public:
    using result_type = Result<std::vector<std::uint8_t>>;
    using future_type = std::shared_future<result_type>;

    /**
     * @brief Outcome of join()
     */
    struct ticket {
        /// True when the caller must generate the thumbnail
        bool leader{false};

        /// Becomes ready when the leader publishes or abandons
        future_type future;
    };

    inflight_registry() = default;
    inflight_registry(const inflight_registry&) = delete;
    auto operator=(const inflight_registry&) -> inflight_registry& = delete;

    /**
     * @brief Join the generation of a key
     *
     * Registers the caller as leader if nobody is generating the key yet.
     */
    [[nodiscard]] auto join(const std::string& key) -> ticket;

    /**
     * @brief Publish the leader's result and unregister the key
     *
     * Has no effect if the key is not registered.
     */
    void publish(const std::string& key, result_type result);

    /**
     * @brief Fail all waiters with an exception and unregister the key
     */
    void abandon(const std::string& key, std::exception_ptr error);

    /**
     * @brief Number of keys currently being generated
     */
    [[nodiscard]] auto size() const -> std::size_t;

private:
    struct entry {
        std::promise<result_type> promise;
        future_type future;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, entry> entries_;
};

}  // namespace thumbcache::thumbnail
