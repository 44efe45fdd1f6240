/**
 * @file cache_key.hpp
 * @brief Content-addressing keys for cached thumbnails
 *
 * A cache key is the lowercase hex digest of "<url>|<width>". The width
 * suffix never contains '|', so the last '|' always separates the two
 * fields and distinct (url, width) pairs never share a digest input.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace thumbcache::thumbnail {

/**
 * @class digest_strategy
 * @brief Fixed-width digest used to derive cache keys
 *
 * Implementations must be deterministic and unsalted so that keys stay
 * stable across process restarts.
 */
class digest_strategy {
public:
    virtual ~digest_strategy() = default;

    /// Algorithm name ("md5", "sha256")
    [[nodiscard]] virtual std::string name() const = 0;

    /// Digest length in bytes
    [[nodiscard]] virtual std::size_t digest_size() const noexcept = 0;

    /**
     * @brief Compute the digest of the input
     * @throws std::runtime_error if the crypto backend fails
     */
    [[nodiscard]] virtual std::vector<std::uint8_t> digest(
        std::string_view input) const = 0;
};

/**
 * @brief MD5 digest (128-bit keys, 2^128 key space)
 */
class md5_digest final : public digest_strategy {
public:
    [[nodiscard]] std::string name() const override { return "md5"; }
    [[nodiscard]] std::size_t digest_size() const noexcept override { return 16; }
    [[nodiscard]] std::vector<std::uint8_t> digest(
        std::string_view input) const override;
};

/**
 * @brief SHA-256 digest (256-bit keys)
 */
class sha256_digest final : public digest_strategy {
public:
    [[nodiscard]] std::string name() const override { return "sha256"; }
    [[nodiscard]] std::size_t digest_size() const noexcept override { return 32; }
    [[nodiscard]] std::vector<std::uint8_t> digest(
        std::string_view input) const override;
};

/**
 * @brief Create a digest strategy by name
 * @param name "md5" or "sha256"
 * @return The strategy, or nullptr for an unknown name
 */
[[nodiscard]] std::shared_ptr<digest_strategy> make_digest(std::string_view name);

/**
 * @class cache_key_deriver
 * @brief Maps (url, width) to a stable cache key
 *
 * @par Example
 * @code
 * cache_key_deriver deriver;  // md5 by default
 * auto key = deriver.derive("https://example.com/a.png", 200);
 * // key.size() == 32
 * @endcode
 */
class cache_key_deriver {
public:
    /// Construct with the default 128-bit MD5 digest
    cache_key_deriver();

    /**
     * @brief Construct with a specific digest
     * @param digest Digest strategy (must not be null)
     * @throws std::invalid_argument if digest is null
     */
    explicit cache_key_deriver(std::shared_ptr<digest_strategy> digest);

    /**
     * @brief Derive the cache key for a request
     * @return Lowercase hex string of 2 * digest_size() characters
     */
    [[nodiscard]] std::string derive(std::string_view url, int width) const;

    /// Length of every key this deriver produces
    [[nodiscard]] std::size_t key_length() const noexcept;

    /// The digest strategy in use
    [[nodiscard]] const digest_strategy& digest() const noexcept {
        return *digest_;
    }

private:
    std::shared_ptr<digest_strategy> digest_;
};

}  // namespace thumbcache::thumbnail
