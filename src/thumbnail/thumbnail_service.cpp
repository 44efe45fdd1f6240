/**
 * @file thumbnail_service.cpp
 * @brief Implementation of the thumbnail pipeline
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#include <thumbcache/thumbnail/thumbnail_service.hpp>

#include <thumbcache/image/image_decoder.hpp>
#include <thumbcache/image/image_normalizer.hpp>
#include <thumbcache/integration/logger_adapter.hpp>

#include <stdexcept>

namespace thumbcache::thumbnail {

using integration::logger_adapter;

thumbnail_service::thumbnail_service(
    std::shared_ptr<storage::cache_store> store,
    std::shared_ptr<network::image_fetcher> fetcher,
    cache_key_deriver deriver,
    thumbnail_config config)
    : store_(std::move(store)),
      fetcher_(std::move(fetcher)),
      deriver_(std::move(deriver)),
      config_(config) {
    if (!store_) {
        throw std::invalid_argument("thumbnail_service requires a cache store");
    }
    if (!fetcher_) {
        throw std::invalid_argument("thumbnail_service requires an image fetcher");
    }
}

// =============================================================================
// Thumbnail Lookup
// =============================================================================

Result<thumbnail_result> thumbnail_service::get_thumbnail(
    const thumbnail_request& request) {
    auto key = deriver_.derive(request.url, request.width);

    // Fast path: cached entries are immutable and never evicted
    if (store_->exists(key)) {
        auto cached = store_->get(key);
        if (cached.is_ok()) {
            ++hits_;
            return thumbnail_result{std::move(cached.value()),
                                    thumbnail_source::cache, std::move(key)};
        }
        if (cached.error().code != error_codes::entry_not_found) {
            ++failures_;
            return Result<thumbnail_result>(cached.error());
        }
    }

    auto ticket = inflight_.join(key);

    if (!ticket.leader) {
        ++coalesced_;
        logger_adapter::debug("Waiting for in-flight thumbnail {}", key);
        const auto& shared = ticket.future.get();
        if (shared.is_err()) {
            ++failures_;
            return Result<thumbnail_result>(shared.error());
        }
        return thumbnail_result{shared.value(), thumbnail_source::coalesced,
                                std::move(key)};
    }

    bool from_cache = false;
    auto generated = lead(request, key, from_cache);
    if (generated.is_err()) {
        ++failures_;
        return Result<thumbnail_result>(generated.error());
    }

    if (from_cache) {
        ++hits_;
    } else {
        ++misses_;
    }
    return thumbnail_result{
        std::move(generated.value()),
        from_cache ? thumbnail_source::cache : thumbnail_source::generated,
        std::move(key)};
}

Result<thumbnail_service::bytes> thumbnail_service::lead(
    const thumbnail_request& request,
    const std::string& key,
    bool& from_cache) {
    try {
        auto result = load_or_generate(request, key, from_cache);
        inflight_.publish(key, result);
        return result;
    } catch (const std::exception& e) {
        logger_adapter::error("Thumbnail pipeline threw for {}: {}",
                              request.url, e.what());
        auto result = thumbcache_error<bytes>(
            error_codes::encode_error, std::string("Unexpected error: ") + e.what());
        inflight_.publish(key, result);
        return result;
    } catch (...) {
        inflight_.abandon(key, std::current_exception());
        throw;
    }
}

Result<thumbnail_service::bytes> thumbnail_service::load_or_generate(
    const thumbnail_request& request,
    const std::string& key,
    bool& from_cache) {
    // A previous leader may have stored the entry after our first lookup
    if (store_->exists(key)) {
        auto cached = store_->get(key);
        if (cached.is_ok()) {
            from_cache = true;
            return cached;
        }
    }

    auto encoded = generate(request);
    if (encoded.is_err()) {
        logger_adapter::warn("Thumbnail generation failed for {} (width {}): {}",
                             request.url, request.width,
                             encoded.error().message);
        return encoded;
    }

    // Store before waiters are released, so later requests hit the cache
    auto put_result = store_->put(key, encoded.value());
    if (put_result.is_err()) {
        logger_adapter::error("Failed to store thumbnail {}: {}", key,
                              put_result.error().message);
        return Result<bytes>(put_result.error());
    }

    logger_adapter::debug("Stored thumbnail {} ({} bytes)", key,
                          encoded.value().size());
    return encoded;
}

Result<thumbnail_service::bytes> thumbnail_service::generate(
    const thumbnail_request& request) {
    ++fetches_;
    auto body = fetcher_->fetch(request.url);
    if (body.is_err()) {
        return body;
    }

    auto decoded = image::image_decoder::decode(body.value());
    if (decoded.is_err()) {
        return Result<bytes>(decoded.error());
    }

    auto rgb = image::normalize(std::move(decoded.value()));
    if (rgb.is_err()) {
        return Result<bytes>(rgb.error());
    }

    return image::resize_and_encode(rgb.value(),
                                    static_cast<std::uint32_t>(request.width),
                                    config_.jpeg);
}

// =============================================================================
// Statistics
// =============================================================================

thumbnail_statistics thumbnail_service::statistics() const {
    thumbnail_statistics stats;
    stats.hits = hits_.load();
    stats.misses = misses_.load();
    stats.fetches = fetches_.load();
    stats.coalesced = coalesced_.load();
    stats.failures = failures_.load();
    return stats;
}

storage::cache_statistics thumbnail_service::cache_statistics() const {
    return store_->get_statistics();
}

}  // namespace thumbcache::thumbnail
