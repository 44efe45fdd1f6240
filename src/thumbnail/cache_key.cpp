/**
 * @file cache_key.cpp
 * @brief Cache key derivation using OpenSSL EVP digests
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#include <thumbcache/thumbnail/cache_key.hpp>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <stdexcept>

namespace thumbcache::thumbnail {

namespace {

/**
 * @brief RAII wrapper for EVP_MD_CTX
 */
struct evp_md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, evp_md_ctx_deleter>;

/**
 * @brief Get OpenSSL error string
 */
std::string get_openssl_error() {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown error";
    }
    char buf[256];
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::string(buf);
}

std::vector<std::uint8_t> evp_digest(const EVP_MD* md, std::string_view input) {
    evp_md_ctx_ptr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed: " + get_openssl_error());
    }

    std::vector<std::uint8_t> result(static_cast<std::size_t>(EVP_MD_size(md)));
    unsigned int md_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), result.data(), &md_len) != 1) {
        throw std::runtime_error("Digest computation failed: " +
                                 get_openssl_error());
    }

    result.resize(md_len);
    return result;
}

std::string to_hex(const std::vector<std::uint8_t>& bytes) {
    static const char* hex = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto b : bytes) {
        out.push_back(hex[b >> 4]);
        out.push_back(hex[b & 0x0F]);
    }
    return out;
}

}  // namespace

std::vector<std::uint8_t> md5_digest::digest(std::string_view input) const {
    return evp_digest(EVP_md5(), input);
}

std::vector<std::uint8_t> sha256_digest::digest(std::string_view input) const {
    return evp_digest(EVP_sha256(), input);
}

std::shared_ptr<digest_strategy> make_digest(std::string_view name) {
    if (name == "md5") {
        return std::make_shared<md5_digest>();
    }
    if (name == "sha256") {
        return std::make_shared<sha256_digest>();
    }
    return nullptr;
}

// =============================================================================
// cache_key_deriver
// =============================================================================

cache_key_deriver::cache_key_deriver()
    : digest_(std::make_shared<md5_digest>()) {}

cache_key_deriver::cache_key_deriver(std::shared_ptr<digest_strategy> digest)
    : digest_(std::move(digest)) {
    if (!digest_) {
        throw std::invalid_argument("cache_key_deriver requires a digest");
    }
}

std::string cache_key_deriver::derive(std::string_view url, int width) const {
    std::string input;
    input.reserve(url.size() + 12);
    input.append(url);
    input.push_back('|');
    input.append(std::to_string(width));
    return to_hex(digest_->digest(input));
}

std::size_t cache_key_deriver::key_length() const noexcept {
    return digest_->digest_size() * 2;
}

}  // namespace thumbcache::thumbnail
