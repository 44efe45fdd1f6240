/**
 * @file thumbnail_request.cpp
 * @brief Thumbnail query validation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#include <thumbcache/thumbnail/thumbnail_request.hpp>

#include <charconv>
#include <system_error>

namespace thumbcache::thumbnail {

namespace {

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
           c == '\v';
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

/// Parse a base-10 integer, allowing surrounding whitespace and one sign
std::optional<int> parse_int(std::string_view text) {
    text = trim(text);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && text.front() == '-') {
            return std::nullopt;
        }
    }
    if (text.empty()) {
        return std::nullopt;
    }

    int value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

Result<thumbnail_request> validate_request(
    std::optional<std::string_view> url,
    std::optional<std::string_view> width) {
    if (!url || url->empty()) {
        return thumbcache_error<thumbnail_request>(
            error_codes::missing_parameter, "Missing 'url' parameter");
    }

    thumbnail_request request;
    request.url = std::string(*url);

    if (width) {
        auto parsed = parse_int(*width);
        if (!parsed) {
            return thumbcache_error<thumbnail_request>(
                error_codes::invalid_parameter, "Invalid width parameter",
                std::string(*width));
        }
        request.width = *parsed;
    }

    if (request.width < min_width || request.width > max_width) {
        return thumbcache_error<thumbnail_request>(
            error_codes::out_of_range, "Width must be between 50 and 2000",
            std::to_string(request.width));
    }

    return ok(std::move(request));
}

}  // namespace thumbcache::thumbnail
