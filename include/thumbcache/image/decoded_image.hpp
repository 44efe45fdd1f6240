/**
 * @file decoded_image.hpp
 * @brief In-memory raster image passed between pipeline stages
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace thumbcache::image {

/**
 * @brief Pixel layout of a decoded image
 */
enum class color_mode {
    grayscale,        ///< 1 sample per pixel
    grayscale_alpha,  ///< 2 samples per pixel (gray, alpha)
    rgb,              ///< 3 samples per pixel
    rgba,             ///< 4 samples per pixel
    indexed,          ///< 1 palette index per pixel
    cmyk              ///< 4 samples per pixel, not inverted
};

/**
 * @brief Number of 8-bit samples stored per pixel for a mode
 */
[[nodiscard]] constexpr auto samples_per_pixel(color_mode mode) noexcept
    -> std::size_t {
    switch (mode) {
        case color_mode::grayscale:
        case color_mode::indexed:
            return 1;
        case color_mode::grayscale_alpha:
            return 2;
        case color_mode::rgb:
            return 3;
        case color_mode::rgba:
        case color_mode::cmyk:
            return 4;
    }
    return 0;
}

/**
 * @brief Human-readable name of a color mode
 */
[[nodiscard]] auto to_string(color_mode mode) -> std::string_view;

/**
 * @brief Palette entry (straight, non-premultiplied alpha)
 */
struct palette_entry {
    std::uint8_t r{0};
    std::uint8_t g{0};
    std::uint8_t b{0};
    std::uint8_t a{255};
};

/**
 * @brief Decoded raster image with 8-bit samples
 *
 * Rows are stored top to bottom without padding, so
 * `pixels.size() == width * height * samples_per_pixel(mode)`.
 */
struct decoded_image {
    std::uint32_t width{0};
    std::uint32_t height{0};
    color_mode mode{color_mode::rgb};

    /// Interleaved samples, row-major
    std::vector<std::uint8_t> pixels;

    /// Colors referenced by index when mode is indexed
    std::vector<palette_entry> palette;

    /// Bytes per row
    [[nodiscard]] auto stride() const noexcept -> std::size_t {
        return static_cast<std::size_t>(width) * samples_per_pixel(mode);
    }

    /// True when dimensions and buffer size agree
    [[nodiscard]] auto is_consistent() const noexcept -> bool {
        return width > 0 && height > 0 &&
               pixels.size() == stride() * static_cast<std::size_t>(height);
    }
};

}  // namespace thumbcache::image
