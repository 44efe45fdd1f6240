/**
 * @file image_normalizer.hpp
 * @brief Conversion of any decoded image to opaque RGB
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "decoded_image.hpp"

#include <thumbcache/core/result.hpp>

#include <cstdint>

namespace thumbcache::image {

/**
 * @brief Composite one straight-alpha sample over white
 *
 * Computes `(fg * a + 255 * (255 - a)) / 255` rounded to nearest, so
 * a == 0 yields 255 and a == 255 yields fg.
 */
[[nodiscard]] constexpr auto composite_over_white(std::uint8_t fg,
                                                  std::uint8_t alpha) noexcept
    -> std::uint8_t {
    unsigned value = static_cast<unsigned>(fg) * alpha + 255u * (255u - alpha);
    return static_cast<std::uint8_t>((value + 127u) / 255u);
}

/**
 * @brief Convert an image to opaque 8-bit RGB
 *
 * - rgba, grayscale_alpha, indexed: composited over a white background
 * - grayscale: gray value replicated into R, G and B
 * - cmyk: r = (255 - c) * (255 - k) / 255, likewise for g and b
 * - rgb: returned unchanged
 *
 * @param image Image to convert (consumed)
 * @return RGB image of the same dimensions, or decode_error when the
 *         pixel buffer does not match the declared dimensions
 */
[[nodiscard]] auto normalize(decoded_image image) -> Result<decoded_image>;

}  // namespace thumbcache::image
