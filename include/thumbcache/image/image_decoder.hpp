/**
 * @file image_decoder.hpp
 * @brief PNG and JPEG decoding into decoded_image
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "decoded_image.hpp"

#include <thumbcache/core/result.hpp>

#include <cstdint>
#include <vector>

namespace thumbcache::image {

/**
 * @brief Container format detected from the leading bytes
 */
enum class image_format {
    unknown,
    png,
    jpeg
};

/**
 * @brief Detect the image format from its signature
 */
[[nodiscard]] auto detect_format(const std::vector<std::uint8_t>& bytes) noexcept
    -> image_format;

/**
 * @brief Decodes raster image bytes
 *
 * Output modes:
 * - PNG gray / gray+alpha / RGB / RGBA keep their layout; a tRNS chunk on a
 *   gray or RGB image adds an alpha channel.
 * - PNG palette images decode as indexed with a palette built from PLTE and
 *   tRNS.
 * - 16-bit PNG samples are reduced to 8 bits, sub-byte samples expanded.
 * - JPEG grayscale decodes as grayscale, CMYK/YCCK as cmyk (Adobe inverted
 *   data is flipped back), everything else as rgb.
 */
class image_decoder {
public:
    /**
     * @brief Decode image bytes
     * @return The image, or decode_error for unknown or corrupt data
     */
    [[nodiscard]] static auto decode(const std::vector<std::uint8_t>& bytes)
        -> Result<decoded_image>;

    /// Decode PNG bytes
    [[nodiscard]] static auto decode_png(const std::vector<std::uint8_t>& bytes)
        -> Result<decoded_image>;

    /// Decode JPEG bytes
    [[nodiscard]] static auto decode_jpeg(const std::vector<std::uint8_t>& bytes)
        -> Result<decoded_image>;

    /// Largest accepted width * height
    static constexpr std::uint64_t max_pixels = 100'000'000;
};

}  // namespace thumbcache::image
