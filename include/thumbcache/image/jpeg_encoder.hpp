/**
 * @file jpeg_encoder.hpp
 * @brief JPEG encoding of resized thumbnails
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
 * @brief Encoder settings
 */
struct jpeg_options {
    /// Quality factor (1-100)
    int quality{85};

    /// Compute optimal Huffman tables
    bool optimize{true};
};

/**
 * @brief Encodes rgb and grayscale images as baseline JPEG via libjpeg
 */
class jpeg_encoder {
public:
    /**
     * @brief Encode an image
     * @param image rgb or grayscale image
     * @param options Quality and optimization settings
     * @return JPEG bytes, or encode_error
     */
    [[nodiscard]] static auto encode(const decoded_image& image,
                                     const jpeg_options& options = {})
        -> Result<std::vector<std::uint8_t>>;
};

/**
 * @brief Resize an opaque image to a width and encode it as JPEG
 *
 * Height follows compute_target_height(). Used by the thumbnail pipeline
 * after normalize().
 *
 * @param image Opaque rgb image
 * @param target_width Output width in pixels
 * @param options Encoder settings
 * @return JPEG bytes, or encode_error (also when the target height exceeds
 *         JPEG_MAX_DIMENSION or the target exceeds image_decoder::max_pixels)
 */
[[nodiscard]] auto resize_and_encode(const decoded_image& image,
                                     std::uint32_t target_width,
                                     const jpeg_options& options = {})
    -> Result<std::vector<std::uint8_t>>;

}  // namespace thumbcache::image
