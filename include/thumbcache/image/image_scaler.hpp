/**
 * @file image_scaler.hpp
 * @brief Lanczos-3 image resampling
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
 * @brief Height that keeps the source aspect ratio at a target width
 *
 * Returns round(target_width * source_height / source_width), never less
 * than 1.
 */
[[nodiscard]] auto compute_target_height(std::uint32_t source_width,
                                         std::uint32_t source_height,
                                         std::uint32_t target_width)
    -> std::uint32_t;

/**
 * @brief Lanczos-3 kernel value at x
 */
[[nodiscard]] auto lanczos3(double x) noexcept -> double;

/**
 * @brief Separable Lanczos-3 resampler
 *
 * Per-axis contribution tables are computed once per resize. When
 * shrinking, the kernel support is widened by the scale factor so every
 * source pixel contributes to the output. Rows are resampled horizontally
 * on demand and kept only while the vertical filter window needs them.
 *
 * @par Example
 * @code
 * auto height = compute_target_height(rgb.width, rgb.height, 200);
 * auto resized = image_scaler::resize(rgb, 200, height);
 * @endcode
 */
class image_scaler {
public:
    /**
     * @brief Source range and normalized weights for one output sample
     */
    struct contribution {
        std::uint32_t first{0};
        std::vector<float> weights;
    };

    /**
     * @brief Build the contribution table for one axis
     * @param source_size Source length along the axis (> 0)
     * @param target_size Output length along the axis (> 0)
     * @return One entry per output position, weights summing to 1
     */
    [[nodiscard]] static auto build_contributions(std::uint32_t source_size,
                                                  std::uint32_t target_size)
        -> std::vector<contribution>;

    /**
     * @brief Resize an image
     *
     * Works on any mode except indexed; samples are filtered per channel.
     *
     * @return The resized image, or encode_error for an indexed or
     *         inconsistent source or a zero target dimension
     */
    [[nodiscard]] static auto resize(const decoded_image& source,
                                     std::uint32_t target_width,
                                     std::uint32_t target_height)
        -> Result<decoded_image>;
};

}  // namespace thumbcache::image
