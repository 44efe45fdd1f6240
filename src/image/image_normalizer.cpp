/**
 * @file image_normalizer.cpp
 * @brief Conversion of decoded images to opaque RGB
 */

#include <thumbcache/image/image_normalizer.hpp>

#include <string>

namespace thumbcache::image {

namespace {

auto make_rgb(const decoded_image& source) -> decoded_image {
    decoded_image out;
    out.width = source.width;
    out.height = source.height;
    out.mode = color_mode::rgb;
    out.pixels.resize(static_cast<std::size_t>(source.width) * source.height * 3);
    return out;
}

auto mul_div_255(unsigned a, unsigned b) -> std::uint8_t {
    return static_cast<std::uint8_t>((a * b + 127u) / 255u);
}

}  // namespace

auto normalize(decoded_image image) -> Result<decoded_image> {
    if (!image.is_consistent()) {
        return thumbcache_error<decoded_image>(
            error_codes::decode_error,
            "Pixel buffer does not match " + std::to_string(image.width) + "x" +
                std::to_string(image.height) + " " +
                std::string(to_string(image.mode)) + " image");
    }

    if (image.mode == color_mode::rgb) {
        return image;
    }

    const std::size_t count = static_cast<std::size_t>(image.width) * image.height;
    auto out = make_rgb(image);
    const auto* src = image.pixels.data();
    auto* dst = out.pixels.data();

    switch (image.mode) {
        case color_mode::grayscale:
            for (std::size_t i = 0; i < count; ++i) {
                dst[i * 3] = dst[i * 3 + 1] = dst[i * 3 + 2] = src[i];
            }
            break;

        case color_mode::grayscale_alpha:
            for (std::size_t i = 0; i < count; ++i) {
                auto v = composite_over_white(src[i * 2], src[i * 2 + 1]);
                dst[i * 3] = dst[i * 3 + 1] = dst[i * 3 + 2] = v;
            }
            break;

        case color_mode::rgba:
            for (std::size_t i = 0; i < count; ++i) {
                const auto a = src[i * 4 + 3];
                dst[i * 3] = composite_over_white(src[i * 4], a);
                dst[i * 3 + 1] = composite_over_white(src[i * 4 + 1], a);
                dst[i * 3 + 2] = composite_over_white(src[i * 4 + 2], a);
            }
            break;

        case color_mode::indexed: {
            // Indices past the palette end render as opaque black
            const palette_entry fallback{0, 0, 0, 255};
            for (std::size_t i = 0; i < count; ++i) {
                const auto index = src[i];
                const auto& entry = index < image.palette.size()
                                        ? image.palette[index]
                                        : fallback;
                dst[i * 3] = composite_over_white(entry.r, entry.a);
                dst[i * 3 + 1] = composite_over_white(entry.g, entry.a);
                dst[i * 3 + 2] = composite_over_white(entry.b, entry.a);
            }
            break;
        }

        case color_mode::cmyk:
            for (std::size_t i = 0; i < count; ++i) {
                const unsigned k = 255u - src[i * 4 + 3];
                dst[i * 3] = mul_div_255(255u - src[i * 4], k);
                dst[i * 3 + 1] = mul_div_255(255u - src[i * 4 + 1], k);
                dst[i * 3 + 2] = mul_div_255(255u - src[i * 4 + 2], k);
            }
            break;

        case color_mode::rgb:
            break;
    }

    return out;
}

}  // namespace thumbcache::image
