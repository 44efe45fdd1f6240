/**
 * @file image_decoder.cpp
 * @brief PNG (libpng) and JPEG (libjpeg) decoding
 */

#include <thumbcache/image/image_decoder.hpp>

#include <cstdio>
#include <csetjmp>
#include <cstring>
#include <string>

#include <jpeglib.h>
#include <png.h>

namespace thumbcache::image {

auto to_string(color_mode mode) -> std::string_view {
    switch (mode) {
        case color_mode::grayscale:
            return "grayscale";
        case color_mode::grayscale_alpha:
            return "grayscale_alpha";
        case color_mode::rgb:
            return "rgb";
        case color_mode::rgba:
            return "rgba";
        case color_mode::indexed:
            return "indexed";
        case color_mode::cmyk:
            return "cmyk";
    }
    return "unknown";
}

namespace {

constexpr std::uint8_t png_signature[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

auto decode_error(const std::string& message) -> Result<decoded_image> {
    return thumbcache_error<decoded_image>(error_codes::decode_error, message);
}

auto exceeds_pixel_limit(std::uint32_t width, std::uint32_t height) -> bool {
    return static_cast<std::uint64_t>(width) * height > image_decoder::max_pixels;
}

// ─────────────────────────────────────────────────────
// libpng callbacks
// ─────────────────────────────────────────────────────

struct png_read_context {
    const std::uint8_t* data{nullptr};
    std::size_t size{0};
    std::size_t offset{0};
    char message[256] = {0};
};

void png_read_callback(png_structp png_ptr, png_bytep out_bytes,
                       png_size_t byte_count) {
    auto* ctx = static_cast<png_read_context*>(png_get_io_ptr(png_ptr));
    if (!ctx || ctx->offset + byte_count > ctx->size) {
        png_error(png_ptr, "Truncated PNG data");
    }
    std::memcpy(out_bytes, ctx->data + ctx->offset, byte_count);
    ctx->offset += byte_count;
}

void png_error_callback(png_structp png_ptr, png_const_charp message) {
    auto* ctx = static_cast<png_read_context*>(png_get_error_ptr(png_ptr));
    if (ctx) {
        std::snprintf(ctx->message, sizeof(ctx->message), "%s", message);
    }
    png_longjmp(png_ptr, 1);
}

void png_warning_callback(png_structp, png_const_charp) {}

// ─────────────────────────────────────────────────────
// libjpeg error manager
// ─────────────────────────────────────────────────────

struct jpeg_error_context {
    jpeg_error_mgr pub;
    jmp_buf setjmp_buffer;
    char message[JMSG_LENGTH_MAX];
};

void jpeg_error_exit(j_common_ptr cinfo) {
    auto* err = reinterpret_cast<jpeg_error_context*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->message);
    longjmp(err->setjmp_buffer, 1);
}

void jpeg_ignore_message(j_common_ptr) {}

auto jpeg_has_adobe_marker(const jpeg_decompress_struct& cinfo) -> bool {
    for (jpeg_saved_marker_ptr m = cinfo.marker_list; m != nullptr; m = m->next) {
        if (m->marker == JPEG_APP0 + 14 && m->data_length >= 5 &&
            std::memcmp(m->data, "Adobe", 5) == 0) {
            return true;
        }
    }
    return false;
}

}  // namespace

auto detect_format(const std::vector<std::uint8_t>& bytes) noexcept
    -> image_format {
    if (bytes.size() >= sizeof(png_signature) &&
        std::memcmp(bytes.data(), png_signature, sizeof(png_signature)) == 0) {
        return image_format::png;
    }
    if (bytes.size() >= 3 && bytes[0] == 0xFF && bytes[1] == 0xD8 &&
        bytes[2] == 0xFF) {
        return image_format::jpeg;
    }
    return image_format::unknown;
}

auto image_decoder::decode(const std::vector<std::uint8_t>& bytes)
    -> Result<decoded_image> {
    switch (detect_format(bytes)) {
        case image_format::png:
            return decode_png(bytes);
        case image_format::jpeg:
            return decode_jpeg(bytes);
        case image_format::unknown:
            break;
    }
    return decode_error("cannot identify image file");
}

auto image_decoder::decode_png(const std::vector<std::uint8_t>& bytes)
    -> Result<decoded_image> {
    if (detect_format(bytes) != image_format::png) {
        return decode_error("not a PNG file");
    }

    png_read_context ctx;
    ctx.data = bytes.data();
    ctx.size = bytes.size();

    decoded_image out;
    std::vector<png_bytep> rows;

    png_structp png_ptr = png_create_read_struct(
        PNG_LIBPNG_VER_STRING, &ctx, png_error_callback, png_warning_callback);
    if (!png_ptr) {
        return decode_error("Failed to create PNG read struct");
    }

    png_infop info_ptr = png_create_info_struct(png_ptr);
    if (!info_ptr) {
        png_destroy_read_struct(&png_ptr, nullptr, nullptr);
        return decode_error("Failed to create PNG info struct");
    }

    if (setjmp(png_jmpbuf(png_ptr))) {
        png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
        return decode_error(std::string("Invalid PNG data: ") + ctx.message);
    }

    png_set_read_fn(png_ptr, &ctx, png_read_callback);
    png_read_info(png_ptr, info_ptr);

    png_uint_32 width = 0;
    png_uint_32 height = 0;
    int bit_depth = 0;
    int color_type = 0;
    png_get_IHDR(png_ptr, info_ptr, &width, &height, &bit_depth, &color_type,
                 nullptr, nullptr, nullptr);

    if (width == 0 || height == 0 || exceeds_pixel_limit(width, height)) {
        png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
        return decode_error("Unsupported PNG dimensions: " +
                            std::to_string(width) + "x" +
                            std::to_string(height));
    }

    bool has_trns = png_get_valid(png_ptr, info_ptr, PNG_INFO_tRNS) != 0;

    if (bit_depth == 16) {
        png_set_strip_16(png_ptr);
    }
    if (color_type == PNG_COLOR_TYPE_PALETTE) {
        // One index per byte; palette expansion happens in the normalizer
        if (bit_depth < 8) png_set_packing(png_ptr);

        png_colorp plte = nullptr;
        int num_plte = 0;
        if (png_get_PLTE(png_ptr, info_ptr, &plte, &num_plte) != PNG_INFO_PLTE) {
            png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
            return decode_error("Palette image without PLTE chunk");
        }

        png_bytep trans_alpha = nullptr;
        int num_trans = 0;
        if (has_trns) {
            png_get_tRNS(png_ptr, info_ptr, &trans_alpha, &num_trans, nullptr);
        }

        out.palette.resize(static_cast<std::size_t>(num_plte));
        for (int i = 0; i < num_plte; ++i) {
            auto& entry = out.palette[static_cast<std::size_t>(i)];
            entry.r = plte[i].red;
            entry.g = plte[i].green;
            entry.b = plte[i].blue;
            entry.a = (trans_alpha && i < num_trans) ? trans_alpha[i] : 255;
        }
    } else {
        if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) {
            png_set_expand_gray_1_2_4_to_8(png_ptr);
        }
        if (has_trns) {
            png_set_tRNS_to_alpha(png_ptr);
        }
    }
    png_set_interlace_handling(png_ptr);
    png_read_update_info(png_ptr, info_ptr);

    switch (png_get_color_type(png_ptr, info_ptr)) {
        case PNG_COLOR_TYPE_GRAY:
            out.mode = color_mode::grayscale;
            break;
        case PNG_COLOR_TYPE_GRAY_ALPHA:
            out.mode = color_mode::grayscale_alpha;
            break;
        case PNG_COLOR_TYPE_RGB:
            out.mode = color_mode::rgb;
            break;
        case PNG_COLOR_TYPE_RGB_ALPHA:
            out.mode = color_mode::rgba;
            break;
        case PNG_COLOR_TYPE_PALETTE:
            out.mode = color_mode::indexed;
            break;
        default:
            png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
            return decode_error("Unsupported PNG color type");
    }

    out.width = width;
    out.height = height;

    const png_size_t rowbytes = png_get_rowbytes(png_ptr, info_ptr);
    if (rowbytes != out.stride()) {
        png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);
        return decode_error("Unexpected PNG row layout");
    }

    out.pixels.resize(rowbytes * height);
    rows.resize(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        rows[y] = out.pixels.data() + static_cast<std::size_t>(y) * rowbytes;
    }

    png_read_image(png_ptr, rows.data());
    png_read_end(png_ptr, nullptr);
    png_destroy_read_struct(&png_ptr, &info_ptr, nullptr);

    return out;
}

auto image_decoder::decode_jpeg(const std::vector<std::uint8_t>& bytes)
    -> Result<decoded_image> {
    if (detect_format(bytes) != image_format::jpeg) {
        return decode_error("not a JPEG file");
    }

    jpeg_decompress_struct cinfo{};
    jpeg_error_context jerr{};
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit;
    jerr.pub.output_message = jpeg_ignore_message;

    decoded_image out;

    if (setjmp(jerr.setjmp_buffer)) {
        jpeg_destroy_decompress(&cinfo);
        return decode_error(std::string("Invalid JPEG data: ") + jerr.message);
    }

    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, const_cast<unsigned char*>(bytes.data()),
                 static_cast<unsigned long>(bytes.size()));

    // Adobe APP14 marks inverted CMYK
    jpeg_save_markers(&cinfo, JPEG_APP0 + 14, 0xFFFF);

    jpeg_read_header(&cinfo, TRUE);

    const bool inverted = jpeg_has_adobe_marker(cinfo);

    switch (cinfo.jpeg_color_space) {
        case JCS_GRAYSCALE:
            cinfo.out_color_space = JCS_GRAYSCALE;
            out.mode = color_mode::grayscale;
            break;
        case JCS_CMYK:
        case JCS_YCCK:
            cinfo.out_color_space = JCS_CMYK;
            out.mode = color_mode::cmyk;
            break;
        default:
            cinfo.out_color_space = JCS_RGB;
            out.mode = color_mode::rgb;
            break;
    }

    if (exceeds_pixel_limit(cinfo.image_width, cinfo.image_height)) {
        jpeg_destroy_decompress(&cinfo);
        return decode_error("Unsupported JPEG dimensions: " +
                            std::to_string(cinfo.image_width) + "x" +
                            std::to_string(cinfo.image_height));
    }

    jpeg_start_decompress(&cinfo);

    out.width = cinfo.output_width;
    out.height = cinfo.output_height;

    if (static_cast<std::size_t>(cinfo.output_components) !=
        samples_per_pixel(out.mode)) {
        jpeg_destroy_decompress(&cinfo);
        return decode_error("Unexpected JPEG component count");
    }

    const std::size_t row_stride = out.stride();
    out.pixels.resize(row_stride * out.height);

    while (cinfo.output_scanline < cinfo.output_height) {
        JSAMPROW row = out.pixels.data() +
                       static_cast<std::size_t>(cinfo.output_scanline) * row_stride;
        jpeg_read_scanlines(&cinfo, &row, 1);
    }

    jpeg_finish_decompress(&cinfo);
    jpeg_destroy_decompress(&cinfo);

    if (out.mode == color_mode::cmyk && inverted) {
        for (auto& sample : out.pixels) {
            sample = static_cast<std::uint8_t>(255 - sample);
        }
    }

    return out;
}

}  // namespace thumbcache::image
