/**
 * @file jpeg_encoder.cpp
 * @brief libjpeg-based JPEG encoding
 */

#include <thumbcache/image/jpeg_encoder.hpp>

#include <thumbcache/image/image_decoder.hpp>
#include <thumbcache/image/image_scaler.hpp>

#include <algorithm>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <string>

#include <jpeglib.h>

namespace thumbcache::image {

namespace {

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

auto encode_error(const std::string& message)
    -> Result<std::vector<std::uint8_t>> {
    return thumbcache_error<std::vector<std::uint8_t>>(error_codes::encode_error,
                                                       message);
}

}  // namespace

auto jpeg_encoder::encode(const decoded_image& image, const jpeg_options& options)
    -> Result<std::vector<std::uint8_t>> {
    if (image.mode != color_mode::rgb && image.mode != color_mode::grayscale) {
        return encode_error("JPEG output requires rgb or grayscale, got " +
                            std::string(to_string(image.mode)));
    }
    if (!image.is_consistent()) {
        return encode_error("Inconsistent image buffer");
    }

    jpeg_compress_struct cinfo{};
    jpeg_error_context jerr{};
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit;

    unsigned char* outbuffer = nullptr;
    unsigned long outsize = 0;

    if (setjmp(jerr.setjmp_buffer)) {
        jpeg_destroy_compress(&cinfo);
        if (outbuffer) {
            std::free(outbuffer);
        }
        return encode_error(std::string("JPEG encoding failed: ") + jerr.message);
    }

    jpeg_create_compress(&cinfo);
    jpeg_mem_dest(&cinfo, &outbuffer, &outsize);

    cinfo.image_width = image.width;
    cinfo.image_height = image.height;
    cinfo.input_components = static_cast<int>(samples_per_pixel(image.mode));
    cinfo.in_color_space =
        image.mode == color_mode::rgb ? JCS_RGB : JCS_GRAYSCALE;

    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, std::clamp(options.quality, 1, 100), TRUE);
    cinfo.optimize_coding = options.optimize ? TRUE : FALSE;
    jpeg_start_compress(&cinfo, TRUE);

    const std::size_t row_stride = image.stride();
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row_pointer[1];
        row_pointer[0] = const_cast<JSAMPLE*>(
            &image.pixels[cinfo.next_scanline * row_stride]);
        jpeg_write_scanlines(&cinfo, row_pointer, 1);
    }

    jpeg_finish_compress(&cinfo);
    jpeg_destroy_compress(&cinfo);

    std::vector<std::uint8_t> result(outbuffer, outbuffer + outsize);
    std::free(outbuffer);

    return result;
}

auto resize_and_encode(const decoded_image& image, std::uint32_t target_width,
                       const jpeg_options& options)
    -> Result<std::vector<std::uint8_t>> {
    const auto target_height =
        compute_target_height(image.width, image.height, target_width);

    // Reject before the scaler allocates the output raster
    if (target_height > JPEG_MAX_DIMENSION ||
        static_cast<std::uint64_t>(target_width) * target_height >
            image_decoder::max_pixels) {
        return encode_error("Thumbnail too large: " + std::to_string(target_width) +
                            "x" + std::to_string(target_height));
    }

    auto resized = image_scaler::resize(image, target_width, target_height);
    if (resized.is_err()) {
        return Result<std::vector<std::uint8_t>>(resized.error());
    }

    return jpeg_encoder::encode(resized.value(), options);
}

}  // namespace thumbcache::image
