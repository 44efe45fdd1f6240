/**
 * @file image_scaler.cpp
 * @brief Separable Lanczos-3 resampling with contribution tables
 */

#include <thumbcache/image/image_scaler.hpp>

#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>
#include <string>

namespace thumbcache::image {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kLanczosRadius = 3.0;

auto clamp_to_byte(float value) -> std::uint8_t {
    if (value <= 0.0f) return 0;
    if (value >= 255.0f) return 255;
    return static_cast<std::uint8_t>(value + 0.5f);
}

/// Horizontally resample one source row into float samples
void resample_row(const std::uint8_t* row,
                  const std::vector<image_scaler::contribution>& table,
                  std::size_t channels,
                  std::vector<float>& out) {
    out.assign(table.size() * channels, 0.0f);
    for (std::size_t x = 0; x < table.size(); ++x) {
        const auto& c = table[x];
        float* dst = out.data() + x * channels;
        const std::uint8_t* src = row + static_cast<std::size_t>(c.first) * channels;
        for (std::size_t i = 0; i < c.weights.size(); ++i) {
            const float w = c.weights[i];
            for (std::size_t ch = 0; ch < channels; ++ch) {
                dst[ch] += w * static_cast<float>(src[i * channels + ch]);
            }
        }
    }
}

}  // namespace

auto compute_target_height(std::uint32_t source_width,
                           std::uint32_t source_height,
                           std::uint32_t target_width) -> std::uint32_t {
    if (source_width == 0) {
        return 1;
    }
    const double exact = static_cast<double>(target_width) * source_height /
                         static_cast<double>(source_width);
    const auto rounded = static_cast<std::uint64_t>(std::llround(exact));
    const std::uint64_t limit = std::numeric_limits<std::uint32_t>::max();
    return static_cast<std::uint32_t>(
        std::clamp<std::uint64_t>(rounded, 1, limit));
}

auto lanczos3(double x) noexcept -> double {
    x = std::fabs(x);
    if (x < 1e-8) {
        return 1.0;
    }
    if (x >= kLanczosRadius) {
        return 0.0;
    }
    const double px = kPi * x;
    return kLanczosRadius * std::sin(px) * std::sin(px / kLanczosRadius) /
           (px * px);
}

auto image_scaler::build_contributions(std::uint32_t source_size,
                                       std::uint32_t target_size)
    -> std::vector<contribution> {
    std::vector<contribution> table(target_size);

    const double scale = static_cast<double>(target_size) / source_size;
    const double filter_scale = std::max(1.0, 1.0 / scale);
    const double support = kLanczosRadius * filter_scale;

    for (std::uint32_t i = 0; i < target_size; ++i) {
        const double center = (i + 0.5) / scale;
        const auto left = static_cast<std::int64_t>(
            std::max(0.0, std::floor(center - support)));
        const auto right = static_cast<std::int64_t>(
            std::min(static_cast<double>(source_size) - 1.0,
                     std::ceil(center + support)));

        std::vector<double> weights;
        weights.reserve(static_cast<std::size_t>(right - left + 1));
        double sum = 0.0;
        for (std::int64_t j = left; j <= right; ++j) {
            const double w = lanczos3((j + 0.5 - center) / filter_scale);
            weights.push_back(w);
            sum += w;
        }

        // Trim zero weights at both ends
        std::size_t begin = 0;
        std::size_t end = weights.size();
        while (begin < end && weights[begin] == 0.0) ++begin;
        while (end > begin && weights[end - 1] == 0.0) --end;

        auto& c = table[i];
        if (begin == end || sum == 0.0) {
            // Degenerate window: take the nearest source sample
            c.first = static_cast<std::uint32_t>(std::clamp<std::int64_t>(
                static_cast<std::int64_t>(center), 0,
                static_cast<std::int64_t>(source_size) - 1));
            c.weights.assign(1, 1.0f);
            continue;
        }

        c.first = static_cast<std::uint32_t>(left + static_cast<std::int64_t>(begin));
        c.weights.reserve(end - begin);
        for (std::size_t k = begin; k < end; ++k) {
            c.weights.push_back(static_cast<float>(weights[k] / sum));
        }
    }

    return table;
}

auto image_scaler::resize(const decoded_image& source,
                          std::uint32_t target_width,
                          std::uint32_t target_height) -> Result<decoded_image> {
    if (source.mode == color_mode::indexed) {
        return thumbcache_error<decoded_image>(
            error_codes::encode_error, "Cannot resample an indexed image");
    }
    if (!source.is_consistent()) {
        return thumbcache_error<decoded_image>(
            error_codes::encode_error, "Inconsistent source image");
    }
    if (target_width == 0 || target_height == 0) {
        return thumbcache_error<decoded_image>(
            error_codes::encode_error,
            "Invalid target size " + std::to_string(target_width) + "x" +
                std::to_string(target_height));
    }

    const std::size_t channels = samples_per_pixel(source.mode);
    const auto h_table = build_contributions(source.width, target_width);
    const auto v_table = build_contributions(source.height, target_height);

    decoded_image out;
    out.width = target_width;
    out.height = target_height;
    out.mode = source.mode;
    out.pixels.resize(out.stride() * target_height);

    const std::size_t out_row_len = static_cast<std::size_t>(target_width) * channels;
    std::deque<std::vector<float>> window;
    std::uint32_t window_first = 0;
    std::vector<float> accum(out_row_len);

    for (std::uint32_t y = 0; y < target_height; ++y) {
        const auto& c = v_table[y];
        const auto needed_end = c.first + static_cast<std::uint32_t>(c.weights.size());

        while (!window.empty() && window_first < c.first) {
            window.pop_front();
            ++window_first;
        }
        if (window.empty()) {
            window_first = c.first;
        }
        while (window_first + window.size() < needed_end) {
            const auto src_y = window_first + static_cast<std::uint32_t>(window.size());
            window.emplace_back();
            resample_row(source.pixels.data() + source.stride() * src_y,
                         h_table, channels, window.back());
        }

        std::fill(accum.begin(), accum.end(), 0.0f);
        for (std::size_t i = 0; i < c.weights.size(); ++i) {
            const float w = c.weights[i];
            const auto& row = window[c.first - window_first + i];
            for (std::size_t k = 0; k < out_row_len; ++k) {
                accum[k] += w * row[k];
            }
        }

        std::uint8_t* dst = out.pixels.data() + out.stride() * y;
        for (std::size_t k = 0; k < out_row_len; ++k) {
            dst[k] = clamp_to_byte(accum[k]);
        }
    }

    return out;
}

}  // namespace thumbcache::image
