/**
 * @file image_scaler_test.cpp
 * @brief Unit tests for Lanczos resampling
 */

#include <thumbcache/image/image_scaler.hpp>

#include "../fixtures/test_images.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <numeric>

using namespace thumbcache;
using namespace thumbcache::image;
using Catch::Approx;

TEST_CASE("compute_target_height keeps the aspect ratio", "[image][scaler]") {
    CHECK(compute_target_height(800, 600, 200) == 150);
    CHECK(compute_target_height(1000, 1000, 400) == 400);
    CHECK(compute_target_height(300, 100, 60) == 20);
    // 200 * 333 / 1000 = 66.6
    CHECK(compute_target_height(1000, 333, 200) == 67);
    // Very wide images never collapse to zero rows
    CHECK(compute_target_height(10000, 10, 50) == 1);
    // Upscaling
    CHECK(compute_target_height(100, 50, 400) == 200);
    // Extreme aspect ratios saturate instead of wrapping
    CHECK(compute_target_height(1, 4'000'000'000u, 2000) == 4'294'967'295u);
}

TEST_CASE("lanczos3 kernel", "[image][scaler]") {
    CHECK(lanczos3(0.0) == Approx(1.0));
    CHECK(lanczos3(1.0) == Approx(0.0).margin(1e-9));
    CHECK(lanczos3(2.0) == Approx(0.0).margin(1e-9));
    CHECK(lanczos3(3.0) == 0.0);
    CHECK(lanczos3(4.5) == 0.0);
    CHECK(lanczos3(-0.5) == Approx(lanczos3(0.5)));
    CHECK(lanczos3(0.5) > 0.0);
    CHECK(lanczos3(1.5) < 0.0);
}

TEST_CASE("build_contributions", "[image][scaler]") {
    auto check_table = [](std::uint32_t src, std::uint32_t dst) {
        INFO(src << " -> " << dst);
        auto table = image_scaler::build_contributions(src, dst);
        REQUIRE(table.size() == dst);
        for (const auto& c : table) {
            REQUIRE_FALSE(c.weights.empty());
            CHECK(c.first + c.weights.size() <= src);
            float sum = std::accumulate(c.weights.begin(), c.weights.end(), 0.0f);
            CHECK(sum == Approx(1.0f).epsilon(1e-4));
        }
    };

    SECTION("downscale") {
        check_table(800, 200);
        check_table(1000, 333);
    }

    SECTION("upscale") {
        check_table(10, 40);
    }

    SECTION("identity scale weights the matching sample") {
        auto table = image_scaler::build_contributions(16, 16);
        for (std::uint32_t i = 0; i < 16; ++i) {
            const auto& c = table[i];
            REQUIRE(c.first <= i);
            REQUIRE(i - c.first < c.weights.size());
            CHECK(c.weights[i - c.first] == Approx(1.0f).margin(1e-5));
        }
    }

    SECTION("downscale widens the filter") {
        auto narrow = image_scaler::build_contributions(100, 100);
        auto wide = image_scaler::build_contributions(400, 100);
        CHECK(wide[50].weights.size() > narrow[50].weights.size());
    }
}

TEST_CASE("image_scaler::resize", "[image][scaler]") {
    SECTION("flat colors stay flat") {
        auto src = testing::solid_image(97, 61, color_mode::rgb, {12, 130, 250});
        auto result = image_scaler::resize(src, 40, 25);
        REQUIRE(result.is_ok());

        const auto& out = result.value();
        CHECK(out.width == 40);
        CHECK(out.height == 25);
        CHECK(out.mode == color_mode::rgb);
        REQUIRE(out.is_consistent());
        for (std::size_t i = 0; i < out.pixels.size(); i += 3) {
            CHECK(std::abs(int(out.pixels[i]) - 12) <= 1);
            CHECK(std::abs(int(out.pixels[i + 1]) - 130) <= 1);
            CHECK(std::abs(int(out.pixels[i + 2]) - 250) <= 1);
        }
    }

    SECTION("grayscale upscale") {
        auto src = testing::solid_image(4, 4, color_mode::grayscale, {128});
        auto result = image_scaler::resize(src, 9, 9);
        REQUIRE(result.is_ok());
        CHECK(result.value().pixels.size() == 81);
    }

    SECTION("left half black, right half white keeps its edge") {
        decoded_image src;
        src.width = 100;
        src.height = 10;
        src.mode = color_mode::grayscale;
        for (std::uint32_t y = 0; y < src.height; ++y) {
            for (std::uint32_t x = 0; x < src.width; ++x) {
                src.pixels.push_back(x < 50 ? 0 : 255);
            }
        }

        auto result = image_scaler::resize(src, 50, 5);
        REQUIRE(result.is_ok());
        const auto& out = result.value();
        CHECK(out.pixels[0] == 0);
        CHECK(out.pixels[49] == 255);
    }

    SECTION("rejected inputs") {
        decoded_image indexed;
        indexed.width = 1;
        indexed.height = 1;
        indexed.mode = color_mode::indexed;
        indexed.pixels = {0};
        CHECK(image_scaler::resize(indexed, 1, 1).is_err());

        auto src = testing::solid_image(4, 4, color_mode::rgb, {0, 0, 0});
        auto zero = image_scaler::resize(src, 0, 4);
        REQUIRE(zero.is_err());
        CHECK(zero.error().code == error_codes::encode_error);

        src.pixels.pop_back();
        CHECK(image_scaler::resize(src, 2, 2).is_err());
    }
}
