#include "roi_mask/threshold/threshold_methods.hpp"
#include "roi_mask/mask/mask_ops.hpp"
#include "roi_mask/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace roi_mask;

namespace {

FrameStack constant_stack(int rows, int cols, int length, float value) {
    FrameStack stack;
    for (int t = 0; t < length; ++t) {
        stack.frames.push_back(Matrix2Df::Constant(rows, cols, value));
    }
    return stack;
}

} // namespace

TEST_CASE("temporal_mean_and_std_use_sample_statistics") {
    FrameStack stack = constant_stack(1, 2, 4, 0.0f);
    for (int t = 0; t < 4; ++t) {
        stack.frames[t](0, 0) = static_cast<float>(t);
    }

    Matrix2Df mean = threshold::temporal_mean(stack);
    Matrix2Df sd = threshold::temporal_std(stack, mean);

    REQUIRE(mean(0, 0) == Catch::Approx(1.5f));
    REQUIRE(sd(0, 0) == Catch::Approx(std::sqrt(5.0f / 3.0f)));
    REQUIRE(sd(0, 1) == Catch::Approx(0.0f));

    FrameStack single = constant_stack(1, 1, 1, 3.0f);
    REQUIRE(threshold::temporal_std(single, threshold::temporal_mean(single))(0, 0) == 0.0f);
}

TEST_CASE("otsu_level_splits_bimodal_values") {
    std::vector<float> v(50, 0.0f);
    v.insert(v.end(), 50, 10.0f);
    v.push_back(NAN);

    float level = threshold::otsu_level(v);

    REQUIRE(level > 0.0f);
    REQUIRE(level < 10.0f);
    REQUIRE(std::count_if(v.begin(), v.end(), [&](float x) { return x > level; }) == 50);

    std::vector<float> flat(10, 3.0f);
    REQUIRE(threshold::otsu_level(flat) == 3.0f);
}

TEST_CASE("triangle_level_sits_just_above_dominant_dim_peak") {
    // Peak at the low end, long tail towards bright values
    std::vector<float> v(96, 10.0f);
    v.insert(v.end(), 4, 100.0f);

    float level = threshold::triangle_level(v);

    REQUIRE(level > 10.0f);
    REQUIRE(level < 20.0f);
    REQUIRE(std::count_if(v.begin(), v.end(), [&](float x) { return x > level; }) == 4);
}

TEST_CASE("triangle_level_sits_just_below_dominant_bright_peak") {
    // Peak at the high end, long tail towards dim values
    std::vector<float> v(96, 100.0f);
    v.insert(v.end(), 4, 10.0f);

    float level = threshold::triangle_level(v);

    REQUIRE(level > 90.0f);
    REQUIRE(level < 100.0f);
    REQUIRE(std::count_if(v.begin(), v.end(), [&](float x) { return x > level; }) == 96);
}

TEST_CASE("sigma_threshold_flags_transient_pixels") {
    FrameStack stack = constant_stack(3, 3, 10, 5.0f);
    for (auto& frame : stack.frames) {
        frame(1, 1) = 0.0f;
    }
    stack.frames[6](1, 1) = 100.0f;

    MaskMatrix m = threshold::sigma_threshold(stack, 2.0f);

    REQUIRE(m.rows() == 3);
    REQUIRE(m.cols() == 3);
    REQUIRE(m(1, 1));
    REQUIRE(mask::count_true(m) == 1);

    // mean 10, std ~31.6: a factor of 3 puts the bar above 100
    MaskMatrix strict = threshold::sigma_threshold(stack, 3.0f);
    REQUIRE(mask::count_true(strict) == 0);
}

TEST_CASE("adaptive_threshold_finds_bright_block") {
    FrameStack stack = constant_stack(40, 40, 3, 0.0f);
    for (auto& frame : stack.frames) {
        frame.block(10, 10, 3, 3).setConstant(1.0f);
    }

    MaskMatrix m = threshold::adaptive_threshold(stack, 25, 0.0f);

    REQUIRE(mask::count_true(m) == 9);
    REQUIRE(m(11, 11));
    REQUIRE_FALSE(m(30, 30));
}

TEST_CASE("adaptive_threshold_handles_small_and_flat_images") {
    FrameStack flat = constant_stack(8, 8, 2, 4.0f);
    REQUIRE(mask::count_true(threshold::adaptive_threshold(flat, 25, 0.0f)) == 0);

    // Even block sizes and blocks larger than the frame are accepted
    FrameStack small = constant_stack(6, 6, 2, 0.0f);
    for (auto& frame : small.frames) {
        frame(2, 2) = 1.0f;
    }
    MaskMatrix m = threshold::adaptive_threshold(small, 4, 0.0f);
    REQUIRE(m(2, 2));
    REQUIRE(mask::count_true(m) == 1);
}

TEST_CASE("otsu_threshold_flags_pixels_with_normalized_peaks") {
    FrameStack stack = constant_stack(4, 4, 20, 10.0f);
    stack.frames[5](0, 1) = 100.0f;
    stack.frames[5](3, 2) = 100.0f;

    MaskMatrix m = threshold::otsu_threshold(stack);

    REQUIRE(mask::count_true(m) == 2);
    REQUIRE(m(0, 1));
    REQUIRE(m(3, 2));
}

TEST_CASE("triangle_threshold_flags_bright_pixels") {
    FrameStack stack = constant_stack(10, 10, 4, 10.0f);
    for (auto& frame : stack.frames) {
        frame(0, 0) = 100.0f;
        frame(0, 9) = 100.0f;
        frame(9, 0) = 100.0f;
        frame(9, 9) = 100.0f;
    }

    MaskMatrix m = threshold::triangle_threshold(stack);

    REQUIRE(mask::count_true(m) == 4);
    REQUIRE(m(9, 9));
}

TEST_CASE("threshold_methods_reject_empty_stacks") {
    FrameStack empty;

    REQUIRE_THROWS_AS(threshold::sigma_threshold(empty), ValidationError);
    REQUIRE_THROWS_AS(threshold::adaptive_threshold(empty), ValidationError);
    REQUIRE_THROWS_AS(threshold::otsu_threshold(empty), ValidationError);
    REQUIRE_THROWS_AS(threshold::triangle_threshold(empty), ValidationError);
}
