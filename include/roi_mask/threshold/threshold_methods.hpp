#pragma once

#include "roi_mask/core/types.hpp"
#include <vector>

namespace roi_mask::threshold {

// Per-pixel temporal mean (rows x cols)
Matrix2Df temporal_mean(const FrameStack& stack);

// Per-pixel sample standard deviation over time around `mean`. Zero for a
// single-frame stack.
Matrix2Df temporal_std(const FrameStack& stack, const Matrix2Df& mean);

// Auto-threshold levels from cv::threshold on the values stretched from
// [min, max] to 8 bits. Returned in data units: a value lies above the level
// iff its 8-bit code lies above OpenCV's threshold. Constant input returns
// that constant. Non-finite values are ignored.
float otsu_level(const std::vector<float>& values);
float triangle_level(const std::vector<float>& values);

// Threshold methods. Each returns a rows x cols mask; pixel (y, x) is true
// when it belongs to the region of interest. An empty stack raises
// ValidationError.

// Any sample above mean + k * std of its own time series
MaskMatrix sigma_threshold(const FrameStack& stack, float k = 2.0f);

// Temporal mean image (rescaled to [0,1]) above its local block mean + offset
MaskMatrix adaptive_threshold(const FrameStack& stack, int block_size = 25,
                              float offset = 0.0f);

// Any sample of the mean-normalized series above the Otsu level of all
// normalized samples
MaskMatrix otsu_threshold(const FrameStack& stack);

// Temporal mean image above its triangle level
MaskMatrix triangle_threshold(const FrameStack& stack);

} // namespace roi_mask::threshold
