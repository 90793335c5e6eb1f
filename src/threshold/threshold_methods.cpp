#include "roi_mask/threshold/threshold_methods.hpp"
#include "roi_mask/core/errors.hpp"
#include "roi_mask/mask/mask_ops.hpp"

#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace roi_mask::threshold {

namespace {

void require_frames(const FrameStack& stack, const char* method) {
    if (stack.empty() || stack.rows() == 0 || stack.cols() == 0) {
        throw ValidationError(std::string(method) + " threshold needs a non-empty frame stack");
    }
    mask::validate_stack(stack);
}

// Threshold level of an OpenCV auto-threshold method (THRESH_OTSU or
// THRESH_TRIANGLE) computed on the finite values stretched from [min, max]
// to 8 bits, mapped back to data units. Constant input returns that constant.
float auto_level(const std::vector<float>& values, int method) {
    std::vector<float> finite;
    finite.reserve(values.size());
    for (float v : values) {
        if (std::isfinite(v)) finite.push_back(v);
    }
    if (finite.empty()) {
        return 0.0f;
    }

    const auto [min_it, max_it] = std::minmax_element(finite.begin(), finite.end());
    const double lo = *min_it;
    const double hi = *max_it;
    if (!(hi > lo)) {
        return static_cast<float>(lo);
    }

    const double alpha = 255.0 / (hi - lo);
    cv::Mat src(1, static_cast<int>(finite.size()), CV_32F, finite.data());
    cv::Mat u8;
    src.convertTo(u8, CV_8U, alpha, -lo * alpha);

    cv::Mat bin;
    const double t = cv::threshold(u8, bin, 0, 255, cv::THRESH_BINARY | method);

    // Code c > t iff value rounds above lo + (t + 0.5) / alpha
    return static_cast<float>(lo + (t + 0.5) / alpha);
}

} // namespace

Matrix2Df temporal_mean(const FrameStack& stack) {
    const int h = stack.rows();
    const int w = stack.cols();
    Matrix2Dd sum = Matrix2Dd::Zero(h, w);
    for (const auto& frame : stack.frames) {
        sum += frame.cast<double>();
    }
    if (stack.length() > 0) {
        sum /= static_cast<double>(stack.length());
    }
    return sum.cast<float>();
}

Matrix2Df temporal_std(const FrameStack& stack, const Matrix2Df& mean) {
    const int n = stack.length();
    Matrix2Dd ss = Matrix2Dd::Zero(mean.rows(), mean.cols());
    if (n < 2) {
        return ss.cast<float>();
    }
    const Matrix2Dd mu = mean.cast<double>();
    for (const auto& frame : stack.frames) {
        ss.array() += (frame.cast<double>() - mu).array().square();
    }
    return (ss.array() / static_cast<double>(n - 1)).sqrt().matrix().cast<float>();
}

float otsu_level(const std::vector<float>& values) {
    return auto_level(values, cv::THRESH_OTSU);
}

float triangle_level(const std::vector<float>& values) {
    return auto_level(values, cv::THRESH_TRIANGLE);
}

MaskMatrix sigma_threshold(const FrameStack& stack, float k) {
    require_frames(stack, "sigma");

    const Matrix2Df mean = temporal_mean(stack);
    const Matrix2Df sd = temporal_std(stack, mean);
    const Matrix2Df thr = (mean.array() + k * sd.array()).matrix();

    MaskMatrix mask = MaskMatrix::Constant(stack.rows(), stack.cols(), false);
    for (const auto& frame : stack.frames) {
        mask = (mask.array() || (frame.array() > thr.array())).matrix();
    }
    return mask;
}

MaskMatrix adaptive_threshold(const FrameStack& stack, int block_size, float offset) {
    require_frames(stack, "adaptive");
    const int h = stack.rows();
    const int w = stack.cols();

    const Matrix2Df mean = temporal_mean(stack);
    const float lo = mean.minCoeff();
    const float hi = mean.maxCoeff();
    if (!(hi > lo)) {
        return MaskMatrix::Constant(h, w, false);
    }
    Matrix2Df scaled = ((mean.array() - lo) / (hi - lo)).matrix();

    // Odd block no larger than the smaller image side
    int block = std::max(1, block_size);
    if (block % 2 == 0) block++;
    int limit = std::min(h, w);
    if (limit % 2 == 0) limit--;
    block = std::max(1, std::min(block, limit));

    cv::Mat cv_scaled(h, w, CV_32F, scaled.data());
    cv::Mat local;
    cv::blur(cv_scaled, local, cv::Size(block, block), cv::Point(-1, -1),
             cv::BORDER_REFLECT_101);

    MaskMatrix mask(h, w);
    for (int y = 0; y < h; ++y) {
        const float* lrow = local.ptr<float>(y);
        for (int x = 0; x < w; ++x) {
            mask(y, x) = scaled(y, x) > lrow[x] + offset;
        }
    }
    return mask;
}

MaskMatrix otsu_threshold(const FrameStack& stack) {
    require_frames(stack, "otsu");
    const int h = stack.rows();
    const int w = stack.cols();

    const Matrix2Df mean = temporal_mean(stack);
    Matrix2Df peak = Matrix2Df::Constant(h, w, -std::numeric_limits<float>::infinity());

    std::vector<float> normalized;
    normalized.reserve(static_cast<size_t>(mean.size()) * static_cast<size_t>(stack.length()));
    for (const auto& frame : stack.frames) {
        for (Eigen::Index p = 0; p < frame.size(); ++p) {
            const float m = mean.data()[p];
            const float v = (m != 0.0f) ? frame.data()[p] / m : 0.0f;
            normalized.push_back(v);
            peak.data()[p] = std::max(peak.data()[p], v);
        }
    }

    const float level = otsu_level(normalized);
    return (peak.array() > level).matrix();
}

MaskMatrix triangle_threshold(const FrameStack& stack) {
    require_frames(stack, "triangle");

    const Matrix2Df mean = temporal_mean(stack);
    std::vector<float> values(mean.data(), mean.data() + mean.size());
    const float level = triangle_level(values);
    return (mean.array() > level).matrix();
}

} // namespace roi_mask::threshold
