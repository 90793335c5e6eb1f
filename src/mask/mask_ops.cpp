#include "roi_mask/mask/mask_ops.hpp"
#include "roi_mask/core/errors.hpp"

#include <string>

namespace roi_mask::mask {

void validate_stack(const FrameStack& stack) {
    for (size_t t = 1; t < stack.frames.size(); ++t) {
        if (stack.frames[t].rows() != stack.rows() || stack.frames[t].cols() != stack.cols()) {
            throw ValidationError("frame " + std::to_string(t) + " is " +
                                  std::to_string(stack.frames[t].rows()) + " x " +
                                  std::to_string(stack.frames[t].cols()) + ", expected " +
                                  std::to_string(stack.rows()) + " x " +
                                  std::to_string(stack.cols()));
        }
    }
}

int count_true(const MaskMatrix& mask) {
    return static_cast<int>(mask.count());
}

MaskMatrix to_mask_matrix(const MaskArray& array) {
    if (!array.logical) {
        throw ValidationError("mask array is not logical");
    }
    if (array.planes != 1) {
        throw ValidationError("mask array has " + std::to_string(array.planes) + " planes");
    }
    if (static_cast<size_t>(array.rows) * static_cast<size_t>(array.cols) != array.values.size()) {
        throw ValidationError("mask array shape " + shape_to_string(array) +
                              " does not match its " + std::to_string(array.values.size()) +
                              " values");
    }

    MaskMatrix out(array.rows, array.cols);
    for (int y = 0; y < array.rows; ++y) {
        for (int x = 0; x < array.cols; ++x) {
            out(y, x) = array.values[static_cast<size_t>(y) * array.cols + x] != 0.0f;
        }
    }
    return out;
}

MaskArray to_mask_array(const MaskMatrix& mask) {
    MaskArray out;
    out.logical = true;
    out.rows = static_cast<int>(mask.rows());
    out.cols = static_cast<int>(mask.cols());
    out.planes = 1;
    out.values.resize(static_cast<size_t>(mask.size()));
    for (Eigen::Index i = 0; i < mask.size(); ++i) {
        out.values[static_cast<size_t>(i)] = mask.data()[i] ? 1.0f : 0.0f;
    }
    return out;
}

PixelMatrix flatten_stack(const FrameStack& stack) {
    validate_stack(stack);
    const int h = stack.rows();
    const int w = stack.cols();
    const int n = stack.length();

    PixelMatrix out(static_cast<Eigen::Index>(h) * w, n);
    for (int t = 0; t < n; ++t) {
        const Matrix2Df& frame = stack.frames[t];
        // Row-major storage: frame.data()[p] is pixel p = y * w + x
        out.col(t) = Eigen::Map<const VectorXf>(frame.data(), frame.size());
    }
    return out;
}

Matrix2Df merge_trailing_dims(const FrameStack& stack) {
    validate_stack(stack);
    const int h = stack.rows();
    const int w = stack.cols();
    const int n = stack.length();

    Matrix2Df out(h, static_cast<Eigen::Index>(w) * n);
    for (int t = 0; t < n; ++t) {
        out.block(0, static_cast<Eigen::Index>(t) * w, h, w) = stack.frames[t];
    }
    return out;
}

FrameStack unflatten_pixels(const PixelMatrix& pixels, int rows, int cols) {
    if (pixels.rows() != static_cast<Eigen::Index>(rows) * cols) {
        throw ValidationError("cannot view " + std::to_string(pixels.rows()) +
                              " pixels as " + std::to_string(rows) + " x " +
                              std::to_string(cols) + " frames");
    }

    FrameStack stack;
    stack.frames.reserve(static_cast<size_t>(pixels.cols()));
    for (Eigen::Index t = 0; t < pixels.cols(); ++t) {
        Matrix2Df frame(rows, cols);
        for (Eigen::Index p = 0; p < pixels.rows(); ++p) {
            frame.data()[p] = pixels(p, t);
        }
        stack.frames.push_back(std::move(frame));
    }
    return stack;
}

Matrix2Df select_pixels(const Matrix2Df& data, const MaskMatrix& mask) {
    if (data.rows() != mask.size()) {
        throw ValidationError("cannot select " + std::to_string(mask.size()) +
                              "-pixel mask from " + std::to_string(data.rows()) + " rows");
    }

    Matrix2Df out(count_true(mask), data.cols());
    Eigen::Index k = 0;
    for (Eigen::Index p = 0; p < mask.size(); ++p) {
        if (mask.data()[p]) {
            out.row(k++) = data.row(p);
        }
    }
    return out;
}

} // namespace roi_mask::mask
