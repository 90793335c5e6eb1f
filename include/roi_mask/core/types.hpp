#pragma once

#include <Eigen/Dense>
#include <string>
#include <variant>
#include <vector>

namespace roi_mask {

// Matrix types
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using MaskMatrix = Eigen::Matrix<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXf = Eigen::VectorXf;
using VectorXd = Eigen::VectorXd;

// Pixels x time. Row p is the time series of pixel p = r * cols + c.
using PixelMatrix = Matrix2Df;

// Frame stack (rows x cols x time). frames[t] is the image at time t.
struct FrameStack {
    std::vector<Matrix2Df> frames;

    int rows() const { return frames.empty() ? 0 : static_cast<int>(frames.front().rows()); }
    int cols() const { return frames.empty() ? 0 : static_cast<int>(frames.front().cols()); }
    int length() const { return static_cast<int>(frames.size()); }
    bool empty() const { return frames.empty(); }
};

// Input data: either a full frame stack or an already flattened stack.
using DataArray = std::variant<FrameStack, PixelMatrix>;

// Mask array as supplied by a caller (inline, YAML or FITS). Not yet
// validated: it may be empty, numeric, or carry several planes.
struct MaskArray {
    bool logical = false;
    int rows = 0;
    int cols = 0;
    int planes = 1;
    std::vector<float> values;  // plane-major, row-major within a plane

    bool empty() const { return values.empty(); }
};

// Mask specification variants
struct NamedMethod {
    std::string name;
};

struct ExplicitMask {
    MaskArray array;
};

using MaskSpec = std::variant<std::monostate, NamedMethod, ExplicitMask>;

// Mask parameters carried through the pipeline. Updated in place by
// mask::resolve_mask.
struct MaskParams {
    MaskSpec mask;
    int n_rows = 0;
    int n_cols = 0;
};

// Describe a shape as "d0 x d1 [x d2]"
std::string shape_to_string(const DataArray& data);
std::string shape_to_string(const MaskArray& mask);

} // namespace roi_mask
