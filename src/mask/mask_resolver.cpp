#include "roi_mask/mask/mask_resolver.hpp"
#include "roi_mask/mask/mask_ops.hpp"
#include "roi_mask/core/errors.hpp"

#include <sstream>

namespace roi_mask::mask {

namespace {

// First dimension of the data as a pixel-major matrix: rows of a frame
// stack, pixels of a pixel matrix
Eigen::Index leading_dim(const DataArray& data) {
    if (const auto* stack = std::get_if<FrameStack>(&data)) {
        return stack->rows();
    }
    return std::get<PixelMatrix>(data).rows();
}

// Data as (leading dim) x (everything else)
Matrix2Df as_pixel_major(const DataArray& data) {
    if (const auto* stack = std::get_if<FrameStack>(&data)) {
        return merge_trailing_dims(*stack);
    }
    return std::get<PixelMatrix>(data);
}

Matrix2Df reconcile(const MaskMatrix& m, const MaskArray& raw, int n_rows, int n_cols,
                    const DataArray& data) {
    const auto* stack = std::get_if<FrameStack>(&data);
    if (stack && stack->rows() == n_rows && stack->cols() == n_cols) {
        return select_pixels(flatten_stack(*stack), m);
    }

    const Eigen::Index first = leading_dim(data);
    if (first == static_cast<Eigen::Index>(n_rows) * n_cols) {
        return select_pixels(as_pixel_major(data), m);
    }
    const int selected = count_true(m);
    if (first == selected) {
        return as_pixel_major(data);
    }

    std::ostringstream oss;
    oss << "Sizes of mask and data input do not match. "
        << "Mask: " << shape_to_string(raw)
        << " (n_rows=" << n_rows << ", n_cols=" << n_cols
        << ", selected=" << selected << "); "
        << "data size: " << shape_to_string(data);
    throw MaskDataSizeMismatch(oss.str());
}

std::optional<Matrix2Df> resolve_explicit(MaskParams& params, const MaskArray& raw,
                                          const DataArray& data) {
    if (raw.empty()) {
        return std::nullopt;
    }
    if (!raw.logical) {
        throw InvalidMaskType("mask must be boolean. Ensure it is logical and try again");
    }
    if (raw.planes != 1) {
        throw UnsupportedMaskDimensionality("3D mask not supported (" +
                                            shape_to_string(raw) + ")");
    }

    const MaskMatrix m = to_mask_matrix(raw);
    params.n_rows = raw.rows;
    params.n_cols = raw.cols;
    return reconcile(m, raw, params.n_rows, params.n_cols, data);
}

// Frame stack for a threshold method. A pixel matrix is viewed as frames
// when the current n_rows x n_cols covers its pixels; `storage` holds that view.
const FrameStack& stack_for_threshold(const MaskParams& params, const DataArray& data,
                                      const std::string& method, FrameStack& storage) {
    if (const auto* stack = std::get_if<FrameStack>(&data)) {
        return *stack;
    }
    const auto& pixels = std::get<PixelMatrix>(data);
    if (params.n_rows > 0 && params.n_cols > 0 &&
        pixels.rows() == static_cast<Eigen::Index>(params.n_rows) * params.n_cols) {
        storage = unflatten_pixels(pixels, params.n_rows, params.n_cols);
        return storage;
    }
    std::ostringstream oss;
    oss << "threshold method '" << method << "' needs rows x cols x time data; "
        << "data size: " << shape_to_string(data)
        << " (n_rows=" << params.n_rows << ", n_cols=" << params.n_cols << ")";
    throw MaskDataSizeMismatch(oss.str());
}

} // namespace

MaskResolution resolve_mask(MaskParams& params, const DataArray& data,
                            const threshold::ThresholdRegistry& registry) {
    MaskResolution result;

    if (const auto* named = std::get_if<NamedMethod>(&params.mask)) {
        const std::string name = named->name;
        const threshold::ThresholdFn* fn = nullptr;
        try {
            fn = &registry.at(name);
        } catch (const UnrecognizedMaskOption& e) {
            result.warnings.push_back(e.what());
            params.mask = std::monostate{};
            return result;
        }

        FrameStack reshaped;
        const FrameStack& stack = stack_for_threshold(params, data, name, reshaped);
        MaskMatrix m = (*fn)(stack);
        if (m.rows() != stack.rows() || m.cols() != stack.cols()) {
            throw ValidationError("threshold method '" + name + "' returned a " +
                                  std::to_string(m.rows()) + " x " + std::to_string(m.cols()) +
                                  " mask for " + std::to_string(stack.rows()) + " x " +
                                  std::to_string(stack.cols()) + " frames");
        }

        params.mask = ExplicitMask{to_mask_array(m)};
        params.n_rows = stack.rows();
        params.n_cols = stack.cols();
        result.computed_mask = true;
        return result;
    }

    if (const auto* explicit_mask = std::get_if<ExplicitMask>(&params.mask)) {
        const MaskArray& raw = explicit_mask->array;
        result.masked_data = resolve_explicit(params, raw, data);
    }
    return result;
}

MaskResolution resolve_mask(MaskParams& params, const DataArray& data) {
    return resolve_mask(params, data, threshold::default_registry());
}

Matrix2Df apply_resolved_mask(MaskParams& params, const DataArray& data) {
    const auto* explicit_mask = std::get_if<ExplicitMask>(&params.mask);
    if (!explicit_mask || explicit_mask->array.empty()) {
        throw ValidationError("no explicit mask to apply");
    }
    const MaskArray& raw = explicit_mask->array;
    return *resolve_explicit(params, raw, data);
}

MaskResolution resolve_and_apply(MaskParams& params, const DataArray& data,
                                 const threshold::ThresholdRegistry& registry) {
    MaskResolution result = resolve_mask(params, data, registry);
    if (result.computed_mask) {
        result.masked_data = apply_resolved_mask(params, data);
    }
    return result;
}

} // namespace roi_mask::mask
