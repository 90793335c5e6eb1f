#pragma once

#include "roi_mask/core/types.hpp"
#include "roi_mask/threshold/registry.hpp"

#include <optional>
#include <string>
#include <vector>

namespace roi_mask::mask {

struct MaskResolution {
    // Mask-selected pixels x time; set only by the explicit-mask branch
    // (or by resolve_and_apply)
    std::optional<Matrix2Df> masked_data;
    // Non-fatal diagnostics, e.g. an unrecognized method name
    std::vector<std::string> warnings;
    // True when a named method computed the mask during this call
    bool computed_mask = false;
};

// Resolve params.mask against data, updating params in place.
//
// - NamedMethod: looked up in registry. An unknown name adds a warning and
//   resets params.mask; a known one stores the computed rows x cols mask in
//   params.mask without selecting any data.
// - ExplicitMask: validated (logical, single plane) and reconciled with the
//   data, in order: frame stack matching (n_rows, n_cols); first dimension
//   equal to n_rows * n_cols; first dimension equal to the selected pixel
//   count (already masked, passed through).
// - Unset or empty array: no-op.
//
// Throws InvalidMaskType, UnsupportedMaskDimensionality or
// MaskDataSizeMismatch.
MaskResolution resolve_mask(MaskParams& params, const DataArray& data,
                            const threshold::ThresholdRegistry& registry);

MaskResolution resolve_mask(MaskParams& params, const DataArray& data);

// Second pass after a named method: select data with the stored mask.
// Throws ValidationError if params.mask is not a non-empty explicit mask.
Matrix2Df apply_resolved_mask(MaskParams& params, const DataArray& data);

// resolve_mask followed by apply_resolved_mask when a mask was computed
MaskResolution resolve_and_apply(MaskParams& params, const DataArray& data,
                                 const threshold::ThresholdRegistry& registry);

} // namespace roi_mask::mask
