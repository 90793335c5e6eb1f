#pragma once

#include "roi_mask/core/types.hpp"

namespace roi_mask::mask {

// Throws ValidationError unless every frame has the shape of the first
void validate_stack(const FrameStack& stack);

int count_true(const MaskMatrix& mask);

// Convert a single-plane logical array to a boolean matrix. Throws
// ValidationError for anything else.
MaskMatrix to_mask_matrix(const MaskArray& array);

MaskArray to_mask_array(const MaskMatrix& mask);

// (rows, cols, time) -> (rows * cols, time), pixel index r * cols + c
PixelMatrix flatten_stack(const FrameStack& stack);

// (rows, cols, time) -> (rows, cols * time), column index t * cols + c
Matrix2Df merge_trailing_dims(const FrameStack& stack);

// Inverse of flatten_stack
FrameStack unflatten_pixels(const PixelMatrix& pixels, int rows, int cols);

// Keep the rows of data whose row-major mask entry is true.
// data.rows() must equal mask.size().
Matrix2Df select_pixels(const Matrix2Df& data, const MaskMatrix& mask);

} // namespace roi_mask::mask
