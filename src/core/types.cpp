#include "roi_mask/core/types.hpp"

#include <sstream>

namespace roi_mask {

std::string shape_to_string(const DataArray& data) {
    std::ostringstream oss;
    if (const auto* stack = std::get_if<FrameStack>(&data)) {
        oss << stack->rows() << " x " << stack->cols() << " x " << stack->length();
    } else {
        const auto& pixels = std::get<PixelMatrix>(data);
        oss << pixels.rows() << " x " << pixels.cols();
    }
    return oss.str();
}

std::string shape_to_string(const MaskArray& mask) {
    std::ostringstream oss;
    oss << mask.rows << " x " << mask.cols;
    if (mask.planes != 1) {
        oss << " x " << mask.planes;
    }
    return oss.str();
}

} // namespace roi_mask
