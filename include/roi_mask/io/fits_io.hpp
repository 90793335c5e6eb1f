#pragma once

#include "roi_mask/core/types.hpp"
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace roi_mask::io {

namespace fs = std::filesystem;

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, int> int_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, int value);
};

bool is_fits_image_path(const fs::path& path);

// NAXIS=3: frame stack (NAXIS1 = cols, NAXIS2 = rows, NAXIS3 = time).
// NAXIS=2: pixels x time (NAXIS1 = time, NAXIS2 = pixels).
std::pair<DataArray, FitsHeader> read_fits_data(const fs::path& path);

// Logical iff BITPIX is 8 and every value is 0 or 1. NAXIS3 gives planes.
MaskArray read_fits_mask(const fs::path& path);

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header);

void write_fits_mask(const fs::path& path, const MaskMatrix& mask, const FitsHeader& header);

} // namespace roi_mask::io
