#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace roi_mask::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
void write_text(const fs::path& path, const std::string& text);

// String utilities
std::string to_lower(const std::string& s);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

} // namespace roi_mask::core
