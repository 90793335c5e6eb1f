#pragma once

#include "roi_mask/core/types.hpp"

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace roi_mask::config {

namespace fs = std::filesystem;

struct ThresholdConfig {
  float sigma_factor = 2.0f;     // sigma: mean + k * std
  int adaptive_block_size = 25;  // adaptive: neighborhood side in pixels
  float adaptive_offset = 0.0f;  // adaptive: added to the local mean
};

struct OutputConfig {
  std::string masked_data;  // FITS path for the pixels x time matrix
  std::string mask;         // FITS path for the resolved mask
};

struct Config {
  MaskParams params;
  std::string mask_file;  // mask: {file: ...}, loaded by the caller
  ThresholdConfig threshold;
  OutputConfig output;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

// Parse an inline mask array: nested sequences of booleans (logical) or
// numbers. Two levels give rows x cols, three give planes of rows x cols.
MaskArray parse_mask_array(const YAML::Node &node);
YAML::Node mask_array_to_yaml(const MaskArray &array);

std::string get_schema_json();

} // namespace roi_mask::config
