#include "roi_mask/config/configuration.hpp"
#include "roi_mask/core/errors.hpp"
#include "roi_mask/core/utils.hpp"

#include <string>
#include <vector>

namespace roi_mask::config {

namespace {

struct ScalarGrid {
    std::vector<std::vector<YAML::Node>> rows;
};

// One plane: a sequence of rows, or a single row of scalars
ScalarGrid read_plane(const YAML::Node& plane) {
    ScalarGrid grid;
    if (plane.size() > 0 && plane[0].IsScalar()) {
        std::vector<YAML::Node> row;
        for (const auto& v : plane) {
            if (!v.IsScalar()) {
                throw ConfigError("mask row mixes scalars and sequences");
            }
            row.push_back(v);
        }
        grid.rows.push_back(std::move(row));
        return grid;
    }
    for (const auto& r : plane) {
        if (!r.IsSequence()) {
            throw ConfigError("mask rows must be sequences");
        }
        std::vector<YAML::Node> row;
        for (const auto& v : r) {
            if (!v.IsScalar()) {
                throw ConfigError("mask values must be scalars");
            }
            row.push_back(v);
        }
        grid.rows.push_back(std::move(row));
    }
    return grid;
}

} // namespace

MaskArray parse_mask_array(const YAML::Node& node) {
    MaskArray array;
    if (!node || node.IsNull()) {
        return array;
    }
    if (!node.IsSequence()) {
        throw ConfigError("mask array must be a sequence");
    }
    if (node.size() == 0) {
        return array;
    }

    std::vector<ScalarGrid> planes;
    const bool three_levels = node[0].IsSequence() && node[0].size() > 0 && node[0][0].IsSequence();
    if (three_levels) {
        for (const auto& p : node) {
            if (!p.IsSequence()) {
                throw ConfigError("mask planes must be sequences");
            }
            planes.push_back(read_plane(p));
        }
    } else {
        planes.push_back(read_plane(node));
    }

    const size_t rows = planes.front().rows.size();
    const size_t cols = rows > 0 ? planes.front().rows.front().size() : 0;
    for (const auto& plane : planes) {
        if (plane.rows.size() != rows) {
            throw ConfigError("mask planes have different row counts");
        }
        for (const auto& row : plane.rows) {
            if (row.size() != cols) {
                throw ConfigError("mask rows have different lengths");
            }
        }
    }

    array.rows = static_cast<int>(rows);
    array.cols = static_cast<int>(cols);
    array.planes = static_cast<int>(planes.size());
    array.values.reserve(rows * cols * planes.size());

    bool all_bool = true;
    for (const auto& plane : planes) {
        for (const auto& row : plane.rows) {
            for (const auto& v : row) {
                bool b = false;
                if (!YAML::convert<bool>::decode(v, b)) {
                    all_bool = false;
                }
            }
        }
    }

    try {
        for (const auto& plane : planes) {
            for (const auto& row : plane.rows) {
                for (const auto& v : row) {
                    if (all_bool) {
                        array.values.push_back(v.as<bool>() ? 1.0f : 0.0f);
                    } else {
                        array.values.push_back(v.as<float>());
                    }
                }
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("mask values must be booleans or numbers: ") + e.what());
    }
    array.logical = all_bool;
    return array;
}

YAML::Node mask_array_to_yaml(const MaskArray& array) {
    YAML::Node out(YAML::NodeType::Sequence);
    out.SetStyle(YAML::EmitterStyle::Flow);
    if (array.empty()) {
        return out;
    }

    auto plane_node = [&](int p) {
        YAML::Node plane(YAML::NodeType::Sequence);
        for (int y = 0; y < array.rows; ++y) {
            YAML::Node row(YAML::NodeType::Sequence);
            for (int x = 0; x < array.cols; ++x) {
                const size_t i = (static_cast<size_t>(p) * array.rows + y) * array.cols + x;
                if (array.logical) {
                    row.push_back(array.values[i] != 0.0f);
                } else {
                    row.push_back(array.values[i]);
                }
            }
            plane.push_back(row);
        }
        return plane;
    };

    if (array.planes == 1) {
        YAML::Node plane = plane_node(0);
        plane.SetStyle(YAML::EmitterStyle::Flow);
        return plane;
    }
    for (int p = 0; p < array.planes; ++p) {
        out.push_back(plane_node(p));
    }
    return out;
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["mask"]) {
        auto m = node["mask"];
        if (m.IsScalar()) {
            cfg.params.mask = NamedMethod{m.as<std::string>()};
        } else if (m.IsSequence()) {
            cfg.params.mask = ExplicitMask{parse_mask_array(m)};
        } else if (m.IsMap()) {
            if (m["method"]) {
                cfg.params.mask = NamedMethod{m["method"].as<std::string>()};
            } else if (m["values"]) {
                cfg.params.mask = ExplicitMask{parse_mask_array(m["values"])};
            } else if (m["file"]) {
                cfg.mask_file = m["file"].as<std::string>();
            } else {
                throw ConfigError("mask map needs one of: method, values, file");
            }
        }
    }
    if (node["n_rows"]) cfg.params.n_rows = node["n_rows"].as<int>();
    if (node["n_cols"]) cfg.params.n_cols = node["n_cols"].as<int>();

    if (node["threshold"]) {
        auto t = node["threshold"];
        if (t["sigma_factor"]) cfg.threshold.sigma_factor = t["sigma_factor"].as<float>();
        if (t["adaptive_block_size"]) cfg.threshold.adaptive_block_size = t["adaptive_block_size"].as<int>();
        if (t["adaptive_offset"]) cfg.threshold.adaptive_offset = t["adaptive_offset"].as<float>();
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["masked_data"]) cfg.output.masked_data = o["masked_data"].as<std::string>();
        if (o["mask"]) cfg.output.mask = o["mask"].as<std::string>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Emitter out;
    out << to_yaml();
    core::write_text(path, std::string(out.c_str()) + "\n");
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    if (const auto* named = std::get_if<NamedMethod>(&params.mask)) {
        node["mask"] = named->name;
    } else if (const auto* explicit_mask = std::get_if<ExplicitMask>(&params.mask)) {
        node["mask"] = mask_array_to_yaml(explicit_mask->array);
    } else if (!mask_file.empty()) {
        node["mask"]["file"] = mask_file;
    }
    node["n_rows"] = params.n_rows;
    node["n_cols"] = params.n_cols;

    node["threshold"]["sigma_factor"] = threshold.sigma_factor;
    node["threshold"]["adaptive_block_size"] = threshold.adaptive_block_size;
    node["threshold"]["adaptive_offset"] = threshold.adaptive_offset;

    if (!output.masked_data.empty()) node["output"]["masked_data"] = output.masked_data;
    if (!output.mask.empty()) node["output"]["mask"] = output.mask;

    return node;
}

void Config::validate() const {
    if (params.n_rows < 0 || params.n_cols < 0) {
        throw ValidationError("n_rows and n_cols must be >= 0");
    }
    if (!(threshold.sigma_factor > 0.0f)) {
        throw ValidationError("threshold.sigma_factor must be > 0");
    }
    if (threshold.adaptive_block_size < 3) {
        throw ValidationError("threshold.adaptive_block_size must be >= 3");
    }
    if (std::holds_alternative<NamedMethod>(params.mask) && !mask_file.empty()) {
        throw ValidationError("mask cannot be both a method and a file");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "mask": {
      "oneOf": [
        {"type": "string", "enum": ["sigma", "adaptive", "otsu", "triangle"]},
        {"type": "array"},
        {
          "type": "object",
          "properties": {
            "method": {"type": "string"},
            "values": {"type": "array"},
            "file": {"type": "string"}
          }
        },
        {"type": "null"}
      ]
    },
    "n_rows": {"type": "integer", "minimum": 0},
    "n_cols": {"type": "integer", "minimum": 0},
    "threshold": {
      "type": "object",
      "properties": {
        "sigma_factor": {"type": "number", "exclusiveMinimum": 0},
        "adaptive_block_size": {"type": "integer", "minimum": 3},
        "adaptive_offset": {"type": "number"}
      }
    },
    "output": {
      "type": "object",
      "properties": {
        "masked_data": {"type": "string"},
        "mask": {"type": "string"}
      }
    }
  }
})";
}

} // namespace roi_mask::config
