#include "cli_commands.hpp"

#include "roi_mask/core/errors.hpp"
#include "roi_mask/core/events.hpp"
#include "roi_mask/core/types.hpp"
#include "roi_mask/core/utils.hpp"
#include "roi_mask/io/fits_io.hpp"
#include "roi_mask/mask/mask_ops.hpp"
#include "roi_mask/mask/mask_resolver.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <exception>
#include <filesystem>

namespace roi_mask::cli {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Paths inside a config file are relative to the file itself
fs::path resolve_config_path(const fs::path& config_path, const std::string& p) {
    fs::path candidate(p);
    if (candidate.is_absolute() || config_path.empty()) {
        return candidate;
    }
    return config_path.parent_path() / candidate;
}

config::Config load_run_config(const std::string& config_path) {
    config::Config cfg;
    if (!config_path.empty()) {
        cfg = config::Config::load(config_path);
    }
    cfg.validate();
    if (!cfg.mask_file.empty()) {
        fs::path mask_path = resolve_config_path(config_path, cfg.mask_file);
        cfg.params.mask = ExplicitMask{io::read_fits_mask(mask_path)};
    }
    return cfg;
}

io::FitsHeader geometry_header(const MaskParams& params) {
    io::FitsHeader header;
    header.set("NROWS", params.n_rows);
    header.set("NCOLS", params.n_cols);
    return header;
}

void write_outputs(const MaskParams& params, const mask::MaskResolution& result,
                   const fs::path& mask_out, const fs::path& data_out) {
    const auto* explicit_mask = std::get_if<ExplicitMask>(&params.mask);
    if (!mask_out.empty() && explicit_mask && !explicit_mask->array.empty()) {
        io::write_fits_mask(mask_out, mask::to_mask_matrix(explicit_mask->array),
                            geometry_header(params));
    }
    if (!data_out.empty() && result.masked_data) {
        io::FitsHeader header = geometry_header(params);
        header.set("NSELECT", static_cast<int>(result.masked_data->rows()));
        io::write_fits_float(data_out, *result.masked_data, header);
    }
}

json resolution_summary(const mask::MaskResolution& result) {
    json extra;
    extra["computed_mask"] = result.computed_mask;
    extra["warnings"] = result.warnings.size();
    if (result.masked_data) {
        extra["masked_data_shape"] = {result.masked_data->rows(), result.masked_data->cols()};
    }
    return extra;
}

} // namespace

int run_resolution(const ResolveRequest& request, std::ostream& out,
                   const RegistryFactory& make_registry) {
    core::EventEmitter events;
    const std::string run_id = core::get_run_id();
    events.run_start(run_id,
                     {{"command", request.command},
                      {"config", request.config_path},
                      {"data", request.data_path}},
                     out);

    auto fail = [&](const std::string& message) {
        events.error(run_id, message, out);
        events.run_end(run_id, false, "error", out);
        return 1;
    };

    try {
        config::Config cfg = load_run_config(request.config_path);
        if (!request.method.empty()) {
            cfg.params.mask = NamedMethod{request.method};
        }

        std::string mask_out = request.mask_out;
        std::string data_out = request.data_out;
        if (mask_out.empty() && !cfg.output.mask.empty()) {
            mask_out = resolve_config_path(request.config_path, cfg.output.mask).string();
        }
        if (data_out.empty() && !cfg.output.masked_data.empty()) {
            data_out = resolve_config_path(request.config_path, cfg.output.masked_data).string();
        }

        auto [data, header] = io::read_fits_data(request.data_path);
        // Flattened inputs carry their frame geometry in the header
        if (cfg.params.n_rows == 0 && cfg.params.n_cols == 0) {
            if (auto r = header.get_int("NROWS")) cfg.params.n_rows = *r;
            if (auto c = header.get_int("NCOLS")) cfg.params.n_cols = *c;
        }

        const threshold::ThresholdRegistry registry = make_registry(cfg.threshold);
        mask::MaskResolution result = request.apply
            ? mask::resolve_and_apply(cfg.params, data, registry)
            : mask::resolve_mask(cfg.params, data, registry);

        for (const auto& w : result.warnings) {
            events.warning(run_id, w, out);
        }
        events.mask_resolved(run_id, cfg.params, resolution_summary(result), out);

        write_outputs(cfg.params, result, mask_out, data_out);

        // An explicitly requested method that was not recognized is a failure
        const bool ok = request.method.empty() || result.warnings.empty();
        events.run_end(run_id, ok, ok ? "ok" : "unrecognized_method", out);
        return ok ? 0 : 1;
    } catch (const RoiMaskError& e) {
        return fail(e.what());
    } catch (const YAML::Exception& e) {
        return fail(std::string("Config error: ") + e.what());
    } catch (const std::exception& e) {
        return fail(e.what());
    }
}

} // namespace roi_mask::cli
