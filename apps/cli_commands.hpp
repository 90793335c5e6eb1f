#pragma once

#include "roi_mask/config/configuration.hpp"
#include "roi_mask/threshold/registry.hpp"

#include <functional>
#include <ostream>
#include <string>

namespace roi_mask::cli {

using RegistryFactory = std::function<threshold::ThresholdRegistry(const config::ThresholdConfig&)>;

struct ResolveRequest {
    std::string command;      // event label: "resolve" or "threshold"
    std::string config_path;  // optional for "threshold"
    std::string data_path;
    std::string method;       // overrides the configured mask when set
    std::string mask_out;
    std::string data_out;
    bool apply = false;
};

// Load config and data, resolve the mask, write outputs. Progress and
// failures are reported as JSON-lines events on `out`. Returns the process
// exit code.
int run_resolution(const ResolveRequest& request, std::ostream& out,
                   const RegistryFactory& make_registry = threshold::default_registry);

} // namespace roi_mask::cli
