#pragma once

#include "roi_mask/config/configuration.hpp"
#include "roi_mask/core/types.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace roi_mask::threshold {

using ThresholdFn = std::function<MaskMatrix(const FrameStack&)>;

// Named threshold methods. Lookup ignores case only; names() keeps
// registration order.
class ThresholdRegistry {
public:
    ThresholdRegistry() = default;

    // Replaces an existing entry with the same name
    void add(const std::string& name, ThresholdFn fn);

    bool contains(const std::string& name) const;
    const ThresholdFn* find(const std::string& name) const;

    // Throws UnrecognizedMaskOption naming `name` and listing names()
    const ThresholdFn& at(const std::string& name) const;

    std::vector<std::string> names() const;

private:
    std::vector<std::pair<std::string, ThresholdFn>> entries_;
};

// sigma, adaptive, otsu, triangle bound to the tuning constants in cfg
ThresholdRegistry default_registry(const config::ThresholdConfig& cfg = {});

} // namespace roi_mask::threshold
