#include "roi_mask/threshold/registry.hpp"
#include "roi_mask/threshold/threshold_methods.hpp"
#include "roi_mask/core/errors.hpp"
#include "roi_mask/core/utils.hpp"

namespace roi_mask::threshold {

static std::string normalize_name(const std::string& name) {
    return core::to_lower(name);
}

void ThresholdRegistry::add(const std::string& name, ThresholdFn fn) {
    const std::string key = normalize_name(name);
    for (auto& [existing, existing_fn] : entries_) {
        if (existing == key) {
            existing_fn = std::move(fn);
            return;
        }
    }
    entries_.emplace_back(key, std::move(fn));
}

bool ThresholdRegistry::contains(const std::string& name) const {
    return find(name) != nullptr;
}

const ThresholdFn* ThresholdRegistry::find(const std::string& name) const {
    const std::string key = normalize_name(name);
    for (const auto& [existing, fn] : entries_) {
        if (existing == key) {
            return &fn;
        }
    }
    return nullptr;
}

const ThresholdFn& ThresholdRegistry::at(const std::string& name) const {
    const ThresholdFn* fn = find(name);
    if (!fn) {
        throw UnrecognizedMaskOption(
            "Selection for mask '" + name + "' not recognized. "
            "Currently only supports the following options for pre-computed masks: " +
            core::join(names(), ", "));
    }
    return *fn;
}

std::vector<std::string> ThresholdRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.first);
    }
    return out;
}

ThresholdRegistry default_registry(const config::ThresholdConfig& cfg) {
    ThresholdRegistry registry;
    registry.add("sigma", [k = cfg.sigma_factor](const FrameStack& stack) {
        return sigma_threshold(stack, k);
    });
    registry.add("adaptive", [block = cfg.adaptive_block_size,
                              offset = cfg.adaptive_offset](const FrameStack& stack) {
        return adaptive_threshold(stack, block, offset);
    });
    registry.add("otsu", [](const FrameStack& stack) {
        return otsu_threshold(stack);
    });
    registry.add("triangle", [](const FrameStack& stack) {
        return triangle_threshold(stack);
    });
    return registry;
}

} // namespace roi_mask::threshold
