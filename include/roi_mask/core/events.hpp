#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace roi_mask::core {

using json = nlohmann::json;

// JSON-lines event log
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status, std::ostream& out);

    void mask_resolved(const std::string& run_id, const MaskParams& params,
                       const json& extra, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);
};

// Summary of a mask spec for logs: kind plus shape or name
json describe_mask(const MaskSpec& mask);

} // namespace roi_mask::core
