#include "roi_mask/core/events.hpp"
#include "roi_mask/core/utils.hpp"

namespace roi_mask::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    out << event.dump() << "\n";
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    emit(event, out);
}

void EventEmitter::mask_resolved(const std::string& run_id, const MaskParams& params,
                                 const json& extra, std::ostream& out) {
    json event = base_event("mask_resolved", run_id);
    event["mask"] = describe_mask(params.mask);
    event["n_rows"] = params.n_rows;
    event["n_cols"] = params.n_cols;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event, out);
}

json describe_mask(const MaskSpec& mask) {
    json out;
    if (const auto* named = std::get_if<NamedMethod>(&mask)) {
        out["kind"] = "named";
        out["name"] = named->name;
    } else if (const auto* explicit_mask = std::get_if<ExplicitMask>(&mask)) {
        const MaskArray& a = explicit_mask->array;
        out["kind"] = "explicit";
        out["logical"] = a.logical;
        out["shape"] = {a.rows, a.cols, a.planes};
        if (a.logical) {
            int selected = 0;
            for (float v : a.values) {
                if (v != 0.0f) ++selected;
            }
            out["selected_pixels"] = selected;
        }
    } else {
        out["kind"] = "unset";
    }
    return out;
}

} // namespace roi_mask::core
