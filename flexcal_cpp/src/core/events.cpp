#include "flexcal/core/events.hpp"
#include "flexcal/core/utils.hpp"

#include <utility>

namespace flexcal::core {

EventEmitter::EventEmitter(std::string run_id, std::ostream* out)
    : run_id_(std::move(run_id)), out_(out) {}

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const std::string& type, const json& data) {
    if (out_ == nullptr) return;

    json event = base_event(type);
    if (data.is_object()) {
        for (auto& [key, value] : data.items()) {
            event[key] = value;
        }
    }
    (*out_) << event.dump() << "\n";
    out_->flush();
}

void EventEmitter::run_start(const json& extra) {
    emit("run_start", extra);
}

void EventEmitter::run_end(bool success, const std::string& status) {
    emit("run_end", {{"success", success}, {"status", status}});
}

void EventEmitter::detector_start(int det, int n_objects) {
    emit("detector_start", {{"det", det}, {"n_objects", n_objects}});
}

void EventEmitter::detector_end(int det, int n_success, int n_failed) {
    emit("detector_end", {{"det", det}, {"n_success", n_success}, {"n_failed", n_failed}});
}

void EventEmitter::object_processed(int det, int obj_idx, const json& record) {
    json data = record;
    data["det"] = det;
    data["obj_idx"] = obj_idx;
    emit("flexure_object", data);
}

void EventEmitter::object_failed(int det, int obj_idx, const std::string& reason) {
    emit("flexure_object_failed", {{"det", det}, {"obj_idx", obj_idx}, {"reason", reason}});
}

void EventEmitter::warning(const std::string& message) {
    emit("warning", {{"message", message}});
}

} // namespace flexcal::core
