#pragma once

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace flexcal::core {

using json = nlohmann::json;

/**
 * JSON-lines diagnostics stream. Every event carries "type", "run_id" and
 * "ts"; extra fields are merged in.
 */
class EventEmitter {
public:
    EventEmitter(std::string run_id, std::ostream* out);

    const std::string& run_id() const { return run_id_; }

    void run_start(const json& extra = json::object());
    void run_end(bool success, const std::string& status);

    void detector_start(int det, int n_objects);
    void detector_end(int det, int n_success, int n_failed);

    void object_processed(int det, int obj_idx, const json& record);
    void object_failed(int det, int obj_idx, const std::string& reason);

    void warning(const std::string& message);

    void emit(const std::string& type, const json& data = json::object());

private:
    json base_event(const std::string& type) const;

    std::string run_id_;
    std::ostream* out_;
};

} // namespace flexcal::core
