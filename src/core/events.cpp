#include "flypath/core/events.hpp"
#include "flypath/core/utils.hpp"

namespace flypath::core {

namespace {

void merge_into(json& event, const json& extra) {
    if (!extra.is_object()) return;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
}

} // namespace

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    json event = json::object();
    event["type"] = type;
    event["run_id"] = run_id;
    event["ts"] = get_iso_timestamp();
    return event;
}

json EventEmitter::phase_event(const std::string& type, const std::string& run_id, Phase phase) {
    json event = base_event(type, run_id);
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    return event;
}

// One JSON object per line, flushed immediately
void EventEmitter::emit(const json& event, std::ostream& out) {
    out << event.dump() << '\n' << std::flush;
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    merge_into(event, extra);
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = success;
    event["status"] = status;
    emit(event, out);
}

void EventEmitter::phase_start(const std::string& run_id, Phase phase, std::ostream& out) {
    emit(phase_event("phase_start", run_id, phase), out);
}

void EventEmitter::phase_progress(const std::string& run_id, Phase phase, size_t current,
                                  size_t total, const std::string& message, std::ostream& out) {
    json event = phase_event("phase_progress", run_id, phase);
    event["current"] = current;
    event["total"] = total;
    event["progress"] = total == 0 ? 1.0 : static_cast<double>(current) / static_cast<double>(total);
    event["substep"] = message;
    emit(event, out);
}

void EventEmitter::phase_end(const std::string& run_id, Phase phase,
                             const std::string& status, const json& extra, std::ostream& out) {
    json event = phase_event("phase_end", run_id, phase);
    event["status"] = status;
    merge_into(event, extra);
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

} // namespace flypath::core
