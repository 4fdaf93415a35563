#include "covmap/core/events.hpp"
#include "covmap/core/utils.hpp"

namespace covmap::core {

json EventEmitter::make_event(const std::string& type, const std::string& run_id,
                              const json& extra) {
    json event = {
        {"type", type},
        {"run_id", run_id},
        {"seq", next_seq_++},
        {"ts", get_iso_timestamp()}
    };
    if (extra.is_object()) {
        event.update(extra);
    }
    return event;
}

json EventEmitter::make_stage_event(const std::string& type, const std::string& run_id,
                                    Stage stage, const json& extra) {
    json event = make_event(type, run_id, extra);
    event["stage"] = stage_to_int(stage);
    event["stage_name"] = stage_to_string(stage);
    return event;
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    out << event.dump() << '\n' << std::flush;
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    emit(make_event("run_start", run_id, extra), out);
}

void EventEmitter::run_end(const std::string& run_id, bool success,
                           const std::string& status, const json& extra,
                           std::ostream& out) {
    json event = make_event("run_end", run_id, extra);
    event["success"] = success;
    event["status"] = status;
    emit(event, out);
}

void EventEmitter::stage_start(const std::string& run_id, Stage stage, std::ostream& out) {
    emit(make_stage_event("stage_start", run_id, stage, json()), out);
}

void EventEmitter::stage_end(const std::string& run_id, Stage stage,
                             const std::string& status, const json& extra,
                             std::ostream& out) {
    json event = make_stage_event("stage_end", run_id, stage, extra);
    event["status"] = status;
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    emit(make_event("warning", run_id, {{"message", message}}), out);
}

} // namespace covmap::core
