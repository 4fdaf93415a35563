#pragma once

#include "types.hpp"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace covmap::core {

using json = nlohmann::json;

// JSON-lines run events, one object per line. Every event carries type,
// run_id, a per-emitter sequence number and a UTC timestamp; caller-supplied
// fields are merged on top.
class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, bool success, const std::string& status,
                 const json& extra, std::ostream& out);

    void stage_start(const std::string& run_id, Stage stage, std::ostream& out);
    void stage_end(const std::string& run_id, Stage stage, const std::string& status,
                   const json& extra, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    json make_event(const std::string& type, const std::string& run_id, const json& extra);
    json make_stage_event(const std::string& type, const std::string& run_id, Stage stage,
                          const json& extra);
    void emit(const json& event, std::ostream& out);

    std::uint64_t next_seq_ = 0;
};

} // namespace covmap::core
