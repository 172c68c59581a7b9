#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace recon_splat::core {

using json = nlohmann::json;

/**
 * Writes one JSON object per line (JSONL) describing run and stage
 * transitions. Every event carries "type", "run_id" and an ISO-8601 "ts".
 */
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
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);
};

void emit_event(const std::string& type, const std::string& run_id,
                const json& data, std::ostream& out);

} // namespace recon_splat::core
