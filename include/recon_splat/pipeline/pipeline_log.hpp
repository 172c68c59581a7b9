#pragma once

#include "recon_splat/core/events.hpp"
#include "recon_splat/core/types.hpp"

#include <ostream>
#include <string>

namespace recon_splat::pipeline {

/**
 * Console progress in the "[PIPELINE] ..." format plus, once a run record
 * exists, the same transitions as JSONL events.
 */
class PipelineLog {
public:
    PipelineLog(std::ostream& out, std::ostream& err);

    // Forward events to events_out (nullptr detaches)
    void attach_events(std::ostream* events_out, const std::string& run_id);

    void info(const std::string& message);
    void warning(const std::string& message);
    void error(const std::string& message);
    void command(const std::string& rendered);

    void stage_start(Stage stage, const std::string& step_label, const std::string& label);
    void stage_end(Stage stage, const std::string& status, const core::json& extra = core::json::object());

    void run_start(const core::json& extra);
    void run_end(bool success, const std::string& status, const core::json& extra = core::json::object());

private:
    std::ostream& out_;
    std::ostream& err_;
    std::ostream* events_ = nullptr;
    std::string run_id_;
    core::EventEmitter emitter_;
};

} // namespace recon_splat::pipeline
