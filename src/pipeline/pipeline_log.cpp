#include "recon_splat/pipeline/pipeline_log.hpp"

namespace recon_splat::pipeline {

PipelineLog::PipelineLog(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

void PipelineLog::attach_events(std::ostream* events_out, const std::string& run_id) {
    events_ = events_out;
    run_id_ = run_id;
}

void PipelineLog::info(const std::string& message) {
    out_ << "[PIPELINE] " << message << std::endl;
}

void PipelineLog::warning(const std::string& message) {
    err_ << "[PIPELINE][WARNING] " << message << std::endl;
    if (events_) emitter_.warning(run_id_, message, *events_);
}

void PipelineLog::error(const std::string& message) {
    err_ << "[PIPELINE][ERROR] " << message << std::endl;
    if (events_) emitter_.error(run_id_, message, *events_);
}

void PipelineLog::command(const std::string& rendered) {
    out_ << "[PIPELINE] Running: " << rendered << std::endl;
}

void PipelineLog::stage_start(Stage stage, const std::string& step_label,
                              const std::string& label) {
    out_ << "[PIPELINE] " << step_label << " " << label << std::endl;
    if (events_) emitter_.stage_start(run_id_, stage, *events_);
}

void PipelineLog::stage_end(Stage stage, const std::string& status, const core::json& extra) {
    if (events_) emitter_.stage_end(run_id_, stage, status, extra, *events_);
}

void PipelineLog::run_start(const core::json& extra) {
    if (events_) emitter_.run_start(run_id_, extra, *events_);
}

void PipelineLog::run_end(bool success, const std::string& status, const core::json& extra) {
    if (events_) emitter_.run_end(run_id_, success, status, extra, *events_);
}

} // namespace recon_splat::pipeline
