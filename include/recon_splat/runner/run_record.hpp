#pragma once

#include "recon_splat/core/events.hpp"
#include "recon_splat/pipeline/mask_resolver.hpp"
#include "recon_splat/pipeline/orchestrator.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace recon_splat::runner {

namespace fs = std::filesystem;
using core::json;

// runs/<run_id>/{config.yaml, logs/run_events.jsonl, run_summary.json}
struct RunRecord {
    std::string run_id;
    fs::path run_dir;
    fs::path config_path;
    fs::path events_path;
    fs::path summary_path;
};

RunRecord make_run_record(const fs::path& runs_dir, const std::string& run_id);

// Creates run_dir and run_dir/logs. Throws IOError.
RunRecord create_run_record(const fs::path& runs_dir, const std::string& run_id);

// Reopens an existing run directory. Throws IOError when it is not one.
RunRecord open_run_record(const fs::path& run_dir);

json mask_decision_to_json(const pipeline::MaskDecision& decision);

json summarize_run(const RunRecord& record, const pipeline::RunState& state);

void write_run_summary(const RunRecord& record, const json& summary);

// nullopt when the run has no (readable) summary yet
std::optional<json> read_run_summary(const fs::path& run_dir);

/**
 * Stage a resumed run should start from: the failed stage of the
 * previous summary, or FEATURE_EXTRACTION when there is none.
 */
Stage resume_stage_from_summary(const std::optional<json>& summary);

// One entry per runs/<id>/ directory, sorted by id
json list_runs(const fs::path& runs_dir);

} // namespace recon_splat::runner
