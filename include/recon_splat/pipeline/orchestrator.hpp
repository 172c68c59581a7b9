#pragma once

#include "recon_splat/config/configuration.hpp"
#include "recon_splat/core/types.hpp"
#include "recon_splat/pipeline/layout.hpp"
#include "recon_splat/pipeline/mask_resolver.hpp"
#include "recon_splat/pipeline/pipeline_log.hpp"
#include "recon_splat/pipeline/process.hpp"
#include "recon_splat/pipeline/stage_runner.hpp"
#include "recon_splat/pipeline/stage_spec.hpp"

#include <string>
#include <vector>

namespace recon_splat::pipeline {

enum class RunStatus {
    RUNNING,
    SUCCEEDED,
    FAILED
};

std::string run_status_to_string(RunStatus status);

struct StageRecord {
    Stage stage = Stage::FEATURE_EXTRACTION;
    std::string status; // ok | skipped | error
    int exit_code = 0;
    double duration_s = 0.0;
    std::string reason;
};

struct RunState {
    Stage start_stage = Stage::FEATURE_EXTRACTION;
    Stage current_stage = Stage::FEATURE_EXTRACTION;
    MaskDecision source_masks;
    MaskDecision dense_masks;
    std::vector<std::string> warnings;
    std::vector<StageRecord> stages;
    RunStatus status = RunStatus::RUNNING;
    StageResult failure; // meaningful when status == FAILED
    bool training_skipped = false;
    size_t copied_masks = 0;
};

struct PlannedStage {
    Stage stage = Stage::FEATURE_EXTRACTION;
    std::string step_label;
    std::string label;
    std::string command; // empty for in-process steps
    bool enabled = true;
    std::string skip_reason;
    bool binary_found = true;
};

struct RunPlan {
    MaskDecision source_masks;
    MaskDecision dense_masks;
    std::vector<PlannedStage> stages;
};

/**
 * Drives the fixed stage sequence: feature extraction, matching, mapping,
 * undistortion, dense mask provisioning and training. Stops at the first
 * failure; outputs of completed stages are left in place.
 */
class PipelineOrchestrator {
public:
    PipelineOrchestrator(const config::Config& cfg, const ProjectLayout& layout,
                         ProcessLauncher& launcher, PipelineLog& log);

    RunState run(Stage from = Stage::FEATURE_EXTRACTION);

    // What run(from) would launch. Reads the filesystem only.
    RunPlan plan(Stage from = Stage::FEATURE_EXTRACTION) const;

private:
    void run_stages(Stage from, RunState& state, const StageSpec*& open_stage);
    void report_notes(const std::string& what, const MaskDecision& decision, RunState& state);
    StageResult provision(const StageSpec& spec, RunState& state);
    void fail(RunState& state, const StageSpec* spec, const StageResult& result);

    const config::Config& cfg_;
    ProjectLayout layout_;
    PipelineLog& log_;
    StageRunner runner_;
    std::vector<StageSpec> specs_;
};

} // namespace recon_splat::pipeline
