#pragma once

#include "recon_splat/config/configuration.hpp"
#include "recon_splat/core/types.hpp"
#include "recon_splat/pipeline/layout.hpp"
#include "recon_splat/pipeline/mask_resolver.hpp"
#include "recon_splat/pipeline/pipeline_log.hpp"
#include "recon_splat/pipeline/process.hpp"
#include "recon_splat/pipeline/stage_spec.hpp"

#include <string>

namespace recon_splat::pipeline {

struct StageResult {
    Stage stage = Stage::FEATURE_EXTRACTION;
    bool success = false;
    FailureKind kind = FailureKind::NONE;
    int exit_code = 0;
    std::string reason;
    std::string command; // empty when nothing was launched
    double duration_s = 0.0;
};

// Builds the command a process stage would launch. The mask decision is
// only forwarded to stages that accept it.
Command build_command(const StageSpec& spec, const ProjectLayout& layout,
                      const config::Config& cfg, const MaskDecision& mask);

class StageRunner {
public:
    // log may be null; when set, each launch is announced on it
    explicit StageRunner(ProcessLauncher& launcher, PipelineLog* log = nullptr);

    // Precondition, one launch, exit code, postcondition. No retries.
    StageResult run(const StageSpec& spec, const ProjectLayout& layout,
                    const config::Config& cfg, const MaskDecision& mask);

private:
    ProcessLauncher& launcher_;
    PipelineLog* log_;
};

} // namespace recon_splat::pipeline
