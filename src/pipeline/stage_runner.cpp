#include "recon_splat/pipeline/stage_runner.hpp"

#include <chrono>
#include <exception>

namespace recon_splat::pipeline {

Command build_command(const StageSpec& spec, const ProjectLayout& layout,
                      const config::Config& cfg, const MaskDecision& mask) {
    Command cmd;
    cmd.program = spec.binary;
    if (spec.args_builder) {
        cmd.args = spec.accepts_mask ? spec.args_builder(layout, cfg, mask)
                                     : spec.args_builder(layout, cfg, MaskDecision{});
    }
    cmd.env = spec.env;
    return cmd;
}

StageRunner::StageRunner(ProcessLauncher& launcher, PipelineLog* log)
    : launcher_(launcher), log_(log) {}

StageResult StageRunner::run(const StageSpec& spec, const ProjectLayout& layout,
                             const config::Config& cfg, const MaskDecision& mask) {
    StageResult result;
    result.stage = spec.stage;

    if (spec.precondition && !spec.precondition(layout)) {
        result.kind = FailureKind::PRECONDITION_UNMET;
        result.reason = spec.precondition_message;
        return result;
    }

    Command cmd = build_command(spec, layout, cfg, mask);
    result.command = format_command(cmd);
    if (log_) log_->command(result.command);

    auto t0 = std::chrono::steady_clock::now();
    try {
        result.exit_code = launcher_.launch(cmd);
    } catch (const std::exception& e) {
        result.kind = FailureKind::LAUNCH_FAILED;
        result.reason = e.what();
        return result;
    }
    auto t1 = std::chrono::steady_clock::now();
    result.duration_s = std::chrono::duration<double>(t1 - t0).count();

    if (result.exit_code != 0) {
        result.kind = FailureKind::PROCESS_EXIT_NON_ZERO;
        result.reason = spec.label + " exited with code " + std::to_string(result.exit_code);
        if (result.exit_code == 127) {
            result.reason += " (command not found: " + spec.binary + ")";
        }
        return result;
    }

    if (spec.postcondition && !spec.postcondition(layout)) {
        result.kind = FailureKind::POSTCONDITION_UNMET;
        result.reason = spec.postcondition_message;
        return result;
    }

    result.success = true;
    return result;
}

} // namespace recon_splat::pipeline
