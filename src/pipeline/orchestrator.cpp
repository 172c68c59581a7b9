#include "recon_splat/pipeline/orchestrator.hpp"
#include "recon_splat/core/utils.hpp"
#include "recon_splat/pipeline/mask_provisioning.hpp"

#include <chrono>
#include <exception>

namespace recon_splat::pipeline {

namespace {

bool ensure_directory(const fs::path& dir, std::string& error) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        error = "cannot create " + dir.string() + ": " + ec.message();
        return false;
    }
    return true;
}

core::json mask_event(const MaskDecision& d) {
    return {{"active", d.active},
            {"status", mask_status_to_string(d.status)},
            {"source_dir", d.source_dir.string()},
            {"mask_count", d.mask_count},
            {"image_count", d.image_count}};
}

} // namespace

std::string run_status_to_string(RunStatus status) {
    switch (status) {
        case RunStatus::RUNNING: return "running";
        case RunStatus::SUCCEEDED: return "succeeded";
        case RunStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

PipelineOrchestrator::PipelineOrchestrator(const config::Config& cfg, const ProjectLayout& layout,
                                           ProcessLauncher& launcher, PipelineLog& log)
    : cfg_(cfg),
      layout_(layout),
      log_(log),
      runner_(launcher, &log),
      specs_(build_stage_specs(cfg)) {}

void PipelineOrchestrator::report_notes(const std::string& what, const MaskDecision& decision,
                                        RunState& state) {
    for (const auto& note : decision.notes) {
        const std::string msg = what + ": " + note.message;
        if (note.severity == NoteSeverity::WARNING) {
            log_.warning(msg);
            state.warnings.push_back(msg);
        } else {
            log_.info(msg);
        }
    }
}

void PipelineOrchestrator::fail(RunState& state, const StageSpec* spec, const StageResult& result) {
    state.status = RunStatus::FAILED;
    state.failure = result;

    // Without a spec the failure happened before any stage started
    const std::string where = spec ? spec->step_label + " " + spec->label : "Setup";
    log_.error(where + " failed [" + failure_kind_to_string(result.kind) + "]: " + result.reason);

    if (spec) {
        core::json extra = {{"kind", failure_kind_to_string(result.kind)},
                            {"reason", result.reason},
                            {"exit_code", result.exit_code}};
        log_.stage_end(result.stage, "error", extra);
    }
    log_.run_end(false, "failed",
                 {{"stage", stage_to_string(result.stage)},
                  {"kind", failure_kind_to_string(result.kind)},
                  {"reason", result.reason}});
}

StageResult PipelineOrchestrator::provision(const StageSpec& spec, RunState& state) {
    StageResult result;
    result.stage = spec.stage;

    state.dense_masks = resolve_masks(cfg_.masks.dense_masks_dir, layout_.trainer_images_dir,
                                      cfg_.masks.mask_ext);
    report_notes("Dense masks", state.dense_masks, state);

    if (spec.precondition && !spec.precondition(layout_)) {
        result.kind = FailureKind::PRECONDITION_UNMET;
        result.reason = spec.precondition_message;
        return result;
    }

    if (!state.dense_masks.active) {
        log_.info("No dense masks to copy (" + mask_status_to_string(state.dense_masks.status) +
                  "). Training will run without masks.");
        result.success = true;
        return result;
    }

    auto t0 = std::chrono::steady_clock::now();
    try {
        ProvisionResult pr = provision_dense_masks(state.dense_masks, layout_);
        state.copied_masks = pr.copied;
        log_.info("Copied " + std::to_string(pr.copied) + " mask(s) to " + pr.target_dir.string());
    } catch (const std::exception& e) {
        result.kind = FailureKind::PROVISIONING_FAILED;
        result.reason = e.what();
        return result;
    }
    auto t1 = std::chrono::steady_clock::now();
    result.duration_s = std::chrono::duration<double>(t1 - t0).count();
    result.success = true;
    return result;
}

RunState PipelineOrchestrator::run(Stage from) {
    RunState state;
    state.start_stage = from;
    state.current_stage = from;

    const StageSpec* open_stage = nullptr;
    try {
        run_stages(from, state, open_stage);
    } catch (const std::exception& e) {
        StageResult r;
        r.stage = state.current_stage;
        r.kind = FailureKind::INTERNAL_ERROR;
        r.reason = e.what();
        if (open_stage) {
            state.stages.push_back({open_stage->stage, "error", 0, 0.0, r.reason});
        }
        fail(state, open_stage, r);
    }
    return state;
}

void PipelineOrchestrator::run_stages(Stage from, RunState& state, const StageSpec*& open_stage) {
    log_.run_start({{"project_root", layout_.project_root.string()},
                    {"images_dir", layout_.images_dir.string()},
                    {"from_stage", stage_to_string(from)}});

    log_.info("Project root: " + layout_.project_root.string());
    log_.info("Images:       " + layout_.images_dir.string());
    if (from != Stage::FEATURE_EXTRACTION) {
        log_.info("Starting at stage " + stage_to_string(from));
    }

    std::error_code ec;
    if (!fs::is_directory(layout_.images_dir, ec)) {
        StageResult r;
        r.stage = from;
        r.kind = FailureKind::CONFIGURATION_INVALID;
        r.reason = "images directory not found: " + layout_.images_dir.string();
        fail(state, nullptr, r);
        return;
    }

    std::string dir_error;
    for (const auto& dir : {layout_.project_root, layout_.sparse_dir, layout_.dense_dir}) {
        if (!ensure_directory(dir, dir_error)) {
            StageResult r;
            r.stage = from;
            r.kind = FailureKind::CONFIGURATION_INVALID;
            r.reason = dir_error;
            fail(state, nullptr, r);
            return;
        }
    }

    if (from == Stage::FEATURE_EXTRACTION) {
        state.source_masks = resolve_masks(cfg_.masks.masks_dir, layout_.images_dir,
                                           cfg_.masks.mask_ext);
        report_notes("Source masks", state.source_masks, state);
    }

    for (const auto& spec : specs_) {
        if (stage_to_int(spec.stage) < stage_to_int(from)) {
            continue;
        }
        state.current_stage = spec.stage;

        if (!spec.enabled) {
            log_.info(spec.step_label + " " + spec.label + " skipped: " + spec.skip_reason);
            state.stages.push_back({spec.stage, "skipped", 0, 0.0, spec.skip_reason});
            if (spec.stage == Stage::TRAINING) {
                state.training_skipped = true;
            }
            log_.stage_end(spec.stage, "skipped", {{"reason", spec.skip_reason}});
            continue;
        }

        log_.stage_start(spec.stage, spec.step_label, spec.label);
        open_stage = &spec;

        StageResult result;
        if (spec.action == StageAction::PROVISION_MASKS) {
            result = provision(spec, state);
        } else {
            if (spec.stage == Stage::TRAINING && !ensure_directory(layout_.export_dir, dir_error)) {
                result.stage = spec.stage;
                result.kind = FailureKind::PRECONDITION_UNMET;
                result.reason = dir_error;
            } else {
                result = runner_.run(spec, layout_, cfg_, state.source_masks);
            }
        }

        if (!result.success) {
            state.stages.push_back({spec.stage, "error", result.exit_code, result.duration_s,
                                    result.reason});
            fail(state, &spec, result);
            return;
        }

        state.stages.push_back({spec.stage, "ok", result.exit_code, result.duration_s, ""});
        core::json extra = {{"duration_s", result.duration_s}};
        if (spec.stage == Stage::FEATURE_EXTRACTION) {
            extra["masks"] = mask_event(state.source_masks);
        } else if (spec.stage == Stage::MASK_PROVISIONING) {
            extra["masks"] = mask_event(state.dense_masks);
            extra["copied"] = state.copied_masks;
        }
        log_.stage_end(spec.stage, "ok", extra);
        open_stage = nullptr;

        if (spec.stage == Stage::UNDISTORTION) {
            log_.info("Dataset for training: " + layout_.trainer_dataset_dir.string());
            log_.info("  images: " + layout_.trainer_images_dir.string());
            log_.info("  sparse: " + layout_.trainer_sparse_dir.string());
        } else if (spec.stage == Stage::TRAINING) {
            log_.info("Exports written to " + layout_.export_dir.string());
        }
    }

    state.status = RunStatus::SUCCEEDED;
    state.current_stage = Stage::DONE;
    if (state.training_skipped) {
        log_.info("Done (training skipped). Dataset ready at " +
                  layout_.trainer_dataset_dir.string());
    } else {
        log_.info("Done.");
    }
    log_.run_end(true, "ok", {{"training_skipped", state.training_skipped},
                              {"warnings", state.warnings.size()}});
}

RunPlan PipelineOrchestrator::plan(Stage from) const {
    RunPlan p;
    if (from == Stage::FEATURE_EXTRACTION) {
        p.source_masks = resolve_masks(cfg_.masks.masks_dir, layout_.images_dir,
                                       cfg_.masks.mask_ext);
    }
    if (stage_to_int(from) <= stage_to_int(Stage::MASK_PROVISIONING)) {
        p.dense_masks = resolve_masks(cfg_.masks.dense_masks_dir, layout_.trainer_images_dir,
                                      cfg_.masks.mask_ext);
    }

    for (const auto& spec : specs_) {
        if (stage_to_int(spec.stage) < stage_to_int(from)) {
            continue;
        }
        PlannedStage ps;
        ps.stage = spec.stage;
        ps.step_label = spec.step_label;
        ps.label = spec.label;
        ps.enabled = spec.enabled;
        ps.skip_reason = spec.skip_reason;
        if (spec.action == StageAction::RUN_PROCESS) {
            ps.command = format_command(build_command(spec, layout_, cfg_, p.source_masks));
            ps.binary_found = core::find_executable(spec.binary).has_value();
        }
        p.stages.push_back(ps);
    }
    return p;
}

} // namespace recon_splat::pipeline
