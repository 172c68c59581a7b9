#include "recon_splat/config/configuration.hpp"
#include "recon_splat/core/errors.hpp"
#include "recon_splat/core/events.hpp"
#include "recon_splat/core/types.hpp"
#include "recon_splat/core/utils.hpp"
#include "recon_splat/pipeline/layout.hpp"
#include "recon_splat/pipeline/orchestrator.hpp"
#include "recon_splat/pipeline/pipeline_log.hpp"
#include "recon_splat/pipeline/process.hpp"
#include "recon_splat/runner/run_record.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace {

using recon_splat::Stage;
namespace config = recon_splat::config;
namespace core = recon_splat::core;
namespace pipeline = recon_splat::pipeline;
namespace runner = recon_splat::runner;

struct RunOverrides {
  std::string project_dir;
  std::string images_dir;
  std::string masks_dir;
  std::string dense_masks_dir;
  std::string mask_ext;
  std::string colmap_bin;
  std::string brush_bin;
  std::string gpu_device;
  bool skip_training = false;
};

void apply_overrides(config::Config &cfg, const RunOverrides &o) {
  if (!o.project_dir.empty()) cfg.paths.project_dir = o.project_dir;
  if (!o.images_dir.empty()) cfg.paths.images_dir = o.images_dir;
  if (!o.masks_dir.empty()) cfg.masks.masks_dir = o.masks_dir;
  if (!o.dense_masks_dir.empty()) cfg.masks.dense_masks_dir = o.dense_masks_dir;
  if (!o.mask_ext.empty()) cfg.masks.mask_ext = o.mask_ext;
  if (!o.colmap_bin.empty()) cfg.tools.colmap_bin = o.colmap_bin;
  if (!o.brush_bin.empty()) cfg.tools.brush_bin = o.brush_bin;
  if (!o.gpu_device.empty()) cfg.brush.cubecl_default_device = o.gpu_device;
  if (o.skip_training) cfg.brush.run = false;
}

void report_config_error(const std::string &message) {
  std::cerr << "[PIPELINE][ERROR] "
            << recon_splat::failure_kind_to_string(
                   recon_splat::FailureKind::CONFIGURATION_INVALID)
            << ": " << message << std::endl;
}

std::optional<Stage> parse_from_stage(const std::string &name) {
  auto stage = recon_splat::string_to_stage(name);
  if (!stage || *stage == Stage::DONE) {
    std::cerr << "Error: unknown stage '" << name
              << "' (expected FEATURE_EXTRACTION|MATCHING|MAPPING|UNDISTORTION|"
                 "MASK_PROVISIONING|TRAINING)"
              << std::endl;
    return std::nullopt;
  }
  return stage;
}

void print_mask_decision(const std::string &what,
                         const pipeline::MaskDecision &d) {
  std::cout << "[PIPELINE] " << what << ": "
            << pipeline::mask_status_to_string(d.status);
  if (d.active) {
    std::cout << " (" << d.mask_count << " of " << d.image_count << " from "
              << d.source_dir.string() << ")";
  }
  std::cout << std::endl;
  for (const auto &note : d.notes) {
    if (note.severity == pipeline::NoteSeverity::WARNING) {
      std::cerr << "[PIPELINE][WARNING] " << what << ": " << note.message
                << std::endl;
    }
  }
}

int dry_run(const config::Config &cfg, const pipeline::ProjectLayout &layout,
            Stage from) {
  pipeline::PosixProcessLauncher launcher;
  pipeline::PipelineLog log(std::cout, std::cerr);
  pipeline::PipelineOrchestrator orchestrator(cfg, layout, launcher, log);

  pipeline::RunPlan plan = orchestrator.plan(from);
  std::cout << "[PIPELINE] Dry run, nothing will be launched" << std::endl;
  std::cout << "[PIPELINE] Project root: " << layout.project_root.string()
            << std::endl;
  std::cout << "[PIPELINE] Images:       " << layout.images_dir.string()
            << std::endl;
  if (from == Stage::FEATURE_EXTRACTION) {
    print_mask_decision("Source masks", plan.source_masks);
  }
  if (recon_splat::stage_to_int(from) <=
      recon_splat::stage_to_int(Stage::MASK_PROVISIONING)) {
    print_mask_decision("Dense masks", plan.dense_masks);
  }

  for (const auto &ps : plan.stages) {
    std::cout << "[PIPELINE] " << ps.step_label << " " << ps.label;
    if (!ps.enabled) {
      std::cout << " skipped: " << ps.skip_reason << std::endl;
      continue;
    }
    std::cout << std::endl;
    if (!ps.command.empty()) {
      std::cout << "  " << ps.command << std::endl;
      if (!ps.binary_found) {
        std::cerr << "[PIPELINE][WARNING] executable not found for "
                  << ps.label << std::endl;
      }
    } else {
      std::cout << "  copy dense masks to " << layout.trainer_masks_dir.string()
                << std::endl;
    }
  }
  return 0;
}

int execute(const config::Config &cfg, const runner::RunRecord &record,
            Stage from, bool resumed) {
  pipeline::ProjectLayout layout =
      pipeline::derive_layout(cfg.paths.project_dir, cfg.paths.images_dir);

  // Append to existing events log (do not overwrite)
  std::ofstream event_log_file(record.events_path,
                               std::ios::out | std::ios::app);
  if (!event_log_file) {
    std::cerr << "[PIPELINE][ERROR] cannot open "
              << record.events_path.string() << std::endl;
    return 1;
  }

  if (resumed) {
    core::emit_event("resume_start", record.run_id,
                     {{"run_dir", record.run_dir.string()},
                      {"from_stage", recon_splat::stage_to_string(from)}},
                     event_log_file);
  }

  pipeline::PosixProcessLauncher launcher;
  pipeline::PipelineLog log(std::cout, std::cerr);
  log.attach_events(&event_log_file, record.run_id);
  log.info("Run " + record.run_id + " (" + record.run_dir.string() + ")");

  pipeline::RunState state;
  state.start_stage = from;
  state.current_stage = from;
  try {
    pipeline::PipelineOrchestrator orchestrator(cfg, layout, launcher, log);
    state = orchestrator.run(from);
  } catch (const std::exception &e) {
    state.status = pipeline::RunStatus::FAILED;
    state.failure.stage = state.current_stage;
    state.failure.kind = recon_splat::FailureKind::INTERNAL_ERROR;
    state.failure.reason = e.what();
    log.error(recon_splat::stage_to_string(state.current_stage) + " failed [" +
              recon_splat::failure_kind_to_string(state.failure.kind) +
              "]: " + state.failure.reason);
    log.run_end(false, "failed",
                {{"stage", recon_splat::stage_to_string(state.current_stage)},
                 {"kind", recon_splat::failure_kind_to_string(state.failure.kind)},
                 {"reason", state.failure.reason}});
  }

  try {
    runner::write_run_summary(record, runner::summarize_run(record, state));
  } catch (const std::exception &e) {
    std::cerr << "[PIPELINE][WARNING] failed to write run summary: "
              << e.what() << std::endl;
  }

  return state.status == pipeline::RunStatus::SUCCEEDED ? 0 : 1;
}

} // anonymous namespace

int run_command(const std::string &config_path, const RunOverrides &overrides,
                const std::string &from_stage_name, bool dry) {
  config::Config cfg;
  try {
    if (!config_path.empty()) {
      cfg = config::Config::load(config_path);
    }
    apply_overrides(cfg, overrides);
    cfg.validate();
  } catch (const std::exception &e) {
    report_config_error(e.what());
    return 1;
  }

  Stage from = Stage::FEATURE_EXTRACTION;
  if (!from_stage_name.empty()) {
    auto parsed = parse_from_stage(from_stage_name);
    if (!parsed) return 2;
    from = *parsed;
  }

  pipeline::ProjectLayout layout =
      pipeline::derive_layout(cfg.paths.project_dir, cfg.paths.images_dir);

  if (dry) {
    return dry_run(cfg, layout, from);
  }

  runner::RunRecord record;
  try {
    record = runner::create_run_record(layout.runs_dir, core::get_run_id());
    cfg.save(record.config_path);
  } catch (const std::exception &e) {
    report_config_error(e.what());
    return 1;
  }

  return execute(cfg, record, from, false);
}

int resume_command(const std::string &run_dir_path,
                   const std::string &from_stage_name) {
  runner::RunRecord record;
  config::Config cfg;
  try {
    record = runner::open_run_record(run_dir_path);
    cfg = config::Config::load(record.config_path);
    cfg.validate();
  } catch (const std::exception &e) {
    report_config_error(e.what());
    return 1;
  }

  Stage from = Stage::FEATURE_EXTRACTION;
  if (!from_stage_name.empty()) {
    auto parsed = parse_from_stage(from_stage_name);
    if (!parsed) return 2;
    from = *parsed;
  } else {
    from = runner::resume_stage_from_summary(
        runner::read_run_summary(record.run_dir));
  }

  return execute(cfg, record, from, true);
}

int main(int argc, char *argv[]) {
  CLI::App app{"recon_splat runner: COLMAP + Brush"};
  app.require_subcommand(1);

  std::string config_path;
  RunOverrides overrides;
  std::string from_stage;
  bool dry = false;
  std::string resume_run_dir;
  std::string resume_from_stage;

  auto run_cmd = app.add_subcommand("run", "Run the pipeline");
  run_cmd->add_option("--config", config_path, "Path to config.yaml");
  run_cmd->add_option("--project-dir", overrides.project_dir,
                      "Project directory (database, sparse, dense, exports)");
  run_cmd->add_option("--images-dir", overrides.images_dir, "Input images");
  run_cmd->add_option("--masks-dir", overrides.masks_dir,
                      "Masks for the original images");
  run_cmd->add_option("--dense-masks-dir", overrides.dense_masks_dir,
                      "Masks matching dense/0/images");
  run_cmd->add_option("--mask-ext", overrides.mask_ext,
                      "Mask file extension (default png)");
  run_cmd->add_option("--colmap-bin", overrides.colmap_bin, "COLMAP executable");
  run_cmd->add_option("--brush-bin", overrides.brush_bin, "Brush executable");
  run_cmd->add_option("--gpu-device", overrides.gpu_device,
                      "CUBECL_DEFAULT_DEVICE for Brush");
  run_cmd->add_flag("--skip-training", overrides.skip_training,
                    "Stop after dense mask provisioning");
  run_cmd->add_option("--from-stage", from_stage,
                      "Start at this stage, reusing earlier outputs");
  run_cmd->add_flag("--dry-run", dry,
                    "Print planned commands and mask decisions only");

  auto resume_cmd = app.add_subcommand("resume", "Resume an existing run");
  resume_cmd->add_option("--run-dir", resume_run_dir, "Existing run directory")
      ->required();
  resume_cmd->add_option("--from-stage", resume_from_stage,
                         "Stage to resume from (default: the failed stage)");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    // --help exits 0, every other parse problem is a usage error
    return app.exit(e) == 0 ? 0 : 2;
  }

  if (run_cmd->parsed()) {
    return run_command(config_path, overrides, from_stage, dry);
  }

  if (resume_cmd->parsed()) {
    return resume_command(resume_run_dir, resume_from_stage);
  }

  std::cerr << app.help() << std::endl;
  return 2;
}
