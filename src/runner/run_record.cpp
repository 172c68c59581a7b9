#include "recon_splat/runner/run_record.hpp"
#include "recon_splat/core/errors.hpp"
#include "recon_splat/core/utils.hpp"

#include <algorithm>
#include <utility>

namespace recon_splat::runner {

RunRecord make_run_record(const fs::path& runs_dir, const std::string& run_id) {
    RunRecord r;
    r.run_id = run_id;
    r.run_dir = runs_dir / run_id;
    r.config_path = r.run_dir / "config.yaml";
    r.events_path = r.run_dir / "logs" / "run_events.jsonl";
    r.summary_path = r.run_dir / "run_summary.json";
    return r;
}

RunRecord create_run_record(const fs::path& runs_dir, const std::string& run_id) {
    RunRecord r = make_run_record(runs_dir, run_id);
    std::error_code ec;
    fs::create_directories(r.run_dir / "logs", ec);
    if (ec) {
        throw IOError("Cannot create run directory " + r.run_dir.string() + ": " + ec.message());
    }
    return r;
}

RunRecord open_run_record(const fs::path& run_dir) {
    if (!fs::is_directory(run_dir)) {
        throw IOError("run_dir not found: " + run_dir.string());
    }
    RunRecord r = make_run_record(run_dir.parent_path(), run_dir.filename().string());
    if (!fs::exists(r.config_path)) {
        throw IOError("config.yaml not found in run_dir: " + r.config_path.string());
    }
    std::error_code ec;
    fs::create_directories(r.run_dir / "logs", ec);
    if (ec) {
        throw IOError("Cannot create " + (r.run_dir / "logs").string() + ": " + ec.message());
    }
    return r;
}

json mask_decision_to_json(const pipeline::MaskDecision& d) {
    json notes = json::array();
    for (const auto& n : d.notes) {
        notes.push_back({{"severity", n.severity == pipeline::NoteSeverity::WARNING ? "warning" : "info"},
                         {"message", n.message}});
    }
    return {{"active", d.active},
            {"status", pipeline::mask_status_to_string(d.status)},
            {"source_dir", d.source_dir.string()},
            {"mask_count", d.mask_count},
            {"image_count", d.image_count},
            {"extension", d.extension},
            {"notes", notes}};
}

json summarize_run(const RunRecord& record, const pipeline::RunState& state) {
    json stages = json::array();
    for (const auto& s : state.stages) {
        stages.push_back({{"stage", stage_to_string(s.stage)},
                          {"status", s.status},
                          {"exit_code", s.exit_code},
                          {"duration_s", s.duration_s},
                          {"reason", s.reason}});
    }

    json summary = {
        {"run_id", record.run_id},
        {"ts", core::get_iso_timestamp()},
        {"status", pipeline::run_status_to_string(state.status)},
        {"start_stage", stage_to_string(state.start_stage)},
        {"current_stage", stage_to_string(state.current_stage)},
        {"training_skipped", state.training_skipped},
        {"copied_masks", state.copied_masks},
        {"stages", stages},
        {"source_masks", mask_decision_to_json(state.source_masks)},
        {"dense_masks", mask_decision_to_json(state.dense_masks)},
        {"warnings", state.warnings},
        {"failure", nullptr}};

    if (state.status == pipeline::RunStatus::FAILED) {
        summary["failure"] = {{"stage", stage_to_string(state.failure.stage)},
                              {"kind", failure_kind_to_string(state.failure.kind)},
                              {"reason", state.failure.reason},
                              {"exit_code", state.failure.exit_code},
                              {"command", state.failure.command}};
    }

    if (fs::exists(record.config_path)) {
        summary["config_hash"] = core::sha256_file(record.config_path);
    }
    return summary;
}

void write_run_summary(const RunRecord& record, const json& summary) {
    core::write_text(record.summary_path, summary.dump(2) + "\n");
}

std::optional<json> read_run_summary(const fs::path& run_dir) {
    fs::path p = run_dir / "run_summary.json";
    if (!fs::exists(p)) {
        return std::nullopt;
    }
    json j = json::parse(core::read_text(p), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    return std::make_optional(std::move(j));
}

Stage resume_stage_from_summary(const std::optional<json>& summary) {
    if (!summary) {
        return Stage::FEATURE_EXTRACTION;
    }
    const json& s = *summary;
    if (s.contains("failure") && s["failure"].is_object()) {
        auto stage = string_to_stage(s["failure"].value("stage", ""));
        if (stage && *stage != Stage::DONE) {
            return *stage;
        }
    }
    return Stage::FEATURE_EXTRACTION;
}

json list_runs(const fs::path& runs_dir) {
    json runs = json::array();
    std::error_code ec;
    if (!fs::is_directory(runs_dir, ec)) {
        return runs;
    }

    std::vector<fs::path> dirs;
    for (const auto& entry : fs::directory_iterator(runs_dir, ec)) {
        if (entry.is_directory()) {
            dirs.push_back(entry.path());
        }
    }
    std::sort(dirs.begin(), dirs.end());

    for (const auto& dir : dirs) {
        json item = {{"run_id", dir.filename().string()},
                     {"run_dir", dir.string()},
                     {"status", "unknown"}};
        auto summary = read_run_summary(dir);
        if (summary) {
            item["status"] = summary->value("status", "unknown");
            item["training_skipped"] = summary->value("training_skipped", false);
            if (summary->contains("failure") && (*summary)["failure"].is_object()) {
                item["failed_stage"] = (*summary)["failure"].value("stage", "");
            }
        } else if (fs::exists(dir / "logs" / "run_events.jsonl")) {
            item["status"] = "incomplete";
        }
        runs.push_back(item);
    }
    return runs;
}

} // namespace recon_splat::runner
