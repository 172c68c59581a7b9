#include "recon_splat/config/configuration.hpp"
#include "recon_splat/core/types.hpp"
#include "recon_splat/core/utils.hpp"
#include "recon_splat/pipeline/layout.hpp"
#include "recon_splat/pipeline/mask_resolver.hpp"
#include "recon_splat/runner/run_record.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace core = recon_splat::core;
namespace pipeline = recon_splat::pipeline;
namespace runner = recon_splat::runner;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

// ============================================================================
// get-schema
// ============================================================================
int cmd_get_schema() {
    json schema = json::parse(recon_splat::config::get_schema_json());
    print_json(schema);
    return 0;
}

// ============================================================================
// validate-config --path <path> [--strict-exit-codes]
// ============================================================================
int cmd_validate_config(const std::string& path, bool strict_exit) {
    json result;
    result["valid"] = false;
    result["path"] = path;
    result["errors"] = json::array();

    try {
        recon_splat::config::Config cfg = recon_splat::config::Config::load(path);
        cfg.validate();
        result["valid"] = true;
    } catch (const std::exception& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// scan --images-dir D [--project-dir P] [--masks-dir D] [--dense-masks-dir D] [--mask-ext E]
// ============================================================================
int cmd_scan(const std::string& images_dir, const std::string& project_dir,
             const std::string& masks_dir, const std::string& dense_masks_dir,
             const std::string& mask_ext) {
    json result;
    result["ok"] = false;
    result["images_dir"] = images_dir;
    result["images_detected"] = 0;
    result["errors"] = json::array();

    if (!fs::is_directory(images_dir)) {
        json err;
        err["severity"] = "error";
        err["code"] = "images_dir_not_found";
        err["message"] = "Images directory does not exist: " + images_dir;
        result["errors"].push_back(err);
        print_json(result);
        return 0;
    }

    result["images_detected"] =
        core::count_files_with_extensions(images_dir, core::kImageExtensions);

    // Dense masks are matched against the undistorted images when a project
    // is given, against the source images otherwise.
    fs::path dense_images = images_dir;
    if (!project_dir.empty()) {
        dense_images = pipeline::derive_layout(project_dir, images_dir).trainer_images_dir;
        result["project_dir"] = project_dir;
    }

    result["source_masks"] = runner::mask_decision_to_json(
        pipeline::resolve_masks(masks_dir, images_dir, mask_ext));
    result["dense_masks"] = runner::mask_decision_to_json(
        pipeline::resolve_masks(dense_masks_dir, dense_images, mask_ext));
    result["ok"] = result["images_detected"].get<size_t>() > 0;
    if (!result["ok"].get<bool>()) {
        json err;
        err["severity"] = "error";
        err["code"] = "no_images";
        err["message"] = "No jpg/jpeg/png/tif/tiff images in " + images_dir;
        result["errors"].push_back(err);
    }

    print_json(result);
    return 0;
}

// ============================================================================
// list-runs <project_dir>
// ============================================================================
int cmd_list_runs(const std::string& project_dir) {
    fs::path runs_dir = pipeline::derive_layout(project_dir, fs::path()).runs_dir;

    json result;
    result["project_dir"] = project_dir;
    result["runs_dir"] = runs_dir.string();
    result["runs"] = runner::list_runs(runs_dir);
    print_json(result);
    return 0;
}

// ============================================================================
// get-run-status <run_dir>
// ============================================================================
int cmd_get_run_status(const std::string& run_dir) {
    fs::path p(run_dir);

    json result;
    result["run_dir"] = run_dir;
    result["exists"] = fs::exists(p);
    result["status"] = "unknown";
    result["current_stage"] = nullptr;
    result["events"] = json::array();

    if (!fs::exists(p)) {
        print_json(result);
        return 0;
    }

    fs::path events_file = p / "logs" / "run_events.jsonl";
    if (fs::exists(events_file)) {
        std::ifstream ifs(events_file);
        std::string line;
        std::string last_stage;
        std::string last_status;

        while (std::getline(ifs, line)) {
            if (line.empty()) continue;
            json ev = json::parse(line, nullptr, false);
            if (ev.is_discarded() || !ev.is_object()) continue;
            result["events"].push_back(ev);

            const std::string type = ev.value("type", "");
            if (type == "stage_start") {
                last_stage = ev.value("stage_name", "");
                last_status = "running";
            } else if (type == "stage_end" && ev.value("status", "") == "error") {
                last_stage = ev.value("stage_name", "");
                last_status = "failed";
            } else if (type == "run_end") {
                last_status = ev.value("success", false) ? "succeeded" : "failed";
            }
        }

        result["current_stage"] = last_stage.empty() ? json(nullptr) : json(last_stage);
        result["status"] = last_status.empty() ? "unknown" : last_status;
    }

    auto summary = runner::read_run_summary(p);
    if (summary) {
        result["summary"] = *summary;
        result["status"] = summary->value("status", result["status"].get<std::string>());
    }

    print_json(result);
    return 0;
}

// ============================================================================
// Main
// ============================================================================
void print_usage() {
    std::cout << "Usage: recon_splat_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  get-schema                      Print JSON schema for config\n"
              << "  validate-config --path P [--strict-exit-codes]  Validate config\n"
              << "  scan --images-dir D [--project-dir P] [--masks-dir D]\n"
              << "       [--dense-masks-dir D] [--mask-ext E]  Count images, resolve masks\n"
              << "  list-runs <project_dir>         List pipeline runs\n"
              << "  get-run-status <run_dir>        Get status of a run\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 2;
    }

    std::string command = argv[1];

    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (i + 1 < argc && argv[i + 1][0] != '-') {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    if (command == "get-schema") {
        return cmd_get_schema();
    }

    if (command == "validate-config") {
        std::string path = get_arg("--path");
        if (path.empty()) {
            std::cerr << "validate-config requires --path\n";
            return 2;
        }
        return cmd_validate_config(path, has_flag("--strict-exit-codes"));
    }

    if (command == "scan") {
        std::string images_dir = get_arg("--images-dir");
        if (images_dir.empty()) {
            std::cerr << "scan requires --images-dir\n";
            return 2;
        }
        std::string mask_ext = get_arg("--mask-ext");
        if (mask_ext.empty()) mask_ext = "png";
        return cmd_scan(images_dir, get_arg("--project-dir"), get_arg("--masks-dir"),
                        get_arg("--dense-masks-dir"), mask_ext);
    }

    if (command == "list-runs") {
        std::string project_dir = get_positional(0);
        if (project_dir.empty()) {
            std::cerr << "list-runs requires a project_dir argument\n";
            return 2;
        }
        return cmd_list_runs(project_dir);
    }

    if (command == "get-run-status") {
        std::string run_dir = get_positional(0);
        if (run_dir.empty()) {
            std::cerr << "get-run-status requires a run_dir argument\n";
            return 2;
        }
        return cmd_get_run_status(run_dir);
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 2;
}
