#include "recon_splat/pipeline/stage_spec.hpp"
#include "recon_splat/core/utils.hpp"

namespace recon_splat::pipeline {

namespace {

std::string flag(bool value) { return value ? "1" : "0"; }

bool is_dir(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p, ec);
}

bool path_exists(const fs::path& p) {
    std::error_code ec;
    return fs::exists(p, ec);
}

bool has_regular_file(const fs::path& dir) {
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && !entry_ec) return true;
    }
    return false;
}

bool dense_dataset_ready(const ProjectLayout& l) {
    return is_dir(l.trainer_images_dir) && is_dir(l.trainer_sparse_dir);
}

StageSpec feature_extraction(const config::Config& cfg) {
    StageSpec s;
    s.stage = Stage::FEATURE_EXTRACTION;
    s.step_label = "1/5";
    s.label = "COLMAP: feature extraction";
    s.binary = cfg.tools.colmap_bin;
    s.accepts_mask = true;
    s.args_builder = [](const ProjectLayout& l, const config::Config& c,
                        const MaskDecision& mask) {
        std::vector<std::string> args = {
            "feature_extractor",
            "--database_path", l.database_path.string(),
            "--image_path", l.images_dir.string()};
        if (mask.active) {
            args.push_back("--ImageReader.mask_path");
            args.push_back(mask.source_dir.string());
        }
        args.insert(args.end(), {
            "--ImageReader.single_camera", flag(c.colmap.single_camera),
            "--ImageReader.camera_model", c.colmap.camera_model,
            "--SiftExtraction.use_gpu", flag(c.colmap.use_gpu),
            "--SiftExtraction.max_image_size", std::to_string(c.colmap.sfm_max_image_size),
            "--SiftExtraction.max_num_features", std::to_string(c.colmap.sift_max_num_features)});
        return args;
    };
    s.precondition = [](const ProjectLayout& l) { return is_dir(l.images_dir); };
    s.precondition_message = "images directory not found";
    s.postcondition = [](const ProjectLayout& l) { return path_exists(l.database_path); };
    s.postcondition_message = "feature database was not created";
    return s;
}

StageSpec matching(const config::Config& cfg) {
    StageSpec s;
    s.stage = Stage::MATCHING;
    s.step_label = "2/5";
    s.label = "COLMAP: exhaustive matching";
    s.binary = cfg.tools.colmap_bin;
    s.args_builder = [](const ProjectLayout& l, const config::Config& c, const MaskDecision&) {
        return std::vector<std::string>{
            "exhaustive_matcher",
            "--database_path", l.database_path.string(),
            "--SiftMatching.use_gpu", flag(c.colmap.use_gpu)};
    };
    s.precondition = [](const ProjectLayout& l) { return path_exists(l.database_path); };
    s.precondition_message = "feature database not found";
    s.postcondition = [](const ProjectLayout& l) { return path_exists(l.database_path); };
    s.postcondition_message = "feature database missing after matching";
    return s;
}

StageSpec mapping(const config::Config& cfg) {
    StageSpec s;
    s.stage = Stage::MAPPING;
    s.step_label = "3/5";
    s.label = "COLMAP: mapper (SfM)";
    s.binary = cfg.tools.colmap_bin;
    s.args_builder = [](const ProjectLayout& l, const config::Config& c, const MaskDecision&) {
        return std::vector<std::string>{
            "mapper",
            "--database_path", l.database_path.string(),
            "--image_path", l.images_dir.string(),
            "--output_path", l.sparse_dir.string(),
            "--Mapper.min_num_matches", std::to_string(c.colmap.min_num_matches),
            "--Mapper.ba_refine_focal_length", flag(c.colmap.refine_focal_length),
            "--Mapper.ba_refine_extra_params", flag(c.colmap.refine_extra_params),
            "--Mapper.ba_refine_principal_point", flag(c.colmap.refine_principal_point)};
    };
    s.precondition = [](const ProjectLayout& l) { return path_exists(l.database_path); };
    s.precondition_message = "feature database not found";
    s.postcondition = [](const ProjectLayout& l) { return is_dir(l.sparse_model_dir); };
    s.postcondition_message = "sparse model not found (sparse/0). Mapper probably failed to register images";
    return s;
}

StageSpec undistortion(const config::Config& cfg) {
    StageSpec s;
    s.stage = Stage::UNDISTORTION;
    s.step_label = "4/5";
    s.label = "COLMAP: image_undistorter";
    s.binary = cfg.tools.colmap_bin;
    s.args_builder = [](const ProjectLayout& l, const config::Config& c, const MaskDecision&) {
        return std::vector<std::string>{
            "image_undistorter",
            "--image_path", l.images_dir.string(),
            "--input_path", l.sparse_model_dir.string(),
            "--output_path", l.dense_dir.string(),
            "--output_type", "COLMAP",
            "--max_image_size", std::to_string(c.colmap.undistort_max_image_size)};
    };
    s.precondition = [](const ProjectLayout& l) { return is_dir(l.sparse_model_dir); };
    s.precondition_message = "sparse model not found (sparse/0)";
    s.postcondition = dense_dataset_ready;
    s.postcondition_message = "undistorted dataset incomplete (dense/0/images or dense/0/sparse missing)";
    return s;
}

StageSpec mask_provisioning() {
    StageSpec s;
    s.stage = Stage::MASK_PROVISIONING;
    s.step_label = "4b";
    s.label = "Dense masks";
    s.action = StageAction::PROVISION_MASKS;
    s.precondition = [](const ProjectLayout& l) { return is_dir(l.trainer_dataset_dir); };
    s.precondition_message = "dense dataset not found (dense/0)";
    return s;
}

StageSpec training(const config::Config& cfg) {
    StageSpec s;
    s.stage = Stage::TRAINING;
    s.step_label = "5/5";
    s.label = "BRUSH: train + export";
    s.binary = cfg.tools.brush_bin;
    s.args_builder = [](const ProjectLayout& l, const config::Config& c, const MaskDecision&) {
        return std::vector<std::string>{
            l.trainer_dataset_dir.string(),
            "--total-steps", std::to_string(c.brush.total_steps),
            "--max-resolution", std::to_string(c.brush_max_resolution()),
            "--max-splats", std::to_string(c.brush.max_splats),
            "--eval-split-every", std::to_string(c.brush.eval_split_every),
            "--export-every", std::to_string(c.brush.export_every),
            "--export-path", l.export_dir.string(),
            "--export-name", c.brush.export_name,
            "--eval-every", std::to_string(c.brush.export_every),
            "--eval-save-to-disk"};
    };
    if (!cfg.brush.cubecl_default_device.empty()) {
        s.env.emplace_back("CUBECL_DEFAULT_DEVICE", cfg.brush.cubecl_default_device);
    }

    const std::string brush_bin = cfg.tools.brush_bin;
    s.precondition = [brush_bin](const ProjectLayout& l) {
        return dense_dataset_ready(l) && core::find_executable(brush_bin).has_value();
    };
    s.precondition_message = "dense/0/images and dense/0/sparse must exist and '" + brush_bin +
                             "' must be an executable path or on PATH";
    // brush_exports is created before launch, so require an actual export
    s.postcondition = [](const ProjectLayout& l) { return has_regular_file(l.export_dir); };
    s.postcondition_message = "no export written to brush_exports";

    if (!cfg.brush.run) {
        s.enabled = false;
        s.skip_reason = "training disabled (brush.run = false)";
    }
    return s;
}

} // namespace

std::vector<StageSpec> build_stage_specs(const config::Config& cfg) {
    std::vector<StageSpec> specs;
    specs.push_back(feature_extraction(cfg));
    specs.push_back(matching(cfg));
    specs.push_back(mapping(cfg));
    specs.push_back(undistortion(cfg));
    specs.push_back(mask_provisioning());
    specs.push_back(training(cfg));
    return specs;
}

const StageSpec* find_stage_spec(const std::vector<StageSpec>& specs, Stage stage) {
    for (const auto& s : specs) {
        if (s.stage == stage) return &s;
    }
    return nullptr;
}

} // namespace recon_splat::pipeline
