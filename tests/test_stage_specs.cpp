#include "recon_splat/config/configuration.hpp"
#include "recon_splat/pipeline/stage_runner.hpp"
#include "recon_splat/pipeline/stage_spec.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>

namespace fs = std::filesystem;

using recon_splat::Stage;
using recon_splat::config::Config;
using namespace recon_splat::pipeline;
using recon_splat::testing::TempDir;
using recon_splat::testing::make_executable;
using recon_splat::testing::touch;

namespace {

bool has_arg(const std::vector<std::string>& args, const std::string& a) {
    return std::find(args.begin(), args.end(), a) != args.end();
}

std::string arg_after(const std::vector<std::string>& args, const std::string& flag) {
    auto it = std::find(args.begin(), args.end(), flag);
    if (it == args.end() || it + 1 == args.end()) return "";
    return *(it + 1);
}

StageSpec spec_for(const Config& cfg, Stage stage) {
    auto specs = build_stage_specs(cfg);
    return *find_stage_spec(specs, stage);
}

MaskDecision active_mask(const fs::path& dir) {
    MaskDecision m;
    m.active = true;
    m.status = MaskStatus::ACTIVE;
    m.source_dir = dir;
    m.mask_count = 4;
    m.extension = "png";
    return m;
}

} // namespace

TEST_CASE("stage_specs_are_in_execution_order") {
    Config cfg;
    auto specs = build_stage_specs(cfg);
    REQUIRE(specs.size() == 6);
    REQUIRE(specs[0].stage == Stage::FEATURE_EXTRACTION);
    REQUIRE(specs[1].stage == Stage::MATCHING);
    REQUIRE(specs[2].stage == Stage::MAPPING);
    REQUIRE(specs[3].stage == Stage::UNDISTORTION);
    REQUIRE(specs[4].stage == Stage::MASK_PROVISIONING);
    REQUIRE(specs[4].action == StageAction::PROVISION_MASKS);
    REQUIRE(specs[5].stage == Stage::TRAINING);

    int accepting = 0;
    for (const auto& s : specs) {
        if (s.accepts_mask) ++accepting;
    }
    REQUIRE(accepting == 1);
    REQUIRE(specs[0].accepts_mask);
}

TEST_CASE("feature_extraction_passes_mask_path_only_when_active") {
    Config cfg;
    auto l = derive_layout("/p", "/p/images");
    const StageSpec fe = spec_for(cfg, Stage::FEATURE_EXTRACTION);

    auto without = build_command(fe, l, cfg, MaskDecision{}).args;
    REQUIRE(without[0] == "feature_extractor");
    REQUIRE_FALSE(has_arg(without, "--ImageReader.mask_path"));
    REQUIRE(arg_after(without, "--database_path") == "/p/database.db");
    REQUIRE(arg_after(without, "--image_path") == "/p/images");
    REQUIRE(arg_after(without, "--ImageReader.single_camera") == "1");
    REQUIRE(arg_after(without, "--ImageReader.camera_model") == "OPENCV");
    REQUIRE(arg_after(without, "--SiftExtraction.use_gpu") == "1");
    REQUIRE(arg_after(without, "--SiftExtraction.max_image_size") == "4096");
    REQUIRE(arg_after(without, "--SiftExtraction.max_num_features") == "8192");

    auto with = build_command(fe, l, cfg, active_mask("/m")).args;
    REQUIRE(arg_after(with, "--ImageReader.mask_path") == "/m");
}

TEST_CASE("colmap_stages_after_extraction_never_receive_masks") {
    Config cfg;
    auto l = derive_layout("/p", "/p/images");
    auto specs = build_stage_specs(cfg);
    for (Stage st : {Stage::MATCHING, Stage::MAPPING, Stage::UNDISTORTION}) {
        auto args = build_command(*find_stage_spec(specs, st), l, cfg, active_mask("/m")).args;
        REQUIRE_FALSE(has_arg(args, "--ImageReader.mask_path"));
        REQUIRE_FALSE(has_arg(args, "/m"));
    }
}

TEST_CASE("matching_mapping_undistortion_arguments") {
    Config cfg;
    cfg.colmap.use_gpu = false;
    cfg.colmap.min_num_matches = 16;
    cfg.colmap.undistort_max_image_size = 1600;
    auto l = derive_layout("/p", "/imgs");
    auto specs = build_stage_specs(cfg);

    auto m = build_command(*find_stage_spec(specs, Stage::MATCHING), l, cfg, {}).args;
    REQUIRE(m[0] == "exhaustive_matcher");
    REQUIRE(arg_after(m, "--SiftMatching.use_gpu") == "0");

    auto mp = build_command(*find_stage_spec(specs, Stage::MAPPING), l, cfg, {}).args;
    REQUIRE(mp[0] == "mapper");
    REQUIRE(arg_after(mp, "--output_path") == "/p/sparse");
    REQUIRE(arg_after(mp, "--Mapper.min_num_matches") == "16");
    REQUIRE(arg_after(mp, "--Mapper.ba_refine_focal_length") == "1");
    REQUIRE(arg_after(mp, "--Mapper.ba_refine_extra_params") == "1");
    REQUIRE(arg_after(mp, "--Mapper.ba_refine_principal_point") == "0");

    auto u = build_command(*find_stage_spec(specs, Stage::UNDISTORTION), l, cfg, {}).args;
    REQUIRE(u[0] == "image_undistorter");
    REQUIRE(arg_after(u, "--image_path") == "/imgs");
    REQUIRE(arg_after(u, "--input_path") == "/p/sparse/0");
    REQUIRE(arg_after(u, "--output_path") == "/p/dense");
    REQUIRE(arg_after(u, "--output_type") == "COLMAP");
    REQUIRE(arg_after(u, "--max_image_size") == "1600");
}

TEST_CASE("training_arguments_and_environment") {
    Config cfg;
    cfg.tools.brush_bin = "/opt/brush/brush";
    cfg.brush.cubecl_default_device = "1";
    auto l = derive_layout("/p", "/imgs");
    const StageSpec tr = spec_for(cfg, Stage::TRAINING);

    Command cmd = build_command(tr, l, cfg, {});
    REQUIRE(cmd.program == "/opt/brush/brush");
    REQUIRE(cmd.args[0] == "/p/dense/0");
    REQUIRE(arg_after(cmd.args, "--total-steps") == "30000");
    REQUIRE(arg_after(cmd.args, "--max-resolution") == "2400");
    REQUIRE(arg_after(cmd.args, "--max-splats") == "6000000");
    REQUIRE(arg_after(cmd.args, "--eval-split-every") == "10");
    REQUIRE(arg_after(cmd.args, "--export-every") == "5000");
    REQUIRE(arg_after(cmd.args, "--eval-every") == "5000");
    REQUIRE(arg_after(cmd.args, "--export-path") == "/p/brush_exports");
    REQUIRE(arg_after(cmd.args, "--export-name") == "export_{iter}.ply");
    REQUIRE(cmd.args.back() == "--eval-save-to-disk");

    REQUIRE(cmd.env.size() == 1);
    REQUIRE(cmd.env[0].first == "CUBECL_DEFAULT_DEVICE");
    REQUIRE(cmd.env[0].second == "1");
}

TEST_CASE("training_max_resolution_override_and_no_device") {
    Config cfg;
    cfg.brush.max_resolution = 1920;
    auto l = derive_layout("/p", "/imgs");
    const StageSpec tr = spec_for(cfg, Stage::TRAINING);
    Command cmd = build_command(tr, l, cfg, {});
    REQUIRE(arg_after(cmd.args, "--max-resolution") == "1920");
    REQUIRE(cmd.env.empty());
}

TEST_CASE("training_disabled_is_marked_with_reason") {
    Config cfg;
    cfg.brush.run = false;
    const StageSpec tr = spec_for(cfg, Stage::TRAINING);
    REQUIRE_FALSE(tr.enabled);
    REQUIRE_FALSE(tr.skip_reason.empty());
}

TEST_CASE("training_precondition_requires_dataset_and_brush_binary") {
    TempDir tmp;
    auto l = derive_layout(tmp / "proj", tmp / "images");
    fs::create_directories(l.trainer_images_dir);
    fs::create_directories(l.trainer_sparse_dir);

    Config cfg;
    cfg.tools.brush_bin = (tmp / "bin" / "brush").string();
    {
        const StageSpec tr = spec_for(cfg, Stage::TRAINING);
        REQUIRE_FALSE(tr.precondition(l));
    }

    make_executable(tmp / "bin" / "brush");
    const StageSpec tr = spec_for(cfg, Stage::TRAINING);
    REQUIRE(tr.precondition(l));

    fs::remove_all(l.trainer_sparse_dir);
    REQUIRE_FALSE(tr.precondition(l));
}

TEST_CASE("mapping_postcondition_requires_sparse_model") {
    TempDir tmp;
    auto l = derive_layout(tmp / "proj", tmp / "images");
    Config cfg;
    const StageSpec mp = spec_for(cfg, Stage::MAPPING);

    fs::create_directories(l.sparse_dir);
    REQUIRE_FALSE(mp.postcondition(l));
    fs::create_directories(l.sparse_model_dir);
    REQUIRE(mp.postcondition(l));
}

TEST_CASE("training_postcondition_requires_an_export_file") {
    TempDir tmp;
    auto l = derive_layout(tmp / "proj", tmp / "images");
    Config cfg;
    const StageSpec tr = spec_for(cfg, Stage::TRAINING);

    fs::create_directories(l.export_dir);
    REQUIRE_FALSE(tr.postcondition(l));
    touch(l.export_dir / "export_5000.ply");
    REQUIRE(tr.postcondition(l));
}
