#include "recon_splat/config/configuration.hpp"
#include "recon_splat/core/errors.hpp"
#include "test_support.hpp"

#include <nlohmann/json.hpp>

#include <catch2/catch_test_macros.hpp>

namespace fs = std::filesystem;

using recon_splat::ConfigError;
using recon_splat::ValidationError;
using recon_splat::config::Config;
using recon_splat::testing::TempDir;
using recon_splat::testing::touch;

namespace {

Config minimal() {
    Config cfg;
    cfg.paths.project_dir = "/p";
    cfg.paths.images_dir = "/p/images";
    return cfg;
}

} // namespace

TEST_CASE("config_defaults_match_presets") {
    Config cfg;
    REQUIRE(cfg.tools.colmap_bin == "colmap");
    REQUIRE(cfg.tools.brush_bin == "brush");
    REQUIRE(cfg.masks.mask_ext == "png");
    REQUIRE(cfg.colmap.camera_model == "OPENCV");
    REQUIRE(cfg.colmap.sfm_max_image_size == 4096);
    REQUIRE(cfg.colmap.sift_max_num_features == 8192);
    REQUIRE(cfg.colmap.min_num_matches == 32);
    REQUIRE(cfg.colmap.undistort_max_image_size == 2400);
    REQUIRE_FALSE(cfg.colmap.refine_principal_point);
    REQUIRE(cfg.brush.run);
    REQUIRE(cfg.brush.total_steps == 30000);
    REQUIRE(cfg.brush.max_splats == 6000000);
    REQUIRE(cfg.brush.export_every == 5000);
    REQUIRE(cfg.brush_max_resolution() == 2400);
}

TEST_CASE("config_from_yaml_overrides_only_given_keys") {
    YAML::Node node = YAML::Load(R"(
paths:
  project_dir: /data/proj
  images_dir: /data/images
masks:
  masks_dir: /data/masks
  mask_ext: .PNG
colmap:
  camera_model: PINHOLE
  single_camera: 0
  use_gpu: false
brush:
  run: 0
  max_resolution: 1920
  cubecl_default_device: 1
)");
    Config cfg = Config::from_yaml(node);
    REQUIRE(cfg.paths.project_dir == "/data/proj");
    REQUIRE(cfg.masks.masks_dir == "/data/masks");
    REQUIRE(cfg.masks.dense_masks_dir.empty());
    REQUIRE(cfg.masks.mask_ext == ".PNG");
    REQUIRE(cfg.colmap.camera_model == "PINHOLE");
    REQUIRE_FALSE(cfg.colmap.single_camera);
    REQUIRE_FALSE(cfg.colmap.use_gpu);
    REQUIRE(cfg.colmap.sfm_max_image_size == 4096);
    REQUIRE_FALSE(cfg.brush.run);
    REQUIRE(cfg.brush_max_resolution() == 1920);
    REQUIRE(cfg.brush.cubecl_default_device == "1");
    REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_validate_rejects_bad_values") {
    REQUIRE_NOTHROW(minimal().validate());

    Config no_project = minimal();
    no_project.paths.project_dir.clear();
    REQUIRE_THROWS_AS(no_project.validate(), ValidationError);

    Config no_images = minimal();
    no_images.paths.images_dir.clear();
    REQUIRE_THROWS_AS(no_images.validate(), ValidationError);

    Config bad_model = minimal();
    bad_model.colmap.camera_model = "FISHEYE_9000";
    REQUIRE_THROWS_AS(bad_model.validate(), ValidationError);

    Config bad_steps = minimal();
    bad_steps.brush.total_steps = 0;
    REQUIRE_THROWS_AS(bad_steps.validate(), ValidationError);

    Config bad_res = minimal();
    bad_res.brush.max_resolution = -1;
    REQUIRE_THROWS_AS(bad_res.validate(), ValidationError);

    Config bad_ext = minimal();
    bad_ext.masks.mask_ext = "";
    REQUIRE_THROWS_AS(bad_ext.validate(), ValidationError);
}

TEST_CASE("config_load_missing_file_throws_config_error") {
    TempDir tmp;
    REQUIRE_THROWS_AS(Config::load(tmp / "missing.yaml"), ConfigError);
}

TEST_CASE("config_load_malformed_yaml_throws_config_error") {
    TempDir tmp;
    touch(tmp / "bad.yaml", "colmap:\n  min_num_matches: [oops\n");
    REQUIRE_THROWS_AS(Config::load(tmp / "bad.yaml"), ConfigError);

    touch(tmp / "wrong_type.yaml", "colmap:\n  min_num_matches: many\n");
    REQUIRE_THROWS_AS(Config::load(tmp / "wrong_type.yaml"), ConfigError);
}

TEST_CASE("config_saved_snapshot_reloads_identically") {
    TempDir tmp;
    Config cfg = minimal();
    cfg.masks.dense_masks_dir = "/p/dense_masks";
    cfg.colmap.use_gpu = false;
    cfg.brush.export_name = "splat_{iter}.ply";
    cfg.save(tmp / "config.yaml");

    Config back = Config::load(tmp / "config.yaml");
    REQUIRE(back.paths.project_dir == "/p");
    REQUIRE(back.masks.dense_masks_dir == "/p/dense_masks");
    REQUIRE_FALSE(back.colmap.use_gpu);
    REQUIRE(back.brush.export_name == "splat_{iter}.ply");
    REQUIRE(back.brush.cubecl_default_device.empty());
}

TEST_CASE("config_schema_is_json") {
    auto schema = nlohmann::json::parse(recon_splat::config::get_schema_json());
    REQUIRE(schema["properties"].contains("colmap"));
    REQUIRE(schema["properties"]["brush"]["properties"].contains("max_splats"));
}
