#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace recon_splat::config {

namespace fs = std::filesystem;

struct PathsConfig {
  std::string project_dir;
  std::string images_dir;
};

struct ToolsConfig {
  std::string colmap_bin = "colmap";
  std::string brush_bin = "brush"; // name on PATH or full path
};

struct MasksConfig {
  // Masks for the original images, same base name as the image
  // (masks/IMG_0001.png for images/IMG_0001.jpg).
  std::string masks_dir;       // empty = disabled
  // Masks matching dense/0/images pixel-to-pixel, copied to dense/0/masks.
  std::string dense_masks_dir; // empty = disabled
  std::string mask_ext = "png";
};

struct ColmapConfig {
  std::string camera_model = "OPENCV";
  bool single_camera = true;
  bool use_gpu = true;
  int sfm_max_image_size = 4096;
  int sift_max_num_features = 8192;
  int min_num_matches = 32;
  bool refine_focal_length = true;
  bool refine_extra_params = true;
  bool refine_principal_point = false;
  int undistort_max_image_size = 2400;
};

struct BrushConfig {
  bool run = true;
  int total_steps = 30000;
  int max_resolution = 0; // 0 = follow colmap.undistort_max_image_size
  int max_splats = 6000000;
  int export_every = 5000;
  int eval_split_every = 10;
  std::string export_name = "export_{iter}.ply";
  std::string cubecl_default_device; // empty = inherit from environment
};

struct Config {
  PathsConfig paths;
  ToolsConfig tools;
  MasksConfig masks;
  ColmapConfig colmap;
  BrushConfig brush;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  int brush_max_resolution() const {
    return brush.max_resolution > 0 ? brush.max_resolution
                                    : colmap.undistort_max_image_size;
  }
};

std::string get_schema_json();

} // namespace recon_splat::config
