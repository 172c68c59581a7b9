#include "recon_splat/config/configuration.hpp"
#include "recon_splat/core/errors.hpp"

#include <algorithm>
#include <array>
#include <fstream>

namespace recon_splat::config {

namespace {

const std::array<const char*, 11> kCameraModels = {
    "SIMPLE_PINHOLE", "PINHOLE", "SIMPLE_RADIAL", "RADIAL", "OPENCV",
    "OPENCV_FISHEYE", "FULL_OPENCV", "FOV", "SIMPLE_RADIAL_FISHEYE",
    "RADIAL_FISHEYE", "THIN_PRISM_FISHEYE"};

template <typename T>
void read_value(const YAML::Node& n, const char* key, T& out) {
    if (n[key]) out = n[key].as<T>();
}

// Switches may be written as 0/1 as well as true/false.
template <>
void read_value<bool>(const YAML::Node& n, const char* key, bool& out) {
    if (!n[key]) return;
    bool value = false;
    if (YAML::convert<bool>::decode(n[key], value)) {
        out = value;
    } else {
        out = n[key].as<int>() != 0;
    }
}

void require_positive(int value, const std::string& name) {
    if (value <= 0) {
        throw ValidationError(name + " must be > 0");
    }
}

} // namespace

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    try {
        YAML::Node node = YAML::LoadFile(path.string());
        return from_yaml(node);
    } catch (const YAML::Exception& e) {
        throw ConfigError(path.string() + ": " + e.what());
    }
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["paths"]) {
        auto p = node["paths"];
        read_value(p, "project_dir", cfg.paths.project_dir);
        read_value(p, "images_dir", cfg.paths.images_dir);
    }

    if (node["tools"]) {
        auto t = node["tools"];
        read_value(t, "colmap_bin", cfg.tools.colmap_bin);
        read_value(t, "brush_bin", cfg.tools.brush_bin);
    }

    if (node["masks"]) {
        auto m = node["masks"];
        read_value(m, "masks_dir", cfg.masks.masks_dir);
        read_value(m, "dense_masks_dir", cfg.masks.dense_masks_dir);
        read_value(m, "mask_ext", cfg.masks.mask_ext);
    }

    if (node["colmap"]) {
        auto c = node["colmap"];
        read_value(c, "camera_model", cfg.colmap.camera_model);
        read_value(c, "single_camera", cfg.colmap.single_camera);
        read_value(c, "use_gpu", cfg.colmap.use_gpu);
        read_value(c, "sfm_max_image_size", cfg.colmap.sfm_max_image_size);
        read_value(c, "sift_max_num_features", cfg.colmap.sift_max_num_features);
        read_value(c, "min_num_matches", cfg.colmap.min_num_matches);
        read_value(c, "refine_focal_length", cfg.colmap.refine_focal_length);
        read_value(c, "refine_extra_params", cfg.colmap.refine_extra_params);
        read_value(c, "refine_principal_point", cfg.colmap.refine_principal_point);
        read_value(c, "undistort_max_image_size", cfg.colmap.undistort_max_image_size);
    }

    if (node["brush"]) {
        auto b = node["brush"];
        read_value(b, "run", cfg.brush.run);
        read_value(b, "total_steps", cfg.brush.total_steps);
        read_value(b, "max_resolution", cfg.brush.max_resolution);
        read_value(b, "max_splats", cfg.brush.max_splats);
        read_value(b, "export_every", cfg.brush.export_every);
        read_value(b, "eval_split_every", cfg.brush.eval_split_every);
        read_value(b, "export_name", cfg.brush.export_name);
        // Device ids are often written unquoted (0, 1); keep them as text.
        if (b["cubecl_default_device"] && !b["cubecl_default_device"].IsNull()) {
            cfg.brush.cubecl_default_device = b["cubecl_default_device"].as<std::string>();
        }
    }

    return cfg;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["paths"]["project_dir"] = paths.project_dir;
    node["paths"]["images_dir"] = paths.images_dir;

    node["tools"]["colmap_bin"] = tools.colmap_bin;
    node["tools"]["brush_bin"] = tools.brush_bin;

    node["masks"]["masks_dir"] = masks.masks_dir;
    node["masks"]["dense_masks_dir"] = masks.dense_masks_dir;
    node["masks"]["mask_ext"] = masks.mask_ext;

    node["colmap"]["camera_model"] = colmap.camera_model;
    node["colmap"]["single_camera"] = colmap.single_camera;
    node["colmap"]["use_gpu"] = colmap.use_gpu;
    node["colmap"]["sfm_max_image_size"] = colmap.sfm_max_image_size;
    node["colmap"]["sift_max_num_features"] = colmap.sift_max_num_features;
    node["colmap"]["min_num_matches"] = colmap.min_num_matches;
    node["colmap"]["refine_focal_length"] = colmap.refine_focal_length;
    node["colmap"]["refine_extra_params"] = colmap.refine_extra_params;
    node["colmap"]["refine_principal_point"] = colmap.refine_principal_point;
    node["colmap"]["undistort_max_image_size"] = colmap.undistort_max_image_size;

    node["brush"]["run"] = brush.run;
    node["brush"]["total_steps"] = brush.total_steps;
    node["brush"]["max_resolution"] = brush.max_resolution;
    node["brush"]["max_splats"] = brush.max_splats;
    node["brush"]["export_every"] = brush.export_every;
    node["brush"]["eval_split_every"] = brush.eval_split_every;
    node["brush"]["export_name"] = brush.export_name;
    node["brush"]["cubecl_default_device"] = brush.cubecl_default_device;

    return node;
}

void Config::save(const fs::path& path) const {
    std::ofstream out(path);
    if (!out) {
        throw IOError("Cannot create file: " + path.string());
    }
    YAML::Emitter emitter;
    emitter << to_yaml();
    out << emitter.c_str() << "\n";
}

void Config::validate() const {
    if (paths.project_dir.empty()) {
        throw ValidationError("paths.project_dir must be set");
    }
    if (paths.images_dir.empty()) {
        throw ValidationError("paths.images_dir must be set");
    }
    if (tools.colmap_bin.empty()) {
        throw ValidationError("tools.colmap_bin must not be empty");
    }
    if (tools.brush_bin.empty()) {
        throw ValidationError("tools.brush_bin must not be empty");
    }
    if (masks.mask_ext.empty() || masks.mask_ext == ".") {
        throw ValidationError("masks.mask_ext must not be empty");
    }

    if (std::find(kCameraModels.begin(), kCameraModels.end(), colmap.camera_model) ==
        kCameraModels.end()) {
        throw ValidationError("colmap.camera_model '" + colmap.camera_model +
                              "' is not a known COLMAP camera model");
    }
    require_positive(colmap.sfm_max_image_size, "colmap.sfm_max_image_size");
    require_positive(colmap.sift_max_num_features, "colmap.sift_max_num_features");
    require_positive(colmap.min_num_matches, "colmap.min_num_matches");
    require_positive(colmap.undistort_max_image_size, "colmap.undistort_max_image_size");

    require_positive(brush.total_steps, "brush.total_steps");
    if (brush.max_resolution < 0) {
        throw ValidationError("brush.max_resolution must be >= 0");
    }
    require_positive(brush.max_splats, "brush.max_splats");
    require_positive(brush.export_every, "brush.export_every");
    require_positive(brush.eval_split_every, "brush.eval_split_every");
    if (brush.export_name.empty()) {
        throw ValidationError("brush.export_name must not be empty");
    }
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "properties": {
    "paths": {
      "type": "object",
      "properties": {
        "project_dir": {"type": "string", "minLength": 1},
        "images_dir": {"type": "string", "minLength": 1}
      }
    },
    "tools": {
      "type": "object",
      "properties": {
        "colmap_bin": {"type": "string", "minLength": 1},
        "brush_bin": {"type": "string", "minLength": 1}
      }
    },
    "masks": {
      "type": "object",
      "properties": {
        "masks_dir": {"type": "string"},
        "dense_masks_dir": {"type": "string"},
        "mask_ext": {"type": "string", "minLength": 1}
      }
    },
    "colmap": {
      "type": "object",
      "properties": {
        "camera_model": {"type": "string", "enum": ["SIMPLE_PINHOLE", "PINHOLE", "SIMPLE_RADIAL",
          "RADIAL", "OPENCV", "OPENCV_FISHEYE", "FULL_OPENCV", "FOV", "SIMPLE_RADIAL_FISHEYE",
          "RADIAL_FISHEYE", "THIN_PRISM_FISHEYE"]},
        "single_camera": {"type": "boolean"},
        "use_gpu": {"type": "boolean"},
        "sfm_max_image_size": {"type": "integer", "minimum": 1},
        "sift_max_num_features": {"type": "integer", "minimum": 1},
        "min_num_matches": {"type": "integer", "minimum": 1},
        "refine_focal_length": {"type": "boolean"},
        "refine_extra_params": {"type": "boolean"},
        "refine_principal_point": {"type": "boolean"},
        "undistort_max_image_size": {"type": "integer", "minimum": 1}
      }
    },
    "brush": {
      "type": "object",
      "properties": {
        "run": {"type": "boolean"},
        "total_steps": {"type": "integer", "minimum": 1},
        "max_resolution": {"type": "integer", "minimum": 0},
        "max_splats": {"type": "integer", "minimum": 1},
        "export_every": {"type": "integer", "minimum": 1},
        "eval_split_every": {"type": "integer", "minimum": 1},
        "export_name": {"type": "string", "minLength": 1},
        "cubecl_default_device": {"type": "string"}
      }
    }
  }
})";
}

} // namespace recon_splat::config
