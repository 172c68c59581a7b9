#pragma once

#include <filesystem>

namespace recon_splat::pipeline {

namespace fs = std::filesystem;

// Every location the pipeline reads or writes. Everything except the two
// inputs is derived from project_root by derive_layout() and never
// configured on its own.
struct ProjectLayout {
    fs::path project_root;
    fs::path images_dir;

    fs::path database_path;     // project_root/database.db
    fs::path sparse_dir;        // project_root/sparse
    fs::path sparse_model_dir;  // project_root/sparse/0
    fs::path dense_dir;         // project_root/dense

    // COLMAP dataset folder consumed by the trainer
    fs::path trainer_dataset_dir;  // dense/0
    fs::path trainer_images_dir;   // dense/0/images
    fs::path trainer_sparse_dir;   // dense/0/sparse
    fs::path trainer_masks_dir;    // dense/0/masks

    fs::path export_dir;  // project_root/brush_exports
    fs::path runs_dir;    // project_root/runs
};

ProjectLayout derive_layout(const fs::path& project_root, const fs::path& images_dir);

bool operator==(const ProjectLayout& a, const ProjectLayout& b);
bool operator!=(const ProjectLayout& a, const ProjectLayout& b);

} // namespace recon_splat::pipeline
