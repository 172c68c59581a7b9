#include "recon_splat/pipeline/layout.hpp"

namespace recon_splat::pipeline {

ProjectLayout derive_layout(const fs::path& project_root, const fs::path& images_dir) {
    ProjectLayout layout;
    layout.project_root = project_root;
    layout.images_dir = images_dir;

    layout.database_path = project_root / "database.db";
    layout.sparse_dir = project_root / "sparse";
    layout.sparse_model_dir = layout.sparse_dir / "0";
    layout.dense_dir = project_root / "dense";

    layout.trainer_dataset_dir = layout.dense_dir / "0";
    layout.trainer_images_dir = layout.trainer_dataset_dir / "images";
    layout.trainer_sparse_dir = layout.trainer_dataset_dir / "sparse";
    layout.trainer_masks_dir = layout.trainer_dataset_dir / "masks";

    layout.export_dir = project_root / "brush_exports";
    layout.runs_dir = project_root / "runs";
    return layout;
}

bool operator==(const ProjectLayout& a, const ProjectLayout& b) {
    return a.project_root == b.project_root &&
           a.images_dir == b.images_dir &&
           a.database_path == b.database_path &&
           a.sparse_dir == b.sparse_dir &&
           a.sparse_model_dir == b.sparse_model_dir &&
           a.dense_dir == b.dense_dir &&
           a.trainer_dataset_dir == b.trainer_dataset_dir &&
           a.trainer_images_dir == b.trainer_images_dir &&
           a.trainer_sparse_dir == b.trainer_sparse_dir &&
           a.trainer_masks_dir == b.trainer_masks_dir &&
           a.export_dir == b.export_dir &&
           a.runs_dir == b.runs_dir;
}

bool operator!=(const ProjectLayout& a, const ProjectLayout& b) {
    return !(a == b);
}

} // namespace recon_splat::pipeline
