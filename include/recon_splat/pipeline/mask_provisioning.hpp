#pragma once

#include "recon_splat/pipeline/layout.hpp"
#include "recon_splat/pipeline/mask_resolver.hpp"

namespace recon_splat::pipeline {

struct ProvisionResult {
    bool performed = false;
    size_t copied = 0;
    fs::path target_dir;
};

/**
 * Copy every *.<ext> file of an active dense-mask decision into
 * layout.trainer_masks_dir, overwriting same-named files. An inactive
 * decision is a no-op. Throws IOError when a copy fails.
 */
ProvisionResult provision_dense_masks(const MaskDecision& decision, const ProjectLayout& layout);

} // namespace recon_splat::pipeline
