#include "recon_splat/pipeline/mask_provisioning.hpp"
#include "recon_splat/core/errors.hpp"
#include "recon_splat/core/utils.hpp"

namespace recon_splat::pipeline {

ProvisionResult provision_dense_masks(const MaskDecision& decision, const ProjectLayout& layout) {
    ProvisionResult result;
    result.target_dir = layout.trainer_masks_dir;
    if (!decision.active) {
        return result;
    }

    std::error_code ec;
    fs::create_directories(layout.trainer_masks_dir, ec);
    if (ec) {
        throw IOError("Cannot create " + layout.trainer_masks_dir.string() + ": " + ec.message());
    }

    auto files = core::list_files_with_extensions(decision.source_dir, {decision.extension});
    for (const auto& src : files) {
        fs::path dst = layout.trainer_masks_dir / src.filename();
        // Source and target may be the same directory
        std::error_code same_ec;
        if (fs::equivalent(src, dst, same_ec) && !same_ec) {
            ++result.copied;
            continue;
        }
        fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            throw IOError("Cannot copy " + src.string() + " to " + dst.string() + ": " +
                          ec.message());
        }
        ++result.copied;
    }

    result.performed = true;
    return result;
}

} // namespace recon_splat::pipeline
