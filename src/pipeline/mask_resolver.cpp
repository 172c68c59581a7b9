#include "recon_splat/pipeline/mask_resolver.hpp"
#include "recon_splat/core/utils.hpp"

#include <algorithm>

namespace recon_splat::pipeline {

std::string mask_status_to_string(MaskStatus status) {
    switch (status) {
        case MaskStatus::NOT_CONFIGURED: return "not_configured";
        case MaskStatus::DIRECTORY_MISSING: return "directory_missing";
        case MaskStatus::NO_MATCHING_FILES: return "no_matching_files";
        case MaskStatus::ACTIVE: return "active";
        default: return "unknown";
    }
}

bool MaskDecision::has_warnings() const {
    return std::any_of(notes.begin(), notes.end(), [](const MaskNote& n) {
        return n.severity == NoteSeverity::WARNING;
    });
}

MaskDecision resolve_masks(const fs::path& candidate_dir, const fs::path& images_dir,
                           const std::string& extension) {
    MaskDecision d;
    d.extension = core::normalize_extension(extension);

    if (candidate_dir.empty()) {
        d.status = MaskStatus::NOT_CONFIGURED;
        d.notes.push_back({NoteSeverity::INFO, "No mask directory configured. Continuing without masks."});
        return d;
    }

    std::error_code ec;
    if (!fs::is_directory(candidate_dir, ec)) {
        d.status = MaskStatus::DIRECTORY_MISSING;
        d.notes.push_back({NoteSeverity::INFO,
                           "Mask directory not found: " + candidate_dir.string() +
                               ". Continuing without masks."});
        return d;
    }

    d.source_dir = candidate_dir;
    d.image_count = core::count_files_with_extensions(images_dir, core::kImageExtensions);
    d.mask_count = core::count_files_with_extensions(candidate_dir, {d.extension});

    if (d.mask_count == 0) {
        d.status = MaskStatus::NO_MATCHING_FILES;
        d.notes.push_back({NoteSeverity::WARNING,
                           "Mask directory exists (" + candidate_dir.string() +
                               ") but no *." + d.extension + " files found. Not using masks."});
        return d;
    }

    d.active = true;
    d.status = MaskStatus::ACTIVE;
    d.notes.push_back({NoteSeverity::INFO,
                       "Masks detected: " + std::to_string(d.mask_count) +
                           " mask(s) (expected up to " + std::to_string(d.image_count) + ")."});
    if (d.image_count > 0 && d.mask_count < d.image_count) {
        d.notes.push_back({NoteSeverity::WARNING,
                           "Fewer masks than images (" + std::to_string(d.mask_count) + " < " +
                               std::to_string(d.image_count) +
                               "). Images without masks will be processed without masking."});
    }
    return d;
}

} // namespace recon_splat::pipeline
