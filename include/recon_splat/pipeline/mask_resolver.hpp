#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace recon_splat::pipeline {

namespace fs = std::filesystem;

enum class NoteSeverity {
    INFO,
    WARNING
};

struct MaskNote {
    NoteSeverity severity = NoteSeverity::INFO;
    std::string message;
};

enum class MaskStatus {
    NOT_CONFIGURED,    // no directory given
    DIRECTORY_MISSING, // given, but not an existing directory
    NO_MATCHING_FILES, // directory exists, no *.<ext> inside
    ACTIVE
};

std::string mask_status_to_string(MaskStatus status);

// active implies mask_count > 0 and source_dir is an existing directory.
// A shortfall against image_count is a warning only and never clears active.
struct MaskDecision {
    bool active = false;
    fs::path source_dir;
    size_t mask_count = 0;
    size_t image_count = 0;
    std::string extension;
    MaskStatus status = MaskStatus::NOT_CONFIGURED;
    std::vector<MaskNote> notes;

    bool has_warnings() const;
};

/**
 * Decide from directory listings alone whether candidate_dir provides
 * masks for the images in images_dir. Reads the filesystem, never writes,
 * and never throws for a missing or empty candidate directory.
 */
MaskDecision resolve_masks(const fs::path& candidate_dir, const fs::path& images_dir,
                           const std::string& extension);

} // namespace recon_splat::pipeline
