#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace recon_splat {

// Pipeline stage enumeration (execution order)
enum class Stage {
    FEATURE_EXTRACTION = 0,
    MATCHING = 1,
    MAPPING = 2,
    UNDISTORTION = 3,
    MASK_PROVISIONING = 4,
    TRAINING = 5,
    DONE = 6
};

inline std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::FEATURE_EXTRACTION: return "FEATURE_EXTRACTION";
        case Stage::MATCHING: return "MATCHING";
        case Stage::MAPPING: return "MAPPING";
        case Stage::UNDISTORTION: return "UNDISTORTION";
        case Stage::MASK_PROVISIONING: return "MASK_PROVISIONING";
        case Stage::TRAINING: return "TRAINING";
        case Stage::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int stage_to_int(Stage stage) {
    return static_cast<int>(stage);
}

// Accepts the canonical names case-insensitively, with '-' for '_'.
inline std::optional<Stage> string_to_stage(const std::string& s) {
    std::string norm = s;
    std::transform(norm.begin(), norm.end(), norm.begin(),
                   [](unsigned char c) {
                       return c == '-' ? '_' : static_cast<char>(std::toupper(c));
                   });
    for (int i = 0; i <= stage_to_int(Stage::DONE); ++i) {
        Stage stage = static_cast<Stage>(i);
        if (stage_to_string(stage) == norm) {
            return stage;
        }
    }
    return std::nullopt;
}

// Why a stage (or the run as a whole) did not succeed
enum class FailureKind {
    NONE,
    CONFIGURATION_INVALID,
    PRECONDITION_UNMET,
    LAUNCH_FAILED,
    PROCESS_EXIT_NON_ZERO,
    POSTCONDITION_UNMET,
    PROVISIONING_FAILED,
    INTERNAL_ERROR // unexpected exception inside the run
};

inline std::string failure_kind_to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::NONE: return "None";
        case FailureKind::CONFIGURATION_INVALID: return "ConfigurationInvalid";
        case FailureKind::PRECONDITION_UNMET: return "PreconditionUnmet";
        case FailureKind::LAUNCH_FAILED: return "LaunchFailed";
        case FailureKind::PROCESS_EXIT_NON_ZERO: return "ProcessExitNonZero";
        case FailureKind::POSTCONDITION_UNMET: return "PostconditionUnmet";
        case FailureKind::PROVISIONING_FAILED: return "ProvisioningFailed";
        case FailureKind::INTERNAL_ERROR: return "InternalError";
        default: return "Unknown";
    }
}

} // namespace recon_splat
