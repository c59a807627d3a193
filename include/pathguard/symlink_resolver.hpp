#pragma once

#include "pathguard/depth_protector.hpp"
#include "pathguard/errors.hpp"
#include "pathguard/normalization.hpp"
#include "pathguard/path_policy.hpp"

#include <string>
#include <vector>

namespace pathguard {

constexpr int kDefaultMaxSymlinkDepth = 16;

// ============================================================================
// Resolver States
// ============================================================================

enum class ResolveState {
    CheckDepth,
    Normalize,
    CheckIsSymlink,
    CheckLoop,
    ReadTarget,
    PlatformValidate,
    CheckExists,
    CheckAllowed,
    Recurse,
    Done,
};

inline const char* resolve_state_to_string(ResolveState s) {
    switch (s) {
        case ResolveState::CheckDepth: return "check_depth";
        case ResolveState::Normalize: return "normalize";
        case ResolveState::CheckIsSymlink: return "check_is_symlink";
        case ResolveState::CheckLoop: return "check_loop";
        case ResolveState::ReadTarget: return "read_target";
        case ResolveState::PlatformValidate: return "platform_validate";
        case ResolveState::CheckExists: return "check_exists";
        case ResolveState::CheckAllowed: return "check_allowed";
        case ResolveState::Recurse: return "recurse";
        case ResolveState::Done: return "done";
        default: return "unknown";
    }
}

// ============================================================================
// Resolution
// ============================================================================

/**
 * @brief Follow a symlink chain to its final target.
 *
 * Each hop runs, in this order:
 *   1. depth >= max_depth                     -> SYMLINK_MAX_DEPTH
 *   2. normalize; not a symlink               -> success (idempotent)
 *   3. readlink-only walk of the remaining chain, a revisit -> SYMLINK_LOOP
 *   4. read the target (relative targets are taken from the link's
 *      directory); an OS error                -> SYMLINK_ERROR
 *   5. platform policy check of the target    -> SYMLINK_ERROR (windows_specific)
 *   6. target exists                          -> else SYMLINK_BROKEN
 *   7. target inside allowed_dirs             -> else SYMLINK_TARGET_NOT_ALLOWED
 *   8. continue at depth + 1
 *
 * Loop detection never looks at existence, so a cycle whose members all
 * report as missing is still classified as a loop.
 *
 * @param request  Budget to charge for every filesystem operation, or nullptr
 *                 to resolve without limits.
 */
Result<NormalizedPath> resolve_symlink(const std::string& path,
                                       int max_depth,
                                       const std::vector<std::string>& allowed_dirs,
                                       ResolutionRequest* request = nullptr,
                                       const PathPolicy& policy = host_path_policy());

} // namespace pathguard
