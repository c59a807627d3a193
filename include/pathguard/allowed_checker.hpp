#pragma once

#include <string>
#include <vector>

namespace pathguard {

/**
 * Check whether `path` is equal to, or inside, any of `allowed_dirs`.
 *
 * Both sides are normalized and compared component by component, so
 * "/basement/file" is not inside "/base". A second pass resolves every
 * symlink on both sides and repeats the comparison, so paths the OS has
 * already resolved (e.g. /private/var/... on macOS) are accepted too.
 *
 * Fails closed: a path that cannot be normalized is never allowed, and an
 * allowed directory that cannot be normalized is skipped.
 */
bool is_path_in_allowed_dirs(const std::string& path,
                             const std::vector<std::string>& allowed_dirs,
                             bool case_insensitive = false);

/**
 * Like is_path_in_allowed_dirs(), but the second pass resolves only the
 * parent directories of `path`. A symlink is judged by where it lives, not
 * by where it points.
 */
bool is_location_in_allowed_dirs(const std::string& path,
                                 const std::vector<std::string>& allowed_dirs,
                                 bool case_insensitive = false);

// Normalized, component-wise ancestor-or-equal test for a single directory
bool is_path_under_directory(const std::string& path,
                             const std::string& directory,
                             bool case_insensitive = false);

} // namespace pathguard
