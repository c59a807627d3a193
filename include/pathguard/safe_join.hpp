#pragma once

#include "pathguard/path_policy.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pathguard {

/**
 * Join untrusted path segments onto a trusted base directory.
 *
 * Returns nullopt (reject) when:
 *   - the base is empty and there are no segments, or anything contains NUL
 *   - a segment is absolute, is "..", starts with "../", ends with "/.." or
 *     contains "/../"
 *   - the policy rejects the base, a segment, or the joined result
 *     (Windows: device paths, drive-relative paths, reserved names,
 *     alternate data streams, UNC paths)
 *   - the joined path does not keep the normalized base as a prefix
 *
 * Segments are lexically normalized; empty and "." segments are skipped.
 * The result uses forward slashes. It never touches the filesystem and does
 * not resolve symlinks. Callers must treat nullopt as a rejection and never
 * fall back to the raw input.
 */
std::optional<std::string> safe_join(const std::string& base,
                                     const std::vector<std::string>& segments,
                                     const PathPolicy& policy = host_path_policy());

// True if every component of `base` matches the leading components of `path`
bool has_component_prefix(const std::string& path, const std::string& base);

} // namespace pathguard
