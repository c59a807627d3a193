#pragma once

#include "pathguard/errors.hpp"
#include "pathguard/security_manager.hpp"

#include <string>
#include <vector>

namespace pathguard {

// ============================================================================
// File Collection
// ============================================================================

struct CollectOptions {
    bool recursive = false;
    // Extensions to keep, with or without the leading dot; empty keeps all
    std::vector<std::string> extensions;
};

/**
 * @brief Collect the files of a directory, each one validated by the manager.
 *
 * The directory goes through resolve_path() first. The walk never follows
 * directory symlinks; file entries (regular files and symlinks) are passed
 * to validate_path(), so a symlink is only followed through the resolver.
 * A security error on any entry aborts the collection. Entries that vanish
 * or cannot be read are skipped with a warning. Case spellings recorded
 * during the walk are cleared when it returns.
 *
 * @return Sorted validated paths
 */
Result<std::vector<std::string>> collect_files_from_directory(SecurityManager& manager,
                                                              const std::string& directory,
                                                              const CollectOptions& options = {});

/**
 * @brief Collect the files named in a list file (one path per line, '#'
 * comments). The list file is validated before it is read. Relative entries
 * are taken from the current directory.
 */
Result<std::vector<std::string>> collect_files_from_list(SecurityManager& manager,
                                                         const std::string& list_file);

} // namespace pathguard
