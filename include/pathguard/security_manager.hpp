#pragma once

/**
 * @file security_manager.hpp
 * @brief Path access decisions over one base directory and a set of
 *        allowed directories
 *
 * SecurityManager composes the normalizer, the allowed-directory checker,
 * the symlink resolver and the resolution protector. Every path a user names
 * goes through validate_path() (or resolve_path()) before it is read.
 *
 * @example
 * ```cpp
 * pathguard::SecurityManagerOptions options;
 * options.base_dir = "/repo";
 * options.allowed_dirs = {"/shared"};
 *
 * auto created = pathguard::SecurityManager::create(options);
 * if (created.isErr()) { ... }
 * auto& manager = created.value();
 *
 * auto checked = manager->validate_path("/shared/doc.txt");
 * if (checked.isOk()) {
 *     // read checked.value()
 * }
 * ```
 */

#include "pathguard/case_manager.hpp"
#include "pathguard/depth_protector.hpp"
#include "pathguard/errors.hpp"
#include "pathguard/normalization.hpp"
#include "pathguard/path_policy.hpp"
#include "pathguard/platform.hpp"
#include "pathguard/symlink_resolver.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pathguard {

// ============================================================================
// Security Mode
// ============================================================================

// How paths outside every allow rule are treated by the file-access checks
enum class SecurityMode {
    Permissive,  // allowed silently
    Warn,        // allowed, logged as a warning
    Strict,      // rejected
};

inline const char* security_mode_to_string(SecurityMode m) {
    switch (m) {
        case SecurityMode::Permissive: return "permissive";
        case SecurityMode::Warn: return "warn";
        case SecurityMode::Strict: return "strict";
        default: return "warn";
    }
}

std::optional<SecurityMode> parse_security_mode(const std::string& s);

// ============================================================================
// Options
// ============================================================================

struct SecurityManagerOptions {
    std::string base_dir;                    // empty: current working directory
    std::vector<std::string> allowed_dirs;
    bool allow_temp_paths = false;
    std::string temp_dir;                    // empty: system temporary directory
    int max_symlink_depth = kDefaultMaxSymlinkDepth;
    ProtectorLimits limits;
    SecurityMode mode = SecurityMode::Warn;
    const PathPolicy* policy = nullptr;      // nullptr: host_path_policy()
};

class SecurityManager;

/**
 * @brief Clears the manager's case-preservation state when it goes out of
 * scope, on every exit path.
 */
class SymlinkScope {
public:
    explicit SymlinkScope(CaseManager& cases) : cases_(&cases) {}
    SymlinkScope(SymlinkScope&& other) noexcept : cases_(other.cases_) { other.cases_ = nullptr; }
    SymlinkScope(const SymlinkScope&) = delete;
    SymlinkScope& operator=(const SymlinkScope&) = delete;
    SymlinkScope& operator=(SymlinkScope&&) = delete;

    ~SymlinkScope() {
        if (cases_) cases_->clear();
    }

private:
    CaseManager* cases_;
};

/// Mode, allowed directories and pinned files, as saved by a SecurityContextScope
struct SecurityState {
    SecurityMode mode = SecurityMode::Warn;
    std::vector<std::string> allowed_dirs;
    std::set<FileIdentity> pinned_files;
};

/**
 * @brief Restores a manager's mode, allowed directories and pinned files
 * when it goes out of scope, on every exit path.
 *
 * Obtained from SecurityManager::security_context(). The manager must
 * outlive the scope.
 */
class SecurityContextScope {
public:
    SecurityContextScope(SecurityManager& manager, SecurityState saved)
        : manager_(&manager), saved_(std::move(saved)) {}
    SecurityContextScope(SecurityContextScope&& other) noexcept
        : manager_(other.manager_), saved_(std::move(other.saved_)) {
        other.manager_ = nullptr;
    }
    SecurityContextScope(const SecurityContextScope&) = delete;
    SecurityContextScope& operator=(const SecurityContextScope&) = delete;
    SecurityContextScope& operator=(SecurityContextScope&&) = delete;

    ~SecurityContextScope();

private:
    SecurityManager* manager_;
    SecurityState saved_;
};

// ============================================================================
// SecurityManager
// ============================================================================

class SecurityManager {
public:
    /**
     * @brief Create a manager for a base directory
     * @return The manager, or DIRECTORY_NOT_FOUND if the base directory or any
     *         allowed directory is not an existing directory
     */
    static Result<std::unique_ptr<SecurityManager>> create(const SecurityManagerOptions& options);

    SecurityManager(const SecurityManager&) = delete;
    SecurityManager& operator=(const SecurityManager&) = delete;

    const std::string& base_dir() const { return base_dir_; }
    std::vector<std::string> allowed_dirs() const;
    const std::string& temp_dir() const { return temp_dir_; }
    bool allow_temp_paths() const { return allow_temp_paths_; }
    int max_symlink_depth() const { return max_symlink_depth_; }
    const PathPolicy& policy() const { return *policy_; }

    // ------------------------------------------------------------------------
    // Trust boundary
    // ------------------------------------------------------------------------

    /// Add an existing directory to the boundary; adding one twice is a no-op.
    /// Call during setup, before paths are validated concurrently.
    Result<void> add_allowed_directory(const std::string& dir);

    /// Add every directory listed in a text file (one per line, '#' comments).
    /// The list file itself must pass validate_path().
    Result<void> add_allowed_dirs_from_file(const std::string& file);

    /// True if temp paths are enabled and `path` is inside the temp directory
    bool is_temp_path(const std::string& path) const;

    /// Normalized membership in the allowed directories (or the temp
    /// directory when enabled). Never throws, fails closed.
    bool is_path_allowed(const std::string& path) const;

    // ------------------------------------------------------------------------
    // Validation
    // ------------------------------------------------------------------------

    /**
     * @brief Validate a user-supplied path for reading
     *
     * Symlinks are resolved under the protector's budgets. Other paths are
     * re-checked for traversal and suspicious characters, then for boundary
     * membership. Existence is checked last, so a path outside the boundary
     * reports PATH_OUTSIDE_ALLOWED whether or not it exists.
     *
     * @return The validated (symlink-resolved) path
     */
    Result<std::string> validate_path(const std::string& path);

    /**
     * @brief Like validate_path(), for callers that expect plain not-found
     * errors: a broken symlink reports FILE_NOT_FOUND. Loops and depth
     * overruns stay security errors. Temp files pass when enabled, as long
     * as they do not reach outside through a symlink.
     */
    Result<std::string> resolve_path(const std::string& path);

    /// Scope guard clearing the case-preservation map on exit
    SymlinkScope symlink_scope() { return SymlinkScope(cases_); }

    /// Original spelling recorded for a path on case-insensitive platforms
    std::string original_case(const std::string& path) const;
    size_t case_entries() const { return cases_.size(); }

    // ------------------------------------------------------------------------
    // Allow-lists and file pinning
    // ------------------------------------------------------------------------

    /// Pin a file by (device, inode), opened without following a final symlink
    bool pin_file_by_inode(const std::string& file);

    /// True if `file` (not following a final symlink) is a pinned file
    bool is_file_allowed_by_inode(const std::string& file) const;

    /// Load an allow-list: directories are added to the boundary, regular
    /// files are pinned, anything else is logged and skipped.
    Result<void> load_allow_list(const std::string& file);

    // ------------------------------------------------------------------------
    // Security modes
    // ------------------------------------------------------------------------

    SecurityMode security_mode() const;
    void set_security_mode(SecurityMode mode);

    /// Set the mode, pin individual files and load allow-list files
    Result<void> configure_security_mode(SecurityMode mode,
                                         const std::vector<std::string>& allow_files = {},
                                         const std::vector<std::string>& allow_lists = {});

    /**
     * @brief Switch to `mode` and add `additional_dirs` until the returned
     * scope ends. Directories that cannot be added are logged and skipped.
     *
     * @code
     * {
     *     auto scope = manager->security_context(SecurityMode::Permissive);
     *     auto r = manager->validate_file_access(file);
     * } // previous mode, directories and pinned files restored
     * @endcode
     */
    SecurityContextScope security_context(SecurityMode mode,
                                          const std::vector<std::string>& additional_dirs = {});

    /// Pinned files, then the directory rules, then the mode decides
    Result<bool> is_path_allowed_enhanced(const std::string& path) const;

    /// Normalize, resolve, require existence, then apply is_path_allowed_enhanced()
    Result<std::string> validate_file_access(const std::string& path,
                                             const std::string& context = "file access");

    /// validate_file_access() for each path. Strict mode fails the whole batch
    /// with BATCH_VALIDATION_FAILED; other modes log failures and return the
    /// valid subset.
    Result<std::vector<std::string>> validate_batch_access(const std::vector<std::string>& paths,
                                                           const std::string& context = "batch access");

    /// Resolution admission control and metrics
    SymlinkDepthProtector& protector() { return protector_; }
    const SymlinkDepthProtector& protector() const { return protector_; }

private:
    friend class SecurityContextScope;

    SecurityManager(std::string base_dir, const SecurityManagerOptions& options, std::string temp_dir);

    Result<std::string> check_path(const std::string& path, bool compat);
    Result<NormalizedPath> resolve_with_protector(const std::string& path);
    Result<void> check_resolved_containment(const std::string& path, const std::string& original) const;

    bool in_allowed_dirs(const std::string& path) const;
    bool in_temp_dir(const std::string& path) const;
    bool link_location_allowed(const std::string& path) const;
    std::vector<std::string> resolution_dirs() const;
    void record_case(const NormalizedPath& path);
    SecurityState save_state() const;
    void restore_state(SecurityState state);
    SecurityError outside_allowed_error(const std::string& path, const std::string& expanded) const;

    std::string base_dir_;
    std::vector<std::string> allowed_dirs_;
    bool allow_temp_paths_;
    std::string temp_dir_;
    int max_symlink_depth_;
    SecurityMode mode_;
    const PathPolicy* policy_;

    SymlinkDepthProtector protector_;
    CaseManager cases_;
    std::set<FileIdentity> pinned_files_;
    mutable std::mutex mutex_;
};

} // namespace pathguard
