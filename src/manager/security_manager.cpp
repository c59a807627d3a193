#include "pathguard/security_manager.hpp"
#include "pathguard/allowed_checker.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

namespace pathguard {

namespace {

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += "\n";
        out += lines[i];
    }
    return out;
}

} // namespace

std::optional<SecurityMode> parse_security_mode(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "permissive") return SecurityMode::Permissive;
    if (lower == "warn") return SecurityMode::Warn;
    if (lower == "strict") return SecurityMode::Strict;
    return std::nullopt;
}

// ============================================================================
// Construction
// ============================================================================

SecurityManager::SecurityManager(std::string base_dir, const SecurityManagerOptions& options,
                                 std::string temp_dir)
    : base_dir_(std::move(base_dir)),
      allow_temp_paths_(options.allow_temp_paths),
      temp_dir_(std::move(temp_dir)),
      max_symlink_depth_(options.max_symlink_depth),
      mode_(options.mode),
      policy_(options.policy ? options.policy : &host_path_policy()),
      protector_(options.limits) {
    allowed_dirs_.push_back(base_dir_);
}

Result<std::unique_ptr<SecurityManager>> SecurityManager::create(const SecurityManagerOptions& options) {
    using R = Result<std::unique_ptr<SecurityManager>>;

    auto base = normalize(options.base_dir);
    if (base.isErr()) {
        return R::err(base.error().withContext("base directory"));
    }
    if (!is_directory(base.value().str())) {
        SecurityErrorContext ctx;
        ctx.path = options.base_dir;
        ctx.expanded_path = base.value().str();
        return R::err(SecurityError(SecurityReason::DIRECTORY_NOT_FOUND,
                                    "Base directory not found: " + options.base_dir,
                                    std::move(ctx)));
    }

    std::string temp_dir;
    std::string raw_temp = options.temp_dir.empty() ? get_temp_directory() : options.temp_dir;
    if (!raw_temp.empty()) {
        auto t = normalize(raw_temp);
        if (t.isOk()) {
            temp_dir = t.value().str();
        } else {
            spdlog::warn("Ignoring temporary directory {}: {}", raw_temp, t.error().message());
        }
    }

    auto manager = std::unique_ptr<SecurityManager>(
        new SecurityManager(base.value().str(), options, std::move(temp_dir)));

    for (const auto& dir : options.allowed_dirs) {
        auto added = manager->add_allowed_directory(dir);
        if (added.isErr()) {
            return R::err(added.error());
        }
    }

    spdlog::debug("Security manager ready: base {} ({} allowed dirs, temp {}, mode {})",
                  manager->base_dir_, manager->allowed_dirs_.size(),
                  manager->allow_temp_paths_ ? "on" : "off",
                  security_mode_to_string(manager->mode_));
    return R::ok(std::move(manager));
}

// ============================================================================
// Trust boundary
// ============================================================================

std::vector<std::string> SecurityManager::allowed_dirs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return allowed_dirs_;
}

Result<void> SecurityManager::add_allowed_directory(const std::string& dir) {
    auto n = normalize(dir);
    if (n.isErr()) {
        return Result<void>::err(n.error().withContext("allowed directory"));
    }
    if (!is_directory(n.value().str())) {
        SecurityErrorContext ctx;
        ctx.path = dir;
        ctx.expanded_path = n.value().str();
        return Result<void>::err(SecurityError(SecurityReason::DIRECTORY_NOT_FOUND,
                                               "Allowed directory not found: " + dir,
                                               std::move(ctx)));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(allowed_dirs_.begin(), allowed_dirs_.end(), n.value().str()) == allowed_dirs_.end()) {
        allowed_dirs_.push_back(n.value().str());
        spdlog::debug("Added allowed directory {}", n.value().str());
    }
    return Result<void>::ok();
}

Result<void> SecurityManager::add_allowed_dirs_from_file(const std::string& file) {
    auto checked = validate_path(file);
    if (checked.isErr()) {
        return Result<void>::err(checked.error().withContext("allowed directories file"));
    }

    auto lines = read_list_file(checked.value());
    if (!lines.ok) {
        SecurityErrorContext ctx;
        ctx.path = file;
        ctx.detail = lines.error;
        return Result<void>::err(SecurityError(SecurityReason::ALLOW_LIST_READ_ERROR,
                                               "Cannot read allowed directories file: " + file,
                                               std::move(ctx)));
    }

    for (const auto& line : lines.lines) {
        auto added = add_allowed_directory(line);
        if (added.isErr()) {
            return added;
        }
    }
    return Result<void>::ok();
}

bool SecurityManager::in_allowed_dirs(const std::string& path) const {
    return is_path_in_allowed_dirs(path, allowed_dirs(), policy_->is_case_insensitive());
}

bool SecurityManager::in_temp_dir(const std::string& path) const {
    if (temp_dir_.empty()) {
        return false;
    }
    return is_path_in_allowed_dirs(path, {temp_dir_}, policy_->is_case_insensitive());
}

bool SecurityManager::link_location_allowed(const std::string& path) const {
    bool ci = policy_->is_case_insensitive();
    if (is_location_in_allowed_dirs(path, allowed_dirs(), ci)) {
        return true;
    }
    return allow_temp_paths_ && !temp_dir_.empty() && is_location_in_allowed_dirs(path, {temp_dir_}, ci);
}

bool SecurityManager::is_temp_path(const std::string& path) const {
    return allow_temp_paths_ && in_temp_dir(path);
}

bool SecurityManager::is_path_allowed(const std::string& path) const {
    auto n = normalize(path);
    if (n.isErr()) {
        spdlog::debug("Path not allowed, normalization failed: {}", path);
        return false;
    }
    if (in_allowed_dirs(n.value().str())) {
        return true;
    }
    return is_temp_path(n.value().str());
}

std::vector<std::string> SecurityManager::resolution_dirs() const {
    std::vector<std::string> dirs = allowed_dirs();
    if (allow_temp_paths_ && !temp_dir_.empty()) {
        dirs.push_back(temp_dir_);
    }
    return dirs;
}

SecurityError SecurityManager::outside_allowed_error(const std::string& path,
                                                     const std::string& expanded) const {
    SecurityErrorContext ctx;
    ctx.path = path;
    ctx.expanded_path = expanded;
    ctx.base_dir = base_dir_;
    ctx.allowed_dirs = allowed_dirs();
    ctx.hints.push_back("Use --allowed-dir to add more allowed directories");
    return SecurityError(SecurityReason::PATH_OUTSIDE_ALLOWED,
                         "Access denied: " + path + " is outside base directory and not in allowed directories",
                         std::move(ctx));
}

// ============================================================================
// Validation
// ============================================================================

void SecurityManager::record_case(const NormalizedPath& path) {
    if (!policy_->is_case_insensitive()) {
        return;
    }
    auto folded = fold_case(path.str());
    if (folded.isOk()) {
        cases_.set_original_case(folded.value(), path.str());
    }
}

std::string SecurityManager::original_case(const std::string& path) const {
    auto folded = fold_case(path);
    if (folded.isErr()) {
        return path;
    }
    std::string original = cases_.get_original_case(folded.value());
    return original == folded.value() ? path : original;
}

Result<NormalizedPath> SecurityManager::resolve_with_protector(const std::string& path) {
    auto request = protector_.acquire();
    if (request.isErr()) {
        return Result<NormalizedPath>::err(request.error());
    }
    auto resolved = resolve_symlink(path, max_symlink_depth_, resolution_dirs(),
                                     &request.value(), *policy_);
    request.value().release();
    return resolved;
}

Result<void> SecurityManager::check_resolved_containment(const std::string& path,
                                                         const std::string& original) const {
    auto real = resolve_fully(path);
    if (!real) {
        SecurityErrorContext ctx;
        ctx.path = original;
        ctx.expanded_path = path;
        return Result<void>::err(SecurityError(SecurityReason::SYMLINK_ERROR,
                                               "Symlink security violation: cannot resolve " + original,
                                               std::move(ctx)));
    }
    if (in_allowed_dirs(*real) || (allow_temp_paths_ && in_temp_dir(*real))) {
        return Result<void>::ok();
    }

    spdlog::warn("Path escapes allowed directories through a symlink: {} -> {}", original, *real);
    SecurityError error = outside_allowed_error(original, path);
    error.context().detail = "resolves to " + *real;
    error.context().target = *real;
    return Result<void>::err(error);
}

Result<std::string> SecurityManager::check_path(const std::string& path, bool compat) {
    using R = Result<std::string>;

    auto n = normalize(path);
    if (n.isErr()) {
        spdlog::warn("Rejected {}: {}", path, n.error().message());
        return R::err(n.error());
    }
    const NormalizedPath& normalized = n.value();
    record_case(normalized);

    // Plain temp files skip the boundary checks in compat mode; temp symlinks
    // are resolved like any other
    if (compat && is_temp_path(normalized.str()) && !is_symlink(normalized.str())) {
        auto contained = check_resolved_containment(normalized.str(), path);
        if (contained.isErr()) {
            return R::err(contained.error());
        }
        if (!path_exists(normalized.str())) {
            return R::err(make_error(SecurityReason::FILE_NOT_FOUND,
                                     "File not found: " + path, path));
        }
        return R::ok(normalized.str());
    }

    std::string candidate = normalized.str();

    if (is_symlink(normalized.str())) {
        auto resolved = resolve_with_protector(normalized.str());
        if (resolved.isErr()) {
            SecurityError error = resolved.error();
            if (error.context().path.empty()) {
                error.context().path = path;
            }
            if (compat && error.reason() == SecurityReason::SYMLINK_BROKEN) {
                SecurityErrorContext ctx = error.context();
                return R::err(SecurityError(SecurityReason::FILE_NOT_FOUND,
                                            "Broken symlink: " + ctx.source + " -> " + ctx.target,
                                            std::move(ctx)));
            }
            return R::err(error);
        }
        if (!link_location_allowed(normalized.str())) {
            spdlog::warn("Symlink location not allowed: {}", path);
            return R::err(outside_allowed_error(path, normalized.str()));
        }
        candidate = resolved.value().str();
    } else {
        if (has_traversal_segment(normalized.str())) {
            return R::err(make_error(SecurityReason::PATH_TRAVERSAL,
                                     "Directory traversal not allowed", path));
        }
        if (has_suspicious_unicode(normalized.str())) {
            return R::err(make_error(SecurityReason::UNSAFE_UNICODE,
                                     "Path contains unsafe characters", path));
        }
        if (!in_allowed_dirs(normalized.str())) {
            if (in_temp_dir(normalized.str())) {
                if (!allow_temp_paths_) {
                    spdlog::warn("Temporary path rejected: {}", path);
                    SecurityErrorContext ctx;
                    ctx.path = path;
                    ctx.expanded_path = normalized.str();
                    ctx.hints.push_back("Use --allow-temp to permit temporary files");
                    return R::err(SecurityError(SecurityReason::TEMP_PATHS_NOT_ALLOWED,
                                                "Access to temporary files is not allowed: " + path,
                                                std::move(ctx)));
                }
            } else {
                spdlog::warn("Path outside allowed directories: {}", path);
                return R::err(outside_allowed_error(path, normalized.str()));
            }
        }
    }

    auto contained = check_resolved_containment(candidate, path);
    if (contained.isErr()) {
        return R::err(contained.error());
    }

    if (!path_exists(candidate)) {
        return R::err(make_error(SecurityReason::FILE_NOT_FOUND,
                                 "File not found: " + path, path));
    }

    spdlog::debug("Validated {} -> {}", path, candidate);
    return R::ok(candidate);
}

Result<std::string> SecurityManager::validate_path(const std::string& path) {
    return check_path(path, false);
}

Result<std::string> SecurityManager::resolve_path(const std::string& path) {
    return check_path(path, true);
}

// ============================================================================
// Allow-lists and file pinning
// ============================================================================

bool SecurityManager::pin_file_by_inode(const std::string& file) {
    auto n = normalize(file);
    if (n.isErr()) {
        spdlog::warn("Cannot pin {}: {}", file, n.error().message());
        return false;
    }

    auto opened = open_file_identity(n.value().str());
    if (!opened.ok) {
        if (opened.refused_symlink) {
            spdlog::warn("Refusing to pin symlink {}", file);
        } else {
            spdlog::warn("Cannot pin {}: {}", file, opened.error);
        }
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    pinned_files_.insert(opened.identity);
    spdlog::debug("Pinned {} (dev {}, ino {})", file, opened.identity.device, opened.identity.inode);
    return true;
}

bool SecurityManager::is_file_allowed_by_inode(const std::string& file) const {
    auto identity = get_file_identity(file);
    if (!identity) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return pinned_files_.count(*identity) > 0;
}

Result<void> SecurityManager::load_allow_list(const std::string& file) {
    auto n = normalize(file);
    if (n.isErr()) {
        return Result<void>::err(n.error().withContext("allow-list"));
    }
    if (!path_exists(n.value().str())) {
        SecurityErrorContext ctx;
        ctx.path = file;
        ctx.expanded_path = n.value().str();
        return Result<void>::err(SecurityError(SecurityReason::DIRECTORY_NOT_FOUND,
                                               "Allow-list file not found: " + file,
                                               std::move(ctx)));
    }

    auto lines = read_list_file(n.value().str());
    if (!lines.ok) {
        SecurityErrorContext ctx;
        ctx.path = file;
        ctx.detail = lines.error;
        return Result<void>::err(SecurityError(SecurityReason::ALLOW_LIST_READ_ERROR,
                                               "Cannot read allow-list: " + file,
                                               std::move(ctx)));
    }

    for (const auto& entry : lines.lines) {
        if (is_directory(entry)) {
            auto added = add_allowed_directory(entry);
            if (added.isErr()) {
                spdlog::warn("Skipping allow-list entry {}: {}", entry, added.error().message());
            }
        } else if (is_regular_file(entry)) {
            pin_file_by_inode(entry);
        } else {
            spdlog::warn("Allow-list entry is neither a directory nor a file: {}", entry);
        }
    }
    return Result<void>::ok();
}

// ============================================================================
// Security modes
// ============================================================================

SecurityMode SecurityManager::security_mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_;
}

void SecurityManager::set_security_mode(SecurityMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    mode_ = mode;
}

SecurityState SecurityManager::save_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SecurityState state;
    state.mode = mode_;
    state.allowed_dirs = allowed_dirs_;
    state.pinned_files = pinned_files_;
    return state;
}

void SecurityManager::restore_state(SecurityState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    mode_ = state.mode;
    allowed_dirs_ = std::move(state.allowed_dirs);
    pinned_files_ = std::move(state.pinned_files);
}

SecurityContextScope SecurityManager::security_context(SecurityMode mode,
                                                       const std::vector<std::string>& additional_dirs) {
    SecurityContextScope scope(*this, save_state());

    set_security_mode(mode);
    for (const auto& dir : additional_dirs) {
        auto added = add_allowed_directory(dir);
        if (added.isErr()) {
            spdlog::warn("Failed to add temporary directory {}: {}", dir, added.error().message());
        } else {
            spdlog::debug("Temporarily added directory {}", dir);
        }
    }

    spdlog::debug("Entered security context: mode {}, {} additional dirs",
                  security_mode_to_string(mode), additional_dirs.size());
    return scope;
}

SecurityContextScope::~SecurityContextScope() {
    if (manager_) {
        SecurityMode mode = saved_.mode;
        manager_->restore_state(std::move(saved_));
        spdlog::debug("Restored security context: mode {}", security_mode_to_string(mode));
    }
}

Result<void> SecurityManager::configure_security_mode(SecurityMode mode,
                                                      const std::vector<std::string>& allow_files,
                                                      const std::vector<std::string>& allow_lists) {
    set_security_mode(mode);

    for (const auto& file : allow_files) {
        if (!pin_file_by_inode(file)) {
            spdlog::warn("Could not add {} to the file allowlist", file);
        }
    }
    for (const auto& list : allow_lists) {
        auto loaded = load_allow_list(list);
        if (loaded.isErr()) {
            return loaded;
        }
    }

    spdlog::debug("Security mode set to {}", security_mode_to_string(mode));
    return Result<void>::ok();
}

Result<bool> SecurityManager::is_path_allowed_enhanced(const std::string& path) const {
    if (is_file_allowed_by_inode(path)) {
        return Result<bool>::ok(true);
    }
    if (is_path_allowed(path)) {
        return Result<bool>::ok(true);
    }

    switch (security_mode()) {
        case SecurityMode::Permissive:
            spdlog::debug("Permissive mode: allowing {}", path);
            return Result<bool>::ok(true);
        case SecurityMode::Warn:
            spdlog::warn("Accessing file outside allowed directories: {}", path);
            return Result<bool>::ok(true);
        case SecurityMode::Strict:
        default: {
            SecurityError error = outside_allowed_error(path, path);
            return Result<bool>::err(SecurityError(SecurityReason::PATH_OUTSIDE_ALLOWED,
                                                   "Path not in allowlist: " + path,
                                                   error.context()));
        }
    }
}

Result<std::string> SecurityManager::validate_file_access(const std::string& path,
                                                          const std::string& context) {
    using R = Result<std::string>;

    std::string resolved;
    auto n = normalize(path);
    if (n.isErr()) {
        if (n.error().reason() == SecurityReason::PATH_TRAVERSAL && is_file_allowed_by_inode(path)) {
            auto real = resolve_fully(path);
            if (!real) {
                return R::err(make_error(SecurityReason::FILE_NOT_FOUND,
                                         "File not found: " + path, path));
            }
            resolved = *real;
        } else {
            return R::err(n.error().withContext(context));
        }
    } else {
        auto real = resolve_fully(n.value().str());
        resolved = real ? *real : n.value().str();
    }

    if (!path_exists(resolved)) {
        return R::err(make_error(SecurityReason::FILE_NOT_FOUND, "File not found: " + path, path));
    }

    auto allowed = is_path_allowed_enhanced(resolved);
    if (allowed.isErr()) {
        return R::err(allowed.error().withContext(context));
    }
    return R::ok(resolved);
}

Result<std::vector<std::string>> SecurityManager::validate_batch_access(
    const std::vector<std::string>& paths, const std::string& context) {
    using R = Result<std::vector<std::string>>;

    std::vector<std::string> valid;
    std::vector<std::string> errors;
    for (const auto& path : paths) {
        auto checked = validate_file_access(path, context);
        if (checked.isOk()) {
            valid.push_back(checked.value());
        } else {
            errors.push_back(path + ": " + checked.error().message());
        }
    }

    if (errors.empty()) {
        return R::ok(valid);
    }

    if (security_mode() == SecurityMode::Strict) {
        SecurityErrorContext ctx;
        ctx.detail = join_lines(errors);
        return R::err(SecurityError(SecurityReason::BATCH_VALIDATION_FAILED,
                                    "Batch validation failed for " + std::to_string(errors.size()) +
                                        " of " + std::to_string(paths.size()) + " paths",
                                    std::move(ctx)));
    }

    for (const auto& e : errors) {
        spdlog::warn("{}: {}", context, e);
    }
    return R::ok(valid);
}

} // namespace pathguard
