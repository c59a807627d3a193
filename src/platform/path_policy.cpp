#include "pathguard/path_policy.hpp"
#include "pathguard/platform.hpp"
#include "pathguard/windows_paths.hpp"

#include <algorithm>

namespace pathguard {

namespace {

bool any_reserved_component(const std::string& path) {
    auto parts = split_components(path);
    return std::any_of(parts.begin(), parts.end(), is_reserved_name);
}

} // namespace

// ============================================================================
// POSIX
// ============================================================================

std::optional<std::string> PosixPathPolicy::validate(const std::string&) const {
    return std::nullopt;
}

bool PosixPathPolicy::check_join_base(const std::string&) const {
    return true;
}

bool PosixPathPolicy::check_join_component(const std::string&) const {
    return true;
}

bool PosixPathPolicy::check_join_result(const std::string&) const {
    return true;
}

// ============================================================================
// Windows
// ============================================================================

std::optional<std::string> WindowsPathPolicy::validate(const std::string& path) const {
    return validate_windows_path(path);
}

bool WindowsPathPolicy::check_join_base(const std::string& base) const {
    if (is_device_path(base) || is_drive_relative_path(base)) {
        return false;
    }
    if (any_reserved_component(base) || has_alternate_data_stream(base)) {
        return false;
    }
    // A UNC base must name both server and share
    if (base.size() > 2 && base[0] == '/' && base[1] == '/' && base[2] != '/') {
        if (std::count(base.begin(), base.end(), '/') < 3) {
            return false;
        }
    }
    return true;
}

bool WindowsPathPolicy::check_join_component(const std::string& segment) const {
    if (is_device_path(segment) || is_drive_relative_path(segment)) {
        return false;
    }
    // "C:/x" is absolute on Windows
    if (segment.size() >= 2 && segment[1] == ':') {
        return false;
    }
    if (any_reserved_component(segment) || has_alternate_data_stream(segment)) {
        return false;
    }
    return !is_unc_path(segment) && !is_incomplete_unc_path(segment);
}

bool WindowsPathPolicy::check_join_result(const std::string& joined) const {
    return !has_alternate_data_stream(joined) && !any_reserved_component(joined);
}

// ============================================================================
// Selection
// ============================================================================

const PathPolicy& posix_path_policy() {
    static const PosixPathPolicy policy;
    return policy;
}

const PathPolicy& windows_path_policy() {
    static const WindowsPathPolicy policy{};
    return policy;
}

const PathPolicy& host_path_policy() {
    switch (get_current_platform()) {
        case Platform::Windows:
            return windows_path_policy();
        case Platform::macOS: {
            static const PosixPathPolicy mac_policy(true);
            return mac_policy;
        }
        default:
            return posix_path_policy();
    }
}

} // namespace pathguard
