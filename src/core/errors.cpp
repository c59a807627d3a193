#include "pathguard/errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <nlohmann/json.hpp>

namespace pathguard {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

const SecurityReason kAllReasons[] = {
    SecurityReason::PATH_TRAVERSAL,
    SecurityReason::UNSAFE_UNICODE,
    SecurityReason::NORMALIZATION_ERROR,
    SecurityReason::CASE_MISMATCH,
    SecurityReason::SYMLINK_LOOP,
    SecurityReason::SYMLINK_ERROR,
    SecurityReason::SYMLINK_TARGET_NOT_ALLOWED,
    SecurityReason::SYMLINK_MAX_DEPTH,
    SecurityReason::SYMLINK_BROKEN,
    SecurityReason::PATH_NOT_IN_BASE,
    SecurityReason::PATH_OUTSIDE_ALLOWED,
    SecurityReason::TEMP_PATHS_NOT_ALLOWED,
    SecurityReason::DIRECTORY_NOT_FOUND,
    SecurityReason::CONFIG_ERROR,
    SecurityReason::ALLOW_LIST_READ_ERROR,
    SecurityReason::FILE_NOT_FOUND,
    SecurityReason::RESOURCE_CONCURRENCY_LIMIT,
    SecurityReason::RESOURCE_OPS_LIMIT,
    SecurityReason::RESOURCE_TIME_LIMIT,
    SecurityReason::BATCH_VALIDATION_FAILED,
};

std::string join_list(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

} // namespace

std::optional<SecurityReason> parse_reason(const std::string& key) {
    std::string lower = to_lower(key);
    for (SecurityReason r : kAllReasons) {
        if (lower == reason_to_string(r)) {
            return r;
        }
    }
    return std::nullopt;
}

ErrorCategory reason_category(SecurityReason r) {
    switch (r) {
        case SecurityReason::RESOURCE_CONCURRENCY_LIMIT:
        case SecurityReason::RESOURCE_OPS_LIMIT:
        case SecurityReason::RESOURCE_TIME_LIMIT:
            return ErrorCategory::Resource;
        case SecurityReason::FILE_NOT_FOUND:
            return ErrorCategory::NotFound;
        case SecurityReason::DIRECTORY_NOT_FOUND:
        case SecurityReason::CONFIG_ERROR:
        case SecurityReason::ALLOW_LIST_READ_ERROR:
            return ErrorCategory::Config;
        default:
            return ErrorCategory::Security;
    }
}

std::string SecurityError::format() const {
    std::ostringstream out;
    out << message_;
    if (!context_.path.empty()) {
        out << "\nPath: " << context_.path;
    }
    out << "\nReason: " << reason_to_string(reason_);

    if (!context_.expanded_path.empty() && context_.expanded_path != context_.path) {
        out << "\nExpanded path: " << context_.expanded_path;
    }
    if (!context_.source.empty() || !context_.target.empty()) {
        out << "\nSymlink: " << context_.source << " -> " << context_.target;
    }
    if (!context_.chain.empty()) {
        out << "\nSymlink chain: " << join_list(context_.chain, " -> ");
    }
    if (context_.max_depth >= 0) {
        out << "\nDepth: " << context_.depth << " (max " << context_.max_depth << ")";
    }
    if (!context_.detail.empty()) {
        out << "\nDetail: " << context_.detail;
    }
    if (!context_.base_dir.empty()) {
        out << "\nBase directory: " << context_.base_dir;
    }
    if (!context_.allowed_dirs.empty()) {
        out << "\nAllowed directories: " << join_list(context_.allowed_dirs, ", ");
    }
    for (const auto& hint : context_.hints) {
        out << "\n" << hint;
    }
    return out.str();
}

nlohmann::json SecurityError::to_json() const {
    nlohmann::json j;
    j["reason"] = reason_to_string(reason_);
    j["category"] = category_to_string(category());
    j["message"] = message_;
    if (!context_.path.empty()) j["path"] = context_.path;
    if (!context_.expanded_path.empty()) j["expanded_path"] = context_.expanded_path;
    if (!context_.base_dir.empty()) j["base_dir"] = context_.base_dir;
    if (!context_.allowed_dirs.empty()) j["allowed_dirs"] = context_.allowed_dirs;
    if (!context_.chain.empty()) j["chain"] = context_.chain;
    if (!context_.source.empty()) j["source"] = context_.source;
    if (!context_.target.empty()) j["target"] = context_.target;
    if (!context_.detail.empty()) j["detail"] = context_.detail;
    if (context_.max_depth >= 0) {
        j["depth"] = context_.depth;
        j["max_depth"] = context_.max_depth;
    }
    if (context_.windows_specific) j["windows_specific"] = true;
    if (!context_.hints.empty()) j["hints"] = context_.hints;
    return j;
}

} // namespace pathguard
