#include "pathguard/allowed_checker.hpp"
#include "pathguard/normalization.hpp"
#include "pathguard/platform.hpp"
#include "pathguard/safe_join.hpp"

#include <filesystem>
#include <optional>

#include <spdlog/spdlog.h>

namespace pathguard {

namespace {

std::optional<std::string> comparison_key(const std::string& path, bool case_insensitive) {
    if (!case_insensitive) {
        return path;
    }
    auto folded = fold_case(path);
    if (folded.isErr()) {
        return std::nullopt;
    }
    return folded.value();
}

bool matches_any(const std::string& key, const std::vector<std::string>& dir_keys) {
    for (const auto& dir : dir_keys) {
        if (has_component_prefix(key, dir)) {
            return true;
        }
    }
    return false;
}

// Resolve every symlink on the way to `path` but keep its final name, so a
// symlink is placed where it lives rather than where it points
std::optional<std::string> resolve_location(const std::string& path) {
    std::filesystem::path p(path);
    if (!p.has_filename()) {
        return resolve_fully(path);
    }
    auto parent = resolve_fully(p.parent_path().string());
    if (!parent) {
        return std::nullopt;
    }
    return to_portable_path((std::filesystem::path(*parent) / p.filename()).string());
}

bool in_dirs(const std::string& path,
             const std::vector<std::string>& allowed_dirs,
             bool case_insensitive,
             bool follow_final) {
    auto normalized = normalize(path);
    if (normalized.isErr()) {
        spdlog::debug("Allowed check failed closed for {}: {}", path,
                      normalized.error().message());
        return false;
    }
    auto key = comparison_key(normalized.value().str(), case_insensitive);
    if (!key) {
        return false;
    }

    std::vector<std::string> dir_paths;
    std::vector<std::string> dir_keys;
    for (const auto& dir : allowed_dirs) {
        auto normalized_dir = normalize(dir);
        if (normalized_dir.isErr()) {
            spdlog::debug("Skipping allowed directory {}: {}", dir,
                          normalized_dir.error().message());
            continue;
        }
        auto dir_key = comparison_key(normalized_dir.value().str(), case_insensitive);
        if (!dir_key) {
            continue;
        }
        dir_paths.push_back(normalized_dir.value().str());
        dir_keys.push_back(*dir_key);
    }

    if (matches_any(*key, dir_keys)) {
        return true;
    }

    // Second pass: compare resolved forms of both sides
    auto resolved = follow_final ? resolve_fully(normalized.value().str())
                                 : resolve_location(normalized.value().str());
    if (!resolved) {
        return false;
    }
    auto resolved_key = comparison_key(*resolved, case_insensitive);
    if (!resolved_key) {
        return false;
    }

    std::vector<std::string> resolved_dir_keys;
    for (const auto& dir : dir_paths) {
        auto resolved_dir = resolve_fully(dir);
        if (!resolved_dir) continue;
        auto dir_key = comparison_key(*resolved_dir, case_insensitive);
        if (dir_key) {
            resolved_dir_keys.push_back(*dir_key);
        }
    }

    return matches_any(*resolved_key, resolved_dir_keys);
}

} // namespace

bool is_path_in_allowed_dirs(const std::string& path,
                             const std::vector<std::string>& allowed_dirs,
                             bool case_insensitive) {
    return in_dirs(path, allowed_dirs, case_insensitive, true);
}

bool is_location_in_allowed_dirs(const std::string& path,
                                 const std::vector<std::string>& allowed_dirs,
                                 bool case_insensitive) {
    return in_dirs(path, allowed_dirs, case_insensitive, false);
}

bool is_path_under_directory(const std::string& path,
                             const std::string& directory,
                             bool case_insensitive) {
    auto normalized = normalize(path);
    auto normalized_dir = normalize(directory);
    if (normalized.isErr() || normalized_dir.isErr()) {
        return false;
    }
    auto key = comparison_key(normalized.value().str(), case_insensitive);
    auto dir_key = comparison_key(normalized_dir.value().str(), case_insensitive);
    return key && dir_key && has_component_prefix(*key, *dir_key);
}

} // namespace pathguard
