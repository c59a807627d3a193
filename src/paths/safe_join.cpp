#include "pathguard/safe_join.hpp"
#include "pathguard/platform.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace pathguard {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool escapes_base(const std::string& segment) {
    return segment[0] == '/' ||
           segment == ".." ||
           starts_with(segment, "../") ||
           ends_with(segment, "/..") ||
           segment.find("/../") != std::string::npos;
}

std::string root_of(const std::string& p) {
    if (starts_with(p, "//") && !starts_with(p, "///")) return "//";
    if (starts_with(p, "/")) return "/";
    return "";
}

std::vector<std::string> meaningful_components(const std::string& p) {
    auto parts = split_components(p);
    parts.erase(std::remove(parts.begin(), parts.end(), "."), parts.end());
    return parts;
}

} // namespace

bool has_component_prefix(const std::string& path, const std::string& base) {
    if (root_of(path) != root_of(base)) {
        return false;
    }
    auto base_parts = meaningful_components(base);
    auto path_parts = meaningful_components(path);
    if (base_parts.size() > path_parts.size()) {
        return false;
    }
    return std::equal(base_parts.begin(), base_parts.end(), path_parts.begin());
}

std::optional<std::string> safe_join(const std::string& base,
                                     const std::vector<std::string>& segments,
                                     const PathPolicy& policy) {
    if (base.empty() && segments.empty()) {
        return std::nullopt;
    }
    if (contains_nul(base) ||
        std::any_of(segments.begin(), segments.end(), contains_nul)) {
        return std::nullopt;
    }

    std::string base_dir = lexically_normalize(to_portable_path(base.empty() ? "." : base));
    if (!policy.check_join_base(base_dir)) {
        spdlog::debug("safe_join: base rejected by {} policy: {}", policy.name(), base);
        return std::nullopt;
    }

    std::vector<std::string> parts;
    for (const auto& raw : segments) {
        if (raw.empty()) {
            continue;
        }
        std::string segment = to_portable_path(raw);

        if (!policy.check_join_component(segment)) {
            spdlog::debug("safe_join: segment rejected by {} policy: {}", policy.name(), raw);
            return std::nullopt;
        }
        if (escapes_base(segment)) {
            spdlog::debug("safe_join: segment escapes base: {}", raw);
            return std::nullopt;
        }

        std::string normalized = lexically_normalize(segment);
        if (normalized == ".") {
            continue;
        }
        parts.push_back(normalized);
    }

    std::string joined = base_dir;
    for (const auto& part : parts) {
        if (joined.back() != '/') joined += '/';
        joined += part;
    }
    joined = lexically_normalize(joined);

    if (!has_component_prefix(joined, base_dir)) {
        spdlog::debug("safe_join: result {} not under {}", joined, base_dir);
        return std::nullopt;
    }
    if (!policy.check_join_result(joined)) {
        spdlog::debug("safe_join: result rejected by {} policy: {}", policy.name(), joined);
        return std::nullopt;
    }

    return joined;
}

} // namespace pathguard
