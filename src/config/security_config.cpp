#include "pathguard/config.hpp"
#include "pathguard/platform.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace pathguard {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

const std::set<std::string>& known_keys() {
    static const std::set<std::string> keys = {
        "$schema", "base_dir", "allowed_dirs", "allowed_dirs_file", "allow_files",
        "allow_lists", "allow_temp_paths", "max_symlink_depth", "max_concurrent_requests",
        "max_filesystem_ops", "max_processing_time_ms", "min_response_time_ms",
        "timing_protection", "security_mode", "log_level",
    };
    return keys;
}

// Each reader leaves `out` untouched when the key is absent and reports a
// type mismatch through `error`.
bool read_string(const nlohmann::json& j, const char* key, std::string& out, std::string& error) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string()) {
        error = std::string(key) + " must be a string";
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

bool read_bool(const nlohmann::json& j, const char* key, bool& out, std::string& error) {
    if (!j.contains(key)) return true;
    if (!j[key].is_boolean()) {
        error = std::string(key) + " must be a boolean";
        return false;
    }
    out = j[key].get<bool>();
    return true;
}

// Limits that gate every resolution must be at least 1; a zero would
// reject all symlinks.
bool read_int(const nlohmann::json& j, const char* key, long long min_value, int& out,
              std::string& error) {
    if (!j.contains(key)) return true;
    if (!j[key].is_number_integer()) {
        error = std::string(key) + " must be an integer";
        return false;
    }
    auto value = j[key].get<long long>();
    if (value < min_value || value > 1000000000LL) {
        error = std::string(key) + " out of range";
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

bool read_string_array(const nlohmann::json& j, const char* key, std::vector<std::string>& out,
                       std::string& error) {
    if (!j.contains(key)) return true;
    if (!j[key].is_array()) {
        error = std::string(key) + " must be an array of strings";
        return false;
    }
    std::vector<std::string> values;
    for (const auto& elem : j[key]) {
        if (!elem.is_string()) {
            error = std::string(key) + " must be an array of strings";
            return false;
        }
        values.push_back(elem.get<std::string>());
    }
    out = std::move(values);
    return true;
}

} // namespace

SecurityConfigParseResult parse_security_config(const std::string& json_str,
                                                const std::string& source_path) {
    SecurityConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        std::string schema;
        if (!j.contains("$schema") || !j["$schema"].is_string()) {
            result.error = "$schema missing";
            return result;
        }
        schema = trim(j["$schema"].get<std::string>());
        if (schema != kConfigSchema) {
            result.error = std::string("$schema mismatch: expected ") + kConfigSchema;
            return result;
        }

        for (auto& [key, val] : j.items()) {
            (void)val;
            if (!known_keys().count(key)) {
                result.warnings.push_back("unknown_key:" + key);
            }
        }

        SecurityConfig& c = result.config;
        std::string& e = result.error;
        if (!read_string(j, "base_dir", c.base_dir, e) ||
            !read_string_array(j, "allowed_dirs", c.allowed_dirs, e) ||
            !read_string(j, "allowed_dirs_file", c.allowed_dirs_file, e) ||
            !read_string_array(j, "allow_files", c.allow_files, e) ||
            !read_string_array(j, "allow_lists", c.allow_lists, e) ||
            !read_bool(j, "allow_temp_paths", c.allow_temp_paths, e) ||
            !read_int(j, "max_symlink_depth", 1, c.max_symlink_depth, e) ||
            !read_int(j, "max_concurrent_requests", 1, c.max_concurrent_requests, e) ||
            !read_int(j, "max_filesystem_ops", 1, c.max_filesystem_ops, e) ||
            !read_int(j, "max_processing_time_ms", 1, c.max_processing_time_ms, e) ||
            !read_int(j, "min_response_time_ms", 0, c.min_response_time_ms, e) ||
            !read_bool(j, "timing_protection", c.timing_protection, e) ||
            !read_string(j, "log_level", c.log_level, e)) {
            return result;
        }

        std::string mode;
        if (!read_string(j, "security_mode", mode, e)) {
            return result;
        }
        if (!mode.empty()) {
            auto parsed = parse_security_mode(mode);
            if (!parsed) {
                result.error = "security_mode must be one of permissive, warn, strict";
                return result;
            }
            c.security_mode = *parsed;
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

SecurityConfigParseResult load_security_config(const std::string& path) {
    auto content = read_file(path);
    if (!content) {
        SecurityConfigParseResult result;
        result.config.source_path = path;
        result.error = "cannot read config file: " + path;
        return result;
    }
    return parse_security_config(*content, path);
}

void apply_environment(SecurityConfig& config) {
    if (auto base = get_env("PATHGUARD_BASE_DIR")) {
        if (!base->empty()) {
            config.base_dir = *base;
        }
    }
    if (auto level = get_env("PATHGUARD_LOG_LEVEL")) {
        if (!level->empty()) {
            config.log_level = *level;
        }
    }
}

SecurityManagerOptions to_manager_options(const SecurityConfig& config) {
    SecurityManagerOptions options;
    options.base_dir = config.base_dir;
    options.allowed_dirs = config.allowed_dirs;
    options.allow_temp_paths = config.allow_temp_paths;
    options.max_symlink_depth = config.max_symlink_depth;
    options.limits.max_concurrent_requests = config.max_concurrent_requests;
    options.limits.max_filesystem_ops = config.max_filesystem_ops;
    options.limits.max_processing_time = std::chrono::milliseconds(config.max_processing_time_ms);
    options.limits.min_response_time = std::chrono::milliseconds(config.min_response_time_ms);
    options.limits.timing_protection = config.timing_protection;
    options.mode = config.security_mode;
    return options;
}

Result<std::unique_ptr<SecurityManager>> build_security_manager(const SecurityConfig& config) {
    using R = Result<std::unique_ptr<SecurityManager>>;

    auto created = SecurityManager::create(to_manager_options(config));
    if (created.isErr()) {
        return created;
    }
    auto manager = std::move(created.value());

    if (!config.allowed_dirs_file.empty()) {
        auto added = manager->add_allowed_dirs_from_file(config.allowed_dirs_file);
        if (added.isErr()) {
            return R::err(added.error());
        }
    }

    auto configured = manager->configure_security_mode(config.security_mode, config.allow_files,
                                                       config.allow_lists);
    if (configured.isErr()) {
        return R::err(configured.error());
    }
    return R::ok(std::move(manager));
}

} // namespace pathguard
