/**
 * pathguard CLI - Common utilities and types
 */

#pragma once

#include <pathguard/pathguard.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace pathguard::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;                       // --config
    std::string base_dir;                     // --base-dir
    std::vector<std::string> allowed_dirs;    // --allowed-dir (repeatable)
    std::string allowed_dirs_file;            // --allowed-dirs-file
    std::vector<std::string> allow_files;     // --allow-file (repeatable)
    std::vector<std::string> allow_lists;     // --allow-list (repeatable)
    bool allow_temp = false;                  // --allow-temp
    std::string mode;                         // --mode
    bool json = false;                        // --json
    bool verbose = false;                     // -v, --verbose
    bool quiet = false;                       // -q, --quiet
};

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_security_error(const SecurityError& error, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = error.to_json();
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << error.format() << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Logger level: -v, then -q, then the configured level; default warn.
 */
inline void configure_logging(const GlobalOptions& opts, const std::string& configured_level) {
    spdlog::level::level_enum level = spdlog::level::warn;
    if (opts.verbose) {
        level = spdlog::level::debug;
    } else if (opts.quiet) {
        level = spdlog::level::err;
    } else if (!configured_level.empty()) {
        level = spdlog::level::from_str(configured_level);
    }
    spdlog::set_level(level);
}

/**
 * Assemble the effective configuration.
 * Precedence: defaults < --config file < environment < command-line flags.
 */
inline bool load_cli_config(const GlobalOptions& opts, SecurityConfig& out) {
    SecurityConfig config;

    if (!opts.config.empty()) {
        auto loaded = load_security_config(opts.config);
        if (!loaded.ok) {
            print_error("Invalid config " + opts.config + ": " + loaded.error, opts.json);
            return false;
        }
        for (const auto& w : loaded.warnings) {
            print_warning(opts.config + ": " + w);
        }
        config = loaded.config;
    }

    apply_environment(config);

    if (!opts.base_dir.empty()) {
        config.base_dir = opts.base_dir;
    }
    for (const auto& dir : opts.allowed_dirs) {
        config.allowed_dirs.push_back(dir);
    }
    if (!opts.allowed_dirs_file.empty()) {
        config.allowed_dirs_file = opts.allowed_dirs_file;
    }
    for (const auto& f : opts.allow_files) {
        config.allow_files.push_back(f);
    }
    for (const auto& l : opts.allow_lists) {
        config.allow_lists.push_back(l);
    }
    if (opts.allow_temp) {
        config.allow_temp_paths = true;
    }
    if (!opts.mode.empty()) {
        auto mode = parse_security_mode(opts.mode);
        if (!mode) {
            print_error("Invalid mode: " + opts.mode + " (expected permissive, warn or strict)",
                        opts.json);
            return false;
        }
        config.security_mode = *mode;
    }

    out = config;
    return true;
}

/**
 * Build the SecurityManager every command works through.
 * Prints the error and returns nullptr on failure.
 */
inline std::unique_ptr<SecurityManager> make_manager(const GlobalOptions& opts) {
    init_warning_collector(opts.json, opts.quiet);

    SecurityConfig config;
    if (!load_cli_config(opts, config)) {
        return nullptr;
    }
    configure_logging(opts, config.log_level);

    auto built = build_security_manager(config);
    if (built.isErr()) {
        print_security_error(built.error(), opts.json);
        return nullptr;
    }
    return std::move(built.value());
}

} // namespace pathguard::cli
