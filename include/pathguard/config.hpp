#pragma once

#include "pathguard/errors.hpp"
#include "pathguard/security_manager.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pathguard {

constexpr const char* kConfigSchema = "pathguard.config.v1";

// ============================================================================
// Security Configuration
// ============================================================================

struct SecurityConfig {
    std::string source_path;

    std::string base_dir;                    // empty: current working directory
    std::vector<std::string> allowed_dirs;
    std::string allowed_dirs_file;
    std::vector<std::string> allow_files;    // pinned by inode
    std::vector<std::string> allow_lists;
    bool allow_temp_paths = false;

    int max_symlink_depth = kDefaultMaxSymlinkDepth;
    int max_concurrent_requests = 10;
    int max_filesystem_ops = 1000;
    int max_processing_time_ms = 5000;
    int min_response_time_ms = 100;
    bool timing_protection = true;

    SecurityMode security_mode = SecurityMode::Warn;
    std::string log_level;                   // empty: leave the logger alone
};

struct SecurityConfigParseResult {
    bool ok = false;
    std::string error;
    SecurityConfig config;
    std::vector<std::string> warnings;
};

// Parse a JSON config ($schema must be "pathguard.config.v1"). Unknown keys
// are warnings; a known key with the wrong type is an error.
SecurityConfigParseResult parse_security_config(const std::string& json_str,
                                                const std::string& source_path = "");

// Read and parse a config file
SecurityConfigParseResult load_security_config(const std::string& path);

// Overlay PATHGUARD_BASE_DIR and PATHGUARD_LOG_LEVEL
void apply_environment(SecurityConfig& config);

SecurityManagerOptions to_manager_options(const SecurityConfig& config);

/**
 * @brief Create a manager from a config: base and allowed directories, the
 * allowed-directories file, then the security mode with its pinned files and
 * allow-lists.
 */
Result<std::unique_ptr<SecurityManager>> build_security_manager(const SecurityConfig& config);

} // namespace pathguard
