#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pathguard {

// ============================================================================
// Platform Detection
// ============================================================================

enum class Platform {
    Linux,
    macOS,
    Windows,
    Unknown
};

Platform get_current_platform();

inline const char* platform_to_string(Platform p) {
    switch (p) {
        case Platform::Linux: return "linux";
        case Platform::macOS: return "macos";
        case Platform::Windows: return "windows";
        case Platform::Unknown: return "unknown";
        default: return "unknown";
    }
}

// ============================================================================
// Path Strings
// ============================================================================

// Convert a path to use forward slashes (portable format).
// All paths handed out by pathguard use forward slashes.
std::string to_portable_path(const std::string& path);

// Purely lexical cleanup of a forward-slash path: collapses repeated
// separators, drops "." segments and a trailing separator, and folds ".."
// into its parent where one exists. A leading "//" (UNC form) and a drive
// root ("C:/") are kept.
// Never touches the filesystem.
std::string lexically_normalize(const std::string& path);

// Split a forward-slash path into its non-empty components
std::vector<std::string> split_components(const std::string& path);

// Directory part of a forward-slash path ("/" for top-level entries)
std::string get_parent_directory(const std::string& path);

// ============================================================================
// Filesystem Queries
// ============================================================================

// Check if a path exists (follows symlinks; a dangling or looping link
// does not exist)
bool path_exists(const std::string& path);

// Check if a path is a directory (follows symlinks)
bool is_directory(const std::string& path);

// Check if a path is a regular file (follows symlinks)
bool is_regular_file(const std::string& path);

// Check if the final component of a path is a symlink
bool is_symlink(const std::string& path);

struct SymlinkReadResult {
    bool ok = false;
    std::string error;
    std::string target;  // raw link contents, as stored
};

// Read a symlink target without following it further
SymlinkReadResult read_symlink(const std::string& path);

// Current working directory in portable form, or nullopt if unavailable
std::optional<std::string> get_current_directory();

// System temporary directory in portable form ("" if it cannot be determined)
std::string get_temp_directory();

// Resolve every symlink in a path that exists, keeping any missing tail
// lexically. Returns nullopt if the OS refuses (e.g. a loop).
std::optional<std::string> resolve_fully(const std::string& path);

// ============================================================================
// File Identity
// ============================================================================

struct FileIdentity {
    uint64_t device = 0;
    uint64_t inode = 0;

    bool operator==(const FileIdentity& other) const {
        return device == other.device && inode == other.inode;
    }
    bool operator<(const FileIdentity& other) const {
        return device != other.device ? device < other.device : inode < other.inode;
    }
};

struct FileIdentityResult {
    bool ok = false;
    std::string error;
    bool refused_symlink = false;  // open refused because the path is a symlink
    FileIdentity identity;
};

// Identity of a file opened without following a final symlink
// (O_NOFOLLOW on POSIX, FILE_FLAG_OPEN_REPARSE_POINT on Windows)
FileIdentityResult open_file_identity(const std::string& path);

// Identity from lstat-style metadata (the link itself when path is a symlink)
std::optional<FileIdentity> get_file_identity(const std::string& path);

// ============================================================================
// Text Files
// ============================================================================

struct ReadLinesResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> lines;  // trimmed; blank lines and '#' comments removed
};

// Read a list file (allow-lists, allowed-dir files, collect lists)
ReadLinesResult read_list_file(const std::string& path);

std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

} // namespace pathguard
