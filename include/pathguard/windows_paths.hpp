#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace pathguard {

// ============================================================================
// Windows Path Validation
// ============================================================================
//
// These checks are pure string inspections. They run on every platform so
// that Windows hazards can be exercised (and rejected) from POSIX hosts too.
// Backslashes and forward slashes are treated as equivalent separators.

constexpr size_t kWindowsMaxPath = 260;

// \\?\ and \\.\ prefixes (either slash style); \\?\UNC\ is handled as UNC
bool is_device_path(const std::string& path);

// \\server or \\server\share with nothing after the share
bool is_incomplete_unc_path(const std::string& path);

// \\server\share[\...]
bool is_unc_path(const std::string& path);

// "C:folder": a drive letter and colon not followed by a separator, at the
// start of the path or right after a separator
bool is_drive_relative_path(const std::string& path);

// "file.txt:stream" or "file.txt:stream:$DATA" at the end of the path
bool has_alternate_data_stream(const std::string& path);

// CON PRN AUX NUL COM1-9 LPT1-9, with or without an extension, any case
bool is_reserved_name(const std::string& component);

// Slashes to '/', repeated separators collapsed (a leading "//" kept), then
// lexically normalized. Pure string operation.
std::string normalize_windows_path(const std::string& path);

/**
 * Validate a path against Windows-specific hazards.
 *
 * Checks, in order: device path, incomplete UNC, normalization (a device
 * prefix produced by normalization is rejected), length above 260, drive-relative
 * path, complete UNC path, alternate data stream, then every component for
 * reserved names, invalid characters and trailing dots or spaces.
 *
 * @return The first violation found, or nullopt if the path is safe.
 */
std::optional<std::string> validate_windows_path(const std::string& path);

// True if the path uses any Windows-only feature (device, drive-relative,
// UNC, ADS, or a reserved final component)
bool is_windows_path(const std::string& path);

} // namespace pathguard
