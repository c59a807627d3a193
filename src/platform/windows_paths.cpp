#include "pathguard/windows_paths.hpp"
#include "pathguard/platform.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include <spdlog/spdlog.h>

namespace pathguard {

namespace {

bool is_drive_letter(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool starts_with_unc_server(const std::string& p) {
    // "//" followed by a server name that cannot be a device marker
    return p.size() > 2 && p[0] == '/' && p[1] == '/' &&
           p[2] != '?' && p[2] != '.' && p[2] != '/';
}

// Characters that may not appear in a stream name
bool is_stream_delimiter(char c) {
    switch (c) {
        case '/': case '\\': case '<': case '>': case ':':
        case '"': case '|': case '?': case '*':
            return true;
        default:
            return false;
    }
}

std::string final_component(const std::string& p) {
    auto pos = p.rfind('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

} // namespace

bool is_device_path(const std::string& path) {
    std::string p = to_portable_path(path);
    if (p.size() < 4 || p[0] != '/' || p[1] != '/') return false;
    if (p[2] != '?' && p[2] != '.') return false;
    if (p[3] != '/') return false;
    if (p.size() >= 8 && to_upper(p.substr(4, 3)) == "UNC" && p[7] == '/') {
        return false;
    }
    return true;
}

bool is_incomplete_unc_path(const std::string& path) {
    std::string p = to_portable_path(path);
    if (!starts_with_unc_server(p)) return false;

    auto server_end = p.find('/', 2);
    if (server_end == std::string::npos) {
        return true;  // \\server
    }
    std::string rest = p.substr(server_end + 1);
    return !rest.empty() && rest.find('/') == std::string::npos;  // \\server\share
}

bool is_unc_path(const std::string& path) {
    std::string p = to_portable_path(path);
    if (!starts_with_unc_server(p)) return false;

    auto server_end = p.find('/', 2);
    if (server_end == std::string::npos) return false;
    auto share_start = server_end + 1;
    return share_start < p.size() && p[share_start] != '/';
}

bool is_drive_relative_path(const std::string& path) {
    std::string p = to_portable_path(path);
    for (size_t i = 0; i + 1 < p.size(); ++i) {
        if (i > 0 && p[i - 1] != '/') continue;
        if (!is_drive_letter(p[i]) || p[i + 1] != ':') continue;
        if (i + 2 == p.size() || p[i + 2] != '/') {
            return true;
        }
    }
    return false;
}

bool has_alternate_data_stream(const std::string& path) {
    auto colon = path.rfind(':');
    if (colon == std::string::npos) return false;

    std::string stream = path.substr(colon + 1);
    if (stream.empty()) return false;
    return std::none_of(stream.begin(), stream.end(), is_stream_delimiter);
}

bool is_reserved_name(const std::string& component) {
    static const char* const kReserved[] = {
        "CON", "PRN", "AUX", "NUL",
        "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
        "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
    };

    std::string stem = to_upper(component.substr(0, component.find('.')));
    for (const char* name : kReserved) {
        if (stem == name) return true;
    }
    return false;
}

std::string normalize_windows_path(const std::string& path) {
    return lexically_normalize(to_portable_path(path));
}

std::optional<std::string> validate_windows_path(const std::string& path) {
    spdlog::debug("Validating Windows path: {}", path);

    if (is_device_path(path)) {
        return std::string("Device paths not allowed");
    }

    if (is_incomplete_unc_path(path)) {
        return std::string("Incomplete UNC path");
    }

    std::string normalized = normalize_windows_path(path);
    if (is_device_path(normalized)) {
        spdlog::debug("Device path produced by normalization: {}", normalized);
        return std::string("Device paths not allowed");
    }

    if (normalized.size() > kWindowsMaxPath) {
        return "Path exceeds maximum length of " + std::to_string(kWindowsMaxPath) + " characters";
    }

    if (is_drive_relative_path(normalized)) {
        return std::string("Drive-relative paths must include separator");
    }

    if (is_unc_path(normalized)) {
        return std::string("UNC paths not allowed");
    }

    if (has_alternate_data_stream(normalized)) {
        return std::string("Alternate Data Streams not allowed");
    }

    for (const auto& part : split_components(normalized)) {
        if (is_reserved_name(part)) {
            return std::string("Windows reserved names not allowed");
        }

        for (size_t i = 0; i < part.size(); ++i) {
            unsigned char c = static_cast<unsigned char>(part[i]);
            bool invalid = c < 0x20 || c == '<' || c == '>' || c == '"' ||
                           c == '|' || c == '?' || c == '*';
            if (c == ':' && !(i == 1 && is_drive_letter(part[0]))) {
                invalid = true;
            }
            if (invalid) {
                return "Invalid characters in path component '" + part + "'";
            }
        }

        char last = part.back();
        if (last == '.' || last == ' ') {
            return "Trailing dots or spaces not allowed in '" + part + "'";
        }
    }

    return std::nullopt;
}

bool is_windows_path(const std::string& path) {
    if (is_device_path(path)) {
        spdlog::debug("Windows device path detected: {}", path);
        return true;
    }

    std::string p = to_portable_path(path);
    return is_drive_relative_path(p) ||
           is_unc_path(p) ||
           has_alternate_data_stream(p) ||
           is_reserved_name(final_component(p));
}

} // namespace pathguard
