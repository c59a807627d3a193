#include "pathguard/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace pathguard {

namespace fs = std::filesystem;

Platform get_current_platform() {
#if defined(__APPLE__)
    return Platform::macOS;
#elif defined(_WIN32)
    return Platform::Windows;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

} // namespace

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::vector<std::string> split_components(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) {
                parts.push_back(current);
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        parts.push_back(current);
    }
    return parts;
}

std::string lexically_normalize(const std::string& path) {
    if (path.empty()) return ".";

    std::string prefix;
    if (path.size() >= 2 && path[0] == '/' && path[1] == '/' &&
        (path.size() == 2 || path[2] != '/')) {
        prefix = "//";
    } else if (path[0] == '/') {
        prefix = "/";
    }

    std::vector<std::string> normalized;
    for (const auto& part : split_components(path)) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (!normalized.empty() && normalized.back() != "..") {
                normalized.pop_back();
            } else if (prefix.empty()) {
                // Relative paths keep leading ".." segments; at a root they vanish
                normalized.push_back(part);
            }
            continue;
        }
        normalized.push_back(part);
    }

    std::string out = prefix;
    for (size_t i = 0; i < normalized.size(); ++i) {
        if (i > 0) out += '/';
        out += normalized[i];
    }
    if (prefix.empty() && out.size() == 2 && out[1] == ':' && path.size() > 2 && path[2] == '/') {
        out += '/';  // drive root, "C:/"
    }
    return out.empty() ? "." : out;
}

std::string get_parent_directory(const std::string& path) {
    auto pos = path.rfind('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool is_symlink(const std::string& path) {
    std::error_code ec;
    return fs::is_symlink(fs::symlink_status(path, ec));
}

SymlinkReadResult read_symlink(const std::string& path) {
    SymlinkReadResult result;
    std::error_code ec;
    fs::path target = fs::read_symlink(path, ec);
    if (ec) {
        result.error = ec.message();
        return result;
    }
    result.ok = true;
    result.target = to_portable_path(target.string());
    return result;
}

std::optional<std::string> get_current_directory() {
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (ec) {
        return std::nullopt;
    }
    return to_portable_path(cwd.string());
}

std::string get_temp_directory() {
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec) {
        return "";
    }
    return to_portable_path(tmp.string());
}

std::optional<std::string> resolve_fully(const std::string& path) {
    std::error_code ec;
    fs::path resolved = fs::weakly_canonical(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return lexically_normalize(to_portable_path(resolved.string()));
}

FileIdentityResult open_file_identity(const std::string& path) {
    FileIdentityResult result;

#ifdef _WIN32
    HANDLE handle = CreateFileA(path.c_str(), 0,
                                FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                                nullptr, OPEN_EXISTING,
                                FILE_FLAG_BACKUP_SEMANTICS | FILE_FLAG_OPEN_REPARSE_POINT,
                                nullptr);
    if (handle == INVALID_HANDLE_VALUE) {
        result.error = "failed to open file: error " + std::to_string(GetLastError());
        return result;
    }

    BY_HANDLE_FILE_INFORMATION info;
    if (!GetFileInformationByHandle(handle, &info)) {
        CloseHandle(handle);
        result.error = "failed to query file: error " + std::to_string(GetLastError());
        return result;
    }
    CloseHandle(handle);

    if (info.dwFileAttributes & FILE_ATTRIBUTE_REPARSE_POINT) {
        result.refused_symlink = true;
        result.error = "path is a reparse point";
        return result;
    }

    result.identity.device = info.dwVolumeSerialNumber;
    result.identity.inode = (static_cast<uint64_t>(info.nFileIndexHigh) << 32) | info.nFileIndexLow;
    result.ok = true;
#else
    int fd = open(path.c_str(), O_RDONLY | O_NOFOLLOW | O_CLOEXEC);
    if (fd < 0) {
        result.refused_symlink = (errno == ELOOP);
        result.error = "failed to open file: " + std::string(strerror(errno));
        return result;
    }

    struct stat st;
    if (fstat(fd, &st) != 0) {
        result.error = "failed to stat file: " + std::string(strerror(errno));
        close(fd);
        return result;
    }
    close(fd);

    result.identity.device = static_cast<uint64_t>(st.st_dev);
    result.identity.inode = static_cast<uint64_t>(st.st_ino);
    result.ok = true;
#endif

    return result;
}

std::optional<FileIdentity> get_file_identity(const std::string& path) {
#ifdef _WIN32
    auto opened = open_file_identity(path);
    if (!opened.ok) return std::nullopt;
    return opened.identity;
#else
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    FileIdentity id;
    id.device = static_cast<uint64_t>(st.st_dev);
    id.inode = static_cast<uint64_t>(st.st_ino);
    return id;
#endif
}

ReadLinesResult read_list_file(const std::string& path) {
    ReadLinesResult result;
    std::ifstream file(path);
    if (!file) {
        result.error = "failed to open " + path;
        return result;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::string entry = trim(line);
        if (entry.empty() || entry[0] == '#') {
            continue;
        }
        result.lines.push_back(std::move(entry));
    }

    if (file.bad()) {
        result.error = "failed to read " + path;
        result.lines.clear();
        return result;
    }

    result.ok = true;
    return result;
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return std::nullopt;
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

} // namespace pathguard
