#include "pathguard/file_collector.hpp"
#include "pathguard/platform.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace pathguard {

namespace {

std::string strip_dot(const std::string& ext) {
    return (!ext.empty() && ext[0] == '.') ? ext.substr(1) : ext;
}

bool extension_matches(const fs::path& file, const std::vector<std::string>& extensions) {
    if (extensions.empty()) {
        return true;
    }
    std::string ext = strip_dot(file.extension().string());
    for (const auto& e : extensions) {
        if (strip_dot(e) == ext) {
            return true;
        }
    }
    return false;
}

// Security errors abort a collection; plain missing files are skipped
bool is_skippable(const SecurityError& error) {
    return error.reason() == SecurityReason::FILE_NOT_FOUND;
}

} // namespace

Result<std::vector<std::string>> collect_files_from_directory(SecurityManager& manager,
                                                              const std::string& directory,
                                                              const CollectOptions& options) {
    using R = Result<std::vector<std::string>>;

    spdlog::debug("Collecting files from {} (recursive={})", directory, options.recursive);
    auto scope = manager.symlink_scope();

    auto dir = manager.resolve_path(directory);
    if (dir.isErr()) {
        spdlog::warn("Security violation in directory path: {}", directory);
        return R::err(dir.error());
    }
    if (!is_directory(dir.value())) {
        SecurityErrorContext ctx;
        ctx.path = directory;
        ctx.expanded_path = dir.value();
        return R::err(SecurityError(SecurityReason::DIRECTORY_NOT_FOUND,
                                    "Path is not a directory: " + directory, std::move(ctx)));
    }

    std::vector<fs::path> entries;
    std::error_code ec;
    if (options.recursive) {
        fs::recursive_directory_iterator it(dir.value(), fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            entries.push_back(it->path());
        }
    } else {
        fs::directory_iterator it(dir.value(), ec);
        for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
            entries.push_back(it->path());
        }
    }
    if (ec) {
        spdlog::error("Error collecting files from {}: {}", directory, ec.message());
        SecurityErrorContext ctx;
        ctx.path = directory;
        ctx.detail = ec.message();
        return R::err(SecurityError(SecurityReason::DIRECTORY_NOT_FOUND,
                                    "Cannot read directory: " + directory, std::move(ctx)));
    }

    std::vector<std::string> files;
    for (const auto& entry : entries) {
        std::string path = to_portable_path(entry.string());
        if (!is_symlink(path) && !is_regular_file(path)) {
            continue;
        }
        // Directory symlinks are neither walked nor collected
        if (is_symlink(path) && is_directory(path)) {
            spdlog::debug("Skipping directory symlink: {}", path);
            continue;
        }
        if (!extension_matches(entry, options.extensions)) {
            spdlog::debug("Skipping file with filtered extension: {}", path);
            continue;
        }

        auto checked = manager.validate_path(path);
        if (checked.isErr()) {
            if (is_skippable(checked.error())) {
                spdlog::warn("Skipping inaccessible file: {} ({})", path, checked.error().message());
                continue;
            }
            spdlog::warn("Security violation for file: {}", path);
            return R::err(checked.error());
        }
        files.push_back(checked.value());
    }

    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());
    spdlog::debug("Collected {} files from {}", files.size(), directory);
    return R::ok(files);
}

Result<std::vector<std::string>> collect_files_from_list(SecurityManager& manager,
                                                         const std::string& list_file) {
    using R = Result<std::vector<std::string>>;

    auto scope = manager.symlink_scope();
    auto checked = manager.validate_path(list_file);
    if (checked.isErr()) {
        return R::err(checked.error().withContext("file list"));
    }

    auto lines = read_list_file(checked.value());
    if (!lines.ok) {
        SecurityErrorContext ctx;
        ctx.path = list_file;
        ctx.detail = lines.error;
        return R::err(SecurityError(SecurityReason::ALLOW_LIST_READ_ERROR,
                                    "Cannot read file list: " + list_file, std::move(ctx)));
    }

    std::vector<std::string> files;
    for (const auto& line : lines.lines) {
        auto file = manager.validate_path(line);
        if (file.isErr()) {
            return R::err(file.error());
        }
        files.push_back(file.value());
    }
    return R::ok(files);
}

} // namespace pathguard
