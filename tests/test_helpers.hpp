#pragma once

#include <pathguard/pathguard.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>

namespace pathguard::testing {

// Random hex suffix for scratch directory names
inline std::string unique_suffix() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::ostringstream out;
    out << std::hex << gen() << gen();
    return out.str();
}

/**
 * Unique scratch directory, removed with everything under it on destruction.
 * `path` is canonical so it compares equal to normalized paths.
 */
class TempTestDir {
public:
    TempTestDir() {
        auto base = std::filesystem::canonical(std::filesystem::temp_directory_path());
        auto dir = base / ("pathguard_test_" + unique_suffix());
        std::filesystem::create_directories(dir);
        path = to_portable_path(dir.string());
    }

    ~TempTestDir() {
        if (!path.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }
    }

    TempTestDir(const TempTestDir&) = delete;
    TempTestDir& operator=(const TempTestDir&) = delete;

    std::string sub(const std::string& rel) const { return path + "/" + rel; }

    std::string mkdir(const std::string& rel) const {
        std::filesystem::create_directories(sub(rel));
        return sub(rel);
    }

    std::string write(const std::string& rel, const std::string& content = "data") const {
        std::filesystem::path p(sub(rel));
        std::filesystem::create_directories(p.parent_path());
        std::ofstream(p) << content;
        return sub(rel);
    }

    std::string link(const std::string& rel, const std::string& target) const {
        std::filesystem::create_symlink(target, sub(rel));
        return sub(rel);
    }

    std::string link_dir(const std::string& rel, const std::string& target) const {
        std::filesystem::create_directory_symlink(target, sub(rel));
        return sub(rel);
    }

    std::string path;
};

// Manager options for tests: short response floor and a private temp
// directory so unrelated system temp files never match
inline SecurityManagerOptions test_options(const TempTestDir& root, const std::string& base_rel) {
    SecurityManagerOptions options;
    options.base_dir = root.mkdir(base_rel);
    options.temp_dir = root.mkdir("systmp");
    options.limits.min_response_time = std::chrono::milliseconds(0);
    options.policy = &posix_path_policy();
    return options;
}

} // namespace pathguard::testing
