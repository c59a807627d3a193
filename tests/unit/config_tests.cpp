#include <doctest/doctest.h>
#include <pathguard/config.hpp>

#include "test_helpers.hpp"

#include <cstdlib>

using namespace pathguard;
using pathguard::testing::TempTestDir;

namespace {

void set_env(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

void unset_env(const char* name) {
#ifdef _WIN32
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("parse a complete config") {
    const char* json = R"({
        "$schema": "pathguard.config.v1",
        "base_dir": "/repo",
        "allowed_dirs": ["/shared", "/data"],
        "allow_temp_paths": true,
        "max_symlink_depth": 8,
        "max_concurrent_requests": 4,
        "max_filesystem_ops": 50,
        "max_processing_time_ms": 250,
        "min_response_time_ms": 0,
        "timing_protection": false,
        "security_mode": "strict",
        "log_level": "debug"
    })";

    auto r = parse_security_config(json, "pathguard.json");
    REQUIRE(r.ok);
    CHECK(r.warnings.empty());
    CHECK(r.config.source_path == "pathguard.json");
    CHECK(r.config.base_dir == "/repo");
    CHECK(r.config.allowed_dirs.size() == 2);
    CHECK(r.config.allow_temp_paths);
    CHECK(r.config.max_symlink_depth == 8);
    CHECK(r.config.max_concurrent_requests == 4);
    CHECK(r.config.max_filesystem_ops == 50);
    CHECK(r.config.max_processing_time_ms == 250);
    CHECK(r.config.min_response_time_ms == 0);
    CHECK_FALSE(r.config.timing_protection);
    CHECK(r.config.security_mode == SecurityMode::Strict);
    CHECK(r.config.log_level == "debug");
}

TEST_CASE("defaults apply to keys that are absent") {
    auto r = parse_security_config(R"({"$schema": "pathguard.config.v1"})");
    REQUIRE(r.ok);
    CHECK(r.config.base_dir.empty());
    CHECK(r.config.max_symlink_depth == kDefaultMaxSymlinkDepth);
    CHECK(r.config.max_concurrent_requests == 10);
    CHECK(r.config.security_mode == SecurityMode::Warn);
    CHECK_FALSE(r.config.allow_temp_paths);
}

TEST_CASE("schema is required and checked") {
    SUBCASE("missing") {
        auto r = parse_security_config(R"({"base_dir": "/repo"})");
        CHECK_FALSE(r.ok);
        CHECK(r.error == "$schema missing");
    }
    SUBCASE("mismatch") {
        auto r = parse_security_config(R"({"$schema": "pathguard.config.v0"})");
        CHECK_FALSE(r.ok);
        CHECK(r.error.find("$schema mismatch") == 0);
    }
}

TEST_CASE("unknown keys are warnings") {
    auto r = parse_security_config(R"({"$schema": "pathguard.config.v1", "colour": "blue"})");
    REQUIRE(r.ok);
    REQUIRE(r.warnings.size() == 1);
    CHECK(r.warnings[0] == "unknown_key:colour");
}

TEST_CASE("wrong types are errors") {
    CHECK_FALSE(parse_security_config(R"({"$schema": "pathguard.config.v1", "allowed_dirs": "/x"})").ok);
    CHECK_FALSE(parse_security_config(R"({"$schema": "pathguard.config.v1", "allowed_dirs": [1]})").ok);
    CHECK_FALSE(parse_security_config(R"({"$schema": "pathguard.config.v1", "allow_temp_paths": "yes"})").ok);
    CHECK_FALSE(parse_security_config(R"({"$schema": "pathguard.config.v1", "max_symlink_depth": -1})").ok);
    CHECK_FALSE(parse_security_config(R"({"$schema": "pathguard.config.v1", "max_symlink_depth": 2.5})").ok);

    auto mode = parse_security_config(R"({"$schema": "pathguard.config.v1", "security_mode": "paranoid"})");
    CHECK_FALSE(mode.ok);
    CHECK(mode.error.find("security_mode") == 0);
}

TEST_CASE("resolution limits must be at least one") {
    auto depth = parse_security_config(R"({"$schema": "pathguard.config.v1", "max_symlink_depth": 0})");
    CHECK_FALSE(depth.ok);
    CHECK(depth.error == "max_symlink_depth out of range");

    auto concurrency = parse_security_config(
        R"({"$schema": "pathguard.config.v1", "max_concurrent_requests": 0})");
    CHECK_FALSE(concurrency.ok);
    CHECK(concurrency.error == "max_concurrent_requests out of range");

    CHECK_FALSE(parse_security_config(R"({"$schema": "pathguard.config.v1", "max_filesystem_ops": 0})").ok);
    CHECK_FALSE(parse_security_config(R"({"$schema": "pathguard.config.v1", "max_processing_time_ms": 0})").ok);

    // No response floor is fine
    auto floor = parse_security_config(R"({"$schema": "pathguard.config.v1", "min_response_time_ms": 0})");
    REQUIRE(floor.ok);
    CHECK(floor.config.min_response_time_ms == 0);
}

TEST_CASE("malformed JSON is reported") {
    auto r = parse_security_config("{not json");
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("parse error") == 0);

    CHECK_FALSE(parse_security_config("[1, 2]").ok);
}

// ============================================================================
// Loading and conversion
// ============================================================================

TEST_CASE("load_security_config reads a file") {
    TempTestDir dir;
    std::string file = dir.write("pathguard.json", R"({"$schema": "pathguard.config.v1", "base_dir": "/r"})");

    auto r = load_security_config(file);
    REQUIRE(r.ok);
    CHECK(r.config.base_dir == "/r");
    CHECK(r.config.source_path == file);

    auto missing = load_security_config(dir.sub("missing.json"));
    CHECK_FALSE(missing.ok);
    CHECK(missing.error.find("cannot read config file") == 0);
}

TEST_CASE("environment overrides base directory and log level") {
    set_env("PATHGUARD_BASE_DIR", "/from/env");
    set_env("PATHGUARD_LOG_LEVEL", "info");

    SecurityConfig config;
    config.base_dir = "/from/file";
    apply_environment(config);
    CHECK(config.base_dir == "/from/env");
    CHECK(config.log_level == "info");

    unset_env("PATHGUARD_BASE_DIR");
    unset_env("PATHGUARD_LOG_LEVEL");
}

TEST_CASE("to_manager_options carries limits and mode") {
    SecurityConfig config;
    config.base_dir = "/repo";
    config.allowed_dirs = {"/shared"};
    config.max_concurrent_requests = 3;
    config.max_processing_time_ms = 1234;
    config.min_response_time_ms = 7;
    config.security_mode = SecurityMode::Permissive;

    auto options = to_manager_options(config);
    CHECK(options.base_dir == "/repo");
    CHECK(options.allowed_dirs == std::vector<std::string>{"/shared"});
    CHECK(options.limits.max_concurrent_requests == 3);
    CHECK(options.limits.max_processing_time == std::chrono::milliseconds(1234));
    CHECK(options.limits.min_response_time == std::chrono::milliseconds(7));
    CHECK(options.mode == SecurityMode::Permissive);
}

TEST_CASE("parse_security_mode") {
    CHECK(parse_security_mode("STRICT") == SecurityMode::Strict);
    CHECK(parse_security_mode("permissive") == SecurityMode::Permissive);
    CHECK_FALSE(parse_security_mode("off").has_value());
    CHECK(std::string(security_mode_to_string(SecurityMode::Warn)) == "warn");
}

TEST_CASE("build_security_manager applies the allowed-directories file and mode") {
    TempTestDir dir;
    std::string base = dir.mkdir("base");
    std::string extra = dir.mkdir("extra");
    dir.write("base/dirs.txt", "# extra dirs\n" + extra + "\n\n");

    SecurityConfig config;
    config.base_dir = base;
    config.allowed_dirs_file = base + "/dirs.txt";
    config.min_response_time_ms = 0;
    config.security_mode = SecurityMode::Strict;

    auto built = build_security_manager(config);
    REQUIRE(built.isOk());
    auto& manager = built.value();
    CHECK(manager->security_mode() == SecurityMode::Strict);
    CHECK(manager->allowed_dirs() == std::vector<std::string>{base, extra});
}

TEST_CASE("build_security_manager reports a missing base directory") {
    TempTestDir dir;
    SecurityConfig config;
    config.base_dir = dir.sub("nope");

    auto built = build_security_manager(config);
    REQUIRE(built.isErr());
    CHECK(built.error().reason() == SecurityReason::DIRECTORY_NOT_FOUND);
}
