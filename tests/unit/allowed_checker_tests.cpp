#include <doctest/doctest.h>
#include <pathguard/allowed_checker.hpp>

#include "test_helpers.hpp"

using namespace pathguard;
using pathguard::testing::TempTestDir;

// ============================================================================
// Lexical comparison
// ============================================================================

TEST_CASE("paths inside an allowed directory are allowed") {
    CHECK(is_path_in_allowed_dirs("/base/sub/file", {"/base"}));
    CHECK(is_path_in_allowed_dirs("/base", {"/base"}));
    CHECK(is_path_in_allowed_dirs("/shared/doc.txt", {"/base", "/shared"}));
}

TEST_CASE("sibling directories sharing a prefix are not allowed") {
    CHECK_FALSE(is_path_in_allowed_dirs("/basement/file", {"/base"}));
    CHECK_FALSE(is_path_in_allowed_dirs("/other/doc.txt", {"/base", "/shared"}));
    CHECK_FALSE(is_path_in_allowed_dirs("/base/file", {}));
}

TEST_CASE("allowed checks fail closed") {
    CHECK_FALSE(is_path_in_allowed_dirs("/base/../etc/passwd", {"/base"}));
    CHECK_FALSE(is_path_in_allowed_dirs("/base/a\x01", {"/base"}));
}

TEST_CASE("an allowed directory that cannot be normalized is skipped") {
    CHECK(is_path_in_allowed_dirs("/base/file", {"/x/../y", "/base"}));
    CHECK_FALSE(is_path_in_allowed_dirs("/y/file", {"/x/../y"}));
}

TEST_CASE("case folding is applied only when requested") {
    CHECK(is_path_in_allowed_dirs("/BASE/File", {"/base"}, true));
    CHECK_FALSE(is_path_in_allowed_dirs("/BASE/File", {"/base"}, false));
}

TEST_CASE("is_path_under_directory") {
    CHECK(is_path_under_directory("/tmp/x/y", "/tmp/x"));
    CHECK_FALSE(is_path_under_directory("/tmp/xy", "/tmp/x"));
    CHECK(is_path_under_directory("/TMP/x", "/tmp", true));
}

// ============================================================================
// Resolved comparison
// ============================================================================

TEST_CASE("a path through a symlinked directory matches its real location") {
    TempTestDir dir;
    std::string real = dir.mkdir("real");
    dir.write("real/file.txt");
    std::string alias = dir.link_dir("alias", real);

    // Lexically "alias/file.txt" is not under "real"; resolved it is
    CHECK(is_path_in_allowed_dirs(alias + "/file.txt", {real}));
    // and the other way round
    CHECK(is_path_in_allowed_dirs(real + "/file.txt", {alias}));
    CHECK_FALSE(is_path_in_allowed_dirs(dir.sub("elsewhere/file.txt"), {real}));
}

TEST_CASE("a symlink's location is judged without following it") {
    TempTestDir dir;
    std::string base = dir.mkdir("base");
    std::string target = dir.write("base/doc.txt");
    std::string outside_link = dir.link("outside_link", target);
    dir.mkdir("base/sub");
    std::string inside_link = dir.link("base/sub/link", dir.write("elsewhere/x.txt"));

    // Following the link lands inside the base
    CHECK(is_path_in_allowed_dirs(outside_link, {base}));
    CHECK_FALSE(is_location_in_allowed_dirs(outside_link, {base}));

    CHECK(is_location_in_allowed_dirs(inside_link, {base}));
    CHECK(is_location_in_allowed_dirs(target, {base}));
}

TEST_CASE("a symlink's location follows symlinked parent directories") {
    TempTestDir dir;
    std::string real = dir.mkdir("real");
    std::string alias = dir.link_dir("alias", real);
    dir.link("real/link", dir.write("other/x.txt"));

    CHECK(is_location_in_allowed_dirs(alias + "/link", {real}));
    CHECK_FALSE(is_location_in_allowed_dirs(alias + "/link", {dir.sub("other")}));
}
