#include <doctest/doctest.h>
#include <pathguard/security_manager.hpp>

#include "test_helpers.hpp"

#include <stdexcept>

using namespace pathguard;
using pathguard::testing::TempTestDir;
using pathguard::testing::test_options;

namespace {

std::unique_ptr<SecurityManager> make(const SecurityManagerOptions& options) {
    auto created = SecurityManager::create(options);
    REQUIRE(created.isOk());
    return std::move(created.value());
}

} // namespace

// ============================================================================
// Inode pinning
// ============================================================================

TEST_CASE("pinned files are recognized by identity") {
    TempTestDir dir;
    auto manager = make(test_options(dir, "repo"));
    std::string file = dir.write("outside/pinned.txt");
    std::string other = dir.write("outside/other.txt");

    CHECK_FALSE(manager->is_file_allowed_by_inode(file));
    CHECK(manager->pin_file_by_inode(file));
    CHECK(manager->is_file_allowed_by_inode(file));
    CHECK_FALSE(manager->is_file_allowed_by_inode(other));

    // A hard link is the same file
    std::filesystem::create_hard_link(file, dir.sub("outside/hard.txt"));
    CHECK(manager->is_file_allowed_by_inode(dir.sub("outside/hard.txt")));
}

TEST_CASE("symlinks cannot be pinned and do not match pinned targets") {
    TempTestDir dir;
    auto manager = make(test_options(dir, "repo"));
    std::string file = dir.write("outside/real.txt");
    std::string link = dir.link("outside/link", file);

    CHECK_FALSE(manager->pin_file_by_inode(link));
    CHECK(manager->pin_file_by_inode(file));
    CHECK_FALSE(manager->is_file_allowed_by_inode(link));
}

TEST_CASE("pinning a missing file fails") {
    TempTestDir dir;
    auto manager = make(test_options(dir, "repo"));
    CHECK_FALSE(manager->pin_file_by_inode(dir.sub("nope.txt")));
}

// ============================================================================
// Allow-list files
// ============================================================================

TEST_CASE("load_allow_list adds directories and pins files") {
    TempTestDir dir;
    auto manager = make(test_options(dir, "repo"));
    std::string data = dir.mkdir("data");
    std::string file = dir.write("loose/notes.txt");
    std::string list = dir.write("allow.txt",
        "# allow-list\n" + data + "\n\n  " + file + "  \n" + dir.sub("missing") + "\n");

    auto loaded = manager->load_allow_list(list);
    REQUIRE(loaded.isOk());
    CHECK(manager->allowed_dirs().back() == data);
    CHECK(manager->is_file_allowed_by_inode(file));
    CHECK(manager->allowed_dirs().size() == 2);
}

TEST_CASE("a missing allow-list file is reported") {
    TempTestDir dir;
    auto manager = make(test_options(dir, "repo"));

    auto loaded = manager->load_allow_list(dir.sub("absent.txt"));
    REQUIRE(loaded.isErr());
    CHECK(loaded.error().reason() == SecurityReason::DIRECTORY_NOT_FOUND);
}

TEST_CASE("add_allowed_dirs_from_file validates the list file first") {
    TempTestDir dir;
    auto manager = make(test_options(dir, "repo"));
    std::string extra = dir.mkdir("extra");

    SUBCASE("list inside the boundary") {
        std::string list = dir.write("repo/dirs.txt", extra + "\n");
        REQUIRE(manager->add_allowed_dirs_from_file(list).isOk());
        CHECK(manager->allowed_dirs().size() == 2);
    }
    SUBCASE("list outside the boundary") {
        std::string list = dir.write("elsewhere/dirs.txt", extra + "\n");
        auto r = manager->add_allowed_dirs_from_file(list);
        REQUIRE(r.isErr());
        CHECK(r.error().reason() == SecurityReason::PATH_OUTSIDE_ALLOWED);
        CHECK(manager->allowed_dirs().size() == 1);
    }
    SUBCASE("a listed directory that does not exist") {
        std::string list = dir.write("repo/dirs.txt", dir.sub("ghost") + "\n");
        auto r = manager->add_allowed_dirs_from_file(list);
        REQUIRE(r.isErr());
        CHECK(r.error().reason() == SecurityReason::DIRECTORY_NOT_FOUND);
    }
}

// ============================================================================
// Security modes
// ============================================================================

TEST_CASE("the mode decides paths outside every rule") {
    TempTestDir dir;
    auto manager = make(test_options(dir, "repo"));
    std::string outside = dir.write("outside/x.txt");
    std::string inside = dir.write("repo/y.txt");

    CHECK(manager->security_mode() == SecurityMode::Warn);

    SUBCASE("permissive") {
        manager->set_security_mode(SecurityMode::Permissive);
        auto r = manager->is_path_allowed_enhanced(outside);
        REQUIRE(r.isOk());
        CHECK(r.value());
    }
    SUBCASE("warn") {
        auto r = manager->is_path_allowed_enhanced(outside);
        REQUIRE(r.isOk());
        CHECK(r.value());
    }
    SUBCASE("strict") {
        manager->set_security_mode(SecurityMode::Strict);
        auto r = manager->is_path_allowed_enhanced(outside);
        REQUIRE(r.isErr());
        CHECK(r.error().reason() == SecurityReason::PATH_OUTSIDE_ALLOWED);
        CHECK(r.error().message() == "Path not in allowlist: " + outside);

        CHECK(manager->is_path_allowed_enhanced(inside).isOk());

        REQUIRE(manager->pin_file_by_inode(outside));
        CHECK(manager->is_path_allowed_enhanced(outside).isOk());
    }
}

TEST_CASE("configure_security_mode pins files and loads lists") {
    TempTestDir dir;
    auto manager = make(test_options(dir, "repo"));
    std::string pinned = dir.write("outside/pinned.txt");
    std::string data = dir.mkdir("data");
    std::string list = dir.write("allow.txt", data + "\n");

    auto configured = manager->configure_security_mode(SecurityMode::Strict, {pinned}, {list});
    REQUIRE(configured.isOk());
    CHECK(manager->security_mode() == SecurityMode::Strict);
    CHECK(manager->is_file_allowed_by_inode(pinned));
    CHECK(manager->is_path_allowed(data + "/anything"));

    auto bad = manager->configure_security_mode(SecurityMode::Warn, {}, {dir.sub("missing.txt")});
    CHECK(bad.isErr());
}

// ============================================================================
// File access
// ============================================================================

TEST_CASE("validate_file_access") {
    TempTestDir dir;
    auto manager = make(test_options(dir, "repo"));
    std::string inside = dir.write("repo/in.txt");
    std::string outside = dir.write("outside/out.txt");

    SUBCASE("inside the boundary") {
        auto r = manager->validate_file_access(inside);
        REQUIRE(r.isOk());
        CHECK(r.value() == inside);
    }
    SUBCASE("missing") {
        auto r = manager->validate_file_access(dir.sub("repo/missing.txt"));
        REQUIRE(r.isErr());
        CHECK(r.error().reason() == SecurityReason::FILE_NOT_FOUND);
    }
    SUBCASE("outside in warn mode") {
        auto r = manager->validate_file_access(outside);
        REQUIRE(r.isOk());
        CHECK(r.value() == outside);
    }
    SUBCASE("outside in strict mode carries the caller's context") {
        manager->set_security_mode(SecurityMode::Strict);
        auto r = manager->validate_file_access(outside, "template file");
        REQUIRE(r.isErr());
        CHECK(r.error().reason() == SecurityReason::PATH_OUTSIDE_ALLOWED);
        CHECK(r.error().message().find("template file: ") == 0);
    }
    SUBCASE("traversal is an error unless the file is pinned") {
        std::string dotted = dir.sub("repo/../outside/out.txt");
        auto r = manager->validate_file_access(dotted, "input");
        REQUIRE(r.isErr());
        CHECK(r.error().reason() == SecurityReason::PATH_TRAVERSAL);

        REQUIRE(manager->pin_file_by_inode(outside));
        auto pinned = manager->validate_file_access(dotted, "input");
        REQUIRE(pinned.isOk());
        CHECK(pinned.value() == outside);
    }
}

TEST_CASE("validate_batch_access") {
    TempTestDir dir;
    auto manager = make(test_options(dir, "repo"));
    std::string a = dir.write("repo/a.txt");
    std::string b = dir.write("repo/b.txt");
    std::string missing = dir.sub("repo/missing.txt");

    SUBCASE("warn mode returns the valid subset") {
        auto r = manager->validate_batch_access({a, missing, b});
        REQUIRE(r.isOk());
        CHECK(r.value() == std::vector<std::string>{a, b});
    }
    SUBCASE("strict mode fails the batch") {
        manager->set_security_mode(SecurityMode::Strict);
        auto r = manager->validate_batch_access({a, missing, b});
        REQUIRE(r.isErr());
        CHECK(r.error().reason() == SecurityReason::BATCH_VALIDATION_FAILED);
        CHECK(r.error().context().detail.find(missing + ": ") == 0);
    }
    SUBCASE("a clean batch passes in strict mode") {
        manager->set_security_mode(SecurityMode::Strict);
        auto r = manager->validate_batch_access({a, b});
        REQUIRE(r.isOk());
        CHECK(r.value().size() == 2);
    }
}

// ============================================================================
// Scoped security context
// ============================================================================

TEST_CASE("security_context restores mode, directories and pinned files") {
    TempTestDir dir;
    auto manager = make(test_options(dir, "repo"));
    std::string extra = dir.mkdir("extra");
    std::string outside = dir.write("outside/out.txt");
    std::string in_extra = dir.write("extra/e.txt");

    {
        auto scope = manager->security_context(SecurityMode::Strict, {extra, dir.sub("ghost")});
        CHECK(manager->security_mode() == SecurityMode::Strict);
        CHECK(manager->allowed_dirs().size() == 2);
        CHECK(manager->is_path_allowed(in_extra));

        REQUIRE(manager->pin_file_by_inode(outside));
        CHECK(manager->validate_file_access(outside).isOk());
    }

    CHECK(manager->security_mode() == SecurityMode::Warn);
    CHECK(manager->allowed_dirs() == std::vector<std::string>{manager->base_dir()});
    CHECK_FALSE(manager->is_path_allowed(in_extra));
    CHECK_FALSE(manager->is_file_allowed_by_inode(outside));
}

TEST_CASE("security_context restores state when the scope is left by an exception") {
    TempTestDir dir;
    auto manager = make(test_options(dir, "repo"));
    std::string extra = dir.mkdir("extra");

    CHECK_THROWS_AS(([&] {
                        auto scope = manager->security_context(SecurityMode::Permissive, {extra});
                        throw std::runtime_error("interrupted");
                    })(),
                    std::runtime_error);

    CHECK(manager->security_mode() == SecurityMode::Warn);
    CHECK(manager->allowed_dirs().size() == 1);
}

TEST_CASE("nested security contexts unwind in order") {
    TempTestDir dir;
    auto manager = make(test_options(dir, "repo"));
    manager->set_security_mode(SecurityMode::Strict);

    {
        auto outer = manager->security_context(SecurityMode::Warn);
        {
            auto inner = manager->security_context(SecurityMode::Permissive);
            CHECK(manager->security_mode() == SecurityMode::Permissive);
        }
        CHECK(manager->security_mode() == SecurityMode::Warn);
    }
    CHECK(manager->security_mode() == SecurityMode::Strict);
}
