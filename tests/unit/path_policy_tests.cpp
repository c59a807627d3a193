#include <doctest/doctest.h>
#include <pathguard/path_policy.hpp>
#include <pathguard/platform.hpp>

using namespace pathguard;

TEST_CASE("host policy matches the running platform") {
    const PathPolicy& host = host_path_policy();
    switch (get_current_platform()) {
        case Platform::Windows:
            CHECK(host.is_windows());
            CHECK(host.is_case_insensitive());
            break;
        case Platform::macOS:
            CHECK_FALSE(host.is_windows());
            CHECK(host.is_case_insensitive());
            break;
        default:
            CHECK(std::string(host.name()) == "posix");
            CHECK_FALSE(host.is_case_insensitive());
            break;
    }
}

TEST_CASE("POSIX policy never reports a hazard") {
    const PathPolicy& posix = posix_path_policy();
    CHECK_FALSE(posix.validate("C:relative"));
    CHECK_FALSE(posix.validate("\\\\?\\C:\\x"));
    CHECK(posix.check_join_component("CON"));
}

TEST_CASE("Windows policy validates with the Windows rules") {
    const PathPolicy& win = windows_path_policy();
    CHECK(win.is_windows());
    CHECK(win.is_case_insensitive());
    CHECK(win.validate("\\\\.\\pipe\\x").has_value());
    CHECK(win.validate("C:/dir/file.txt:ads").has_value());
    CHECK_FALSE(win.validate("C:/dir/file.txt"));
}

TEST_CASE("Windows join hooks") {
    const PathPolicy& win = windows_path_policy();

    CHECK(win.check_join_base("C:/work"));
    CHECK(win.check_join_base("//server/share"));
    CHECK_FALSE(win.check_join_base("//server"));
    CHECK_FALSE(win.check_join_base("C:/com1/x"));

    CHECK(win.check_join_component("docs/a.txt"));
    CHECK_FALSE(win.check_join_component("C:/x"));
    CHECK_FALSE(win.check_join_component("lpt3"));

    CHECK(win.check_join_result("C:/work/a.txt"));
    CHECK_FALSE(win.check_join_result("C:/work/a.txt:s"));
    CHECK_FALSE(win.check_join_result("C:/work/prn.txt"));
}
