#include <doctest/doctest.h>
#include <pathguard/case_manager.hpp>

using pathguard::CaseManager;

TEST_CASE("original spelling is remembered per folded key") {
    CaseManager cases;
    cases.set_original_case("/users/alice/docs", "/Users/Alice/Docs");
    CHECK(cases.get_original_case("/users/alice/docs") == "/Users/Alice/Docs");
    CHECK(cases.size() == 1);
}

TEST_CASE("unknown keys fall back to the key itself") {
    CaseManager cases;
    CHECK(cases.get_original_case("/never/seen") == "/never/seen");
}

TEST_CASE("clear drops every entry") {
    CaseManager cases;
    cases.set_original_case("/a", "/A");
    cases.set_original_case("/b", "/B");
    cases.clear();
    CHECK(cases.size() == 0);
    CHECK(cases.get_original_case("/a") == "/a");
}
