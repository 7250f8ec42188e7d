#include <doctest/doctest.h>
#include <ctxstage/path_utils.hpp>

#include <string>

using ctxstage::PathError;
using ctxstage::resolve_under_root;

TEST_CASE("resolve simple destination under root") {
    auto r = resolve_under_root("/tmp/context_abc", "Dockerfile");
    REQUIRE(r.ok);
    CHECK(r.path == "/tmp/context_abc/Dockerfile");
}

TEST_CASE("resolve nested destination under root") {
    auto r = resolve_under_root("/tmp/context_abc", "scripts/setup/install.sh");
    REQUIRE(r.ok);
    CHECK(r.path == "/tmp/context_abc/scripts/setup/install.sh");
}

TEST_CASE("collapse dot and dotdot segments") {
    auto r = resolve_under_root("/tmp/context_abc", "./bin/../lib/./file");
    REQUIRE(r.ok);
    CHECK(r.path == "/tmp/context_abc/lib/file");
}

TEST_CASE("repeated slashes are ignored") {
    auto r = resolve_under_root("/tmp/context_abc", "a//b///c");
    REQUIRE(r.ok);
    CHECK(r.path == "/tmp/context_abc/a/b/c");
}

TEST_CASE("backslash is an ordinary file name character") {
    auto r = resolve_under_root("/tmp/context_abc", "dir\\name.txt");
    REQUIRE(r.ok);
    CHECK(r.path == "/tmp/context_abc/dir\\name.txt");

    r = resolve_under_root("/tmp/context_abc", "\\leading");
    REQUIRE(r.ok);
    CHECK(r.path == "/tmp/context_abc/\\leading");
}

TEST_CASE("reject escape above root") {
    auto r = resolve_under_root("/tmp/context_abc", "../../etc/passwd");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::EscapesRoot);
}

TEST_CASE("reject escape hidden behind a subdirectory") {
    auto r = resolve_under_root("/tmp/context_abc", "a/../../b");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::EscapesRoot);
}

TEST_CASE("reject absolute destination") {
    auto r = resolve_under_root("/tmp/context_abc", "/etc/passwd");
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::AbsoluteNotAllowed);
}

TEST_CASE("reject destination naming the root itself") {
    SUBCASE("empty") {
        auto r = resolve_under_root("/tmp/context_abc", "");
        CHECK_FALSE(r.ok);
        CHECK(r.error == PathError::Empty);
    }
    SUBCASE("dot") {
        auto r = resolve_under_root("/tmp/context_abc", ".");
        CHECK_FALSE(r.ok);
        CHECK(r.error == PathError::Empty);
    }
    SUBCASE("dir and back") {
        auto r = resolve_under_root("/tmp/context_abc", "a/..");
        CHECK_FALSE(r.ok);
        CHECK(r.error == PathError::Empty);
    }
}

TEST_CASE("reject embedded NUL") {
    std::string name("abc\0def", 7);
    auto r = resolve_under_root("/tmp/context_abc", name);
    CHECK_FALSE(r.ok);
    CHECK(r.error == PathError::ContainsNul);
}
