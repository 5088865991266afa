#include <doctest/doctest.h>
#include <cpull/generator.hpp>

#include "../test_support.hpp"

using namespace cpull;
using cpull::test::TempDir;
using cpull::test::path_exists;

namespace {

ResolvedLibrary lib(const std::string& name) {
    ResolvedLibrary l;
    l.canonical_name = name;
    return l;
}

} // namespace

TEST_CASE("render_include_file lists libraries after the generated header") {
    auto text = render_include_file({lib("foo"), lib("bar")});
    CHECK(text == std::string(GENERATED_HEADER) + "\n"
                  "add_subdirectory(foo)\n"
                  "add_subdirectory(bar)\n");
}

TEST_CASE("render_include_file with no libraries is just the header") {
    CHECK(render_include_file({}) == std::string(GENERATED_HEADER) + "\n");
}

TEST_CASE("write_include_file overwrites the previous file") {
    TempDir dir;
    cpull::test::write_text(dir / "lib/CMakeLists.txt", "add_subdirectory(stale)\n");

    auto r = write_include_file(dir / "lib", {lib("fresh")});
    REQUIRE(r.ok);
    CHECK(r.path == dir / "lib/CMakeLists.txt");

    auto content = cpull::test::read_text(r.path);
    CHECK(content.find("stale") == std::string::npos);
    CHECK(content.find("add_subdirectory(fresh)") != std::string::npos);

    // No temp files left behind
    CHECK(cpull::test::list_entries(dir / "lib").size() == 1);
}

TEST_CASE("write_include_file fails when the destination is missing") {
    TempDir dir;
    auto r = write_include_file(dir / "missing", {lib("foo")});
    CHECK_FALSE(r.ok);
    CHECK(r.kind == ErrorKind::IncludeFileWriteFailed);
    CHECK_FALSE(path_exists(dir / "missing"));
}
