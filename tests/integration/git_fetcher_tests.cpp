/**
 * GitFetcher against local repositories. Skipped when git is not installed.
 */

#include <doctest/doctest.h>
#include <cpull/fetcher.hpp>
#include <cpull/process.hpp>

#include "../test_support.hpp"

using namespace cpull;
using cpull::test::TempDir;
using cpull::test::exited_zero;
using cpull::test::read_text;
using cpull::test::write_text;

namespace {

bool git_available() {
    return exited_zero(run_shell("git --version > /dev/null 2>&1"));
}

// Create a repository at `path` with a single committed file
bool make_repository(const std::string& path, const std::string& file, const std::string& content) {
    write_text(path + "/" + file, content);
    return exited_zero(run_shell("git init --quiet . && git add -A && "
                                 "git -c user.name=cpull -c user.email=cpull@localhost "
                                 "commit --quiet -m initial",
                                 path));
}

} // namespace

TEST_CASE("GitFetcher clones and pulls a local repository") {
    if (!git_available()) {
        MESSAGE("git not found; skipping");
        return;
    }

    TempDir dir;
    REQUIRE(make_repository(dir / "origin", "project.json", R"({"libraries": []})"));

    GitFetcher git;
    auto cloned = git.clone("file://" + dir / "origin", dir / "checkout");
    REQUIRE(cloned.ok);
    CHECK(read_text(dir / "checkout/project.json") == R"({"libraries": []})");

    // New upstream commit arrives with pull
    write_text(dir / "origin/extra.txt", "more");
    REQUIRE(exited_zero(run_shell("git add -A && git -c user.name=cpull -c user.email=cpull@localhost "
                                  "commit --quiet -m more",
                                  dir / "origin")));

    auto pulled = git.pull(dir / "checkout");
    REQUIRE(pulled.ok);
    CHECK(read_text(dir / "checkout/extra.txt") == "more");
}

TEST_CASE("GitFetcher reports a failed clone") {
    if (!git_available()) {
        MESSAGE("git not found; skipping");
        return;
    }

    TempDir dir;
    GitFetcher git;
    auto r = git.clone("file://" + dir / "nowhere", dir / "checkout");
    CHECK_FALSE(r.ok);
    CHECK(r.error.find("exited with status") != std::string::npos);
}

TEST_CASE("GitFetcher reports a missing git executable") {
    TempDir dir;
    GitFetcher git(true, "cpull-test-no-such-git");
    auto r = git.clone("file:///nowhere", dir / "checkout");
    CHECK_FALSE(r.ok);
}
