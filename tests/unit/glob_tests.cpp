#include <doctest/doctest.h>
#include <wheelsmith/glob.hpp>

#include "../test_helpers.hpp"

#include <algorithm>

using namespace wheelsmith;
using wheelsmith::testing::TempDir;
using wheelsmith::testing::write_text;

namespace {

bool contains(const std::vector<std::string>& paths, const std::string& suffix) {
    return std::any_of(paths.begin(), paths.end(), [&](const std::string& p) {
        return p.size() >= suffix.size() &&
               p.compare(p.size() - suffix.size(), suffix.size(), suffix) == 0;
    });
}

} // namespace

// ============================================================================
// Pattern Matching Tests
// ============================================================================

TEST_CASE("fnmatch_segment wildcards") {
    CHECK(fnmatch_segment("*.py", "module.py"));
    CHECK_FALSE(fnmatch_segment("*.py", "module.pyc"));
    CHECK(fnmatch_segment("mod?le.py", "module.py"));
    CHECK(fnmatch_segment("LICENSE*", "LICENSE"));
    CHECK(fnmatch_segment("LICENSE*", "LICENSE.txt"));
    CHECK(fnmatch_segment("*", ""));
}

TEST_CASE("fnmatch_segment character classes") {
    CHECK(fnmatch_segment("file[0-9].txt", "file3.txt"));
    CHECK_FALSE(fnmatch_segment("file[0-9].txt", "filex.txt"));
    CHECK(fnmatch_segment("file[!0-9].txt", "filex.txt"));
    CHECK(fnmatch_segment("[abc]", "b"));
    CHECK_FALSE(fnmatch_segment("[abc]", "d"));
}

TEST_CASE("glob_match handles ** across directories") {
    CHECK(glob_match("pkg/**/*.py", "pkg/a.py"));
    CHECK(glob_match("pkg/**/*.py", "pkg/sub/deep/a.py"));
    CHECK_FALSE(glob_match("pkg/**/*.py", "other/a.py"));
    CHECK(glob_match("**/secret.py", "pkg/secret.py"));
    CHECK(glob_match("pkg/secret.py", "pkg/secret.py"));
    CHECK_FALSE(glob_match("pkg/*.py", "pkg/sub/a.py"));
}

// ============================================================================
// Expansion Tests
// ============================================================================

TEST_CASE("glob_expand resolves literal and wildcard paths") {
    TempDir tmp;
    write_text(tmp / "pkg/__init__.py", "");
    write_text(tmp / "pkg/core.py", "");
    write_text(tmp / "pkg/data/values.txt", "");
    write_text(tmp / "README.md", "");

    auto literal = glob_expand(tmp.path(), "pkg");
    REQUIRE(literal.ok);
    REQUIRE(literal.paths.size() == 1);
    CHECK(contains(literal.paths, "/pkg"));

    auto py = glob_expand(tmp.path(), "pkg/*.py");
    REQUIRE(py.ok);
    CHECK(py.paths.size() == 2);
    CHECK(contains(py.paths, "pkg/__init__.py"));
    CHECK(contains(py.paths, "pkg/core.py"));
    CHECK(std::is_sorted(py.paths.begin(), py.paths.end()));
}

TEST_CASE("glob_expand trailing ** lists everything beneath") {
    TempDir tmp;
    write_text(tmp / "pkg/a.py", "");
    write_text(tmp / "pkg/sub/b.py", "");

    auto all = glob_expand(tmp / "pkg", "**");
    REQUIRE(all.ok);
    CHECK(contains(all.paths, "pkg/a.py"));
    CHECK(contains(all.paths, "pkg/sub"));
    CHECK(contains(all.paths, "pkg/sub/b.py"));
}

TEST_CASE("glob_expand with no match is an empty success") {
    TempDir tmp;
    auto none = glob_expand(tmp.path(), "missing/*.py");
    CHECK(none.ok);
    CHECK(none.paths.empty());
}

TEST_CASE("glob_expand rejects an empty pattern") {
    TempDir tmp;
    auto empty = glob_expand(tmp.path(), "");
    CHECK_FALSE(empty.ok);
    CHECK_FALSE(empty.error.empty());
}
