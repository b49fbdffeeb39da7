#include <doctest/doctest.h>
#include <wheelsmith/version_range.hpp>

using namespace wheelsmith;

namespace {

bool allows(const std::string& range_str, const std::string& version_str) {
    auto range = parse_range(range_str);
    auto version = parse_version(version_str);
    REQUIRE(range.has_value());
    REQUIRE(version.has_value());
    return satisfies(*version, *range);
}

bool overlaps(const std::string& a, const std::string& b) {
    auto ra = parse_range(a);
    auto rb = parse_range(b);
    REQUIRE(ra.has_value());
    REQUIRE(rb.has_value());
    return intersects(*ra, *rb);
}

} // namespace

// ============================================================================
// Version Parsing Tests
// ============================================================================

TEST_CASE("parse_version pads partial versions") {
    auto v = parse_version("2.7");
    REQUIRE(v.has_value());
    CHECK(v->major() == 2);
    CHECK(v->minor() == 7);
    CHECK(v->patch() == 0);

    auto major_only = parse_version("3");
    REQUIRE(major_only.has_value());
    CHECK(major_only->major() == 3);
    CHECK(major_only->minor() == 0);
}

TEST_CASE("parse_version rejects garbage") {
    CHECK_FALSE(parse_version("").has_value());
    CHECK_FALSE(parse_version("abc").has_value());
    CHECK_FALSE(parse_version("1.2.3.4").has_value());
    CHECK_FALSE(parse_version("1..2").has_value());
}

// ============================================================================
// Range Parsing Tests
// ============================================================================

TEST_CASE("comparators combine with whitespace and commas") {
    CHECK(allows(">=2.7 <4.0", "3.8"));
    CHECK(allows(">=2.7, <4.0", "2.7"));
    CHECK_FALSE(allows(">=2.7,<4.0", "4.0"));
    CHECK(allows(">= 2.7", "2.7.1"));
}

TEST_CASE("caret and tilde ranges") {
    CHECK(allows("^3.6", "3.9"));
    CHECK_FALSE(allows("^3.6", "4.0"));
    CHECK(allows("^0.2", "0.2.5"));
    CHECK_FALSE(allows("^0.2", "0.3.0"));
    CHECK(allows("~2.7", "2.7.18"));
    CHECK_FALSE(allows("~2.7", "2.8"));
}

TEST_CASE("compatible release operator") {
    CHECK(allows("~=2.7", "2.9"));
    CHECK_FALSE(allows("~=2.7", "3.0"));
    CHECK(allows("~=2.7.1", "2.7.5"));
    CHECK_FALSE(allows("~=2.7.1", "2.8.0"));
}

TEST_CASE("wildcards") {
    CHECK(allows("*", "1.0"));
    CHECK(allows("2.*", "2.7"));
    CHECK_FALSE(allows("2.*", "3.0"));
    CHECK(allows("==3.8.*", "3.8.10"));
    CHECK_FALSE(allows("==3.8.*", "3.9.0"));
}

TEST_CASE("or-ed ranges") {
    CHECK(allows(">=2.7 <3.0 || >=3.5", "2.7.18"));
    CHECK(allows(">=2.7 <3.0 || >=3.5", "3.6"));
    CHECK_FALSE(allows(">=2.7 <3.0 || >=3.5", "3.4"));
}

TEST_CASE("invalid ranges are rejected") {
    CHECK_FALSE(parse_range("").has_value());
    CHECK_FALSE(parse_range(">=").has_value());
    CHECK_FALSE(parse_range("banana").has_value());
    CHECK_FALSE(parse_range(">2.*").has_value());
}

// ============================================================================
// Intersection Tests
// ============================================================================

TEST_CASE("intersects detects overlap with the python 2 line") {
    const std::string py2 = ">=2.0.0 <3.0.0";
    CHECK(overlaps("*", py2));
    CHECK(overlaps(">=2.7 <4.0", py2));
    CHECK(overlaps("~2.7 || ^3.4", py2));
    CHECK_FALSE(overlaps(">=3.0", py2));
    CHECK_FALSE(overlaps("^3.6", py2));
    CHECK_FALSE(overlaps("<2.0", py2));
}

TEST_CASE("intersects handles touching bounds") {
    CHECK_FALSE(overlaps("<3.0", ">=3.0"));
    CHECK(overlaps("<=3.0", ">=3.0"));
    CHECK_FALSE(overlaps("==3.0", "!=3.0"));
}

TEST_CASE("wildcard exclusions are accepted and ignored") {
    CHECK(allows(">=2.7, !=3.0.*, !=3.1.*", "3.0.5"));
    CHECK(overlaps(">=2.7, !=3.0.*", ">=2.0.0 <3.0.0"));
}
