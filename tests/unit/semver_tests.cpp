#include <doctest/doctest.h>
#include <lode/semver.hpp>

using lode::Comparator;
using lode::compare_versions;
using lode::parse_range;
using lode::parse_version;
using lode::satisfies;
using lode::version_satisfies;

// ============================================================================
// Version Parsing Tests
// ============================================================================

TEST_CASE("parse_version accepts MAJOR.MINOR.PATCH") {
    auto v = parse_version("1.2.3");
    REQUIRE(v);
    CHECK(v->major() == 1);
    CHECK(v->minor() == 2);
    CHECK(v->patch() == 3);
    CHECK_FALSE(v->is_prerelease());
}

TEST_CASE("parse_version pads short versions") {
    auto one = parse_version("1");
    REQUIRE(one);
    CHECK(one->major() == 1);
    CHECK(one->minor() == 0);
    CHECK(one->patch() == 0);

    auto two = parse_version("0.4");
    REQUIRE(two);
    CHECK(two->major() == 0);
    CHECK(two->minor() == 4);
    CHECK(two->patch() == 0);
}

TEST_CASE("parse_version keeps pre-release on padded versions") {
    auto v = parse_version("2.1-rc.1");
    REQUIRE(v);
    CHECK(v->minor() == 1);
    CHECK(v->is_prerelease());
    CHECK(v->prerelease() == "rc.1");
}

TEST_CASE("parse_version rejects invalid versions") {
    CHECK_FALSE(parse_version(""));
    CHECK_FALSE(parse_version("   "));
    CHECK_FALSE(parse_version("not.a.version"));
    CHECK_FALSE(parse_version("1.2.3.4"));
    CHECK_FALSE(parse_version("1..2"));
}

TEST_CASE("parse_version trims whitespace") {
    auto v = parse_version("  1.2.3  ");
    REQUIRE(v);
    CHECK(v->patch() == 3);
}

// ============================================================================
// Requirement Parsing Tests
// ============================================================================

TEST_CASE("parse_range accepts operator separated from version") {
    auto r = parse_range("> 0");
    REQUIRE(r);
    REQUIRE(r->sets.size() == 1);
    REQUIRE(r->sets[0].size() == 1);
    CHECK(r->sets[0][0].op == Comparator::Gt);
}

TEST_CASE("parse_range treats bare version as exact match") {
    auto r = parse_range("1.0.0");
    REQUIRE(r);
    CHECK(r->sets[0][0].op == Comparator::Eq);
}

TEST_CASE("parse_range splits comma separated constraints into one set") {
    auto r = parse_range(">= 1.0, < 2.0");
    REQUIRE(r);
    REQUIRE(r->sets.size() == 1);
    REQUIRE(r->sets[0].size() == 2);
    CHECK(r->sets[0][0].op == Comparator::Ge);
    CHECK(r->sets[0][1].op == Comparator::Lt);
}

TEST_CASE("parse_range expands pessimistic constraint") {
    auto r = parse_range("~> 1.2");
    REQUIRE(r);
    REQUIRE(r->sets[0].size() == 2);
    CHECK(r->sets[0][0].op == Comparator::Ge);
    CHECK(r->sets[0][1].op == Comparator::Lt);
    CHECK(r->sets[0][1].version.major() == 2);
}

TEST_CASE("parse_range accepts alternatives") {
    auto r = parse_range("< 1.0 || >= 3.0");
    REQUIRE(r);
    CHECK(r->sets.size() == 2);
}

TEST_CASE("parse_range rejects malformed requirements") {
    CHECK_FALSE(parse_range(""));
    CHECK_FALSE(parse_range(">="));
    CHECK_FALSE(parse_range(">= abc"));
    CHECK_FALSE(parse_range("1.0 ||"));
}

// ============================================================================
// Satisfaction Tests
// ============================================================================

TEST_CASE("default requirements match installed versions") {
    CHECK(version_satisfies("0.0.1", ">= 0"));
    CHECK(version_satisfies("0.0.0", ">= 0"));
    CHECK(version_satisfies("3.1.4", "> 0"));
    CHECK_FALSE(version_satisfies("0.0.0", "> 0"));
}

TEST_CASE("pessimistic constraint bounds") {
    CHECK(version_satisfies("1.2.0", "~> 1.2"));
    CHECK(version_satisfies("1.9.9", "~> 1.2"));
    CHECK_FALSE(version_satisfies("2.0.0", "~> 1.2"));
    CHECK_FALSE(version_satisfies("1.1.9", "~> 1.2"));

    CHECK(version_satisfies("1.2.7", "~> 1.2.3"));
    CHECK_FALSE(version_satisfies("1.3.0", "~> 1.2.3"));
}

TEST_CASE("not-equal constraint") {
    CHECK(version_satisfies("1.0.1", "!= 1.0.0"));
    CHECK_FALSE(version_satisfies("1.0", "!= 1.0.0"));
}

TEST_CASE("satisfies checks every constraint of a set") {
    auto r = parse_range(">= 1.0, < 2.0");
    REQUIRE(r);
    CHECK(satisfies(*parse_version("1.5"), *r));
    CHECK_FALSE(satisfies(*parse_version("2.0"), *r));
    CHECK_FALSE(satisfies(*parse_version("0.9"), *r));
}

TEST_CASE("version_satisfies is false when either side is invalid") {
    CHECK_FALSE(version_satisfies("bogus", ">= 0"));
    CHECK_FALSE(version_satisfies("1.0.0", "=>> 1"));
}

TEST_CASE("min_version returns the lowest lower bound") {
    auto r = parse_range(">= 2.0 || >= 1.5, < 1.8");
    REQUIRE(r);
    auto min = r->min_version();
    REQUIRE(min);
    CHECK(min->major() == 1);
    CHECK(min->minor() == 5);
}

// ============================================================================
// Ordering Tests
// ============================================================================

TEST_CASE("compare_versions orders numerically") {
    CHECK(compare_versions("1.10.0", "1.9.0") > 0);
    CHECK(compare_versions("0.9", "0.10") < 0);
    CHECK(compare_versions("1.0", "1.0.0") == 0);
    CHECK(compare_versions("1.0.0-rc.1", "1.0.0") < 0);
}

TEST_CASE("compare_versions sorts unparseable versions first") {
    CHECK(compare_versions("junk", "0.0.1") < 0);
    CHECK(compare_versions("0.0.1", "junk") > 0);
    CHECK(compare_versions("a", "b") < 0);
}
