#include <catch2/catch.hpp>
#include <projmetrics/glob.hpp>

using namespace projmetrics;

// ---- Name wildcards ----

TEST_CASE("wildcard literal match", "[glob]") {
    REQUIRE(wildcard_match("vendor", "vendor"));
    REQUIRE_FALSE(wildcard_match("vendor", "vendors"));
    REQUIRE_FALSE(wildcard_match("Vendor", "vendor"));
}

TEST_CASE("wildcard star", "[glob]") {
    REQUIRE(wildcard_match("third_party*", "third_party"));
    REQUIRE(wildcard_match("third_party*", "third_party_v2"));
    REQUIRE(wildcard_match("*.test.js", "button.test.js"));
    REQUIRE(wildcard_match("*_test.py", "parser_test.py"));
    REQUIRE_FALSE(wildcard_match("*_test.py", "parser_test.pyc"));
}

TEST_CASE("wildcard star backtracks", "[glob]") {
    REQUIRE(wildcard_match("*a*b", "xaxxab"));
    REQUIRE(wildcard_match("*.spec.ts", "a.spec.spec.ts"));
    REQUIRE_FALSE(wildcard_match("*a*b", "xaxxa"));
}

TEST_CASE("wildcard question mark", "[glob]") {
    REQUIRE(wildcard_match("build?", "build2"));
    REQUIRE_FALSE(wildcard_match("build?", "build"));
    REQUIRE_FALSE(wildcard_match("build?", "build22"));
}

TEST_CASE("wildcard character classes", "[glob]") {
    REQUIRE(wildcard_match("out[0-9]", "out7"));
    REQUIRE_FALSE(wildcard_match("out[0-9]", "outx"));
    REQUIRE(wildcard_match("[!.]*", "src"));
    REQUIRE_FALSE(wildcard_match("[!.]*", ".git"));
    REQUIRE(wildcard_match("[abc]x", "bx"));
}

TEST_CASE("wildcard unterminated class is literal", "[glob]") {
    REQUIRE(wildcard_match("a[b", "a[b"));
    REQUIRE_FALSE(wildcard_match("a[b", "ab"));
}

TEST_CASE("wildcard ignore case", "[glob]") {
    REQUIRE(wildcard_match("*test.java", "FooTest.java", true));
    REQUIRE(wildcard_match("*TEST.JAVA", "footest.java", true));
    REQUIRE(wildcard_match("[a-z]*", "Makefile", true));
    REQUIRE_FALSE(wildcard_match("*test.java", "FooTest.java", false));
}

TEST_CASE("wildcard empty pattern and name", "[glob]") {
    REQUIRE(wildcard_match("", ""));
    REQUIRE(wildcard_match("*", ""));
    REQUIRE_FALSE(wildcard_match("", "a"));
}

// ---- Path globs ----

TEST_CASE("glob path segments", "[glob]") {
    REQUIRE(glob_match("docs/generated", "docs/generated"));
    REQUIRE(glob_match("docs/*", "docs/api"));
    REQUIRE_FALSE(glob_match("docs/*", "docs/api/v1"));
    REQUIRE_FALSE(glob_match("docs/*", "src/docs/api"));
}

TEST_CASE("glob doublestar", "[glob]") {
    REQUIRE(glob_match("**/generated", "generated"));
    REQUIRE(glob_match("**/generated", "a/b/generated"));
    REQUIRE(glob_match("src/**/fixtures", "src/fixtures"));
    REQUIRE(glob_match("src/**/fixtures", "src/a/b/fixtures"));
    REQUIRE(glob_match("vendor/**", "vendor/x/y"));
    REQUIRE_FALSE(glob_match("src/**/fixtures", "lib/fixtures"));
}

TEST_CASE("glob normalizes separators", "[glob]") {
    REQUIRE(glob_match("a/b", "a\\b"));
    REQUIRE(glob_match("a//b/", "a/b"));
}

TEST_CASE("has_wildcards", "[glob]") {
    REQUIRE(has_wildcards("build*"));
    REQUIRE(has_wildcards("out?"));
    REQUIRE(has_wildcards("[ab]"));
    REQUIRE_FALSE(has_wildcards("node_modules"));
}
