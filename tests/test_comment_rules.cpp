#include <catch2/catch.hpp>
#include <projmetrics/scan/comment_rules.hpp>

using namespace projmetrics;

TEST_CASE("builtin table families", "[rules]") {
    RuleTable rules;
    REQUIRE(rules.lookup(".java") == RuleFamily::CLike);
    REQUIRE(rules.lookup(".tsx") == RuleFamily::CLike);
    REQUIRE(rules.lookup(".hpp") == RuleFamily::CLike);
    REQUIRE(rules.lookup(".scss") == RuleFamily::CLike);
    REQUIRE(rules.lookup(".sh") == RuleFamily::Hash);
    REQUIRE(rules.lookup(".yml") == RuleFamily::Hash);
    REQUIRE(rules.lookup(".toml") == RuleFamily::Hash);
    REQUIRE(rules.lookup(".py") == RuleFamily::PythonTriple);
    REQUIRE(rules.lookup(".pyi") == RuleFamily::PythonTriple);
    REQUIRE(rules.size() == builtin_rules().size());
}

TEST_CASE("lookup ignores case and leading dot", "[rules]") {
    RuleTable rules;
    REQUIRE(rules.lookup(".PY") == RuleFamily::PythonTriple);
    REQUIRE(rules.lookup("Cpp") == RuleFamily::CLike);
    REQUIRE(rules.lookup("sh") == RuleFamily::Hash);
}

TEST_CASE("unknown extensions map to None", "[rules]") {
    RuleTable rules;
    REQUIRE(rules.lookup(".xyz") == RuleFamily::None);
    REQUIRE(rules.lookup(".md") == RuleFamily::None);
    REQUIRE(rules.lookup("") == RuleFamily::None);
    REQUIRE(rules.lookup("(no_ext)") == RuleFamily::None);
}

TEST_CASE("set adds and replaces mappings", "[rules]") {
    RuleTable rules;
    rules.set("RS", RuleFamily::CLike);
    rules.set(".py", RuleFamily::Hash);
    REQUIRE(rules.lookup(".rs") == RuleFamily::CLike);
    REQUIRE(rules.lookup(".py") == RuleFamily::Hash);
    // The builtin table itself is untouched
    REQUIRE(builtin_rules().at(".py") == RuleFamily::PythonTriple);
}

TEST_CASE("rule family names round-trip", "[rules]") {
    for (auto f : {RuleFamily::None, RuleFamily::Hash,
                   RuleFamily::CLike, RuleFamily::PythonTriple}) {
        auto r = parse_rule_family(rule_family_name(f));
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == f);
    }
    REQUIRE(parse_rule_family("C-LIKE").is_err());
}

TEST_CASE("normalize_extension", "[rules]") {
    REQUIRE(normalize_extension("PY") == ".py");
    REQUIRE(normalize_extension(".Hpp") == ".hpp");
    REQUIRE(normalize_extension("") == "");
}

TEST_CASE("extension_of follows file name suffix rules", "[rules]") {
    REQUIRE(extension_of("src/main.CPP") == ".cpp");
    REQUIRE(extension_of("archive.tar.gz") == ".gz");
    REQUIRE(extension_of("Makefile") == "");
    REQUIRE(extension_of(".bashrc") == "");
    REQUIRE(extension_of("notes.") == "");
    REQUIRE(extension_of("dir.d/README") == "");
}

TEST_CASE("ext_key substitutes a placeholder", "[rules]") {
    REQUIRE(ext_key("a/b.Py") == ".py");
    REQUIRE(ext_key("LICENSE") == "(no_ext)");
}
