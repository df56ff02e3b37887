#include <doctest/doctest.h>
#include <lode/specification.hpp>

#include <algorithm>

using namespace lode;

TEST_CASE("parse_specification reads a full specification") {
    const char* json = R"({
        "name": "rake",
        "version": "0.4.15",
        "summary": "Ruby based make-like utility.",
        "dependencies": [
            "sources",
            {"name": "zlib", "requirement": "~> 1.2"}
        ],
        "executables": ["rake"],
        "autorequire": "rake",
        "extensions": ["ext/fast/extconf.rb"],
        "require_paths": ["lib", "ext"],
        "bindir": "scripts"
    })";

    auto result = parse_specification(json);
    REQUIRE(result.ok);
    const auto& spec = result.spec;
    CHECK(spec.name == "rake");
    CHECK(spec.version == "0.4.15");
    CHECK(spec.full_name() == "rake-0.4.15");
    CHECK(spec.summary == "Ruby based make-like utility.");
    REQUIRE(spec.dependencies.size() == 2);
    CHECK(spec.dependencies[0].name == "sources");
    CHECK(spec.dependencies[0].requirement == ">= 0");
    CHECK(spec.dependencies[1].to_string() == "zlib (~> 1.2)");
    CHECK(spec.executables == std::vector<std::string>{"rake"});
    REQUIRE(spec.autorequire);
    CHECK(*spec.autorequire == "rake");
    CHECK(spec.extensions == std::vector<std::string>{"ext/fast/extconf.rb"});
    CHECK(spec.require_paths == std::vector<std::string>{"lib", "ext"});
    CHECK(spec.bindir == "scripts");
}

TEST_CASE("parse_specification applies defaults") {
    auto result = parse_specification(R"({"name": "tiny", "version": "1.0"})");
    REQUIRE(result.ok);
    CHECK(result.spec.dependencies.empty());
    CHECK_FALSE(result.spec.autorequire);
    CHECK(result.spec.require_paths == std::vector<std::string>{"lib"});
    CHECK(result.spec.bindir == "bin");
    CHECK(result.spec.full_gem_path().empty());
}

TEST_CASE("parse_specification treats blank autorequire as absent") {
    auto result = parse_specification(R"({"name": "a", "version": "1", "autorequire": " "})");
    REQUIRE(result.ok);
    CHECK_FALSE(result.spec.autorequire);

    auto null_auto = parse_specification(R"({"name": "a", "version": "1", "autorequire": null})");
    REQUIRE(null_auto.ok);
    CHECK_FALSE(null_auto.spec.autorequire);
}

TEST_CASE("parse_specification rejects invalid input") {
    CHECK(parse_specification(R"({"version": "1.0"})").error == "name missing");
    CHECK(parse_specification(R"({"name": "a"})").error == "version missing");
    CHECK_FALSE(parse_specification(R"({"name": "a", "version": "x.y"})").ok);
    CHECK_FALSE(parse_specification(R"({"name": "a b", "version": "1"})").ok);
    CHECK_FALSE(parse_specification(R"({"name": "../a", "version": "1"})").ok);
    CHECK_FALSE(parse_specification(R"({"name": "a", "version": "1", "dependencies": {}})").ok);
    CHECK_FALSE(parse_specification(R"({"name": "a", "version": "1", "dependencies": [3]})").ok);
    CHECK_FALSE(parse_specification("[1, 2]").ok);
    CHECK(parse_specification("{").error.find("parse error") == 0);
}

TEST_CASE("validate_specification rejects unsafe paths") {
    Specification spec;
    spec.name = "evil";
    spec.version = "1.0";
    std::string error;
    REQUIRE(validate_specification(spec, error));

    SUBCASE("extension escaping the package") {
        spec.extensions = {"../../extconf.rb"};
        CHECK_FALSE(validate_specification(spec, error));
        CHECK(error.find("extension") != std::string::npos);
    }
    SUBCASE("absolute require path") {
        spec.require_paths = {"/usr/lib"};
        CHECK_FALSE(validate_specification(spec, error));
    }
    SUBCASE("executable with a separator") {
        spec.executables = {"bin/evil"};
        CHECK_FALSE(validate_specification(spec, error));
    }
    SUBCASE("autorequire escaping sitelibdir") {
        spec.autorequire = "../../etc/profile";
        CHECK_FALSE(validate_specification(spec, error));
    }
    SUBCASE("bad dependency requirement") {
        spec.dependencies.push_back({"other", ">>= 1"});
        CHECK_FALSE(validate_specification(spec, error));
    }
}

TEST_CASE("specification_to_json round trips the persisted fields") {
    Specification spec;
    spec.name = "net-thing";
    spec.version = "2.0.1";
    spec.dependencies.push_back({"base", ">= 1.0"});
    spec.autorequire = "net/thing";
    spec.executables = {"thing"};

    auto result = parse_specification(serialize_specification(spec));
    REQUIRE(result.ok);
    CHECK(result.spec.full_name() == "net-thing-2.0.1");
    CHECK(result.spec.dependencies[0].requirement == ">= 1.0");
    CHECK(*result.spec.autorequire == "net/thing");

    auto j = specification_to_json(Specification{});
    CHECK(j["autorequire"].is_null());
}

TEST_CASE("full_gem_path lives under gems") {
    Specification spec;
    spec.name = "foo";
    spec.version = "1.2";
    spec.installation_path = "/opt/lode";
    CHECK(spec.full_gem_path() == "/opt/lode/gems/foo-1.2");
}

TEST_CASE("specification_less orders by name then version") {
    std::vector<Specification> specs(3);
    specs[0].name = "b"; specs[0].version = "1.10";
    specs[1].name = "b"; specs[1].version = "1.9";
    specs[2].name = "a"; specs[2].version = "3.0";

    std::sort(specs.begin(), specs.end(), specification_less);
    CHECK(specs[0].full_name() == "a-3.0");
    CHECK(specs[1].full_name() == "b-1.9");
    CHECK(specs[2].full_name() == "b-1.10");
}
