#include <doctest/doctest.h>
#include <wheelsmith/project.hpp>

#include "../test_helpers.hpp"

using namespace wheelsmith;
using wheelsmith::testing::TempDir;
using wheelsmith::testing::write_text;

// ============================================================================
// Parsing Tests
// ============================================================================

TEST_CASE("parse_project reads a full configuration") {
    const char* config = R"({
        "name": "demo-pkg",
        "version": "1.2.0",
        "python": ">=2.7 <4.0",
        "packages": [
            {"include": "demo", "from": "src", "format": ["wheel", "sdist"]},
            {"include": "extra", "format": "sdist"}
        ],
        "include": ["CHANGELOG.md", {"path": "data/*.txt", "format": "wheel"}],
        "exclude": ["demo/secret.py"],
        "build": "build.py",
        "scripts": {
            "demo": "demo.cli:main",
            "demo-extra": {"callable": "demo.cli:extra", "extras": ["cli", "color"]}
        },
        "plugins": {"demo.plugins": {"json": "demo.plugins:Json"}},
        "metadata": {"summary": "A demo", "authors": ["Jane <jane@example.com>"]}
    })";

    auto result = parse_project(config, "/tmp/demo");
    REQUIRE(result.ok);
    const auto& p = result.project;

    CHECK(p.root == "/tmp/demo");
    CHECK(p.name == "demo-pkg");
    CHECK(p.version == "1.2.0");
    CHECK(p.python == ">=2.7 <4.0");

    REQUIRE(p.includes.size() == 4);
    CHECK(p.includes[0].kind == IncludeKind::Package);
    CHECK(p.includes[0].pattern == "demo");
    CHECK(p.includes[0].source == "src");
    CHECK(p.includes[0].applies_to("wheel"));
    CHECK_FALSE(p.includes[1].applies_to("wheel"));
    CHECK(p.includes[2].kind == IncludeKind::File);
    CHECK(p.includes[2].applies_to("wheel"));
    CHECK(p.includes[3].pattern == "data/*.txt");

    CHECK(p.excludes == std::vector<std::string>{"demo/secret.py"});

    REQUIRE(p.requires_native_build());
    CHECK(p.build->script == "build.py");

    CHECK(p.declares_scripts);
    CHECK(p.scripts.at("demo").callable == "demo.cli:main");
    CHECK(p.scripts.at("demo-extra").extras == std::vector<std::string>{"cli", "color"});
    CHECK(p.declares_plugins);
    CHECK(p.plugins.at("demo.plugins").at("json") == "demo.plugins:Json");

    CHECK(p.metadata.summary == "A demo");
    CHECK(p.metadata.authors.size() == 1);
}

TEST_CASE("parse_project defaults") {
    auto result = parse_project(R"({"name": "x", "version": "1", "packages": []})", "/p");
    REQUIRE(result.ok);
    CHECK(result.project.python == "*");
    CHECK_FALSE(result.project.requires_native_build());
    CHECK_FALSE(result.project.declares_scripts);
    CHECK_FALSE(result.project.declares_plugins);
    CHECK(result.project.includes.empty());
}

TEST_CASE("parse_project accepts a build command") {
    auto result = parse_project(
        R"({"name": "x", "version": "1", "packages": [],
            "build": {"command": ["make", "-C", "{project_dir}"]}})",
        "/p");
    REQUIRE(result.ok);
    REQUIRE(result.project.build.has_value());
    CHECK(result.project.build->script.empty());
    CHECK(result.project.build->command.size() == 3);
}

TEST_CASE("parse_project rejects invalid input") {
    auto bad_json = parse_project("{not json", "/p");
    CHECK_FALSE(bad_json.ok);
    CHECK(bad_json.kind == BuildError::InvalidProject);
    CHECK(bad_json.error.find("JSON parse error") != std::string::npos);

    auto missing_version = parse_project(R"({"name": "x"})", "/p");
    CHECK_FALSE(missing_version.ok);
    CHECK(missing_version.kind == BuildError::InvalidProject);

    auto not_object = parse_project("[1, 2]", "/p");
    CHECK_FALSE(not_object.ok);

    auto bad_packages = parse_project(R"({"name": "x", "version": "1", "packages": [{}]})", "/p");
    CHECK_FALSE(bad_packages.ok);

    auto bad_build = parse_project(R"({"name": "x", "version": "1", "packages": [], "build": {}})", "/p");
    CHECK_FALSE(bad_build.ok);

    auto bad_script = parse_project(
        R"({"name": "x", "version": "1", "packages": [], "scripts": {"s": {"extras": []}}})", "/p");
    CHECK_FALSE(bad_script.ok);
}

// ============================================================================
// Default Package Inference Tests
// ============================================================================

TEST_CASE("default package is the module directory at the root") {
    TempDir tmp;
    write_text(tmp / "my_pkg/__init__.py", "");

    auto result = parse_project(R"({"name": "My-Pkg", "version": "1.0"})", tmp.path());
    REQUIRE(result.ok);
    REQUIRE(result.project.includes.size() == 1);
    CHECK(result.project.includes[0].kind == IncludeKind::Package);
    CHECK(result.project.includes[0].pattern == "my_pkg");
    CHECK(result.project.includes[0].source.empty());
}

TEST_CASE("default package falls back to src/ and single modules") {
    TempDir tmp;
    write_text(tmp / "src/tool.py", "");

    auto result = parse_project(R"({"name": "tool", "version": "1.0"})", tmp.path());
    REQUIRE(result.ok);
    REQUIRE(result.project.includes.size() == 1);
    CHECK(result.project.includes[0].pattern == "tool.py");
    CHECK(result.project.includes[0].source == "src");
}

// ============================================================================
// Loading and Exclusion Tests
// ============================================================================

TEST_CASE("load_project reads wheelsmith.json") {
    TempDir tmp;
    write_text(tmp / "wheelsmith.json", R"({"name": "x", "version": "0.1", "packages": []})");

    auto result = load_project(tmp.path());
    REQUIRE(result.ok);
    CHECK(result.project.name == "x");

    TempDir empty;
    auto missing = load_project(empty.path());
    CHECK_FALSE(missing.ok);
    CHECK(missing.kind == BuildError::InvalidProject);
}

TEST_CASE("is_excluded matches root-relative globs") {
    ProjectConfig project;
    project.excludes = {"pkg/secret.py", "pkg/**/*.tmp"};

    CHECK(is_excluded(project, "pkg/secret.py"));
    CHECK(is_excluded(project, "pkg/a/b/c.tmp"));
    CHECK(is_excluded(project, "pkg/c.tmp"));
    CHECK_FALSE(is_excluded(project, "pkg/public.py"));
    CHECK_FALSE(is_excluded(project, "other/secret.py"));
}
