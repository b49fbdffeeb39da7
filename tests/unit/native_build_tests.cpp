#include <doctest/doctest.h>
#include <wheelsmith/native_build.hpp>

#include "../test_helpers.hpp"

using namespace wheelsmith;
using wheelsmith::testing::TempDir;
using wheelsmith::testing::write_text;

namespace {

ProjectConfig project_with_command(const TempDir& tmp, const std::string& script) {
    ProjectConfig project;
    project.root = tmp.path();
    project.name = "native";
    project.version = "1.0";
    NativeBuildConfig build;
    build.command = {"sh", "-c", script};
    project.build = build;
    return project;
}

} // namespace

TEST_CASE("native_build_command defaults to a setup-style invocation") {
    ProjectConfig project;
    project.root = "/work/proj";
    project.build = NativeBuildConfig{"build.py", {}};

    NativeBuildOptions options;
    options.python = "/usr/bin/python3";
    CHECK(native_build_command(project, options) == std::vector<std::string>{
        "/usr/bin/python3", "/work/proj/build.py", "build", "-b", "/work/proj/build"});
}

TEST_CASE("native_build_command substitutes placeholders") {
    ProjectConfig project;
    project.root = "/work/proj";
    project.build = NativeBuildConfig{"", {"{python}", "setup.py", "-b", "{build_dir}", "{project_dir}/x"}};

    NativeBuildOptions options;
    options.python = "py";
    CHECK(native_build_command(project, options) == std::vector<std::string>{
        "py", "setup.py", "-b", "/work/proj/build", "/work/proj/x"});
}

TEST_CASE("invoke_native_build collects the first lib directory") {
    TempDir tmp;
    auto project = project_with_command(tmp,
        "mkdir -p {build_dir}/lib.b/native {build_dir}/lib.a/native && "
        "echo so > {build_dir}/lib.a/native/_speed.so && "
        "echo py > {build_dir}/lib.a/native/__init__.py && "
        "echo other > {build_dir}/lib.b/native/ignored.so");

    std::vector<FileEntry> existing = {{tmp / "native/__init__.py", "native/__init__.py", false}};
    auto result = invoke_native_build(project, existing);
    REQUIRE(result.ok);
    REQUIRE(result.entries.size() == 1);
    CHECK(result.entries[0].archive_path == "native/_speed.so");
    CHECK(result.entries[0].generated);
    CHECK(result.entries[0].source_path == tmp / "build/lib.a/native/_speed.so");
}

TEST_CASE("invoke_native_build honours exclusions") {
    TempDir tmp;
    auto project = project_with_command(tmp,
        "mkdir -p {build_dir}/lib.x && echo a > {build_dir}/lib.x/keep.so && "
        "echo b > {build_dir}/lib.x/drop.so");
    project.excludes = {"build/**/drop.so"};

    auto result = invoke_native_build(project, {});
    REQUIRE(result.ok);
    REQUIRE(result.entries.size() == 1);
    CHECK(result.entries[0].archive_path == "keep.so");
}

TEST_CASE("invoke_native_build without output is an empty success") {
    TempDir tmp;
    auto project = project_with_command(tmp, "true");
    auto result = invoke_native_build(project, {});
    CHECK(result.ok);
    CHECK(result.entries.empty());
}

TEST_CASE("invoke_native_build reports a failing command") {
    TempDir tmp;
    auto project = project_with_command(tmp, "exit 4");
    auto result = invoke_native_build(project, {});
    CHECK_FALSE(result.ok);
    CHECK(result.kind == BuildError::BuildCommandFailed);
    CHECK(result.exit_code == 4);
    CHECK(result.error.find("4") != std::string::npos);
}

TEST_CASE("invoke_native_build enforces the timeout") {
    TempDir tmp;
    auto project = project_with_command(tmp, "exec sleep 30");
    NativeBuildOptions options;
    options.timeout_seconds = 1;
    auto result = invoke_native_build(project, {}, options);
    CHECK_FALSE(result.ok);
    CHECK(result.kind == BuildError::BuildCommandFailed);
}

TEST_CASE("invoke_native_build is a no-op without a build step") {
    TempDir tmp;
    ProjectConfig project;
    project.root = tmp.path();
    auto result = invoke_native_build(project, {});
    CHECK(result.ok);
    CHECK(result.entries.empty());
}
