#include <doctest/doctest.h>
#include <wheelsmith/process.hpp>

#include "../test_helpers.hpp"

#include <filesystem>

using namespace wheelsmith;
using wheelsmith::testing::TempDir;

TEST_CASE("run_process reports exit codes") {
    auto ok = run_process({"sh", "-c", "exit 0"});
    CHECK(ok.ok);
    CHECK(ok.exit_code == 0);

    auto failed = run_process({"sh", "-c", "exit 3"});
    CHECK(failed.ok);
    CHECK(failed.exit_code == 3);
}

TEST_CASE("run_process captures stdout") {
    ProcessOptions options;
    options.capture_output = true;
    auto result = run_process({"sh", "-c", "echo hello"}, options);
    REQUIRE(result.ok);
    CHECK(result.output == "hello\n");
}

TEST_CASE("run_process runs the child in the given directory") {
    TempDir tmp;
    auto before = std::filesystem::current_path();

    ProcessOptions options;
    options.cwd = tmp.path();
    auto result = run_process({"sh", "-c", "touch marker"}, options);
    REQUIRE(result.ok);
    CHECK(result.exit_code == 0);
    CHECK(std::filesystem::exists(tmp / "marker"));
    CHECK(std::filesystem::current_path() == before);
}

TEST_CASE("run_process kills children that exceed the timeout") {
    ProcessOptions options;
    options.timeout_seconds = 1;
    auto result = run_process({"sh", "-c", "exec sleep 30"}, options);
    CHECK_FALSE(result.ok);
    CHECK(result.timed_out);
    CHECK(result.error.find("timed out") != std::string::npos);
}

TEST_CASE("run_process with a missing program exits 127") {
    auto result = run_process({"wheelsmith-definitely-missing-binary"});
    CHECK(result.ok);
    CHECK(result.exit_code == 127);
}

TEST_CASE("run_process rejects an empty command") {
    auto result = run_process({});
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.error.empty());
}
