/**
 * wheelsmith CLI - Entry Point
 *
 * Builds wheel archives from Python project trees.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace wheelsmith::cli::commands {
    void setup_build(CLI::App* app, GlobalOptions& opts);
    void setup_tag(CLI::App* app, GlobalOptions& opts);
    void setup_verify(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace wheelsmith::cli;

    CLI::App app{"wheelsmith - reproducible wheel builder"};
    app.set_version_flag("-V,--version", WHEELSMITH_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--python", opts.python, "Python interpreter for builds and tag probing");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* build_cmd = app.add_subcommand("build", "Build a wheel from a project directory");
    commands::setup_build(build_cmd, opts);

    auto* tag_cmd = app.add_subcommand("tag", "Print the compatibility tag for a project");
    commands::setup_tag(tag_cmd, opts);

    auto* verify_cmd = app.add_subcommand("verify", "Check a wheel against its RECORD");
    commands::setup_verify(verify_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
