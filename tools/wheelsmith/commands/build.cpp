/**
 * wheelsmith CLI - build command
 *
 * Build a wheel from a project directory containing wheelsmith.json.
 */

#include "../common.hpp"
#include <wheelsmith/project.hpp>
#include <wheelsmith/wheel_builder.hpp>
#include <CLI/CLI.hpp>

namespace wheelsmith::cli::commands {

namespace {

struct BuildOptions {
    std::string dir = ".";
    std::string target_dir;
    std::string generator;
    int build_timeout = 0;
};

int cmd_build(const GlobalOptions& opts, const BuildOptions& build_opts) {
    init_command_logging(opts);

    auto loaded = load_project(build_opts.dir);
    if (!loaded.ok) {
        print_error(loaded.error, opts.json, loaded.kind);
        return 1;
    }

    WheelBuildOptions options;
    options.target_dir = build_opts.target_dir;
    options.generator = build_opts.generator;
    options.python = opts.python;
    options.build_timeout_seconds = build_opts.build_timeout;

    WheelBuilder builder(loaded.project, options);
    auto result = builder.build();
    if (!result.ok) {
        print_error(result.error, opts.json, result.kind);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["wheel"] = result.wheel_path;
        j["filename"] = result.wheel_filename;
        j["tag"] = result.tag.str();
        nlohmann::json records = nlohmann::json::array();
        for (const auto& r : result.records) {
            records.push_back({{"path", r.archive_path}, {"sha256", r.hash}, {"size", r.size}});
        }
        j["records"] = records;
        output_json(j);
    } else if (!opts.quiet) {
        print_success(result.wheel_path, opts.json);
    }

    return 0;
}

} // namespace

void setup_build(CLI::App* app, GlobalOptions& opts) {
    static BuildOptions build_opts;

    app->add_option("dir", build_opts.dir, "Project directory (default: .)");
    app->add_option("-o,--target-dir", build_opts.target_dir, "Output directory (default: <dir>/dist)");
    app->add_option("--generator", build_opts.generator, "Generator written to the WHEEL file");
    app->add_option("--build-timeout", build_opts.build_timeout,
                    "Seconds before the native build is killed (0 = no limit)")
        ->check(CLI::NonNegativeNumber);

    app->callback([&opts]() {
        std::exit(cmd_build(opts, build_opts));
    });
}

} // namespace wheelsmith::cli::commands
