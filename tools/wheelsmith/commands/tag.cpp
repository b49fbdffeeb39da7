/**
 * wheelsmith CLI - tag command
 *
 * Print the compatibility tag and wheel filename a build would produce.
 */

#include "../common.hpp"
#include <wheelsmith/naming.hpp>
#include <wheelsmith/project.hpp>
#include <wheelsmith/tags.hpp>
#include <CLI/CLI.hpp>

namespace wheelsmith::cli::commands {

namespace {

struct TagOptions {
    std::string dir = ".";
};

int cmd_tag(const GlobalOptions& opts, const TagOptions& tag_opts) {
    init_command_logging(opts);

    auto loaded = load_project(tag_opts.dir);
    if (!loaded.ok) {
        print_error(loaded.error, opts.json, loaded.kind);
        return 1;
    }
    const auto& project = loaded.project;

    InterpreterTagProbe probe(opts.python);
    auto result = resolve_tag(project.requires_native_build(), project.python, probe);
    if (!result.ok) {
        print_error(result.error, opts.json, result.kind);
        return 1;
    }

    std::string filename = wheel_filename(project.name, project.version, result.tag.str());

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["tag"] = result.tag.str();
        j["interpreter"] = result.tag.interpreter;
        j["abi"] = result.tag.abi;
        j["platform"] = result.tag.platform;
        j["filename"] = filename;
        output_json(j);
    } else {
        std::cout << result.tag.str() << std::endl;
        if (opts.verbose) {
            std::cout << "  Filename: " << filename << std::endl;
        }
    }

    return 0;
}

} // namespace

void setup_tag(CLI::App* app, GlobalOptions& opts) {
    static TagOptions tag_opts;

    app->add_option("dir", tag_opts.dir, "Project directory (default: .)");

    app->callback([&opts]() {
        std::exit(cmd_tag(opts, tag_opts));
    });
}

} // namespace wheelsmith::cli::commands
