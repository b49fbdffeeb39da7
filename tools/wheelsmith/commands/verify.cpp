/**
 * wheelsmith CLI - verify command
 *
 * Check every entry of a wheel against its RECORD manifest.
 */

#include "../common.hpp"
#include <wheelsmith/verify.hpp>
#include <CLI/CLI.hpp>

namespace wheelsmith::cli::commands {

namespace {

struct VerifyOptions {
    std::string wheel;
};

int cmd_verify(const GlobalOptions& opts, const VerifyOptions& verify_opts) {
    init_command_logging(opts);

    auto result = verify_wheel(verify_opts.wheel);
    if (!result.error.empty()) {
        print_error(result.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.ok;
        j["entries"] = result.entry_count;
        j["record"] = result.record_path;
        j["issues"] = result.issues;
        output_json(j);
    } else {
        for (const auto& issue : result.issues) {
            std::cerr << "  " << issue << std::endl;
        }
        if (result.ok) {
            if (!opts.quiet) {
                std::cout << verify_opts.wheel << ": OK (" << result.entry_count
                          << " entries)" << std::endl;
            }
        } else {
            std::cerr << "Error: " << verify_opts.wheel << ": " << result.issues.size()
                      << " issue(s)" << std::endl;
        }
    }

    return result.ok ? 0 : 1;
}

} // namespace

void setup_verify(CLI::App* app, GlobalOptions& opts) {
    static VerifyOptions verify_opts;

    app->add_option("wheel", verify_opts.wheel, "Wheel file to check")->required();

    app->callback([&opts]() {
        std::exit(cmd_verify(opts, verify_opts));
    });
}

} // namespace wheelsmith::cli::commands
