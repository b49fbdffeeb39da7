/**
 * wheelsmith CLI - Common utilities and types
 */

#pragma once

#include <wheelsmith/errors.hpp>
#include <wheelsmith/log.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <iostream>
#include <string>

namespace wheelsmith::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string python = "python3";    // --python
    bool json = false;                 // --json
    bool verbose = false;              // -v, --verbose
    bool quiet = false;                // -q, --quiet
};

/**
 * Configure logging for a command. JSON mode keeps stdout clean by
 * only letting warnings through to the log.
 */
inline void init_command_logging(const GlobalOptions& opts) {
    LogLevel level = log_level_from_flags(opts.verbose, opts.quiet);
    if (opts.json && level == LogLevel::Info) {
        level = LogLevel::Warn;
    }
    init_logger(level);
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode, BuildError kind = BuildError::None) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        if (kind != BuildError::None) {
            j["kind"] = build_error_to_string(kind);
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

} // namespace wheelsmith::cli
