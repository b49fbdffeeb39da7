#include "wheelsmith/native_build.hpp"
#include "wheelsmith/glob.hpp"
#include "wheelsmith/platform.hpp"
#include "wheelsmith/process.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <set>

namespace wheelsmith {

namespace fs = std::filesystem;

namespace {

const char* BUILD_DIR_NAME = "build";
const char* LIB_DIR_PREFIX = "lib.";

void replace_all(std::string& s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
}

std::string join_argv(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) out += ' ';
        out += arg;
    }
    return out;
}

} // namespace

std::vector<std::string> native_build_command(const ProjectConfig& project,
                                              const NativeBuildOptions& options) {
    if (!project.build) return {};
    std::string build_dir = join_path(project.root, BUILD_DIR_NAME);

    if (!project.build->command.empty()) {
        std::vector<std::string> argv = project.build->command;
        for (auto& arg : argv) {
            replace_all(arg, "{python}", options.python);
            replace_all(arg, "{build_dir}", build_dir);
            replace_all(arg, "{project_dir}", project.root);
        }
        return argv;
    }

    return {options.python, join_path(project.root, project.build->script), "build", "-b",
            build_dir};
}

NativeBuildResult invoke_native_build(const ProjectConfig& project,
                                      const std::vector<FileEntry>& existing,
                                      const NativeBuildOptions& options) {
    NativeBuildResult result;

    if (!project.requires_native_build()) {
        result.ok = true;
        return result;
    }

    auto argv = native_build_command(project, options);
    spdlog::info(" - Running build: {}", join_argv(argv));

    ProcessOptions proc_options;
    proc_options.cwd = project.root;
    proc_options.timeout_seconds = options.timeout_seconds;

    auto proc = run_process(argv, proc_options);
    result.exit_code = proc.exit_code;
    if (!proc.ok) {
        result.kind = BuildError::BuildCommandFailed;
        result.error = "build command failed: " + proc.error;
        return result;
    }
    if (proc.exit_code != 0) {
        result.kind = BuildError::BuildCommandFailed;
        result.error = "build command exited with status " + std::to_string(proc.exit_code);
        return result;
    }

    std::string build_dir = join_path(project.root, BUILD_DIR_NAME);
    std::vector<std::string> libs;
    for (const auto& name : list_directory(build_dir)) {
        if (name.rfind(LIB_DIR_PREFIX, 0) == 0 && is_directory(join_path(build_dir, name))) {
            libs.push_back(name);
        }
    }
    if (libs.empty()) {
        // Conditional builds may legitimately produce nothing
        spdlog::warn(" - No build/lib.* directory produced, skipping native build output");
        result.ok = true;
        return result;
    }
    std::sort(libs.begin(), libs.end());
    std::string lib = join_path(build_dir, libs.front());

    auto files = glob_expand(lib, "**");
    if (!files.ok) {
        result.kind = BuildError::SourceReadFailure;
        result.error = "failed to walk " + lib + ": " + files.error;
        return result;
    }

    std::set<std::string> present;
    for (const auto& e : existing) {
        present.insert(e.archive_path);
    }

    for (const auto& file : files.paths) {
        if (is_directory(file)) continue;

        std::string rel_root =
            to_portable_path(fs::path(file).lexically_relative(project.root).string());
        if (is_excluded(project, rel_root)) continue;

        std::string rel = to_portable_path(fs::path(file).lexically_relative(lib).string());
        if (present.count(rel)) continue;
        present.insert(rel);

        FileEntry entry;
        entry.source_path = file;
        entry.archive_path = rel;
        entry.generated = true;
        result.entries.push_back(std::move(entry));
    }

    result.ok = true;
    return result;
}

} // namespace wheelsmith
