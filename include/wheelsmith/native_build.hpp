#pragma once

#include "wheelsmith/errors.hpp"
#include "wheelsmith/project.hpp"
#include "wheelsmith/types.hpp"

#include <string>
#include <vector>

namespace wheelsmith {

// ============================================================================
// Native Extension Build
// ============================================================================

struct NativeBuildOptions {
    std::string python = "python3";
    int timeout_seconds = 0;            // 0 = no timeout
};

struct NativeBuildResult {
    bool ok = false;
    BuildError kind = BuildError::None;
    std::string error;
    int exit_code = 0;
    std::vector<FileEntry> entries;     // generated files, sorted by archive_path
};

// argv for the project's build step. With an explicit command the
// {python}, {build_dir} and {project_dir} placeholders are substituted;
// otherwise it is "<python> <script> build -b <root>/build".
std::vector<std::string> native_build_command(const ProjectConfig& project,
                                              const NativeBuildOptions& options);

// Run the build step in the project root and collect the first
// build/lib.* directory. Paths already present in `existing` and excluded
// paths are skipped. No lib.* directory is an empty success.
NativeBuildResult invoke_native_build(const ProjectConfig& project,
                                      const std::vector<FileEntry>& existing,
                                      const NativeBuildOptions& options = {});

} // namespace wheelsmith
