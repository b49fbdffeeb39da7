#pragma once

#include "wheelsmith/errors.hpp"
#include "wheelsmith/project.hpp"
#include "wheelsmith/record.hpp"
#include "wheelsmith/tags.hpp"

#include <optional>
#include <string>
#include <vector>

namespace wheelsmith {

// ============================================================================
// Wheel Build Orchestration
// ============================================================================

struct WheelBuildOptions {
    std::string target_dir;             // empty = <root>/dist
    std::string generator;              // empty = default_generator()
    std::string python = "python3";     // interpreter for the build step and tag probe
    int build_timeout_seconds = 0;      // 0 = no timeout
    std::optional<std::string> metadata;  // METADATA blob; rendered from the project if unset
};

enum class BuildState {
    Init,
    Collecting,
    Building,
    Writing,
    Finalizing,
    Done,
    Failed,
};

inline const char* build_state_to_string(BuildState s) {
    switch (s) {
        case BuildState::Init: return "init";
        case BuildState::Collecting: return "collecting";
        case BuildState::Building: return "building";
        case BuildState::Writing: return "writing";
        case BuildState::Finalizing: return "finalizing";
        case BuildState::Done: return "done";
        case BuildState::Failed: return "failed";
        default: return "unknown";
    }
}

struct WheelBuildResult {
    bool ok = false;
    BuildError kind = BuildError::None;
    std::string error;
    BuildState failed_state = BuildState::Init;     // state the build was in when it failed

    std::string wheel_path;
    std::string wheel_filename;
    Tag tag;
    std::vector<RecordEntry> records;   // RECORD rows in write order
};

// "wheelsmith <version>"
std::string default_generator();

// Produces one archive per build() call. The archive is written to a
// temporary file in the target directory and renamed into place only
// once complete; on failure the temporary file is removed and any
// previous archive is left untouched.
class WheelBuilder {
public:
    explicit WheelBuilder(ProjectConfig project, WheelBuildOptions options = {});

    // Tag probe is consulted only for projects with a native build
    WheelBuildResult build(HostTagProbe& probe);

    // Probe with InterpreterTagProbe(options.python)
    WheelBuildResult build();

    BuildState state() const { return state_; }
    const ProjectConfig& project() const { return project_; }

private:
    WheelBuildResult fail(WheelBuildResult& result, BuildError kind, const std::string& error);

    ProjectConfig project_;
    WheelBuildOptions options_;
    BuildState state_ = BuildState::Init;
};

} // namespace wheelsmith
