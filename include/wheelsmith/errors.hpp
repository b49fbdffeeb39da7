#pragma once

namespace wheelsmith {

// ============================================================================
// Build Error Taxonomy
// ============================================================================

// Every fallible operation reports one of these alongside its message.
// All of them except None are fatal to the build that produced them.
enum class BuildError {
    None,
    InvalidProject,             // wheelsmith.json unreadable or malformed
    ConfigurationIncompatible,  // no tag for a required native build
    SourceReadFailure,          // a source file could not be read
    BuildCommandFailed,         // native build exited non-zero or timed out
    DuplicateArchivePath,       // two sources would occupy one archive path
    ArchiveWriteFailure,        // the archive could not be written
};

inline const char* build_error_to_string(BuildError e) {
    switch (e) {
        case BuildError::None: return "none";
        case BuildError::InvalidProject: return "invalid_project";
        case BuildError::ConfigurationIncompatible: return "configuration_incompatible";
        case BuildError::SourceReadFailure: return "source_read_failure";
        case BuildError::BuildCommandFailed: return "build_command_failed";
        case BuildError::DuplicateArchivePath: return "duplicate_archive_path";
        case BuildError::ArchiveWriteFailure: return "archive_write_failure";
        default: return "unknown";
    }
}

} // namespace wheelsmith
