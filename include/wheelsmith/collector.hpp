#pragma once

#include "wheelsmith/errors.hpp"
#include "wheelsmith/project.hpp"
#include "wheelsmith/types.hpp"

#include <string>
#include <vector>

namespace wheelsmith {

// ============================================================================
// File Collection
// ============================================================================

inline constexpr const char* WHEEL_FORMAT = "wheel";

struct CollectResult {
    bool ok = false;
    BuildError kind = BuildError::None;
    std::string error;
    std::vector<FileEntry> entries;     // sorted by archive_path
};

// Resolve the project's include rules for the given output format.
//
// Directories, __pycache__ trees and *.pyc files are skipped, as are files
// of package rules matched by an "exclude" glob. A repeated
// (source, archive_path) pair is dropped; one archive_path claimed by two
// different sources is a DuplicateArchivePath error.
CollectResult collect_files(const ProjectConfig& project,
                            const std::string& format = WHEEL_FORMAT);

// Merge additional entries into a sorted list, keeping it sorted
void merge_entries(std::vector<FileEntry>& into, const std::vector<FileEntry>& extra);

} // namespace wheelsmith
