#pragma once

#include <string>

namespace wheelsmith {

// ============================================================================
// File Entry
// ============================================================================

// One file destined for the archive. archive_path is always /-separated and
// unique within an archive.
struct FileEntry {
    std::string source_path;
    std::string archive_path;
    bool generated = false;     // produced by the native build

    bool operator==(const FileEntry& other) const {
        return source_path == other.source_path && archive_path == other.archive_path;
    }
};

} // namespace wheelsmith
