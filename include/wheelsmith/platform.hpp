#pragma once

#include <string>
#include <vector>

namespace wheelsmith {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Build a unique temporary path beside final_path (same directory, hence
// same filesystem) so that a later rename onto final_path is atomic.
std::string make_temp_path(const std::string& final_path);

// Move a fully written temp file over final_path:
// fsync(temp) + rename + fsync(dir). Any previous file at final_path is
// replaced in one step; on failure the temp file is removed and
// final_path is left as it was.
AtomicWriteResult atomic_replace_file(const std::string& temp_path,
                                      const std::string& final_path);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (archive paths are always /-separated)
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);

// List directory entry names (unsorted)
std::vector<std::string> list_directory(const std::string& path);

// Create directories recursively
bool create_directories(const std::string& path);

// Remove a file
bool remove_file(const std::string& path);

// Generate a UUID string
std::string generate_uuid();

} // namespace wheelsmith
