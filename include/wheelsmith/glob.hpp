#pragma once

#include <string>
#include <vector>

namespace wheelsmith {

// ============================================================================
// Path Globbing
// ============================================================================
//
// Patterns are /-separated. Within a segment: `*` matches any run of
// characters, `?` matches one character, `[abc]` / `[a-z]` / `[!x]` match a
// class. A whole segment of `**` matches zero or more directories.

// Match one path segment (no slashes) against one pattern segment
bool fnmatch_segment(const std::string& pattern, const std::string& name);

// Match a /-separated relative path against a /-separated pattern
bool glob_match(const std::string& pattern, const std::string& rel_path);

struct GlobResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> paths;     // base-joined, sorted, unique
};

// Expand pattern relative to base. Both files and directories are returned;
// a pattern without wildcards yields the single path if it exists.
GlobResult glob_expand(const std::string& base, const std::string& pattern);

} // namespace wheelsmith
