#pragma once

#include "wheelsmith/project.hpp"
#include "wheelsmith/tags.hpp"
#include "wheelsmith/zip_writer.hpp"

#include <map>
#include <string>
#include <vector>

namespace wheelsmith {

// ============================================================================
// dist-info Contents
// ============================================================================

inline constexpr const char* WHEEL_FORMAT_VERSION = "1.0";
inline constexpr const char* CONSOLE_SCRIPTS_GROUP = "console_scripts";

// Group name -> sorted "name = reference" lines
std::map<std::string, std::vector<std::string>> convert_entry_points(const ProjectConfig& project);

// entry_points.txt: groups sorted, spaces removed, a blank line after each group
std::string render_entry_points(const ProjectConfig& project);

std::string render_wheel_file(const std::string& generator, bool root_is_purelib,
                              const Tag& tag);

// Regular files at the root whose names start with COPYING or LICENSE
// (case-sensitive), sorted by name
std::vector<std::string> find_license_files(const std::string& root);

// Write entry_points.txt (when declared), license copies, WHEEL and METADATA
// into <dist-info>/, in that order
WriteResult write_dist_info(ZipWriter& writer, const ProjectConfig& project, const Tag& tag,
                            const std::string& metadata, const std::string& generator);

} // namespace wheelsmith
