#pragma once

#include "wheelsmith/errors.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wheelsmith {

// ============================================================================
// Project Configuration (wheelsmith.json)
// ============================================================================

inline constexpr const char* PROJECT_FILE_NAME = "wheelsmith.json";

enum class IncludeKind {
    Package,    // "packages": a structured package, honours "exclude"
    File,       // "include": an arbitrary file list
};

struct IncludeRule {
    IncludeKind kind = IncludeKind::File;
    std::string pattern;                // glob relative to the rule's base
    std::string source;                 // "from": base directory under the root
    std::vector<std::string> formats;   // empty = every output format

    // True if this rule applies when producing the given format
    bool applies_to(const std::string& format) const;
};

struct NativeBuildConfig {
    std::string script;                 // "build": "build.py"
    std::vector<std::string> command;   // explicit argv; overrides script
};

struct ScriptEntry {
    std::string callable;               // "package.module:function"
    std::vector<std::string> extras;
};

// Fields only consumed by the METADATA renderer
struct MetadataFields {
    std::string summary;
    std::string license;
    std::string home_page;
    std::string readme;                 // path relative to the root
    std::vector<std::string> authors;   // "Name <email>"
    std::vector<std::string> keywords;
    std::vector<std::string> classifiers;
    std::vector<std::string> requires_dist;
};

struct ProjectConfig {
    std::string root;                   // project directory
    std::string name;
    std::string version;
    std::string python = "*";           // interpreter compatibility range

    std::vector<IncludeRule> includes;
    std::vector<std::string> excludes;  // globs relative to the root

    std::optional<NativeBuildConfig> build;

    bool declares_scripts = false;
    bool declares_plugins = false;
    std::map<std::string, ScriptEntry> scripts;
    std::map<std::string, std::map<std::string, std::string>> plugins;

    MetadataFields metadata;

    bool requires_native_build() const { return build.has_value(); }
};

struct ProjectLoadResult {
    bool ok = false;
    BuildError kind = BuildError::None;
    std::string error;
    ProjectConfig project;
};

// Read and parse <project_dir>/wheelsmith.json
ProjectLoadResult load_project(const std::string& project_dir);

// Parse configuration text for a project rooted at project_dir.
// When "packages" is absent a default package is inferred from the name.
ProjectLoadResult parse_project(const std::string& json_text, const std::string& project_dir);

// True if rel_path (relative to the root, /-separated) matches an "exclude" glob
bool is_excluded(const ProjectConfig& project, const std::string& rel_path);

} // namespace wheelsmith
