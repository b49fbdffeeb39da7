#include "wheelsmith/project.hpp"
#include "wheelsmith/glob.hpp"
#include "wheelsmith/naming.hpp"
#include "wheelsmith/platform.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace wheelsmith {

using json = nlohmann::json;

namespace {

std::string get_string(const json& j, const std::string& key, const std::string& default_val = "") {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return default_val;
}

std::vector<std::string> get_string_array(const json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& item : j[key]) {
            if (item.is_string()) {
                result.push_back(item.get<std::string>());
            }
        }
    }
    return result;
}

// "format" may be a single string or a list of strings
std::vector<std::string> parse_formats(const json& j) {
    if (j.contains("format") && j["format"].is_string()) {
        return {j["format"].get<std::string>()};
    }
    return get_string_array(j, "format");
}

bool parse_packages(const json& j, std::vector<IncludeRule>& out, std::string& error) {
    if (!j.is_array()) {
        error = "\"packages\" must be an array";
        return false;
    }
    for (const auto& item : j) {
        if (!item.is_object() || !item.contains("include") || !item["include"].is_string()) {
            error = "each package needs a string \"include\"";
            return false;
        }
        IncludeRule rule;
        rule.kind = IncludeKind::Package;
        rule.pattern = item["include"].get<std::string>();
        rule.source = get_string(item, "from");
        rule.formats = parse_formats(item);
        out.push_back(std::move(rule));
    }
    return true;
}

bool parse_includes(const json& j, std::vector<IncludeRule>& out, std::string& error) {
    if (!j.is_array()) {
        error = "\"include\" must be an array";
        return false;
    }
    for (const auto& item : j) {
        IncludeRule rule;
        rule.kind = IncludeKind::File;
        if (item.is_string()) {
            rule.pattern = item.get<std::string>();
        } else if (item.is_object() && item.contains("path") && item["path"].is_string()) {
            rule.pattern = item["path"].get<std::string>();
            rule.formats = parse_formats(item);
        } else {
            error = "each include must be a string or an object with \"path\"";
            return false;
        }
        out.push_back(std::move(rule));
    }
    return true;
}

bool parse_build(const json& j, ProjectConfig& project, std::string& error) {
    NativeBuildConfig build;
    if (j.is_string()) {
        build.script = j.get<std::string>();
    } else if (j.is_object()) {
        build.script = get_string(j, "script");
        build.command = get_string_array(j, "command");
    }

    if (build.script.empty() && build.command.empty()) {
        error = "\"build\" must name a script or a command";
        return false;
    }
    project.build = std::move(build);
    return true;
}

bool parse_scripts(const json& j, ProjectConfig& project, std::string& error) {
    if (!j.is_object()) {
        error = "\"scripts\" must be an object";
        return false;
    }
    project.declares_scripts = true;
    for (auto& [name, val] : j.items()) {
        ScriptEntry entry;
        if (val.is_string()) {
            entry.callable = val.get<std::string>();
        } else if (val.is_object()) {
            entry.callable = get_string(val, "callable");
            entry.extras = get_string_array(val, "extras");
        }
        if (entry.callable.empty()) {
            error = "script \"" + name + "\" has no callable";
            return false;
        }
        project.scripts[name] = std::move(entry);
    }
    return true;
}

bool parse_plugins(const json& j, ProjectConfig& project, std::string& error) {
    if (!j.is_object()) {
        error = "\"plugins\" must be an object";
        return false;
    }
    project.declares_plugins = true;
    for (auto& [group, entries] : j.items()) {
        if (!entries.is_object()) {
            error = "plugin group \"" + group + "\" must be an object";
            return false;
        }
        auto& target = project.plugins[group];
        for (auto& [name, ref] : entries.items()) {
            if (!ref.is_string()) {
                error = "plugin \"" + group + "." + name + "\" must be a string";
                return false;
            }
            target[name] = ref.get<std::string>();
        }
    }
    return true;
}

MetadataFields parse_metadata(const json& j) {
    MetadataFields m;
    m.summary = get_string(j, "summary");
    m.license = get_string(j, "license");
    m.home_page = get_string(j, "home_page");
    m.readme = get_string(j, "readme");
    m.authors = get_string_array(j, "authors");
    m.keywords = get_string_array(j, "keywords");
    m.classifiers = get_string_array(j, "classifiers");
    m.requires_dist = get_string_array(j, "requires_dist");
    return m;
}

// <module>/ or <module>.py at the root, else under src/
IncludeRule infer_default_package(const ProjectConfig& project) {
    IncludeRule rule;
    rule.kind = IncludeKind::Package;

    std::string module = module_name(project.name);
    if (!path_exists(join_path(project.root, module)) &&
        !path_exists(join_path(project.root, module + ".py"))) {
        std::string src = join_path(project.root, "src");
        if (path_exists(join_path(src, module)) || path_exists(join_path(src, module + ".py"))) {
            rule.source = "src";
        }
    }

    std::string base = rule.source.empty() ? project.root : join_path(project.root, rule.source);
    rule.pattern = is_directory(join_path(base, module)) || !path_exists(join_path(base, module + ".py"))
        ? module
        : module + ".py";
    return rule;
}

} // namespace

bool IncludeRule::applies_to(const std::string& format) const {
    return formats.empty() ||
           std::find(formats.begin(), formats.end(), format) != formats.end();
}

ProjectLoadResult parse_project(const std::string& json_text, const std::string& project_dir) {
    ProjectLoadResult result;
    result.kind = BuildError::InvalidProject;

    auto& project = result.project;
    project.root = to_portable_path(project_dir);

    try {
        json j = json::parse(json_text);
        if (!j.is_object()) {
            result.error = "project configuration must be a JSON object";
            return result;
        }

        project.name = get_string(j, "name");
        project.version = get_string(j, "version");
        if (project.name.empty() || project.version.empty()) {
            result.error = "missing required field: name and version";
            return result;
        }

        project.python = get_string(j, "python", "*");
        project.excludes = get_string_array(j, "exclude");

        std::string error;
        if (j.contains("packages") && !parse_packages(j["packages"], project.includes, error)) {
            result.error = error;
            return result;
        }
        if (!j.contains("packages")) {
            project.includes.push_back(infer_default_package(project));
        }
        if (j.contains("include") && !parse_includes(j["include"], project.includes, error)) {
            result.error = error;
            return result;
        }
        if (j.contains("build") && !j["build"].is_null() && !parse_build(j["build"], project, error)) {
            result.error = error;
            return result;
        }
        if (j.contains("scripts") && !parse_scripts(j["scripts"], project, error)) {
            result.error = error;
            return result;
        }
        if (j.contains("plugins") && !parse_plugins(j["plugins"], project, error)) {
            result.error = error;
            return result;
        }
        if (j.contains("metadata") && j["metadata"].is_object()) {
            project.metadata = parse_metadata(j["metadata"]);
        }
    } catch (const json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
        return result;
    }

    result.ok = true;
    result.kind = BuildError::None;
    return result;
}

ProjectLoadResult load_project(const std::string& project_dir) {
    std::string path = join_path(project_dir, PROJECT_FILE_NAME);

    std::ifstream file(path);
    if (!file) {
        ProjectLoadResult result;
        result.kind = BuildError::InvalidProject;
        result.error = "failed to read project configuration: " + path;
        return result;
    }

    std::stringstream ss;
    ss << file.rdbuf();
    return parse_project(ss.str(), project_dir);
}

bool is_excluded(const ProjectConfig& project, const std::string& rel_path) {
    std::string portable = to_portable_path(rel_path);
    for (const auto& pattern : project.excludes) {
        if (glob_match(pattern, portable)) return true;
    }
    return false;
}

} // namespace wheelsmith
