#include "wheelsmith/dist_info.hpp"
#include "wheelsmith/naming.hpp"
#include "wheelsmith/platform.hpp"

#include <algorithm>
#include <sstream>

namespace wheelsmith {

namespace {

const char* LICENSE_PREFIXES[] = {"COPYING", "LICENSE"};

} // namespace

std::map<std::string, std::vector<std::string>> convert_entry_points(const ProjectConfig& project) {
    std::map<std::string, std::vector<std::string>> groups;

    for (const auto& [name, script] : project.scripts) {
        std::string line = name + " = " + script.callable;
        if (!script.extras.empty()) {
            line += "[";
            for (size_t i = 0; i < script.extras.size(); ++i) {
                if (i > 0) line += ", ";
                line += script.extras[i];
            }
            line += "]";
        }
        groups[CONSOLE_SCRIPTS_GROUP].push_back(line);
    }

    for (const auto& [group, entries] : project.plugins) {
        for (const auto& [name, target] : entries) {
            groups[group].push_back(name + " = " + target);
        }
    }

    for (auto& [group, lines] : groups) {
        std::sort(lines.begin(), lines.end());
    }
    return groups;
}

std::string render_entry_points(const ProjectConfig& project) {
    std::ostringstream out;
    for (const auto& [group, lines] : convert_entry_points(project)) {
        out << "[" << group << "]\n";
        for (std::string line : lines) {
            line.erase(std::remove(line.begin(), line.end(), ' '), line.end());
            out << line << "\n";
        }
        out << "\n";
    }
    return out.str();
}

std::string render_wheel_file(const std::string& generator, bool root_is_purelib,
                              const Tag& tag) {
    std::ostringstream out;
    out << "Wheel-Version: " << WHEEL_FORMAT_VERSION << "\n"
        << "Generator: " << generator << "\n"
        << "Root-Is-Purelib: " << (root_is_purelib ? "true" : "false") << "\n"
        << "Tag: " << tag.str() << "\n";
    return out.str();
}

std::vector<std::string> find_license_files(const std::string& root) {
    std::vector<std::string> found;
    for (const char* prefix : LICENSE_PREFIXES) {
        std::vector<std::string> names;
        for (const auto& name : list_directory(root)) {
            if (name.rfind(prefix, 0) != 0) continue;
            if (is_directory(join_path(root, name))) continue;
            names.push_back(name);
        }
        std::sort(names.begin(), names.end());
        found.insert(found.end(), names.begin(), names.end());
    }
    return found;
}

WriteResult write_dist_info(ZipWriter& writer, const ProjectConfig& project, const Tag& tag,
                            const std::string& metadata, const std::string& generator) {
    std::string dist_info = dist_info_name(project.name, project.version);

    if (project.declares_scripts || project.declares_plugins) {
        auto r = writer.write_generated(dist_info + "/entry_points.txt",
                                        render_entry_points(project));
        if (!r.ok) return r;
    }

    for (const auto& name : find_license_files(project.root)) {
        FileEntry entry;
        entry.source_path = join_path(project.root, name);
        entry.archive_path = dist_info + "/" + name;
        auto r = writer.write_file(entry);
        if (!r.ok) return r;
    }

    auto wheel = writer.write_generated(
        dist_info + "/WHEEL",
        render_wheel_file(generator, !project.requires_native_build(), tag));
    if (!wheel.ok) return wheel;

    return writer.write_generated(dist_info + "/METADATA", metadata);
}

} // namespace wheelsmith
