#include "wheelsmith/collector.hpp"
#include "wheelsmith/glob.hpp"
#include "wheelsmith/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <map>

namespace wheelsmith {

namespace fs = std::filesystem;

namespace {

bool has_pycache_segment(const std::string& rel_path) {
    size_t start = 0;
    while (start <= rel_path.size()) {
        size_t end = rel_path.find('/', start);
        if (end == std::string::npos) end = rel_path.size();
        if (rel_path.compare(start, end - start, "__pycache__") == 0) return true;
        start = end + 1;
    }
    return false;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string relative_to(const std::string& path, const std::string& base) {
    return to_portable_path(fs::path(path).lexically_relative(fs::path(base)).string());
}

} // namespace

CollectResult collect_files(const ProjectConfig& project, const std::string& format) {
    CollectResult result;

    // archive_path -> source_path of the entry already claiming it
    std::map<std::string, std::string> claimed;

    for (const auto& rule : project.includes) {
        if (!rule.applies_to(format)) continue;

        bool package_with_source = rule.kind == IncludeKind::Package && !rule.source.empty();
        std::string base = package_with_source ? join_path(project.root, rule.source)
                                               : project.root;

        auto matches = glob_expand(base, rule.pattern);
        if (!matches.ok) {
            result.kind = BuildError::SourceReadFailure;
            result.error = "failed to resolve '" + rule.pattern + "': " + matches.error;
            return result;
        }

        std::vector<std::string> files;
        for (const auto& match : matches.paths) {
            if (!is_directory(match)) {
                files.push_back(match);
                continue;
            }
            auto nested = glob_expand(match, "**");
            if (!nested.ok) {
                result.kind = BuildError::SourceReadFailure;
                result.error = "failed to walk " + match + ": " + nested.error;
                return result;
            }
            files.insert(files.end(), nested.paths.begin(), nested.paths.end());
        }

        for (const auto& file : files) {
            if (is_directory(file)) continue;

            std::string rel_root = relative_to(file, project.root);
            std::string archive_path = package_with_source ? relative_to(file, base) : rel_root;

            if (has_pycache_segment(rel_root)) continue;
            if (ends_with(file, ".pyc")) continue;
            if (rule.kind == IncludeKind::Package && is_excluded(project, rel_root)) {
                spdlog::debug(" - Skipping excluded: {}", rel_root);
                continue;
            }

            auto it = claimed.find(archive_path);
            if (it != claimed.end()) {
                if (it->second == file) continue;
                result.kind = BuildError::DuplicateArchivePath;
                result.error = "duplicate archive path " + archive_path + " (from " +
                               it->second + " and " + file + ")";
                return result;
            }
            claimed.emplace(archive_path, file);

            FileEntry entry;
            entry.source_path = file;
            entry.archive_path = archive_path;
            result.entries.push_back(std::move(entry));
        }
    }

    std::sort(result.entries.begin(), result.entries.end(),
              [](const FileEntry& a, const FileEntry& b) {
                  return a.archive_path < b.archive_path;
              });

    result.ok = true;
    return result;
}

void merge_entries(std::vector<FileEntry>& into, const std::vector<FileEntry>& extra) {
    into.insert(into.end(), extra.begin(), extra.end());
    std::stable_sort(into.begin(), into.end(),
                     [](const FileEntry& a, const FileEntry& b) {
                         return a.archive_path < b.archive_path;
                     });
}

} // namespace wheelsmith
