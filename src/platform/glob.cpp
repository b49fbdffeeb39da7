#include "wheelsmith/glob.hpp"
#include "wheelsmith/platform.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace wheelsmith {

namespace {

std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(to_portable_path(s));
    while (std::getline(ss, current, '/')) {
        if (current.empty() || current == ".") continue;
        parts.push_back(current);
    }
    return parts;
}

bool has_wildcard(const std::string& segment) {
    return segment.find_first_of("*?[") != std::string::npos;
}

// Match a [...] class starting at pattern[p] (the '['). On success, p is
// moved past the closing ']'. An unterminated class is treated as a literal.
bool match_class(const std::string& pattern, size_t& p, char c, bool& matched) {
    size_t i = p + 1;
    bool negate = false;
    if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
        negate = true;
        ++i;
    }

    bool hit = false;
    bool first = true;
    while (i < pattern.size() && (first || pattern[i] != ']')) {
        first = false;
        char lo = pattern[i];
        if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            char hi = pattern[i + 2];
            if (c >= lo && c <= hi) hit = true;
            i += 3;
        } else {
            if (c == lo) hit = true;
            ++i;
        }
    }

    if (i >= pattern.size()) {
        return false;
    }

    p = i + 1;
    matched = hit != negate;
    return true;
}

bool match_segments(const std::vector<std::string>& pat, size_t i,
                    const std::vector<std::string>& path, size_t j) {
    if (i == pat.size()) return j == path.size();

    if (pat[i] == "**") {
        for (size_t k = j; k <= path.size(); ++k) {
            if (match_segments(pat, i + 1, path, k)) return true;
        }
        return false;
    }

    if (j == path.size()) return false;
    if (!fnmatch_segment(pat[i], path[j])) return false;
    return match_segments(pat, i + 1, path, j + 1);
}

void expand(const fs::path& dir, const std::vector<std::string>& segs, size_t i,
            std::vector<std::string>& out) {
    if (i == segs.size()) {
        out.push_back(to_portable_path(dir.string()));
        return;
    }

    const std::string& seg = segs[i];
    const bool last = i + 1 == segs.size();

    if (seg == "**") {
        if (last) {
            // Trailing ** matches everything beneath dir
            for (const auto& entry : fs::recursive_directory_iterator(dir)) {
                out.push_back(to_portable_path(entry.path().string()));
            }
            return;
        }
        expand(dir, segs, i + 1, out);
        for (const auto& entry : fs::directory_iterator(dir)) {
            if (entry.is_directory()) {
                expand(entry.path(), segs, i, out);
            }
        }
        return;
    }

    if (!has_wildcard(seg)) {
        fs::path next = dir / seg;
        std::error_code ec;
        auto st = fs::symlink_status(next, ec);
        if (ec || !fs::exists(st)) return;
        if (!last && !fs::is_directory(next)) return;
        expand(next, segs, i + 1, out);
        return;
    }

    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!fnmatch_segment(seg, entry.path().filename().string())) continue;
        if (!last && !entry.is_directory()) continue;
        expand(entry.path(), segs, i + 1, out);
    }
}

} // namespace

bool fnmatch_segment(const std::string& pattern, const std::string& name) {
    size_t p = 0;
    size_t n = 0;
    size_t star_p = std::string::npos;
    size_t star_n = 0;

    while (n < name.size()) {
        if (p < pattern.size()) {
            char pc = pattern[p];
            if (pc == '*') {
                star_p = p++;
                star_n = n;
                continue;
            }
            if (pc == '?') {
                ++p;
                ++n;
                continue;
            }
            if (pc == '[') {
                size_t after = p;
                bool matched = false;
                if (match_class(pattern, after, name[n], matched)) {
                    if (matched) {
                        p = after;
                        ++n;
                        continue;
                    }
                } else if (name[n] == '[') {
                    ++p;
                    ++n;
                    continue;
                }
            } else if (pc == name[n]) {
                ++p;
                ++n;
                continue;
            }
        }

        // Mismatch: backtrack to the last star, consuming one more character
        if (star_p == std::string::npos) return false;
        p = star_p + 1;
        n = ++star_n;
    }

    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

bool glob_match(const std::string& pattern, const std::string& rel_path) {
    return match_segments(split_segments(pattern), 0, split_segments(rel_path), 0);
}

GlobResult glob_expand(const std::string& base, const std::string& pattern) {
    GlobResult result;

    auto segs = split_segments(pattern);
    if (segs.empty()) {
        result.error = "empty glob pattern";
        return result;
    }

    try {
        if (fs::is_directory(base)) {
            expand(fs::path(base), segs, 0, result.paths);
        }
    } catch (const fs::filesystem_error& e) {
        result.error = std::string("filesystem error: ") + e.what();
        return result;
    }

    std::sort(result.paths.begin(), result.paths.end());
    result.paths.erase(std::unique(result.paths.begin(), result.paths.end()),
                       result.paths.end());
    result.ok = true;
    return result;
}

} // namespace wheelsmith
