#include "wheelsmith/metadata.hpp"
#include "wheelsmith/platform.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace wheelsmith {

namespace {

void header(std::ostringstream& out, const char* key, const std::string& value) {
    if (!value.empty()) {
        out << key << ": " << value << "\n";
    }
}

// "Jane Doe <jane@example.com>" -> ("Jane Doe", "jane@example.com")
void split_author(const std::string& author, std::string& name, std::string& email) {
    size_t lt = author.find('<');
    size_t gt = author.rfind('>');
    if (lt == std::string::npos || gt == std::string::npos || gt < lt) {
        name = author;
        email.clear();
        return;
    }
    name = author.substr(0, lt);
    while (!name.empty() && name.back() == ' ') name.pop_back();
    email = author.substr(lt + 1, gt - lt - 1);
}

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += sep;
        out += item;
    }
    return out;
}

std::string content_type_for(const std::string& readme) {
    auto ext_pos = readme.rfind('.');
    std::string ext = ext_pos == std::string::npos ? "" : readme.substr(ext_pos);
    if (ext == ".md") return "text/markdown";
    if (ext == ".rst") return "text/x-rst";
    return "text/plain";
}

} // namespace

std::string render_metadata(const ProjectConfig& project) {
    const auto& m = project.metadata;
    std::ostringstream out;

    header(out, "Metadata-Version", METADATA_VERSION);
    header(out, "Name", project.name);
    header(out, "Version", project.version);
    header(out, "Summary", m.summary);
    header(out, "Home-page", m.home_page);
    header(out, "License", m.license);
    header(out, "Keywords", join(m.keywords, ","));

    if (!m.authors.empty()) {
        std::string name;
        std::string email;
        split_author(m.authors.front(), name, email);
        header(out, "Author", name);
        header(out, "Author-email", email);
    }

    if (project.python != "*") {
        header(out, "Requires-Python", project.python);
    }
    for (const auto& c : m.classifiers) {
        header(out, "Classifier", c);
    }
    for (const auto& r : m.requires_dist) {
        header(out, "Requires-Dist", r);
    }

    if (!m.readme.empty()) {
        std::string path = join_path(project.root, m.readme);
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            spdlog::warn(" - Readme {} could not be read, leaving it out", m.readme);
        } else {
            std::stringstream ss;
            ss << file.rdbuf();
            header(out, "Description-Content-Type", content_type_for(m.readme));
            out << "\n" << ss.str();
        }
    }

    return out.str();
}

} // namespace wheelsmith
