#include "wheelsmith/naming.hpp"

#include <cctype>

namespace wheelsmith {

namespace {

template <typename Keep>
std::string collapse_runs(const std::string& in, Keep keep) {
    std::string out;
    out.reserve(in.size());
    bool in_run = false;
    for (char c : in) {
        if (keep(static_cast<unsigned char>(c))) {
            out.push_back(c);
            in_run = false;
        } else if (!in_run) {
            out.push_back('_');
            in_run = true;
        }
    }
    return out;
}

} // namespace

std::string escape_name(const std::string& name) {
    return collapse_runs(name, [](unsigned char c) {
        return std::isalnum(c) != 0;
    });
}

std::string escape_version(const std::string& version) {
    return collapse_runs(version, [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '.';
    });
}

std::string dist_info_name(const std::string& name, const std::string& version) {
    return escape_name(name) + "-" + escape_version(version) + ".dist-info";
}

std::string wheel_filename(const std::string& name, const std::string& version,
                           const std::string& tag) {
    return escape_name(name) + "-" + escape_version(version) + "-" + tag + ".whl";
}

std::string module_name(const std::string& name) {
    std::string out;
    bool in_run = false;
    for (char c : name) {
        if (c == '-' || c == '.' || c == ' ') {
            if (!in_run) out.push_back('_');
            in_run = true;
        } else {
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            in_run = false;
        }
    }
    return out;
}

} // namespace wheelsmith
