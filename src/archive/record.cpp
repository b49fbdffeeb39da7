#include "wheelsmith/record.hpp"

#include <sstream>

namespace wheelsmith {

void RecordBuilder::add(RecordEntry entry) {
    entries_.push_back(std::move(entry));
}

std::string RecordBuilder::render(const std::string& record_path) const {
    std::ostringstream out;
    for (const auto& e : entries_) {
        out << e.archive_path << ",sha256=" << e.hash << "," << e.size << "\n";
    }
    out << record_path << ",,\n";
    return out.str();
}

bool parse_record(const std::string& text, std::vector<RecordRow>& rows, std::string& error) {
    rows.clear();
    std::istringstream in(text);
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        // Paths may contain commas; hash and size never do
        size_t last = line.rfind(',');
        size_t mid = last == std::string::npos || last == 0
            ? std::string::npos
            : line.rfind(',', last - 1);
        if (mid == std::string::npos) {
            error = "RECORD line " + std::to_string(line_no) + " does not have three fields";
            return false;
        }

        RecordRow row;
        row.path = line.substr(0, mid);
        std::string hash_field = line.substr(mid + 1, last - mid - 1);
        row.size = line.substr(last + 1);

        size_t eq = hash_field.find('=');
        if (eq != std::string::npos) {
            row.algorithm = hash_field.substr(0, eq);
            row.hash = hash_field.substr(eq + 1);
        } else if (!hash_field.empty()) {
            error = "RECORD line " + std::to_string(line_no) + " has a malformed hash";
            return false;
        }
        rows.push_back(std::move(row));
    }
    return true;
}

} // namespace wheelsmith
