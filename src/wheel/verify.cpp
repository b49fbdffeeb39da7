#include "wheelsmith/verify.hpp"
#include "wheelsmith/hash.hpp"
#include "wheelsmith/record.hpp"
#include "wheelsmith/zip_reader.hpp"

#include <map>

namespace wheelsmith {

namespace {

const std::string RECORD_SUFFIX = ".dist-info/RECORD";
const std::string RECORD_NAME = "/RECORD";

// <name>-<version>.dist-info/RECORD at the top level of the archive
bool is_record_path(const std::string& name) {
    return name.size() > RECORD_SUFFIX.size() &&
           name.compare(name.size() - RECORD_SUFFIX.size(), RECORD_SUFFIX.size(),
                        RECORD_SUFFIX) == 0 &&
           name.find('/') == name.size() - RECORD_NAME.size();
}

} // namespace

VerifyResult verify_wheel(const std::string& wheel_path) {
    VerifyResult result;

    auto zip = read_zip(wheel_path);
    if (!zip.ok) {
        result.error = zip.error;
        return result;
    }
    result.entry_count = zip.entries.size();

    if (zip.entries.empty() || !is_record_path(zip.entries.back().name)) {
        result.issues.push_back("RECORD is not the last entry");
        return result;
    }
    const ZipEntry& record_entry = zip.entries.back();
    result.record_path = record_entry.name;

    std::vector<RecordRow> rows;
    std::string parse_error;
    if (!parse_record(record_entry.data, rows, parse_error)) {
        result.issues.push_back(parse_error);
        return result;
    }

    std::map<std::string, const RecordRow*> by_path;
    for (const auto& row : rows) {
        if (!by_path.emplace(row.path, &row).second) {
            result.issues.push_back("duplicate RECORD row: " + row.path);
        }
    }

    for (const auto& entry : zip.entries) {
        auto it = by_path.find(entry.name);
        if (it == by_path.end()) {
            result.issues.push_back("entry missing from RECORD: " + entry.name);
            continue;
        }
        const RecordRow& row = *it->second;
        by_path.erase(it);

        if (&entry == &record_entry) {
            if (!row.hash.empty() || !row.size.empty()) {
                result.issues.push_back("RECORD row for itself must be empty");
            }
            continue;
        }

        if (row.algorithm != "sha256") {
            result.issues.push_back("unsupported hash algorithm '" + row.algorithm +
                                    "': " + entry.name);
            continue;
        }
        auto digest = compute_sha256(entry.data);
        if (!digest.ok) {
            result.error = digest.error;
            return result;
        }
        std::string expected;
        if (!urlsafe_b64decode_nopad(row.hash, expected)) {
            result.issues.push_back("malformed hash: " + entry.name);
        } else if (expected != digest.digest) {
            result.issues.push_back("hash mismatch: " + entry.name);
        }
        if (std::to_string(entry.data.size()) != row.size) {
            result.issues.push_back("size mismatch: " + entry.name);
        }
    }

    for (const auto& [path, row] : by_path) {
        result.issues.push_back("RECORD row without entry: " + path);
    }

    result.ok = result.issues.empty();
    return result;
}

} // namespace wheelsmith
