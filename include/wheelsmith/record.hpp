#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace wheelsmith {

// ============================================================================
// RECORD Manifest
// ============================================================================

struct RecordEntry {
    std::string archive_path;
    std::string hash;           // urlsafe base64 of the SHA-256, no padding
    uint64_t size = 0;
};

// Rows are kept in write order and never re-sorted.
class RecordBuilder {
public:
    void add(RecordEntry entry);

    const std::vector<RecordEntry>& entries() const { return entries_; }

    // "path,sha256=<hash>,<size>\n" per row, then "<record_path>,,\n"
    std::string render(const std::string& record_path) const;

private:
    std::vector<RecordEntry> entries_;
};

struct RecordRow {
    std::string path;
    std::string algorithm;      // "sha256", or empty for the RECORD row
    std::string hash;
    std::string size;
};

// Split RECORD text into rows; false on a line without three fields
bool parse_record(const std::string& text, std::vector<RecordRow>& rows, std::string& error);

} // namespace wheelsmith
