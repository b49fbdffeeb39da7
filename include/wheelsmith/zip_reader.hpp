#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace wheelsmith {

// ============================================================================
// ZIP Reader (archive inspection)
// ============================================================================

struct ZipEntry {
    std::string name;
    std::string data;           // decompressed contents
    uint16_t method = 0;        // 0 = stored, 8 = deflate
    uint16_t dos_date = 0;
    uint16_t dos_time = 0;
    uint32_t external_attr = 0;
    uint32_t crc = 0;

    uint32_t mode() const { return external_attr >> 16; }
};

struct ZipReadResult {
    bool ok = false;
    std::string error;
    std::vector<ZipEntry> entries;  // central directory order
};

// Read every entry of a stored/deflate ZIP into memory, checking CRCs
ZipReadResult read_zip(const std::string& path);

} // namespace wheelsmith
