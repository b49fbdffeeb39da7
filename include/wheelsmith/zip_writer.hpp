#pragma once

#include "wheelsmith/errors.hpp"
#include "wheelsmith/record.hpp"
#include "wheelsmith/types.hpp"

#include <cstdint>
#include <fstream>
#include <set>
#include <string>
#include <vector>

namespace wheelsmith {

// ============================================================================
// Deterministic ZIP Writer
// ============================================================================
//
// Entries are raw-deflated and carry normalized modes and fixed timestamps,
// so identical inputs give byte-identical archives. ZIP64 is not produced.

// DOS date/time stamps (ZIP epoch 1980-01-01, generated files 2016-01-01)
inline constexpr uint16_t ZIP_EPOCH_DATE = 0x0021;
inline constexpr uint16_t GENERATED_DATE = 0x4821;
inline constexpr uint16_t ZIP_TIME = 0x0000;

inline constexpr size_t ZIP_MAX_ENTRIES = 0xFFFF;
inline constexpr uint64_t ZIP_MAX_SIZE = 0xFFFFFFFFull;

// 0755 if any execute bit is set, 0644 otherwise
uint32_t normalize_mode(uint32_t source_mode);

// Unix mode in the high 16 bits (S_IFREG, or S_IFDIR plus the MS-DOS
// directory flag)
uint32_t external_attributes(uint32_t normalized_mode, bool is_directory);

struct WriteResult {
    bool ok = false;
    BuildError kind = BuildError::None;
    std::string error;
    RecordEntry record;
};

class ZipWriter {
public:
    ZipWriter(std::string path, RecordBuilder& record);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    // Create (truncate) the output file
    WriteResult open();

    // Stream a file from disk. Mode comes from the source, timestamp is
    // the ZIP epoch. A directory becomes an empty "<path>/" entry with the
    // directory flag set.
    WriteResult write_file(const FileEntry& entry);

    // Add an in-memory entry with mode 0644 and the 2016-01-01 timestamp
    WriteResult write_generated(const std::string& archive_path, const std::string& content);

    // Write the rendered manifest as a generated entry that is not itself
    // recorded. No further entries are accepted afterwards.
    WriteResult write_record(const std::string& archive_path);

    // Write the central directory and close the file
    WriteResult close();

    const std::string& path() const { return path_; }
    size_t entry_count() const { return central_.size(); }

private:
    struct CentralEntry {
        std::string name;
        uint16_t flags = 0;
        uint16_t dos_time = 0;
        uint16_t dos_date = 0;
        uint32_t crc = 0;
        uint32_t compressed_size = 0;
        uint32_t uncompressed_size = 0;
        uint32_t external_attr = 0;
        uint32_t local_offset = 0;
    };

    WriteResult begin_entry(const std::string& archive_path, CentralEntry& entry);
    WriteResult write_bytes(const std::string& bytes);
    WriteResult write_memory(const std::string& archive_path, const std::string& content,
                             bool record_it);
    WriteResult write_buffer(const std::string& archive_path, const std::string& content,
                             CentralEntry& central, bool record_it);
    WriteResult finish_entry(CentralEntry& entry, const std::string& digest, uint64_t size,
                             uint64_t compressed, uint32_t crc, bool record_it);

    std::string path_;
    RecordBuilder& record_;
    std::ofstream out_;
    uint64_t offset_ = 0;
    bool sealed_ = false;
    bool closed_ = false;
    std::vector<CentralEntry> central_;
    std::set<std::string> names_;
};

} // namespace wheelsmith
