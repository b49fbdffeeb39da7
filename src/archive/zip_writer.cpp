#include "wheelsmith/zip_writer.hpp"
#include "wheelsmith/hash.hpp"

#include <spdlog/spdlog.h>
#include <zlib.h>

#include <cstring>
#include <filesystem>

namespace wheelsmith {

namespace fs = std::filesystem;

namespace {

constexpr uint32_t LOCAL_HEADER_SIG = 0x04034b50;
constexpr uint32_t CENTRAL_HEADER_SIG = 0x02014b50;
constexpr uint32_t END_OF_CENTRAL_SIG = 0x06054b50;

constexpr uint16_t VERSION_NEEDED = 20;        // deflate
constexpr uint16_t VERSION_MADE_BY = 0x0314;   // Unix, APPNOTE 2.0
constexpr uint16_t METHOD_DEFLATE = 8;
constexpr uint16_t FLAG_UTF8 = 0x0800;

constexpr uint32_t MODE_REGULAR = 0100000;
constexpr uint32_t MODE_DIRECTORY = 0040000;
constexpr uint32_t MSDOS_DIRECTORY = 0x10;

// Offset of the CRC field inside a local file header
constexpr uint64_t LOCAL_CRC_OFFSET = 14;

constexpr size_t CHUNK_SIZE = 8192;

void put_u16(std::string& out, uint16_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
}

void put_u32(std::string& out, uint32_t v) {
    out.push_back(static_cast<char>(v & 0xFF));
    out.push_back(static_cast<char>((v >> 8) & 0xFF));
    out.push_back(static_cast<char>((v >> 16) & 0xFF));
    out.push_back(static_cast<char>((v >> 24) & 0xFF));
}

bool is_ascii(const std::string& s) {
    for (char c : s) {
        if (static_cast<unsigned char>(c) >= 0x80) return false;
    }
    return true;
}

// RAII wrapper for a raw-deflate z_stream
class Deflater {
public:
    Deflater() {
        std::memset(&zs_, 0, sizeof(zs_));
        ok_ = deflateInit2(&zs_, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8,
                           Z_DEFAULT_STRATEGY) == Z_OK;
    }
    ~Deflater() { if (ok_) deflateEnd(&zs_); }

    Deflater(const Deflater&) = delete;
    Deflater& operator=(const Deflater&) = delete;

    explicit operator bool() const { return ok_; }

    // Compress len bytes, appending whatever zlib emits to out.
    // With finish set the stream is flushed and terminated.
    bool feed(const char* data, size_t len, bool finish, std::string& out) {
        unsigned char buffer[CHUNK_SIZE];
        zs_.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data));
        zs_.avail_in = static_cast<uInt>(len);

        int flush = finish ? Z_FINISH : Z_NO_FLUSH;
        do {
            zs_.next_out = buffer;
            zs_.avail_out = sizeof(buffer);
            if (deflate(&zs_, flush) == Z_STREAM_ERROR) {
                return false;
            }
            out.append(reinterpret_cast<const char*>(buffer), sizeof(buffer) - zs_.avail_out);
        } while (zs_.avail_out == 0);

        return zs_.avail_in == 0;
    }

private:
    z_stream zs_;
    bool ok_ = false;
};

WriteResult fail(BuildError kind, const std::string& message) {
    WriteResult result;
    result.kind = kind;
    result.error = message;
    return result;
}

} // namespace

uint32_t normalize_mode(uint32_t source_mode) {
    return (source_mode & 0111) ? 0755 : 0644;
}

uint32_t external_attributes(uint32_t normalized_mode, bool is_directory) {
    if (is_directory) {
        return ((MODE_DIRECTORY | 0755) << 16) | MSDOS_DIRECTORY;
    }
    return (MODE_REGULAR | normalized_mode) << 16;
}

ZipWriter::ZipWriter(std::string path, RecordBuilder& record)
    : path_(std::move(path)), record_(record) {}

ZipWriter::~ZipWriter() {
    if (out_.is_open()) {
        out_.close();
    }
}

WriteResult ZipWriter::open() {
    out_.open(path_, std::ios::binary | std::ios::out | std::ios::trunc);
    if (!out_) {
        return fail(BuildError::ArchiveWriteFailure, "failed to create archive: " + path_);
    }
    WriteResult result;
    result.ok = true;
    return result;
}

WriteResult ZipWriter::write_bytes(const std::string& bytes) {
    if (!bytes.empty()) {
        out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        offset_ += bytes.size();
    }
    if (!out_) {
        return fail(BuildError::ArchiveWriteFailure, "failed to write archive: " + path_);
    }
    WriteResult result;
    result.ok = true;
    return result;
}

WriteResult ZipWriter::begin_entry(const std::string& archive_path, CentralEntry& entry) {
    if (!out_.is_open() || closed_) {
        return fail(BuildError::ArchiveWriteFailure, "archive is not open: " + path_);
    }
    if (sealed_) {
        return fail(BuildError::ArchiveWriteFailure,
                    "archive is sealed, cannot add: " + archive_path);
    }
    if (names_.count(archive_path)) {
        return fail(BuildError::DuplicateArchivePath,
                    "duplicate archive path: " + archive_path);
    }
    if (central_.size() >= ZIP_MAX_ENTRIES) {
        return fail(BuildError::ArchiveWriteFailure,
                    "too many entries for a non-ZIP64 archive");
    }
    if (offset_ >= ZIP_MAX_SIZE) {
        return fail(BuildError::ArchiveWriteFailure,
                    "archive exceeds 4 GiB, ZIP64 is not supported");
    }

    entry.name = archive_path;
    entry.flags = is_ascii(archive_path) ? 0 : FLAG_UTF8;
    entry.local_offset = static_cast<uint32_t>(offset_);

    // CRC and sizes are patched once the data has been written
    std::string header;
    put_u32(header, LOCAL_HEADER_SIG);
    put_u16(header, VERSION_NEEDED);
    put_u16(header, entry.flags);
    put_u16(header, METHOD_DEFLATE);
    put_u16(header, entry.dos_time);
    put_u16(header, entry.dos_date);
    put_u32(header, 0);
    put_u32(header, 0);
    put_u32(header, 0);
    put_u16(header, static_cast<uint16_t>(archive_path.size()));
    put_u16(header, 0);
    header += archive_path;

    names_.insert(archive_path);
    return write_bytes(header);
}

WriteResult ZipWriter::finish_entry(CentralEntry& entry, const std::string& digest,
                                    uint64_t size, uint64_t compressed, uint32_t crc,
                                    bool record_it) {
    if (size >= ZIP_MAX_SIZE || compressed >= ZIP_MAX_SIZE) {
        return fail(BuildError::ArchiveWriteFailure,
                    "entry exceeds 4 GiB, ZIP64 is not supported: " + entry.name);
    }

    entry.crc = crc;
    entry.compressed_size = static_cast<uint32_t>(compressed);
    entry.uncompressed_size = static_cast<uint32_t>(size);

    std::string patch;
    put_u32(patch, entry.crc);
    put_u32(patch, entry.compressed_size);
    put_u32(patch, entry.uncompressed_size);

    out_.seekp(static_cast<std::streamoff>(entry.local_offset + LOCAL_CRC_OFFSET));
    out_.write(patch.data(), static_cast<std::streamsize>(patch.size()));
    out_.seekp(static_cast<std::streamoff>(offset_));
    if (!out_) {
        return fail(BuildError::ArchiveWriteFailure, "failed to write archive: " + path_);
    }

    central_.push_back(entry);

    WriteResult result;
    result.record.archive_path = entry.name;
    result.record.hash = urlsafe_b64encode_nopad(digest);
    result.record.size = size;
    if (record_it) {
        record_.add(result.record);
    }
    result.ok = true;
    return result;
}

WriteResult ZipWriter::write_file(const FileEntry& entry) {
    std::error_code ec;
    auto status = fs::status(entry.source_path, ec);
    if (ec) {
        return fail(BuildError::SourceReadFailure,
                    "cannot read " + entry.source_path + ": " + ec.message());
    }
    if (fs::is_directory(status)) {
        CentralEntry central;
        central.dos_date = ZIP_EPOCH_DATE;
        central.dos_time = ZIP_TIME;
        central.external_attr = external_attributes(0755, true);

        std::string name = entry.archive_path;
        if (name.empty() || name.back() != '/') {
            name += '/';
        }
        return write_buffer(name, "", central, true);
    }
    if (!fs::is_regular_file(status)) {
        return fail(BuildError::SourceReadFailure, "not a regular file: " + entry.source_path);
    }

    std::ifstream in(entry.source_path, std::ios::binary);
    if (!in) {
        return fail(BuildError::SourceReadFailure, "failed to open file: " + entry.source_path);
    }

    CentralEntry central;
    central.dos_date = ZIP_EPOCH_DATE;
    central.dos_time = ZIP_TIME;
    central.external_attr =
        external_attributes(normalize_mode(static_cast<uint32_t>(status.permissions())), false);

    auto begun = begin_entry(entry.archive_path, central);
    if (!begun.ok) return begun;

    spdlog::debug(" - Adding: {}", entry.archive_path);

    Sha256 hasher;
    Deflater deflater;
    if (!deflater) {
        return fail(BuildError::ArchiveWriteFailure, "deflateInit2 failed");
    }

    uLong crc = crc32(0L, Z_NULL, 0);
    uint64_t size = 0;
    uint64_t compressed = 0;
    char buffer[CHUNK_SIZE];
    std::string chunk;

    while (in.read(buffer, sizeof(buffer)) || in.gcount() > 0) {
        size_t n = static_cast<size_t>(in.gcount());
        if (!hasher.update(buffer, n)) {
            return fail(BuildError::ArchiveWriteFailure, "EVP_DigestUpdate failed");
        }
        crc = crc32(crc, reinterpret_cast<const Bytef*>(buffer), static_cast<uInt>(n));
        size += n;

        chunk.clear();
        if (!deflater.feed(buffer, n, false, chunk)) {
            return fail(BuildError::ArchiveWriteFailure, "deflate failed: " + entry.archive_path);
        }
        compressed += chunk.size();
        auto written = write_bytes(chunk);
        if (!written.ok) return written;
    }
    if (in.bad()) {
        return fail(BuildError::SourceReadFailure, "failed to read file: " + entry.source_path);
    }

    chunk.clear();
    if (!deflater.feed(nullptr, 0, true, chunk)) {
        return fail(BuildError::ArchiveWriteFailure, "deflate failed: " + entry.archive_path);
    }
    compressed += chunk.size();
    auto written = write_bytes(chunk);
    if (!written.ok) return written;

    auto digest = hasher.finish();
    if (!digest.ok) {
        return fail(BuildError::ArchiveWriteFailure, digest.error);
    }
    return finish_entry(central, digest.digest, size, compressed,
                        static_cast<uint32_t>(crc), true);
}

WriteResult ZipWriter::write_memory(const std::string& archive_path, const std::string& content,
                                    bool record_it) {
    CentralEntry central;
    central.dos_date = GENERATED_DATE;
    central.dos_time = ZIP_TIME;
    central.external_attr = external_attributes(0644, false);
    return write_buffer(archive_path, content, central, record_it);
}

WriteResult ZipWriter::write_buffer(const std::string& archive_path, const std::string& content,
                                    CentralEntry& central, bool record_it) {
    auto begun = begin_entry(archive_path, central);
    if (!begun.ok) return begun;

    spdlog::debug(" - Adding: {}", archive_path);

    Deflater deflater;
    if (!deflater) {
        return fail(BuildError::ArchiveWriteFailure, "deflateInit2 failed");
    }
    std::string data;
    if (!deflater.feed(content.data(), content.size(), true, data)) {
        return fail(BuildError::ArchiveWriteFailure, "deflate failed: " + archive_path);
    }
    auto written = write_bytes(data);
    if (!written.ok) return written;

    auto digest = compute_sha256(content);
    if (!digest.ok) {
        return fail(BuildError::ArchiveWriteFailure, digest.error);
    }

    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(content.data()),
                static_cast<uInt>(content.size()));

    return finish_entry(central, digest.digest, content.size(), data.size(),
                        static_cast<uint32_t>(crc), record_it);
}

WriteResult ZipWriter::write_generated(const std::string& archive_path,
                                       const std::string& content) {
    return write_memory(archive_path, content, true);
}

WriteResult ZipWriter::write_record(const std::string& archive_path) {
    auto result = write_memory(archive_path, record_.render(archive_path), false);
    if (result.ok) {
        sealed_ = true;
    }
    return result;
}

WriteResult ZipWriter::close() {
    if (closed_) {
        return fail(BuildError::ArchiveWriteFailure, "archive already closed: " + path_);
    }
    if (!out_.is_open()) {
        return fail(BuildError::ArchiveWriteFailure, "archive is not open: " + path_);
    }

    uint64_t cd_start = offset_;
    std::string directory;
    for (const auto& e : central_) {
        put_u32(directory, CENTRAL_HEADER_SIG);
        put_u16(directory, VERSION_MADE_BY);
        put_u16(directory, VERSION_NEEDED);
        put_u16(directory, e.flags);
        put_u16(directory, METHOD_DEFLATE);
        put_u16(directory, e.dos_time);
        put_u16(directory, e.dos_date);
        put_u32(directory, e.crc);
        put_u32(directory, e.compressed_size);
        put_u32(directory, e.uncompressed_size);
        put_u16(directory, static_cast<uint16_t>(e.name.size()));
        put_u16(directory, 0);      // extra
        put_u16(directory, 0);      // comment
        put_u16(directory, 0);      // disk number
        put_u16(directory, 0);      // internal attributes
        put_u32(directory, e.external_attr);
        put_u32(directory, e.local_offset);
        directory += e.name;
    }

    uint64_t cd_size = directory.size();
    if (cd_start >= ZIP_MAX_SIZE || cd_start + cd_size >= ZIP_MAX_SIZE) {
        return fail(BuildError::ArchiveWriteFailure,
                    "archive exceeds 4 GiB, ZIP64 is not supported");
    }

    put_u32(directory, END_OF_CENTRAL_SIG);
    put_u16(directory, 0);
    put_u16(directory, 0);
    put_u16(directory, static_cast<uint16_t>(central_.size()));
    put_u16(directory, static_cast<uint16_t>(central_.size()));
    put_u32(directory, static_cast<uint32_t>(cd_size));
    put_u32(directory, static_cast<uint32_t>(cd_start));
    put_u16(directory, 0);

    auto written = write_bytes(directory);
    if (!written.ok) return written;

    out_.close();
    closed_ = true;
    if (out_.fail()) {
        return fail(BuildError::ArchiveWriteFailure, "failed to close archive: " + path_);
    }

    WriteResult result;
    result.ok = true;
    return result;
}

} // namespace wheelsmith
