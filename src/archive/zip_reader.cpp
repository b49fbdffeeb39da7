#include "wheelsmith/zip_reader.hpp"

#include <zlib.h>

#include <cstring>
#include <fstream>
#include <sstream>

namespace wheelsmith {

namespace {

constexpr uint32_t LOCAL_HEADER_SIG = 0x04034b50;
constexpr uint32_t CENTRAL_HEADER_SIG = 0x02014b50;
constexpr uint32_t END_OF_CENTRAL_SIG = 0x06054b50;

constexpr size_t LOCAL_HEADER_SIZE = 30;
constexpr size_t CENTRAL_HEADER_SIZE = 46;
constexpr size_t END_OF_CENTRAL_SIZE = 22;

// Deflate cannot expand input by more than about 1032:1
constexpr uint64_t MAX_DEFLATE_RATIO = 1032;
constexpr uint64_t DEFLATE_SLACK = 64;

uint16_t get_u16(const std::string& buf, size_t pos) {
    return static_cast<uint16_t>(static_cast<uint8_t>(buf[pos]) |
                                 (static_cast<uint8_t>(buf[pos + 1]) << 8));
}

uint32_t get_u32(const std::string& buf, size_t pos) {
    return static_cast<uint32_t>(static_cast<uint8_t>(buf[pos])) |
           (static_cast<uint32_t>(static_cast<uint8_t>(buf[pos + 1])) << 8) |
           (static_cast<uint32_t>(static_cast<uint8_t>(buf[pos + 2])) << 16) |
           (static_cast<uint32_t>(static_cast<uint8_t>(buf[pos + 3])) << 24);
}

bool inflate_raw(const std::string& in, size_t expected, std::string& out) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) return false;

    out.assign(expected, '\0');
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());
    // zlib wants a non-null output buffer even for empty entries
    unsigned char sink = 0;
    zs.next_out = expected ? reinterpret_cast<Bytef*>(&out[0]) : &sink;
    zs.avail_out = static_cast<uInt>(expected);

    int rc = inflate(&zs, Z_FINISH);
    bool ok = rc == Z_STREAM_END && zs.total_out == expected;
    inflateEnd(&zs);
    return ok;
}

} // namespace

ZipReadResult read_zip(const std::string& path) {
    ZipReadResult result;

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        result.error = "failed to open archive: " + path;
        return result;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    std::string buf = ss.str();

    if (buf.size() < END_OF_CENTRAL_SIZE) {
        result.error = "not a ZIP archive: " + path;
        return result;
    }

    // The end record sits before an optional comment of up to 64 KiB
    size_t eocd = std::string::npos;
    size_t lowest = buf.size() > END_OF_CENTRAL_SIZE + 0xFFFF
        ? buf.size() - END_OF_CENTRAL_SIZE - 0xFFFF
        : 0;
    for (size_t pos = buf.size() - END_OF_CENTRAL_SIZE + 1; pos-- > lowest;) {
        if (get_u32(buf, pos) == END_OF_CENTRAL_SIG) {
            eocd = pos;
            break;
        }
    }
    if (eocd == std::string::npos) {
        result.error = "end of central directory not found: " + path;
        return result;
    }

    uint16_t count = get_u16(buf, eocd + 10);
    uint32_t cd_offset = get_u32(buf, eocd + 16);

    size_t pos = cd_offset;
    for (uint16_t i = 0; i < count; ++i) {
        if (pos + CENTRAL_HEADER_SIZE > buf.size() || get_u32(buf, pos) != CENTRAL_HEADER_SIG) {
            result.error = "corrupt central directory entry " + std::to_string(i);
            return result;
        }

        ZipEntry entry;
        entry.method = get_u16(buf, pos + 10);
        entry.dos_time = get_u16(buf, pos + 12);
        entry.dos_date = get_u16(buf, pos + 14);
        entry.crc = get_u32(buf, pos + 16);
        uint32_t compressed = get_u32(buf, pos + 20);
        uint32_t size = get_u32(buf, pos + 24);
        uint16_t name_len = get_u16(buf, pos + 28);
        uint16_t extra_len = get_u16(buf, pos + 30);
        uint16_t comment_len = get_u16(buf, pos + 32);
        entry.external_attr = get_u32(buf, pos + 38);
        uint32_t local = get_u32(buf, pos + 42);

        if (pos + CENTRAL_HEADER_SIZE + name_len > buf.size()) {
            result.error = "truncated central directory";
            return result;
        }
        entry.name = buf.substr(pos + CENTRAL_HEADER_SIZE, name_len);
        pos += CENTRAL_HEADER_SIZE + name_len + extra_len + comment_len;

        if (local + LOCAL_HEADER_SIZE > buf.size() || get_u32(buf, local) != LOCAL_HEADER_SIG) {
            result.error = "corrupt local header: " + entry.name;
            return result;
        }
        size_t data_start = local + LOCAL_HEADER_SIZE + get_u16(buf, local + 26) +
                            get_u16(buf, local + 28);
        if (data_start + compressed > buf.size()) {
            result.error = "truncated entry data: " + entry.name;
            return result;
        }
        std::string raw = buf.substr(data_start, compressed);

        if ((entry.method == 0 && size != compressed) ||
            (entry.method == 8 &&
             size > static_cast<uint64_t>(compressed) * MAX_DEFLATE_RATIO + DEFLATE_SLACK)) {
            result.error = "implausible uncompressed size " + std::to_string(size) + ": " +
                           entry.name;
            return result;
        }

        if (entry.method == 0) {
            entry.data = std::move(raw);
        } else if (entry.method == 8) {
            if (!inflate_raw(raw, size, entry.data)) {
                result.error = "failed to inflate: " + entry.name;
                return result;
            }
        } else {
            result.error = "unsupported compression method " + std::to_string(entry.method) +
                           ": " + entry.name;
            return result;
        }

        uLong crc = crc32(0L, Z_NULL, 0);
        crc = crc32(crc, reinterpret_cast<const Bytef*>(entry.data.data()),
                    static_cast<uInt>(entry.data.size()));
        if (static_cast<uint32_t>(crc) != entry.crc) {
            result.error = "CRC mismatch: " + entry.name;
            return result;
        }

        result.entries.push_back(std::move(entry));
    }

    result.ok = true;
    return result;
}

} // namespace wheelsmith
