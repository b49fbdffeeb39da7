#include "wheelsmith/platform.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <random>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace wheelsmith {

namespace fs = std::filesystem;

namespace {

#ifndef _WIN32
bool fsync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

bool fsync_path(const std::string& path) {
    int fd = open(path.c_str(), O_RDONLY);
    if (fd < 0) return false;

    bool result = fsync_fd(fd);
    close(fd);
    return result;
}
#endif

std::string random_hex(int digits) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    static const char hex_chars[] = "0123456789abcdef";
    std::string out;
    for (int i = 0; i < digits; ++i) {
        out += hex_chars[dis(gen)];
    }
    return out;
}

} // namespace

std::string make_temp_path(const std::string& final_path) {
    fs::path p(final_path);
    std::string name = "." + p.filename().string() + ".tmp." + random_hex(8);
    return join_path(p.parent_path().string(), name);
}

AtomicWriteResult atomic_replace_file(const std::string& temp_path,
                                      const std::string& final_path) {
    AtomicWriteResult result;

#ifdef _WIN32
    if (!MoveFileExA(temp_path.c_str(), final_path.c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
        DeleteFileA(temp_path.c_str());
        result.error = "failed to move archive into place";
        return result;
    }
#else
    if (!fsync_path(temp_path)) {
        unlink(temp_path.c_str());
        result.error = "failed to fsync temp file: " + std::string(strerror(errno));
        return result;
    }

    if (rename(temp_path.c_str(), final_path.c_str()) != 0) {
        result.error = "failed to rename temp file: " + std::string(strerror(errno));
        unlink(temp_path.c_str());
        return result;
    }

    std::string dir_path = get_parent_directory(final_path);
    if (!dir_path.empty()) {
        fsync_path(dir_path);
    }
#endif

    result.ok = true;
    return result;
}

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string get_parent_directory(const std::string& path) {
    fs::path p(path);
    return p.parent_path().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    if (base.empty()) return to_portable_path(rel);
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> entries;

    std::error_code ec;
    if (!fs::is_directory(path, ec)) return entries;

    for (const auto& entry : fs::directory_iterator(path, ec)) {
        entries.push_back(entry.path().filename().string());
    }

    return entries;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    // Version 4 (random) and variant 1
    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf),
                  "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<uint32_t>(a >> 32),
                  static_cast<uint16_t>((a >> 16) & 0xFFFF),
                  static_cast<uint16_t>(a & 0xFFFF),
                  static_cast<uint16_t>(b >> 48),
                  static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace wheelsmith
