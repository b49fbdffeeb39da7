#pragma once

#include <wheelsmith/platform.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace wheelsmith::testing {

namespace fs = std::filesystem;

// Helper to create temporary directory
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "wheelsmith_test_") {
        path_ = fs::temp_directory_path() / (prefix + generate_uuid());
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    std::string path() const { return path_.string(); }

    std::string operator/(const std::string& rel) const { return (path_ / rel).string(); }

private:
    fs::path path_;
};

// Write content to path, creating parent directories
inline void write_text(const std::string& path, const std::string& content) {
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

inline std::string read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace wheelsmith::testing
