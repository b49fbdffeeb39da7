#include <doctest/doctest.h>
#include <wheelsmith/zip_reader.hpp>
#include <wheelsmith/zip_writer.hpp>

#include "../test_helpers.hpp"

using namespace wheelsmith;
using wheelsmith::testing::TempDir;
using wheelsmith::testing::write_text;

namespace fs = std::filesystem;

// ============================================================================
// Mode Normalization Tests
// ============================================================================

TEST_CASE("normalize_mode keeps only 0644 or 0755") {
    CHECK(normalize_mode(0644) == 0644);
    CHECK(normalize_mode(0600) == 0644);
    CHECK(normalize_mode(0666) == 0644);
    CHECK(normalize_mode(0777) == 0755);
    CHECK(normalize_mode(0700) == 0755);
    CHECK(normalize_mode(0001) == 0755);
    CHECK(normalize_mode(04755) == 0755);
    CHECK(normalize_mode(0100644) == 0644);
}

TEST_CASE("external_attributes encodes file type") {
    CHECK(external_attributes(0644, false) == (0100644u << 16));
    CHECK(external_attributes(0755, false) == (0100755u << 16));
    CHECK(external_attributes(0755, true) == ((040755u << 16) | 0x10));
}

// ============================================================================
// Writer Tests
// ============================================================================

TEST_CASE("ZipWriter writes files and generated entries") {
    TempDir tmp;
    write_text(tmp / "src/mod.py", "print(1)\n");
    std::string archive = tmp / "out.zip";

    RecordBuilder record;
    {
        ZipWriter writer(archive, record);
        REQUIRE(writer.open().ok);

        auto file = writer.write_file({tmp / "src/mod.py", "pkg/mod.py", false});
        REQUIRE(file.ok);
        CHECK(file.record.hash == "zEIVUIj8pXMHWNtysqW8ozESqUHfqi1DCY7EIs5OohM");
        CHECK(file.record.size == 9);

        auto generated = writer.write_generated("pkg-1.0.dist-info/WHEEL", "hello\n");
        REQUIRE(generated.ok);
        CHECK(generated.record.size == 6);

        REQUIRE(writer.write_record("pkg-1.0.dist-info/RECORD").ok);
        REQUIRE(writer.close().ok);
    }

    REQUIRE(record.entries().size() == 2);
    CHECK(record.entries()[0].archive_path == "pkg/mod.py");
    CHECK(record.entries()[1].archive_path == "pkg-1.0.dist-info/WHEEL");

    auto zip = read_zip(archive);
    REQUIRE(zip.ok);
    REQUIRE(zip.entries.size() == 3);

    const auto& mod = zip.entries[0];
    CHECK(mod.name == "pkg/mod.py");
    CHECK(mod.data == "print(1)\n");
    CHECK(mod.method == 8);
    CHECK(mod.dos_date == ZIP_EPOCH_DATE);
    CHECK(mod.dos_time == 0);

    const auto& wheel = zip.entries[1];
    CHECK(wheel.data == "hello\n");
    CHECK(wheel.dos_date == GENERATED_DATE);
    CHECK(wheel.mode() == 0100644);

    const auto& rec = zip.entries[2];
    CHECK(rec.name == "pkg-1.0.dist-info/RECORD");
    CHECK(rec.data ==
          "pkg/mod.py,sha256=zEIVUIj8pXMHWNtysqW8ozESqUHfqi1DCY7EIs5OohM,9\n"
          "pkg-1.0.dist-info/WHEEL,sha256=WJG1tSLV3whtD_CxEPvZ0hu0_HFjrzTQgoai6Eb2vgM,6\n"
          "pkg-1.0.dist-info/RECORD,,\n");
}

TEST_CASE("ZipWriter normalizes source permissions") {
    TempDir tmp;
    write_text(tmp / "script.sh", "#!/bin/sh\n");
    write_text(tmp / "world.txt", "data\n");
    fs::permissions(tmp / "script.sh", fs::perms::all);
    fs::permissions(tmp / "world.txt", fs::perms::owner_read | fs::perms::owner_write |
                                           fs::perms::group_write | fs::perms::others_write);

    std::string archive = tmp / "out.zip";
    RecordBuilder record;
    {
        ZipWriter writer(archive, record);
        REQUIRE(writer.open().ok);
        REQUIRE(writer.write_file({tmp / "script.sh", "script.sh", false}).ok);
        REQUIRE(writer.write_file({tmp / "world.txt", "world.txt", false}).ok);
        REQUIRE(writer.close().ok);
    }

    auto zip = read_zip(archive);
    REQUIRE(zip.ok);
    REQUIRE(zip.entries.size() == 2);
    CHECK(zip.entries[0].mode() == 0100755);
    CHECK(zip.entries[1].mode() == 0100644);
}

TEST_CASE("ZipWriter streams files larger than one chunk") {
    TempDir tmp;
    std::string big;
    for (int i = 0; i < 5000; ++i) {
        big += "line " + std::to_string(i) + "\n";
    }
    write_text(tmp / "big.txt", big);

    std::string archive = tmp / "out.zip";
    RecordBuilder record;
    {
        ZipWriter writer(archive, record);
        REQUIRE(writer.open().ok);
        auto r = writer.write_file({tmp / "big.txt", "big.txt", false});
        REQUIRE(r.ok);
        CHECK(r.record.size == big.size());
        REQUIRE(writer.close().ok);
    }

    auto zip = read_zip(archive);
    REQUIRE(zip.ok);
    REQUIRE(zip.entries.size() == 1);
    CHECK(zip.entries[0].data == big);
}

TEST_CASE("ZipWriter rejects a second write of the same path") {
    TempDir tmp;
    RecordBuilder record;
    ZipWriter writer(tmp / "out.zip", record);
    REQUIRE(writer.open().ok);

    REQUIRE(writer.write_generated("a.txt", "1").ok);
    auto dup = writer.write_generated("a.txt", "2");
    CHECK_FALSE(dup.ok);
    CHECK(dup.kind == BuildError::DuplicateArchivePath);
    CHECK(record.entries().size() == 1);
}

TEST_CASE("ZipWriter reports unreadable sources") {
    TempDir tmp;
    RecordBuilder record;
    ZipWriter writer(tmp / "out.zip", record);
    REQUIRE(writer.open().ok);

    auto missing = writer.write_file({tmp / "missing.py", "missing.py", false});
    CHECK_FALSE(missing.ok);
    CHECK(missing.kind == BuildError::SourceReadFailure);

    fs::create_symlink(tmp / "nowhere", tmp / "dangling");
    auto dangling = writer.write_file({tmp / "dangling", "dangling", false});
    CHECK_FALSE(dangling.ok);
    CHECK(dangling.kind == BuildError::SourceReadFailure);
    CHECK(record.entries().empty());
}

TEST_CASE("ZipWriter accepts nothing after RECORD") {
    TempDir tmp;
    RecordBuilder record;
    ZipWriter writer(tmp / "out.zip", record);
    REQUIRE(writer.open().ok);
    REQUIRE(writer.write_record("x-1.dist-info/RECORD").ok);

    auto late = writer.write_generated("late.txt", "x");
    CHECK_FALSE(late.ok);
    CHECK(late.kind == BuildError::ArchiveWriteFailure);
}

TEST_CASE("ZipWriter fails to open in a missing directory") {
    TempDir tmp;
    RecordBuilder record;
    ZipWriter writer(tmp / "no/such/dir/out.zip", record);
    auto opened = writer.open();
    CHECK_FALSE(opened.ok);
    CHECK(opened.kind == BuildError::ArchiveWriteFailure);
}

TEST_CASE("ZipWriter flags non-ASCII names as UTF-8 and stays readable") {
    TempDir tmp;
    std::string archive = tmp / "out.zip";
    RecordBuilder record;
    {
        ZipWriter writer(archive, record);
        REQUIRE(writer.open().ok);
        REQUIRE(writer.write_generated("pkg/caf\xc3\xa9.txt", "").ok);
        REQUIRE(writer.close().ok);
    }

    auto zip = read_zip(archive);
    REQUIRE(zip.ok);
    REQUIRE(zip.entries.size() == 1);
    CHECK(zip.entries[0].name == "pkg/caf\xc3\xa9.txt");
    CHECK(zip.entries[0].data.empty());
}

TEST_CASE("read_zip rejects non-archives") {
    TempDir tmp;
    write_text(tmp / "plain.txt", "not a zip file at all, just text");
    CHECK_FALSE(read_zip(tmp / "plain.txt").ok);
    CHECK_FALSE(read_zip(tmp / "missing.zip").ok);
}

TEST_CASE("ZipWriter stores a directory as a flagged empty entry") {
    TempDir tmp;
    fs::create_directories(tmp / "src/data");
    std::string archive = tmp / "out.zip";

    RecordBuilder record;
    {
        ZipWriter writer(archive, record);
        REQUIRE(writer.open().ok);
        auto dir = writer.write_file({tmp / "src/data", "pkg/data", false});
        REQUIRE(dir.ok);
        CHECK(dir.record.archive_path == "pkg/data/");
        CHECK(dir.record.size == 0);
        CHECK(dir.record.hash == "47DEQpj8HBSa-_TImW-5JCeuQeRkm5NMpJWZG3hSuFU");
        REQUIRE(writer.close().ok);
    }

    auto zip = read_zip(archive);
    REQUIRE(zip.ok);
    REQUIRE(zip.entries.size() == 1);
    CHECK(zip.entries[0].name == "pkg/data/");
    CHECK(zip.entries[0].data.empty());
    CHECK(zip.entries[0].mode() == 040755);
    CHECK((zip.entries[0].external_attr & 0x10) != 0);
    CHECK(zip.entries[0].dos_date == ZIP_EPOCH_DATE);
}
