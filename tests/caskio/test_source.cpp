/**
 * @file test_source.cpp
 * @brief Unit tests for the byte containers and the shared Source.
 */

#include <catch2/catch.hpp>

#include <caskio_file.hpp>
#include <caskio_source.hpp>

#include <thread>

#include "../helpers/test_utils.hpp"

using namespace test_helpers;

// =============================================================================
// FileMemory
// =============================================================================

TEST_CASE("FileMemory reads, seeks and skips", "[caskio][file]") {
    std::vector<uint8_t> data = { 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08 };
    Cask::FileMemory file;
    REQUIRE(file.open(data.data(), data.size()));
    REQUIRE(file.size() == 8);

    uint8_t buf[3] = {};
    REQUIRE(file.read(buf, 3));
    REQUIRE(buf[0] == 0x01);
    REQUIRE(buf[2] == 0x03);
    REQUIRE(file.tell() == 3);

    REQUIRE(file.skip(2));
    REQUIRE(file.tell() == 5);
    REQUIRE(file.seek(-2, Cask::Seek_end));
    REQUIRE(file.tell() == 6);
    REQUIRE(file.seek(1));
    REQUIRE(file.tell() == 1);
}

TEST_CASE("FileMemory refuses reads past the end", "[caskio][file]") {
    Cask::FileMemory file;
    REQUIRE(file.open_owned({ 0xAA, 0xBB, 0xCC }));

    uint8_t buf[4] = {};
    REQUIRE(file.seek(1));
    REQUIRE_FALSE(file.read(buf, 4));
    REQUIRE_FALSE(file.seek(10));
}

TEST_CASE("File reads integers in either byte order", "[caskio][file]") {
    Cask::FileMemory file;
    REQUIRE(file.open_owned({ 0x12, 0x34, 0x56, 0x78 }));

    REQUIRE(file.read<uint32_t>(Cask::Endian::little) == 0x78563412u);
    REQUIRE(file.seek(0));
    REQUIRE(file.read<uint32_t>(Cask::Endian::big) == 0x12345678u);
    REQUIRE(file.seek(0));
    REQUIRE(file.read<uint16_t>(Cask::Endian::big) == 0x1234);
}

// =============================================================================
// FileDisk
// =============================================================================

TEST_CASE("FileDisk reads a file from disk", "[caskio][file]") {
    TempDir dir;
    std::vector<uint8_t> data = make_pattern(5000);
    REQUIRE(write_file(dir.file("blob.bin"), data));

    Cask::FileDisk file;
    REQUIRE(file.open(dir.file("blob.bin").c_str()));
    REQUIRE(file.size() == data.size());

    std::vector<uint8_t> buf(100);
    REQUIRE(file.seek(4000));
    REQUIRE(file.read(buf.data(), buf.size()));
    REQUIRE(buf == slice(data, 4000, 100));
    REQUIRE(file.tell() == 4100);

    REQUIRE_FALSE(file.read(buf.data(), 1000));
}

TEST_CASE("FileDisk and FileMemory read typed fields in place", "[caskio][file]") {
    std::vector<uint8_t> data = { 0x00, 0x00, 0x00, 0x01, 0x10, 0x00, 0x00, 0x00, 0x34, 0x12 };
    TempDir dir;
    REQUIRE(write_file(dir.file("toc.bin"), data));

    Cask::FileDisk disk;
    REQUIRE(disk.open(dir.file("toc.bin").c_str()));
    int32_t marker = 0;
    uint32_t count = 0;
    REQUIRE(disk.read(marker));
    REQUIRE(disk.read(count));
    REQUIRE(marker == 0x01000000);
    REQUIRE(count == 16);
    REQUIRE(disk.read<uint16_t>() == 0x1234);

    Cask::FileMemory memory;
    REQUIRE(memory.open(data.data(), data.size()));
    REQUIRE(memory.read(marker, Cask::Endian::big));
    REQUIRE(marker == 1);
    REQUIRE(memory.seek(8));
    uint32_t too_wide = 0;
    REQUIRE_FALSE(memory.read(too_wide));
}

TEST_CASE("FileDisk fails to open a missing file", "[caskio][file]") {
    TempDir dir;
    Cask::FileDisk file;
    REQUIRE_FALSE(file.open(dir.file("missing.bin").c_str()));
}

// =============================================================================
// Source
// =============================================================================

TEST_CASE("Source read_at is exact", "[caskio][source]") {
    auto source = Cask::Source::open_memory(make_pattern(64));
    REQUIRE(source->size() == 64);

    std::vector<uint8_t> buf(16);
    REQUIRE(source->read_at(48, buf.data(), 16));
    REQUIRE(buf == slice(make_pattern(64), 48, 16));
    REQUIRE_FALSE(source->read_at(49, buf.data(), 16));
    REQUIRE_FALSE(source->read_at(100, buf.data(), 1));
    REQUIRE(source->read_at(64, buf.data(), 0));
}

TEST_CASE("Source read_some_at stops at the end", "[caskio][source]") {
    auto source = Cask::Source::open_memory(make_pattern(64));

    std::vector<uint8_t> buf(16);
    REQUIRE(source->read_some_at(56, buf.data(), 16) == 8);
    REQUIRE(source->read_some_at(64, buf.data(), 16) == 0);
    REQUIRE(source->read_some_at(0, buf.data(), 16) == 16);
}

TEST_CASE("Source reads typed values", "[caskio][source]") {
    auto source = Cask::Source::open_memory({ 0x00, 0x10, 0x00, 0x00, 0x00, 0xFF });

    uint32_t value = 0;
    REQUIRE(source->read_at(1, value));
    REQUIRE(value == 0x10);
    REQUIRE(source->read_at(1, value, Cask::Endian::big));
    REQUIRE(value == 0x10000000u);
    REQUIRE_FALSE(source->read_at(4, value));
}

TEST_CASE("Source open_disk keeps the path and fails on missing files", "[caskio][source]") {
    TempDir dir;
    REQUIRE(write_file(dir.file("a.bin"), { 1, 2, 3 }));

    auto source = Cask::Source::open_disk(dir.file("a.bin"));
    REQUIRE(source != nullptr);
    REQUIRE(source->path() == dir.file("a.bin"));
    REQUIRE(source->size() == 3);

    REQUIRE(Cask::Source::open_disk(dir.file("b.bin")) == nullptr);
}

TEST_CASE("Source positioned reads do not interfere across threads", "[caskio][source][threads]") {
    std::vector<uint8_t> data = make_pattern(1 << 16);
    auto source = Cask::Source::open_memory(data);

    std::atomic<int> mismatches(0);
    auto worker = [&](size_t start) {
        std::vector<uint8_t> buf(97);
        for (size_t off = start; off + buf.size() <= data.size(); off += 211) {
            if (!source->read_at(off, buf.data(), buf.size()) || buf != slice(data, off, buf.size())) mismatches++;
        }
    };
    std::thread a(worker, 0);
    std::thread b(worker, 5);
    a.join();
    b.join();
    REQUIRE(mismatches == 0);
}
