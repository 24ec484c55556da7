/**
 * @file test_archive.cpp
 * @brief Opening containers and handing out entry streams.
 */

#include <catch2/catch.hpp>

#include <cask_archive.hpp>

#include "../helpers/test_utils.hpp"

using namespace test_helpers;
using Cask::FormatId;
using Cask::Status;

namespace {

std::vector<uint8_t> sample_xp3() {
    return build_xp3({
        { "first.txt", { bytes_of("first entry") }, false },
        { "second.bin", { make_pattern(9000, 71) }, true },
    });
}

} // namespace

TEST_CASE("Archives open from disk", "[archive]") {
    TempDir dir;
    REQUIRE(write_file(dir.file("data.xp3"), sample_xp3()));

    Cask::Archive archive;
    REQUIRE_FALSE(archive.is_open());
    REQUIRE(archive.open(dir.file("data.xp3")) == Status::ok);
    REQUIRE(archive.is_open());
    REQUIRE(archive.format()->id == FormatId::xp3);
    REQUIRE(archive.source()->path() == dir.file("data.xp3"));
    REQUIRE(archive.count() == 2);

    size_t index = 99;
    REQUIRE(archive.find("second.bin", index) == Status::ok);
    REQUIRE(index == 1);

    std::unique_ptr<Cask::Stream> stream;
    REQUIRE(archive.open_entry(index, stream) == Status::ok);
    std::vector<uint8_t> out;
    REQUIRE(stream->read_to_end(out) == Status::ok);
    REQUIRE(out == make_pattern(9000, 71));
    REQUIRE(stream->name() == "second.bin");

    archive.close();
    REQUIRE_FALSE(archive.is_open());
    REQUIRE(archive.count() == 0);
}

TEST_CASE("Missing files and unknown data fail to open", "[archive][error]") {
    TempDir dir;
    Cask::Archive archive;
    REQUIRE(archive.open(dir.file("nothing.xp3")) == Status::io_error);

    REQUIRE(archive.open(Cask::Source::open_memory(bytes_of("hello world, nothing to see here")), "notes.txt") == Status::format_mismatch);
    REQUIRE_FALSE(archive.is_open());
}

TEST_CASE("A failed open leaves the archive as it was", "[archive][error]") {
    Cask::Archive archive;
    REQUIRE(archive.open(Cask::Source::open_memory(sample_xp3()), "data.xp3") == Status::ok);

    std::vector<uint8_t> broken = sample_xp3();
    set_u64(broken, 11, broken.size() + 1);
    REQUIRE(archive.open(Cask::Source::open_memory(broken), "broken.xp3") == Status::structural_corruption);

    REQUIRE(archive.is_open());
    REQUIRE(archive.count() == 2);
    REQUIRE(archive.entries()[0].name() == "first.txt");

    std::unique_ptr<Cask::Stream> stream;
    REQUIRE(archive.open_entry("first.txt", stream) == Status::ok);
    std::vector<uint8_t> out;
    REQUIRE(stream->read_to_end(out) == Status::ok);
    REQUIRE(out == bytes_of("first entry"));
}

TEST_CASE("Unknown names are not found, bad indices are out of bounds", "[archive][error]") {
    Cask::Archive archive;
    REQUIRE(archive.open(Cask::Source::open_memory(sample_xp3()), "data.xp3") == Status::ok);

    std::unique_ptr<Cask::Stream> stream;
    size_t index = 0;
    REQUIRE(archive.open_entry(2, stream) == Status::out_of_bounds);
    REQUIRE(archive.open_entry("third.txt", stream) == Status::not_found);
    REQUIRE(archive.open_raw_entry(100, stream) == Status::out_of_bounds);
    REQUIRE(archive.find("FIRST.TXT", index) == Status::not_found);
    REQUIRE(stream == nullptr);
}

TEST_CASE("open_as skips detection", "[archive]") {
    std::vector<uint8_t> bytes = sample_xp3();
    const Cask::Registry& registry = Cask::Registry::builtin();

    Cask::Archive archive;
    REQUIRE(archive.open_as(*registry.find(FormatId::kirikiri_mdf), Cask::Source::open_memory(bytes), "dir/data.xp3") == Status::ok);
    REQUIRE(archive.format()->id == FormatId::kirikiri_mdf);
    REQUIRE(archive.count() == 1);
    REQUIRE(archive.entries()[0].name() == "data.xp3");
    REQUIRE(archive.entries()[0].size() == bytes.size());

    REQUIRE(archive.open_as(*registry.find(FormatId::circus_pck), Cask::Source::open_memory(bytes), "data.xp3") == Status::structural_corruption);
    REQUIRE(archive.format()->id == FormatId::kirikiri_mdf);
}

TEST_CASE("Raw entries skip the filters", "[archive]") {
    std::vector<uint8_t> crypt = { 0xFE, 0xFE, 0x01, 0xFF, 0xFE, 0x11, 0x00 };
    std::vector<uint8_t> bytes = build_xp3({ { "scenario.ks", { crypt }, false } });

    Cask::Archive archive;
    REQUIRE(archive.open(Cask::Source::open_memory(bytes), "data.xp3") == Status::ok);

    std::unique_ptr<Cask::Stream> stream;
    std::vector<uint8_t> out;
    REQUIRE(archive.open_raw_entry(0, stream) == Status::ok);
    REQUIRE(stream->read_to_end(out) == Status::ok);
    REQUIRE(out == crypt);

    REQUIRE(archive.open_entry(0, stream) == Status::ok);
    REQUIRE(stream->read_to_end(out) == Status::ok);
    REQUIRE(out == std::vector<uint8_t>({ 0xFF, 0xFE, 0x22, 0x00 }));
}

TEST_CASE("Streams keep the source alive after the archive lets go", "[archive]") {
    Cask::Archive archive;
    std::weak_ptr<Cask::Source> weak;
    {
        auto source = Cask::Source::open_memory(sample_xp3());
        weak = source;
        REQUIRE(archive.open(source, "data.xp3") == Status::ok);
    }
    REQUIRE_FALSE(weak.expired());
    REQUIRE(weak.use_count() == 1);

    std::unique_ptr<Cask::Stream> stream;
    REQUIRE(archive.open_entry(0, stream) == Status::ok);
    REQUIRE(weak.use_count() == 2);
    stream.reset();
    archive.close();
    REQUIRE(weak.expired());
}
