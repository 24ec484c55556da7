/**
 * @file test_registry.cpp
 * @brief Format detection and the builtin registry.
 */

#include <catch2/catch.hpp>

#include <cask_format.hpp>

#include <string.h>

using Cask::Format;
using Cask::FormatId;
using Cask::Registry;
using Cask::Status;

namespace {

int sniff_ab(const std::string&, const uint8_t* header, size_t size, const Cask::Options&) {
    return (size >= 2 && header[0] == 'A' && header[1] == 'B') ? 200 : Cask::NO_MATCH;
}

int sniff_a(const std::string&, const uint8_t* header, size_t size, const Cask::Options&) {
    return (size >= 1 && header[0] == 'A') ? 50 : Cask::NO_MATCH;
}

int sniff_ten(const std::string&, const uint8_t*, size_t, const Cask::Options&) {
    return 10;
}

Status parse_nothing(Cask::Source&, const std::string&, const Cask::Options&, std::vector<Cask::EntryDescriptor>& entries) {
    entries.clear();
    return Status::ok;
}

} // namespace

TEST_CASE("detect picks the highest score", "[registry]") {
    Registry registry;
    registry.add({ FormatId::custom, "low", "", sniff_a, parse_nothing });
    registry.add({ FormatId::custom, "high", "", sniff_ab, parse_nothing });

    const uint8_t both[] = { 'A', 'B', 'C' };
    int score = 0;
    const Format* format = registry.detect("x.bin", both, sizeof(both), Cask::Options(), &score);
    REQUIRE(format != nullptr);
    REQUIRE(strcmp(format->name, "high") == 0);
    REQUIRE(score == 200);

    const uint8_t one[] = { 'A', 'C' };
    format = registry.detect("x.bin", one, sizeof(one), Cask::Options(), &score);
    REQUIRE(format != nullptr);
    REQUIRE(strcmp(format->name, "low") == 0);
    REQUIRE(score == 50);

    const uint8_t none[] = { 'Z', 'Z' };
    REQUIRE(registry.detect("x.bin", none, sizeof(none), Cask::Options(), &score) == nullptr);
    REQUIRE(score == Cask::NO_MATCH);
}

TEST_CASE("detect breaks ties by registration order", "[registry]") {
    Registry registry;
    registry.add({ FormatId::custom, "first", "", sniff_ten, parse_nothing });
    registry.add({ FormatId::custom, "second", "", sniff_ten, parse_nothing });

    const uint8_t header[] = { 0 };
    const Format* format = registry.detect("x.bin", header, sizeof(header), Cask::Options());
    REQUIRE(format != nullptr);
    REQUIRE(strcmp(format->name, "first") == 0);
}

TEST_CASE("An empty registry matches nothing", "[registry]") {
    Registry registry;
    const uint8_t header[] = { 'A', 'B' };
    REQUIRE(registry.detect("x.bin", header, sizeof(header), Cask::Options()) == nullptr);
}

TEST_CASE("The builtin registry lists its formats in priority order", "[registry]") {
    const Registry& registry = Registry::builtin();
    const std::vector<std::string> expected = {
        "xp3", "kirikiri_mdf", "kirikiri_simple_crypt", "circus_pck", "circus_dat", "exhibit_grp",
    };

    REQUIRE(registry.formats().size() == expected.size());
    for (size_t i = 0; i < expected.size(); i++) {
        REQUIRE(registry.formats()[i].name == expected[i]);
    }

    REQUIRE(registry.find(FormatId::circus_dat) != nullptr);
    REQUIRE(strcmp(registry.find(FormatId::circus_dat)->name, "circus_dat") == 0);
    REQUIRE(registry.find("XP3") == registry.find(FormatId::xp3));
    REQUIRE(registry.find("zip") == nullptr);
    REQUIRE(registry.find(FormatId::custom) == nullptr);
}

TEST_CASE("Options switch the single file formats off", "[registry]") {
    const uint8_t mdf[] = { 'm', 'd', 'f', 0, 4, 0, 0, 0 };
    const uint8_t crypt[] = { 0xFE, 0xFE, 0x01, 0xFF, 0xFE, 0x11, 0x00 };
    Cask::Options options;

    const Format* format = Registry::builtin().detect("a.mdf", mdf, sizeof(mdf), options);
    REQUIRE(format != nullptr);
    REQUIRE(format->id == FormatId::kirikiri_mdf);
    format = Registry::builtin().detect("a.txt", crypt, sizeof(crypt), options);
    REQUIRE(format != nullptr);
    REQUIRE(format->id == FormatId::kirikiri_simple_crypt);

    options.mdf_unwrap = false;
    options.simple_crypt = false;
    REQUIRE(Registry::builtin().detect("a.mdf", mdf, sizeof(mdf), options) == nullptr);
    REQUIRE(Registry::builtin().detect("a.txt", crypt, sizeof(crypt), options) == nullptr);
}

TEST_CASE("The grp sniff only looks at the file name", "[registry][grp]") {
    const uint8_t data[] = { 'O', 'g', 'g', 'S', 0, 2, 0, 0 };
    const uint8_t toc[] = { 'A', 'i', 'F', 'S', 0, 0, 0, 0 };
    Cask::Options options;

    REQUIRE(Cask::Formats::exhibit_grp_sniff("dir/res00012.grp", data, sizeof(data), options) == 10);
    REQUIRE(Cask::Formats::exhibit_grp_sniff("RES3.GRP", data, sizeof(data), options) == 10);
    REQUIRE(Cask::Formats::exhibit_grp_sniff("res.grp", data, sizeof(data), options) == Cask::NO_MATCH);
    REQUIRE(Cask::Formats::exhibit_grp_sniff("res12a.grp", data, sizeof(data), options) == Cask::NO_MATCH);
    REQUIRE(Cask::Formats::exhibit_grp_sniff("res00000.grp", toc, sizeof(toc), options) == Cask::NO_MATCH);
}
