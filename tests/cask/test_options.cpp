/**
 * @file test_options.cpp
 * @brief Options by name, diagnostics and name decoding.
 */

#include <catch2/catch.hpp>

#include <cask_diagnostics.hpp>
#include <cask_options.hpp>
#include <cask_status.hpp>
#include <cask_text.hpp>

#include <string.h>

using Cask::NameEncoding;
using Cask::Options;

// =============================================================================
// Options
// =============================================================================

TEST_CASE("Options defaults", "[options]") {
    Options options;
    REQUIRE(options.simple_crypt);
    REQUIRE(options.mdf_unwrap);
    REQUIRE(options.filters);
    REQUIRE(options.max_filters == 4);
    REQUIRE(options.name_encoding == NameEncoding::cp932);
    REQUIRE(options.skip_garbage);
}

TEST_CASE("Every option can be set and read back by name", "[options]") {
    Options options;
    std::string value;

    REQUIRE(options.set("simple_crypt", "off"));
    REQUIRE_FALSE(options.simple_crypt);
    REQUIRE(options.get("simple_crypt", value));
    REQUIRE(value == "false");

    REQUIRE(options.set("max_filters", "2"));
    REQUIRE(options.max_filters == 2);
    REQUIRE(options.get("max_filters", value));
    REQUIRE(value == "2");

    REQUIRE(options.set("name_encoding", "UTF-8"));
    REQUIRE(options.name_encoding == NameEncoding::utf8);
    REQUIRE(options.get("name_encoding", value));
    REQUIRE(value == "utf8");

    REQUIRE(options.set("skip_garbage", "0"));
    REQUIRE(options.set("mdf_unwrap", "no"));
    REQUIRE(options.set("filters", "TRUE"));
    REQUIRE_FALSE(options.skip_garbage);
    REQUIRE_FALSE(options.mdf_unwrap);
    REQUIRE(options.filters);

    for (const auto& name : Options::names()) {
        INFO(name);
        REQUIRE(options.get(name, value));
        REQUIRE_FALSE(options.describe(name).empty());
    }
}

TEST_CASE("Bad option names and values are refused", "[options]") {
    Options options;
    std::string value;

    REQUIRE_FALSE(options.set("compression", "on"));
    REQUIRE_FALSE(options.set("simple_crypt", "maybe"));
    REQUIRE_FALSE(options.set("max_filters", "-1"));
    REQUIRE_FALSE(options.set("max_filters", "3x"));
    REQUIRE_FALSE(options.set("max_filters", ""));
    REQUIRE_FALSE(options.set("name_encoding", "latin1"));
    REQUIRE_FALSE(options.get("compression", value));

    REQUIRE(options.simple_crypt);
    REQUIRE(options.max_filters == 4);
}

// =============================================================================
// Diagnostics
// =============================================================================

TEST_CASE("warn_once counts each key once", "[diagnostics]") {
    Cask::Diagnostics diag;
    REQUIRE(diag.warn_once("a.mdf", "size mismatch"));
    REQUIRE_FALSE(diag.warn_once("a.mdf", "size mismatch"));
    REQUIRE(diag.warn_once("b.mdf", "size mismatch"));
    diag.warn("something else");

    REQUIRE(diag.warnings() == 3);
    REQUIRE(diag.messages().size() == 3);

    diag.clear();
    REQUIRE(diag.warnings() == 0);
    REQUIRE(diag.warn_once("a.mdf", "size mismatch"));
}

// =============================================================================
// Names
// =============================================================================

TEST_CASE("Names stop at the terminator", "[text]") {
    const uint8_t field[12] = { 'b', 'g', 'm', '.', 'o', 'g', 'g', 0, 'x', 'x', 0, 0 };
    REQUIRE(Cask::decode_name(field, sizeof(field), NameEncoding::cp932) == "bgm.ogg");

    const uint8_t full[3] = { 'a', 'b', 'c' };
    REQUIRE(Cask::decode_name(full, sizeof(full), NameEncoding::cp932) == "abc");

    const uint8_t wide[8] = { 'a', 0, 'b', 0, 0, 0, 'c', 0 };
    REQUIRE(Cask::decode_name(wide, sizeof(wide), NameEncoding::utf16le) == "ab");
}

TEST_CASE("Legacy names are converted to UTF-8", "[text]") {
    // "あ.png" in Shift-JIS
    const uint8_t sjis[] = { 0x82, 0xA0, '.', 'p', 'n', 'g', 0 };
    REQUIRE(Cask::decode_name(sjis, sizeof(sjis), NameEncoding::cp932) == "\xE3\x81\x82.png");

    // the same as UTF-16LE
    const uint8_t wide[] = { 0x42, 0x30, '.', 0, 'p', 0, 'n', 0, 'g', 0 };
    REQUIRE(Cask::decode_name(wide, sizeof(wide), NameEncoding::utf16le) == "\xE3\x81\x82.png");

    const uint8_t utf8[] = { 0xE3, 0x81, 0x82, 0 };
    REQUIRE(Cask::decode_name(utf8, sizeof(utf8), NameEncoding::utf8) == "\xE3\x81\x82");
}

TEST_CASE("Every status has a message", "[status]") {
    REQUIRE(strcmp(Cask::status_string(Cask::Status::ok), "ok") == 0);
    REQUIRE(strcmp(Cask::status_string(Cask::Status::not_found), "not found") == 0);
    REQUIRE(Cask::ok(Cask::Status::ok));
    REQUIRE_FALSE(Cask::ok(Cask::Status::decode_failure));
}
