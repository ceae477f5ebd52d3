#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

#include "uvm/engine/oto.hpp"
#include "uvm/errors.hpp"

#include <fstream>

using uvm::engine::OtoEntry;

TEST_CASE("Parse a standard oto line", "[oto]") {
    const auto entry = uvm::engine::parse_oto_line("_ka.wav=- ka,20,100,-30,60,25");
    REQUIRE(entry.has_value());
    REQUIRE(entry->wavFile == "_ka.wav");
    REQUIRE(entry->alias == "- ka");
    REQUIRE(entry->params.offsetMs == 20.0);
    REQUIRE(entry->params.consonantMs == 100.0);
    REQUIRE(entry->params.cutoffMs == -30.0);
    REQUIRE(entry->params.preutterMs == 60.0);
    REQUIRE(entry->params.overlapMs == 25.0);
}

TEST_CASE("Empty alias falls back to the filename stem", "[oto]") {
    const auto entry = uvm::engine::parse_oto_line("_sa.wav=,10.5,80,-20,40,-5");
    REQUIRE(entry.has_value());
    REQUIRE(entry->alias == "_sa");
    REQUIRE(entry->params.offsetMs == 10.5);
    REQUIRE(entry->params.overlapMs == -5.0);
}

TEST_CASE("Comments and malformed lines are skipped", "[oto]") {
    REQUIRE_FALSE(uvm::engine::parse_oto_line("").has_value());
    REQUIRE_FALSE(uvm::engine::parse_oto_line("# comment").has_value());
    REQUIRE_FALSE(uvm::engine::parse_oto_line("; comment").has_value());
    REQUIRE_FALSE(uvm::engine::parse_oto_line("no equals sign").has_value());
    REQUIRE_FALSE(uvm::engine::parse_oto_line("_ka.wav=ka,1,2,3").has_value());
    REQUIRE_FALSE(uvm::engine::parse_oto_line("_ka.wav=ka,x,2,3,4,5").has_value());
    REQUIRE_FALSE(uvm::engine::parse_oto_line("_ka.mp3=ka,1,2,3,4,5").has_value());
    REQUIRE_FALSE(uvm::engine::parse_oto_line("_ka.wav=ka,-1,2,3,4,5").has_value());

    const auto entries = uvm::engine::parse_oto("# header\n_ka.wav=ka,1,2,3,4,5\ngarbage\n\n_sa.wav=sa,1,2,3,4,5\n");
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[1].alias == "sa");
}

TEST_CASE("Byte order mark and CRLF line endings", "[oto]") {
    const auto entries = uvm::engine::parse_oto("\xEF\xBB\xBF_ka.wav=ka,1,2,3,4,5\r\n_sa.wav=sa,1,2,3,4,5\r\n");
    REQUIRE(entries.size() == 2);
    REQUIRE(entries[0].wavFile == "_ka.wav");
    REQUIRE(entries[1].params.overlapMs == 5.0);
}

TEST_CASE("Numbers are written without trailing zeros", "[oto]") {
    REQUIRE(uvm::engine::format_number(20.0) == "20");
    REQUIRE(uvm::engine::format_number(-30.0) == "-30");
    REQUIRE(uvm::engine::format_number(12.5) == "12.5");
    REQUIRE(uvm::engine::format_number(0.0) == "0");
    REQUIRE(uvm::engine::to_oto_line({"_ka.wav", "- ka", {20.0, 102.0, -30.0, 60.0, 30.5}}) ==
            "_ka.wav=- ka,20,102,-30,60,30.5");
}

TEST_CASE("Serialized entries parse back unchanged", "[oto]") {
    const std::vector<OtoEntry> entries = {
        {"_ka.wav", "- ka", {20.0, 102.0, -30.0, 60.0, 30.0}},
        {"_a_ka.wav", "a ka", {12.3, 140.0, -45.5, 90.0, 40.0}},
        {"_sa.wav", "- sa", {0.0, 20.0, 15.0, 0.0, -10.0}},
        {"_ta.wav", "- ta", {0.00001, 102.0, -30.0, 60.0, 30.0}},
        {"_na.wav", "- na", {1e15, 2.5e16, -30.0, 1e15, 0.000125}},
    };
    const auto text = uvm::engine::serialize_oto(entries);
    REQUIRE(text.find('\n') != std::string::npos);
    REQUIRE(text.find('e') == std::string::npos);
    REQUIRE(text.find("0.00001,") != std::string::npos);
    REQUIRE(uvm::engine::parse_oto(text) == entries);
}

TEST_CASE("Entries that break the line format are not representable", "[oto]") {
    REQUIRE(uvm::engine::is_representable({"_ka.wav", "- ka", {20.0, 100.0, -30.0, 60.0, 25.0}}));
    REQUIRE(uvm::engine::is_representable({"a,b.wav", "ab", {20.0, 100.0, -30.0, 60.0, 25.0}}));
    REQUIRE_FALSE(uvm::engine::is_representable({"a,b.wav", "a,b", {20.0, 100.0, -30.0, 60.0, 25.0}}));
    REQUIRE_FALSE(uvm::engine::is_representable({"_ka.wav", "k\na", {20.0, 100.0, -30.0, 60.0, 25.0}}));
    REQUIRE_FALSE(uvm::engine::is_representable({"_ka.wav", "", {20.0, 100.0, -30.0, 60.0, 25.0}}));
    REQUIRE_FALSE(uvm::engine::is_representable({"ka.txt", "ka", {20.0, 100.0, -30.0, 60.0, 25.0}}));
}

TEST_CASE("oto.ini file round trip", "[oto]") {
    uvm::test::TempDir dir;
    const auto path = dir.path() / "oto.ini";
    const std::vector<OtoEntry> entries = {{"_ka.wav", "- ka", {20.0, 100.0, -30.0, 60.0, 25.0}}};

    uvm::engine::write_oto_file(path, entries);
    REQUIRE(uvm::test::read_bytes(path) == "_ka.wav=- ka,20,100,-30,60,25\n");
    REQUIRE(uvm::engine::read_oto_file(path) == entries);

    REQUIRE_THROWS_AS(uvm::engine::read_oto_file(dir.path() / "missing.ini"), uvm::StoreError);
}
