#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

#include "uvm/engine/aligner.hpp"
#include "uvm/engine/estimation.hpp"
#include "uvm/errors.hpp"

#include <fstream>

using Catch::Approx;

TEST_CASE("Label text converts 100 ns units to milliseconds", "[aligner]") {
    const auto segments = uvm::engine::parse_lab("0 200000 sil\r\n200000 600000 k\n600000 2000000 a\n\n2000000 2500000 pau\n");
    REQUIRE(segments.size() == 2);
    REQUIRE(segments[0].phoneme == "k");
    REQUIRE(segments[0].startMs == Approx(20.0));
    REQUIRE(segments[0].endMs == Approx(60.0));
    REQUIRE(segments[1].endMs == Approx(200.0));
    REQUIRE(segments[1].confidence == 1.0);
}

TEST_CASE("Malformed label lines are alignment errors", "[aligner]") {
    REQUIRE_THROWS_AS(uvm::engine::parse_lab("0 100 k\nbroken line\n"), uvm::AlignmentError);
    REQUIRE_THROWS_AS(uvm::engine::parse_lab("500 100 a\n"), uvm::AlignmentError);
    REQUIRE(uvm::engine::parse_lab("").empty());
}

TEST_CASE("Lab aligner reads the sidecar next to the audio", "[aligner]") {
    uvm::test::TempDir dir;
    const auto wav = uvm::test::write_tone(dir.path() / "_ka.wav", 250.0);
    std::ofstream(dir.path() / "_ka.lab") << "200000 600000 k\n600000 2000000 a\n";

    uvm::engine::LabFileAligner aligner;
    const auto result = aligner.align(wav, "ka", "ja");
    REQUIRE(result.method == "lab");
    REQUIRE(result.segments.size() == 2);
    REQUIRE(result.durationMs == Approx(250.0));

    const uvm::engine::OtoEstimator estimator;
    const auto suggestion = estimator.suggest(aligner, wav);
    REQUIRE(suggestion.params.preutterMs == Approx(60.0));
    REQUIRE(suggestion.confidence > 0.7);
}

TEST_CASE("Lab aligner honours an explicit label path", "[aligner]") {
    uvm::test::TempDir dir;
    const auto wav = uvm::test::write_tone(dir.path() / "take.wav", 300.0);
    const auto lab = dir.path() / "labels.txt";
    std::ofstream(lab) << "0 1000000 a\n";

    uvm::engine::LabFileAligner explicitLab(lab);
    REQUIRE(explicitLab.align(wav, "a", "ja").segments.size() == 1);

    uvm::engine::LabFileAligner sidecar;
    REQUIRE_THROWS_AS(sidecar.align(wav, "a", "ja"), uvm::AlignmentError);

    REQUIRE_THROWS_AS(explicitLab.align(dir.path() / "missing.wav", "a", "ja"), uvm::AlignmentError);
}
