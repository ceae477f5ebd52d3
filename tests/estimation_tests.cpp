#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"

#include "uvm/engine/estimation.hpp"
#include "uvm/engine/oto_validation.hpp"

#include <limits>

using Catch::Approx;
using uvm::engine::EstimationParams;
using uvm::engine::OtoEstimator;
using uvm::engine::PhonemeSegment;

namespace {

std::vector<PhonemeSegment> ka(double vowelEnd = 200.0) {
    return {{"k", 20.0, 60.0, 0.9}, {"a", 60.0, vowelEnd, 0.85}};
}

void require_defaults(const uvm::engine::OtoSuggestion& s) {
    REQUIRE(s.params.offsetMs == 20.0);
    REQUIRE(s.params.preutterMs == 60.0);
    REQUIRE(s.params.consonantMs == 100.0);
    REQUIRE(s.params.cutoffMs == -30.0);
    REQUIRE(s.params.overlapMs == 25.0);
    REQUIRE(s.confidence == 0.0);
}

}  // namespace

TEST_CASE("CV take estimates consonant-vowel boundaries", "[estimation]") {
    const OtoEstimator estimator;
    const auto s = estimator.estimate(ka(), 250.0, "_ka.wav", "- ka");

    REQUIRE(s.wavFile == "_ka.wav");
    REQUIRE(s.alias == "- ka");
    REQUIRE(s.params.offsetMs == Approx(10.0));
    REQUIRE(s.params.offsetMs >= 0.0);
    REQUIRE(s.params.preutterMs == Approx(60.0));
    REQUIRE(s.params.consonantMs == Approx(102.0));
    REQUIRE(s.params.consonantMs > s.params.preutterMs);
    REQUIRE(s.params.overlapMs == Approx(30.0));
    REQUIRE(s.params.overlapMs > 20.0);
    REQUIRE(s.params.overlapMs < 60.0);
    REQUIRE(s.params.cutoffMs == Approx(-30.0));
    REQUIRE(s.confidence == Approx(0.854).margin(0.001));
    REQUIRE(s.confidence > 0.7);
    REQUIRE(s.validationWarnings.empty());
    REQUIRE(s.phonemesDetected.size() == 2);
}

TEST_CASE("Cutoff measures trailing silence after the last confident segment", "[estimation]") {
    const OtoEstimator estimator;
    const auto s = estimator.estimate(ka(180.0), 250.0);
    REQUIRE(s.params.cutoffMs == Approx(-50.0));
}

TEST_CASE("Empty alignment yields documented defaults", "[estimation]") {
    const OtoEstimator estimator;
    const auto s = estimator.estimate({}, 300.0);
    require_defaults(s);
    REQUIRE(s.audioDurationMs == Approx(300.0));
}

TEST_CASE("Unreliable alignment falls back to defaults", "[estimation]") {
    const OtoEstimator estimator;
    const auto s = estimator.estimate({{"a", 0.0, 10.0, 0.0}}, 10000.0);
    require_defaults(s);
    REQUIRE(s.phonemesDetected.size() == 1);
}

TEST_CASE("Malformed segments are ignored instead of raising", "[estimation]") {
    const OtoEstimator estimator;
    const double nan = std::numeric_limits<double>::quiet_NaN();

    uvm::engine::OtoSuggestion s;
    REQUIRE_NOTHROW(s = estimator.estimate({{"a", nan, 100.0, 0.9}, {"k", 50.0, 20.0, 0.9}}, 300.0));
    require_defaults(s);
    REQUIRE(s.phonemesDetected.empty());

    REQUIRE_NOTHROW(s = estimator.estimate(ka(), -1.0));
    REQUIRE(s.params.preutterMs == Approx(60.0));
}

TEST_CASE("Overlap interpolates from offset toward preutterance", "[estimation]") {
    const OtoEstimator estimator;
    REQUIRE(estimator.estimate_overlap(20.0, 100.0) == 52.0);
    REQUIRE(estimator.estimate_overlap(50.0, 40.0) == 50.0);
    REQUIRE(estimator.estimate_overlap(30.0, 30.0) == 30.0);
}

TEST_CASE("Consonant-aware overlap uses the preutterance consonant", "[estimation]") {
    EstimationParams params;
    params.consonantAwareOverlap = true;
    const OtoEstimator estimator(params);

    REQUIRE(estimator.estimate_overlap(20.0, 100.0, std::string("k")) == Approx(36.0));
    REQUIRE(estimator.estimate_overlap(20.0, 100.0, std::string("zz")) == Approx(52.0));

    const auto s = estimator.estimate(ka(), 250.0);
    REQUIRE(s.params.overlapMs == Approx(20.0));

    REQUIRE(uvm::engine::consonant_overlap_ratio("m") == Approx(0.6));
    REQUIRE_FALSE(uvm::engine::consonant_overlap_ratio("a").has_value());
}

TEST_CASE("VCV-shaped input aligns to the sustained vowel", "[estimation]") {
    const OtoEstimator estimator;
    const auto s = estimator.estimate({{"a", 0.0, 100.0, 0.9}, {"k", 100.0, 150.0, 0.9}, {"a", 150.0, 400.0, 0.9}},
                                      450.0);

    REQUIRE(s.params.offsetMs == 0.0);
    REQUIRE(s.params.preutterMs == Approx(150.0));
    REQUIRE(s.params.consonantMs == Approx(225.0));
    REQUIRE(s.params.overlapMs == Approx(60.0));
    REQUIRE(s.params.cutoffMs == Approx(-30.0));
}

TEST_CASE("Main vowel selection tolerates overlapping boundaries", "[estimation]") {
    const std::vector<PhonemeSegment> consonants = {{"k", 0.0, 100.0, 0.9}};
    const std::vector<PhonemeSegment> vowels = {{"a", 50.0, 150.0, 0.9}};
    REQUIRE(uvm::engine::find_main_vowel(consonants, vowels).startMs == 50.0);

    const std::vector<PhonemeSegment> adjacent = {{"a", 99.9995, 200.0, 0.9}, {"i", 200.0, 300.0, 0.9}};
    REQUIRE(uvm::engine::find_main_vowel(consonants, adjacent).phoneme == "a");
}

TEST_CASE("Consonant-only input pads past the last consonant", "[estimation]") {
    const OtoEstimator estimator;
    const auto s = estimator.estimate({{"k", 10.0, 50.0, 0.9}, {"s", 50.0, 100.0, 0.9}}, 200.0);

    REQUIRE(s.params.offsetMs == 0.0);
    REQUIRE(s.params.preutterMs == Approx(100.0));
    REQUIRE(s.params.consonantMs == Approx(120.0));
    REQUIRE(s.params.overlapMs == Approx(40.0));
    REQUIRE(s.params.cutoffMs == Approx(-80.0));
}

TEST_CASE("Vowel-only input fixes 40 percent into the vowel", "[estimation]") {
    const OtoEstimator estimator;
    const auto s = estimator.estimate({{"a", 30.0, 230.0, 0.8}}, 300.0);

    REQUIRE(s.params.offsetMs == Approx(20.0));
    REQUIRE(s.params.preutterMs == Approx(30.0));
    REQUIRE(s.params.consonantMs == Approx(110.0));
    REQUIRE(s.params.overlapMs == Approx(24.0));
    REQUIRE(s.params.cutoffMs == Approx(-50.0));
    REQUIRE(s.confidence == Approx(0.74).margin(0.001));
}

TEST_CASE("Cutoff never leaves less than ten milliseconds", "[estimation]") {
    const OtoEstimator estimator;
    REQUIRE(estimator.estimate_cutoff(210.0, ka()) == -10.0);
    REQUIRE(estimator.estimate_cutoff(100.0, {}) == -30.0);
}

TEST_CASE("Confidence weighs segment count", "[estimation]") {
    const OtoEstimator estimator;

    std::vector<PhonemeSegment> many;
    for (int i = 0; i < 12; ++i) {
        many.push_back({"a", i * 10.0, i * 10.0 + 10.0, 1.0});
    }
    REQUIRE(estimator.calculate_confidence(many, 120.0) == Approx(0.8));
    REQUIRE(estimator.calculate_confidence({{"a", 0.0, 100.0, 1.0}}, 100.0) == Approx(0.94));
    REQUIRE(estimator.calculate_confidence({}, 100.0) == 0.0);
    REQUIRE(estimator.calculate_confidence({{"a", 0.0, 100.0, 1.0}}, 0.0) == Approx(0.64));
}

TEST_CASE("Offset skips leading low-confidence segments", "[estimation]") {
    const OtoEstimator estimator;
    REQUIRE(estimator.estimate_offset({{"k", 5.0, 40.0, 0.1}, {"a", 40.0, 200.0, 0.9}}) == Approx(30.0));
    REQUIRE(estimator.estimate_offset({{"k", 5.0, 40.0, 0.1}}) == 0.0);
}

TEST_CASE("Every suggestion passes strict validation", "[estimation]") {
    const OtoEstimator estimator;
    const std::vector<std::vector<PhonemeSegment>> inputs = {
        {},
        ka(),
        {{"a", 0.0, 5.0, 0.9}},
        {{"k", 300.0, 310.0, 0.9}, {"a", 0.0, 20.0, 0.9}},
        {{"sil", 0.0, 50.0, 0.9}, {"xyz", 50.0, 90.0, 0.9}},
    };
    for (const auto& segments : inputs) {
        const auto s = estimator.estimate(segments, 400.0);
        REQUIRE_NOTHROW(uvm::engine::validate_strict(s.params));
        REQUIRE(s.params.overlapMs <= s.params.preutterMs);
    }
}

TEST_CASE("Tightness interpolates estimation padding", "[estimation]") {
    const auto loose = EstimationParams::from_tightness(0.0);
    REQUIRE(loose.offsetPaddingMs == Approx(20.0));
    REQUIRE(loose.cutoffPaddingMs == Approx(30.0));
    REQUIRE(loose.overlapRatio == Approx(0.5));
    REQUIRE(loose.minConfidence == Approx(0.2));

    const auto tight = EstimationParams::from_tightness(1.0);
    REQUIRE(tight.offsetPaddingMs == Approx(5.0));
    REQUIRE(tight.consonantVowelExtension == Approx(0.25));

    const auto clamped = EstimationParams::from_tightness(7.0);
    REQUIRE(clamped.offsetPaddingMs == Approx(5.0));

    const auto cv = EstimationParams::from_tightness(0.5, uvm::engine::RecordingStyle::Cv);
    const auto vcv = EstimationParams::from_tightness(0.5, uvm::engine::RecordingStyle::Vcv);
    REQUIRE(cv.overlapRatio == Approx(0.3));
    REQUIRE(vcv.overlapRatio == Approx(0.5));
}

TEST_CASE("Suggest runs the aligner on the sample", "[estimation]") {
    uvm::test::TempDir dir;
    const auto wav = uvm::test::write_tone(dir.path() / "_ka.wav", 250.0);

    uvm::test::FakeAligner aligner;
    aligner.segments = ka();
    aligner.durationMs = 250.0;

    const OtoEstimator estimator;
    const auto s = estimator.suggest(aligner, wav);
    REQUIRE(aligner.calls == 1);
    REQUIRE(s.wavFile == "_ka.wav");
    REQUIRE(s.alias == "- ka");
    REQUIRE(s.params.preutterMs == Approx(60.0));

    const auto named = estimator.suggest(aligner, wav, std::string("ka"));
    REQUIRE(named.alias == "ka");
}

TEST_CASE("Suggest degrades when alignment fails", "[estimation]") {
    uvm::test::FakeAligner aligner;
    aligner.fail = true;
    const OtoEstimator estimator;

    SECTION("unreadable audio assumes one second") {
        const auto s = estimator.suggest(aligner, "missing/_ka.wav");
        require_defaults(s);
        REQUIRE(s.audioDurationMs == Approx(1000.0));
        REQUIRE(s.alias == "- ka");
    }

    SECTION("readable audio reports its duration") {
        uvm::test::TempDir dir;
        const auto wav = uvm::test::write_tone(dir.path() / "_sa.wav", 400.0);
        const auto s = estimator.suggest(aligner, wav);
        require_defaults(s);
        REQUIRE(s.audioDurationMs == Approx(400.0).margin(0.1));
    }
}

TEST_CASE("Aliases and transcripts derive from sample filenames", "[estimation]") {
    REQUIRE(uvm::engine::alias_from_filename("_ka.wav") == "- ka");
    REQUIRE(uvm::engine::alias_from_filename("a.wav") == "- a");
    REQUIRE(uvm::engine::alias_from_filename("_akasa.wav") == "akasa");
    REQUIRE(uvm::engine::alias_from_filename("a_ka.wav") == "a_ka");

    REQUIRE(uvm::engine::transcript_from_filename("_ka.wav") == "ka");
    REQUIRE(uvm::engine::transcript_from_filename("0003_a_ka.wav") == "a ka");
}
