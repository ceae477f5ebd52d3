#pragma once

#include "uvm/engine/phoneme.hpp"
#include "uvm/engine/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace uvm::engine {

class Aligner;

// Values used when alignment is missing or too unreliable to trust.
inline constexpr double kDefaultOffsetMs = 20.0;
inline constexpr double kDefaultPreutterMs = 60.0;
inline constexpr double kDefaultConsonantMs = 100.0;
inline constexpr double kDefaultOverlapMs = 25.0;
inline constexpr double kDefaultCutoffMs = -30.0;

// The fixed region always extends at least this far past preutterance.
inline constexpr double kConsonantPastPreutterMs = 20.0;
// Padding added after the last consonant when no vowel was detected.
inline constexpr double kConsonantOnlyPadMs = 20.0;
inline constexpr double kVowelOnlyFixedRatio = 0.4;
// Cutoff never marks less than this much trailing audio.
inline constexpr double kMinCutoffMs = -10.0;

struct EstimationParams {
    double offsetPaddingMs = 10.0;
    double cutoffPaddingMs = 20.0;
    double overlapRatio = 0.4;
    double consonantVowelExtension = 0.3;
    double minConfidence = 0.3;
    bool consonantAwareOverlap = false;

    // tightness 0 = loose and padded, 1 = tight. The style nudges the overlap ratio.
    static EstimationParams from_tightness(double tightness, std::optional<RecordingStyle> style = std::nullopt);
};

// Overlap ratio for the consonant class at the preutterance point, or nullopt if unlisted.
std::optional<double> consonant_overlap_ratio(const std::string& consonant);

class OtoEstimator {
public:
    explicit OtoEstimator(EstimationParams params = {});

    [[nodiscard]] const EstimationParams& params() const { return params_; }

    // Never throws. Empty or unreliable input yields the documented defaults with confidence 0.
    [[nodiscard]] OtoSuggestion estimate(const std::vector<PhonemeSegment>& segments,
                                         double audioDurationMs,
                                         std::string wavFile = {},
                                         std::string alias = {}) const;

    // Runs the aligner on a sample file; alignment failure degrades to defaults.
    [[nodiscard]] OtoSuggestion suggest(Aligner& aligner,
                                        const std::filesystem::path& wavPath,
                                        std::optional<std::string> alias = std::nullopt,
                                        const std::string& language = "ja") const;

    [[nodiscard]] double calculate_confidence(const std::vector<PhonemeSegment>& segments,
                                              double audioDurationMs) const;
    [[nodiscard]] double estimate_offset(const std::vector<PhonemeSegment>& segments) const;
    [[nodiscard]] double estimate_consonant_end(const std::vector<PhonemeSegment>& segments,
                                                const PhonemeClassification& classification) const;
    [[nodiscard]] double estimate_preutterance(const std::vector<PhonemeSegment>& segments,
                                               const PhonemeClassification& classification) const;
    [[nodiscard]] double estimate_overlap(double offsetMs,
                                          double preutterMs,
                                          const std::optional<std::string>& consonant = std::nullopt) const;
    [[nodiscard]] double estimate_cutoff(double audioDurationMs,
                                         const std::vector<PhonemeSegment>& segments) const;

private:
    EstimationParams params_;
};

// The sustained vowel: first vowel after the consonant block for VCV-shaped input.
const PhonemeSegment& find_main_vowel(const std::vector<PhonemeSegment>& consonants,
                                      const std::vector<PhonemeSegment>& vowels);

// "_ka.wav" -> "- ka"; longer or non-alphabetic stems are used as-is.
std::string alias_from_filename(const std::string& filename);

// Recovers the sung text from a sample filename: "_ka.wav" -> "ka", "0003_a_ka.wav" -> "a ka".
std::string transcript_from_filename(const std::string& filename);

}  // namespace uvm::engine
