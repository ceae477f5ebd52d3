#pragma once

#include "uvm/engine/audio.hpp"
#include "uvm/engine/estimation.hpp"
#include "uvm/engine/types.hpp"
#include "uvm/engine/wav.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace uvm::engine {

inline constexpr double kMinSampleMs = 50.0;
inline constexpr std::size_t kMaxNameLength = 50;

// Pads around the phonemes kept in a whole-take sample.
inline constexpr double kTakeLeadMs = 10.0;
inline constexpr double kTakeTrailMs = 20.0;
// Pads around a vowel-to-vowel transition.
inline constexpr double kVcvLeadMs = 30.0;
inline constexpr double kVcvTrailMs = 20.0;

struct SlicerConfig {
    int targetSampleRate = kTargetSampleRate;
    double fadeMs = kFadeMs;
    double minSampleMs = kMinSampleMs;
    std::size_t maxNameLength = kMaxNameLength;
};

// One planned cut of a take, in take-relative milliseconds.
struct SliceWindow {
    double startMs = 0.0;
    double endMs = 0.0;
    std::string alias;
    std::string baseName;
    std::string phonemeLabel;
};

struct TakeInput {
    std::string takeId;
    std::string promptText;
    RecordingStyle style = RecordingStyle::Cv;
    WavData audio;
    std::vector<PhonemeSegment> segments;
};

struct TakeResult {
    std::vector<SlicedSample> samples;
    std::vector<OtoSuggestion> suggestions;
    std::size_t skippedSlices = 0;

    [[nodiscard]] std::vector<OtoEntry> entries() const;
};

// Replaces characters unsafe in filenames with '_', trims underscores and
// caps the length. Never returns an empty name.
std::string sanitize_name(const std::string& name, std::size_t maxLength = kMaxNameLength);

// "name.wav", or "name_1.wav", "name_2.wav", ... when taken.
std::string unique_filename(const std::filesystem::path& dir, const std::string& filename);

// Segments overlapping [startMs, endMs), clipped and shifted to window-relative time.
std::vector<PhonemeSegment> segments_in_window(const std::vector<PhonemeSegment>& segments,
                                               double startMs,
                                               double endMs);

class SampleSlicer {
public:
    explicit SampleSlicer(const OtoEstimator& estimator, SlicerConfig config = {});

    // Pure style dispatch. Windows shorter than the minimum are still listed.
    [[nodiscard]] std::vector<SliceWindow> plan(RecordingStyle style,
                                                const std::vector<PhonemeSegment>& segments,
                                                double takeDurationMs,
                                                const std::string& promptText) const;

    // Cuts, post-processes and writes every slice of one take into outputDir,
    // estimating an oto entry for each. Throws AudioError when a write fails.
    TakeResult process(const TakeInput& take, const std::filesystem::path& outputDir) const;

    [[nodiscard]] const SlicerConfig& config() const { return config_; }

private:
    [[nodiscard]] SliceWindow whole_take(const std::vector<PhonemeSegment>& segments,
                                         double takeDurationMs,
                                         const std::string& promptText,
                                         std::string alias) const;

    const OtoEstimator& estimator_;
    SlicerConfig config_;
};

}  // namespace uvm::engine
