#pragma once

#include <string>
#include <vector>

namespace uvm::engine {

struct PhonemeSegment {
    std::string phoneme;
    double startMs = 0.0;
    double endMs = 0.0;
    double confidence = 0.0;

    [[nodiscard]] double duration_ms() const { return endMs - startMs; }

    bool operator==(const PhonemeSegment&) const = default;
};

// Timing record of one oto alias. All values in milliseconds.
// cutoffMs < 0 is measured back from the end of the audio; overlapMs < 0 leaves a silent gap.
struct OtoParams {
    double offsetMs = 0.0;
    double consonantMs = 0.0;
    double cutoffMs = 0.0;
    double preutterMs = 0.0;
    double overlapMs = 0.0;

    bool operator==(const OtoParams&) const = default;
};

struct OtoEntry {
    std::string wavFile;
    std::string alias;
    OtoParams params;

    bool operator==(const OtoEntry&) const = default;
};

// Machine-estimated parameters, already repaired by clamp().
struct OtoSuggestion {
    std::string wavFile;
    std::string alias;
    OtoParams params;
    double confidence = 0.0;
    double audioDurationMs = 0.0;
    std::vector<PhonemeSegment> phonemesDetected;
    std::vector<std::string> validationWarnings;

    [[nodiscard]] OtoEntry to_entry() const { return {wavFile, alias, params}; }
};

struct SlicedSample {
    std::string wavFile;
    std::string alias;
    std::string sourceTakeId;
    std::string phonemeLabel;
    double startMs = 0.0;
    double endMs = 0.0;
    double durationMs = 0.0;
};

struct AudioBuffer {
    int sampleRate = 44100;
    std::vector<float> samples;

    [[nodiscard]] double duration_ms() const {
        return sampleRate > 0 ? static_cast<double>(samples.size()) * 1000.0 / sampleRate : 0.0;
    }
};

enum class RecordingStyle {
    Cv,
    Vcv,
    Cvvc,
    Vccv,
    Arpasing,
};

RecordingStyle parse_recording_style(const std::string& value);
std::string to_string(RecordingStyle style);

}  // namespace uvm::engine
