#pragma once

#include "uvm/engine/aligner.hpp"
#include "uvm/engine/estimation.hpp"
#include "uvm/engine/slicer.hpp"
#include "uvm/store/batch_oto.hpp"
#include "uvm/store/session.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace uvm::store {

struct GenerationReport {
    std::string name;
    std::filesystem::path path;
    std::size_t sampleCount = 0;
    std::size_t otoEntryCount = 0;
    std::size_t processedTakes = 0;
    std::size_t skippedTakes = 0;
    std::size_t failedTakes = 0;
    std::vector<FailedItem> reasons;
    double averageConfidence = 0.0;
    double elapsedSeconds = 0.0;
};

// Turns the accepted takes of a recording session into a voicebank folder:
// sliced samples, oto.ini and optionally character.txt.
class VoicebankGenerator {
public:
    VoicebankGenerator(SessionService& sessions,
                       engine::Aligner& aligner,
                       const engine::OtoEstimator& estimator,
                       engine::SlicerConfig slicerConfig = {},
                       bool writeCharacterTxt = true);

    // Per-take failures are counted and reasoned in the report. Throws
    // SessionNotFoundError, or SessionStateError when no take is accepted.
    GenerationReport generate(const std::string& sessionId,
                              const std::string& name,
                              const std::filesystem::path& outputDir);

private:
    engine::TakeResult process_take(const RecordingSession& session,
                                    const RecordingSegment& segment,
                                    const std::filesystem::path& outputDir);
    void write_character_txt(const RecordingSession& session,
                             const std::string& name,
                             const std::filesystem::path& outputDir) const;

    SessionService& sessions_;
    engine::Aligner& aligner_;
    engine::SampleSlicer slicer_;
    bool writeCharacterTxt_;
};

}  // namespace uvm::store
