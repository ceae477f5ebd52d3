#pragma once

#include "uvm/engine/aligner.hpp"
#include "uvm/engine/estimation.hpp"
#include "uvm/store/oto_repository.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace uvm::store {

struct FailedItem {
    std::string file;
    std::string reason;
};

struct BatchOtoResult {
    std::string voicebankId;
    std::size_t totalSamples = 0;
    std::size_t processed = 0;
    std::size_t skipped = 0;
    std::size_t failed = 0;
    std::vector<engine::OtoEntry> entries;
    std::vector<FailedItem> failures;
    double averageConfidence = 0.0;
};

// Estimates oto entries for every sample of a voicebank and merges them into its oto.ini.
class BatchOtoService {
public:
    BatchOtoService(OtoRepository& repository, engine::Aligner& aligner, const engine::OtoEstimator& estimator);

    // Per-file failures are recorded in the result. Throws StoreError if
    // samplesDir is not a directory.
    BatchOtoResult run(const std::string& voicebankId,
                       const std::filesystem::path& samplesDir,
                       bool overwrite = false,
                       const std::string& language = "ja");

private:
    OtoRepository& repository_;
    engine::Aligner& aligner_;
    const engine::OtoEstimator& estimator_;
};

// *.wav files directly inside dir, sorted by name.
std::vector<std::filesystem::path> list_wav_files(const std::filesystem::path& dir);

}  // namespace uvm::store
