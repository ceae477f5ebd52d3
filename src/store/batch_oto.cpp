#include "uvm/store/batch_oto.hpp"

#include "uvm/engine/encoding.hpp"
#include "uvm/engine/oto.hpp"
#include "uvm/engine/wav.hpp"
#include "uvm/errors.hpp"
#include "uvm/logging.hpp"

#include <QString>

#include <algorithm>
#include <cmath>
#include <set>

namespace uvm::store {

std::vector<std::filesystem::path> list_wav_files(const std::filesystem::path& dir) {
    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file() && engine::to_lower_ascii(entry.path().extension().string()) == ".wav") {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end(),
              [](const auto& a, const auto& b) { return a.filename() < b.filename(); });
    return files;
}

BatchOtoService::BatchOtoService(OtoRepository& repository,
                                 engine::Aligner& aligner,
                                 const engine::OtoEstimator& estimator)
    : repository_(repository), aligner_(aligner), estimator_(estimator) {}

BatchOtoResult BatchOtoService::run(const std::string& voicebankId,
                                    const std::filesystem::path& samplesDir,
                                    bool overwrite,
                                    const std::string& language) {
    std::error_code ec;
    if (!std::filesystem::is_directory(samplesDir, ec)) {
        throw StoreError("samples directory not found: " + samplesDir.string());
    }

    BatchOtoResult result;
    result.voicebankId = voicebankId;

    const auto samples = list_wav_files(samplesDir);
    result.totalSamples = samples.size();

    std::set<std::string> existing;
    for (const auto& entry : repository_.entries(voicebankId)) {
        existing.insert(entry.wavFile);
    }

    double confidenceSum = 0.0;
    for (const auto& path : samples) {
        const auto filename = path.filename().string();
        if (!overwrite && existing.contains(filename)) {
            qCDebug(lcUvmStore).noquote() << "skipping" << QString::fromStdString(filename)
                                          << ": already has an oto entry";
            ++result.skipped;
            continue;
        }

        try {
            // Unreadable audio is a failure here rather than a silent default.
            engine::wav_duration_ms(path);
            const auto suggestion = estimator_.suggest(aligner_, path, std::nullopt, language);
            auto entry = suggestion.to_entry();
            if (!engine::is_representable(entry)) {
                throw OtoValidationError("alias cannot be written to oto.ini: " + entry.alias);
            }
            result.entries.push_back(std::move(entry));
            confidenceSum += suggestion.confidence;
            ++result.processed;
        } catch (const Error& e) {
            qCWarning(lcUvmStore).noquote() << "failed to process" << QString::fromStdString(filename) << ":"
                                            << e.what();
            ++result.failed;
            result.failures.push_back({filename, e.what()});
        }
    }

    if (result.processed > 0) {
        result.averageConfidence = std::round(confidenceSum / static_cast<double>(result.processed) * 1000.0) / 1000.0;
    }
    if (!result.entries.empty()) {
        repository_.merge_entries(voicebankId, result.entries, overwrite);
        qCInfo(lcUvmStore).noquote() << "saved" << result.entries.size() << "oto entries for"
                                     << QString::fromStdString(voicebankId);
    }
    return result;
}

}  // namespace uvm::store
