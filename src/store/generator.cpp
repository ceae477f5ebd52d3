#include "uvm/store/generator.hpp"

#include "uvm/engine/oto.hpp"
#include "uvm/engine/wav.hpp"
#include "uvm/errors.hpp"
#include "uvm/logging.hpp"

#include <QSaveFile>
#include <QString>

#include <chrono>
#include <cmath>
#include <system_error>

namespace uvm::store {

namespace {

double round_to(double value, double scale) {
    return std::round(value * scale) / scale;
}

}  // namespace

VoicebankGenerator::VoicebankGenerator(SessionService& sessions,
                                       engine::Aligner& aligner,
                                       const engine::OtoEstimator& estimator,
                                       engine::SlicerConfig slicerConfig,
                                       bool writeCharacterTxt)
    : sessions_(sessions), aligner_(aligner), slicer_(estimator, slicerConfig), writeCharacterTxt_(writeCharacterTxt) {}

engine::TakeResult VoicebankGenerator::process_take(const RecordingSession& session,
                                                    const RecordingSegment& segment,
                                                    const std::filesystem::path& outputDir) {
    const auto audioPath = sessions_.segment_audio_path(session.id, segment.audioFilename);
    auto alignment = aligner_.align(audioPath, segment.promptText, session.language);

    engine::TakeInput take;
    take.takeId = segment.id;
    take.promptText = segment.promptText;
    take.style = session.recordingStyle;
    take.audio = engine::read_wav(audioPath);
    take.segments = std::move(alignment.segments);
    return slicer_.process(take, outputDir);
}

GenerationReport VoicebankGenerator::generate(const std::string& sessionId,
                                              const std::string& name,
                                              const std::filesystem::path& outputDir) {
    const auto started = std::chrono::steady_clock::now();
    const auto session = sessions_.get(sessionId);

    std::vector<const RecordingSegment*> takes;
    for (const auto& segment : session.segments) {
        if (segment.isAccepted) {
            takes.push_back(&segment);
        }
    }
    if (takes.empty()) {
        throw SessionStateError("session '" + sessionId + "' has no accepted segments");
    }

    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        throw StoreError("cannot create " + outputDir.string() + ": " + ec.message());
    }

    GenerationReport report;
    report.name = name;
    report.path = std::filesystem::absolute(outputDir);

    std::vector<engine::OtoEntry> entries;
    double confidenceSum = 0.0;
    for (const auto* segment : takes) {
        qCInfo(lcUvmEngine).noquote() << "processing take" << QString::fromStdString(segment->audioFilename);
        try {
            const auto result = process_take(session, *segment, outputDir);
            if (result.samples.empty()) {
                ++report.skippedTakes;
                report.reasons.push_back({segment->audioFilename, "no slice reached the minimum duration"});
                qCWarning(lcUvmEngine).noquote() << "skipped take" << QString::fromStdString(segment->audioFilename)
                                                 << ": no slice reached the minimum duration";
                continue;
            }

            ++report.processedTakes;
            report.sampleCount += result.samples.size();
            for (const auto& suggestion : result.suggestions) {
                auto entry = suggestion.to_entry();
                if (!engine::is_representable(entry)) {
                    report.reasons.push_back({entry.wavFile, "alias cannot be written to oto.ini: " + entry.alias});
                    qCWarning(lcUvmEngine).noquote() << "no oto entry for" << QString::fromStdString(entry.wavFile)
                                                     << ": alias cannot be written";
                    continue;
                }
                confidenceSum += suggestion.confidence;
                entries.push_back(std::move(entry));
            }
        } catch (const Error& e) {
            ++report.failedTakes;
            report.reasons.push_back({segment->audioFilename, e.what()});
            qCWarning(lcUvmEngine).noquote() << "failed take" << QString::fromStdString(segment->audioFilename) << ":"
                                             << e.what();
        } catch (const std::filesystem::filesystem_error& e) {
            ++report.failedTakes;
            report.reasons.push_back({segment->audioFilename, e.what()});
            qCWarning(lcUvmEngine).noquote() << "failed take" << QString::fromStdString(segment->audioFilename) << ":"
                                             << e.what();
        }
    }

    report.otoEntryCount = entries.size();
    if (!entries.empty()) {
        engine::write_oto_file(outputDir / "oto.ini", entries);
        report.averageConfidence = round_to(confidenceSum / static_cast<double>(entries.size()), 1000.0);
        if (writeCharacterTxt_) {
            write_character_txt(session, name, outputDir);
        }
    } else {
        qCWarning(lcUvmEngine).noquote() << "no samples generated for session" << QString::fromStdString(sessionId);
    }

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
    report.elapsedSeconds = round_to(elapsed.count(), 100.0);
    qCInfo(lcUvmEngine).noquote() << "generated" << report.sampleCount << "samples from" << report.processedTakes
                                  << "takes into" << QString::fromStdString(report.path.string());
    return report;
}

void VoicebankGenerator::write_character_txt(const RecordingSession& session,
                                             const std::string& name,
                                             const std::filesystem::path& outputDir) const {
    const auto path = outputDir / "character.txt";
    const std::string content = "name=" + name + "\n" +
                                "type=UTAU voicebank\n" +
                                "language=" + session.language + "\n" +
                                "recording_style=" + engine::to_string(session.recordingStyle) + "\n" +
                                "generated_by=uvm\n";

    QSaveFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::WriteOnly) ||
        file.write(content.data(), static_cast<qint64>(content.size())) != static_cast<qint64>(content.size()) ||
        !file.commit()) {
        throw StoreError("cannot write " + path.string() + ": " + file.errorString().toStdString());
    }
}

}  // namespace uvm::store
