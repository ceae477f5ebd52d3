#include "uvm/engine/slicer.hpp"

#include "uvm/engine/phoneme.hpp"
#include "uvm/logging.hpp"

#include <QString>

#include <algorithm>
#include <string_view>

namespace uvm::engine {

namespace {

constexpr std::string_view kUnsafeChars = " /\\:*?\"<>|";

std::string join_labels(const std::vector<PhonemeSegment>& segments, std::size_t from, std::size_t to) {
    std::string out;
    for (std::size_t i = from; i < to; ++i) {
        out += segments[i].phoneme;
    }
    return out;
}

}  // namespace

std::vector<OtoEntry> TakeResult::entries() const {
    std::vector<OtoEntry> out;
    out.reserve(suggestions.size());
    for (const auto& suggestion : suggestions) {
        out.push_back(suggestion.to_entry());
    }
    return out;
}

std::string sanitize_name(const std::string& name, std::size_t maxLength) {
    std::string safe = name;
    for (char& ch : safe) {
        if (kUnsafeChars.find(ch) != std::string_view::npos) {
            ch = '_';
        }
    }

    const auto first = safe.find_first_not_of('_');
    if (first == std::string::npos) {
        return "sample";
    }
    const auto last = safe.find_last_not_of('_');
    safe = safe.substr(first, last - first + 1);

    // Cut on characters, not bytes, so multi-byte prompts stay valid UTF-8.
    auto chars = QString::fromStdString(safe);
    if (static_cast<std::size_t>(chars.size()) > maxLength) {
        auto n = static_cast<qsizetype>(maxLength);
        if (n > 0 && chars.at(n - 1).isHighSurrogate()) {
            --n;
        }
        chars.truncate(n);
    }
    return chars.toStdString();
}

std::string unique_filename(const std::filesystem::path& dir, const std::string& filename) {
    if (!std::filesystem::exists(dir / filename)) {
        return filename;
    }

    const std::filesystem::path name(filename);
    const auto stem = name.stem().string();
    const auto ext = name.extension().string();
    for (int counter = 1;; ++counter) {
        auto candidate = stem + "_" + std::to_string(counter) + ext;
        if (!std::filesystem::exists(dir / candidate)) {
            return candidate;
        }
    }
}

std::vector<PhonemeSegment> segments_in_window(const std::vector<PhonemeSegment>& segments,
                                               double startMs,
                                               double endMs) {
    std::vector<PhonemeSegment> out;
    for (const auto& segment : segments) {
        if (segment.endMs <= startMs || segment.startMs >= endMs) {
            continue;
        }
        out.push_back({segment.phoneme,
                       std::max(segment.startMs, startMs) - startMs,
                       std::min(segment.endMs, endMs) - startMs,
                       segment.confidence});
    }
    return out;
}

SampleSlicer::SampleSlicer(const OtoEstimator& estimator, SlicerConfig config)
    : estimator_(estimator), config_(config) {}

SliceWindow SampleSlicer::whole_take(const std::vector<PhonemeSegment>& segments,
                                     double takeDurationMs,
                                     const std::string& promptText,
                                     std::string alias) const {
    SliceWindow window;
    if (segments.empty()) {
        window.endMs = takeDurationMs;
    } else {
        window.startMs = std::max(0.0, segments.front().startMs - kTakeLeadMs);
        window.endMs = std::min(takeDurationMs, segments.back().endMs + kTakeTrailMs);
    }
    window.alias = std::move(alias);
    window.baseName = "_" + sanitize_name(promptText, config_.maxNameLength);
    window.phonemeLabel = promptText;
    return window;
}

std::vector<SliceWindow> SampleSlicer::plan(RecordingStyle style,
                                            const std::vector<PhonemeSegment>& segments,
                                            double takeDurationMs,
                                            const std::string& promptText) const {
    if (style == RecordingStyle::Cv) {
        return {whole_take(segments, takeDurationMs, promptText, "- " + promptText)};
    }
    if (style != RecordingStyle::Vcv) {
        return {whole_take(segments, takeDurationMs, promptText, promptText)};
    }

    std::vector<std::size_t> vowels;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (is_vowel(segments[i].phoneme)) {
            vowels.push_back(i);
        }
    }
    if (vowels.size() < 2) {
        qCInfo(lcUvmEngine).noquote() << "VCV take" << QString::fromStdString(promptText) << "has" << vowels.size()
                                      << "vowels, using the whole take";
        return {whole_take(segments, takeDurationMs, promptText, promptText)};
    }

    std::vector<SliceWindow> windows;
    windows.reserve(vowels.size() - 1);
    for (std::size_t k = 0; k + 1 < vowels.size(); ++k) {
        const auto& first = segments[vowels[k]];
        const auto& second = segments[vowels[k + 1]];
        const auto middle = join_labels(segments, vowels[k] + 1, vowels[k + 1]);

        SliceWindow window;
        window.startMs = std::max(0.0, first.startMs - kVcvLeadMs);
        window.endMs = std::min(takeDurationMs, second.endMs + kVcvTrailMs);
        window.alias = first.phoneme + " " + middle + second.phoneme;
        window.baseName = "_" + sanitize_name(first.phoneme + "_" + middle + second.phoneme, config_.maxNameLength);
        window.phonemeLabel = window.alias;
        windows.push_back(std::move(window));
    }
    return windows;
}

TakeResult SampleSlicer::process(const TakeInput& take, const std::filesystem::path& outputDir) const {
    // Slice boundaries are in milliseconds, so the take is converted once up front.
    const auto source = resample_linear(to_mono(take.audio), config_.targetSampleRate);
    const auto windows = plan(take.style, take.segments, source.duration_ms(), take.promptText);

    TakeResult result;
    for (const auto& window : windows) {
        auto slice = slice_ms(source, window.startMs, window.endMs);
        if (slice.duration_ms() < config_.minSampleMs) {
            qCWarning(lcUvmEngine).noquote() << "slice" << QString::fromStdString(window.alias) << "of take"
                                             << QString::fromStdString(take.takeId) << "is"
                                             << slice.duration_ms() << "ms, below the minimum; skipped";
            ++result.skippedSlices;
            continue;
        }

        peak_normalize(slice);
        apply_fade(slice, config_.fadeMs);

        const auto filename = unique_filename(outputDir, window.baseName + ".wav");
        write_wav(slice, outputDir / filename);

        SlicedSample sample;
        sample.wavFile = filename;
        sample.alias = window.alias;
        sample.sourceTakeId = take.takeId;
        sample.phonemeLabel = window.phonemeLabel;
        sample.startMs = window.startMs;
        sample.endMs = window.endMs;
        sample.durationMs = window.endMs - window.startMs;

        auto suggestion = estimator_.estimate(segments_in_window(take.segments, window.startMs, window.endMs),
                                              slice.duration_ms(), filename, window.alias);
        qCDebug(lcUvmEngine).noquote() << "wrote" << QString::fromStdString(filename) << "alias"
                                       << QString::fromStdString(window.alias) << "confidence"
                                       << suggestion.confidence;

        result.samples.push_back(std::move(sample));
        result.suggestions.push_back(std::move(suggestion));
    }
    return result;
}

}  // namespace uvm::engine
