#include "uvm/engine/estimation.hpp"

#include "uvm/engine/aligner.hpp"
#include "uvm/engine/encoding.hpp"
#include "uvm/engine/oto_validation.hpp"
#include "uvm/engine/wav.hpp"
#include "uvm/errors.hpp"
#include "uvm/logging.hpp"

#include <QString>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <numeric>
#include <unordered_map>

namespace uvm::engine {

namespace {

// Tolerance for boundaries that touch but differ by float noise.
constexpr double kBoundaryEpsilonMs = 1e-3;

double lerp(double a, double b, double t) {
    return a + (b - a) * t;
}

double round_to(double value, double scale) {
    return std::round(value * scale) / scale;
}

std::vector<PhonemeSegment> sanitize(const std::vector<PhonemeSegment>& segments) {
    std::vector<PhonemeSegment> out;
    out.reserve(segments.size());
    for (auto segment : segments) {
        if (!std::isfinite(segment.startMs) || !std::isfinite(segment.endMs) || segment.endMs < segment.startMs) {
            continue;
        }
        segment.startMs = std::max(0.0, segment.startMs);
        segment.endMs = std::max(segment.startMs, segment.endMs);
        segment.confidence = std::isfinite(segment.confidence) ? std::clamp(segment.confidence, 0.0, 1.0) : 0.0;
        out.push_back(std::move(segment));
    }
    return out;
}

double segment_count_score(std::size_t count) {
    if (count == 0) return 0.5;
    if (count == 1) return 0.7;
    if (count <= 5) return 1.0;
    if (count <= 10) return 0.8;
    return 0.0;
}

const PhonemeSegment* last_consonant_before(const std::vector<PhonemeSegment>& consonants, double vowelStartMs) {
    const PhonemeSegment* best = nullptr;
    for (const auto& c : consonants) {
        if (c.endMs <= vowelStartMs + kBoundaryEpsilonMs && (best == nullptr || c.endMs > best->endMs)) {
            best = &c;
        }
    }
    return best;
}

const PhonemeSegment& latest_end(const std::vector<PhonemeSegment>& segments) {
    return *std::max_element(segments.begin(), segments.end(),
                             [](const auto& a, const auto& b) { return a.endMs < b.endMs; });
}

const PhonemeSegment& earliest_start(const std::vector<PhonemeSegment>& segments) {
    return *std::min_element(segments.begin(), segments.end(),
                             [](const auto& a, const auto& b) { return a.startMs < b.startMs; });
}

std::optional<std::string> preutterance_consonant(const PhonemeClassification& classification) {
    if (classification.consonants.empty()) {
        return std::nullopt;
    }
    if (!classification.vowels.empty()) {
        const auto& vowel = find_main_vowel(classification.consonants, classification.vowels);
        if (const auto* c = last_consonant_before(classification.consonants, vowel.startMs)) {
            return strip_ipa_modifiers(c->phoneme);
        }
    }
    return strip_ipa_modifiers(latest_end(classification.consonants).phoneme);
}

const std::unordered_map<std::string, double>& overlap_ratio_table() {
    static const std::unordered_map<std::string, double> table = {
        // plosives
        {"k", 0.2}, {"g", 0.2}, {"t", 0.2}, {"d", 0.2}, {"p", 0.2}, {"b", 0.2}, {"q", 0.2}, {"c", 0.2},
        {"ky", 0.2}, {"gy", 0.2}, {"py", 0.2}, {"by", 0.2},
        // affricates
        {"ch", 0.25}, {"ts", 0.25}, {"dz", 0.25}, {"tʃ", 0.25}, {"dʒ", 0.25},
        // fricatives
        {"s", 0.4}, {"sh", 0.4}, {"h", 0.4}, {"f", 0.4}, {"z", 0.4}, {"v", 0.4}, {"x", 0.4}, {"hy", 0.4},
        {"θ", 0.4}, {"ð", 0.4}, {"ʃ", 0.4}, {"ʒ", 0.4}, {"ʂ", 0.4}, {"ʐ", 0.4}, {"ç", 0.4}, {"ɸ", 0.4},
        // nasals
        {"n", 0.6}, {"m", 0.6}, {"ny", 0.6}, {"my", 0.6}, {"ŋ", 0.6}, {"ɲ", 0.6}, {"ɳ", 0.6},
        // liquids and glides
        {"r", 0.6}, {"w", 0.6}, {"y", 0.6}, {"j", 0.6}, {"l", 0.6}, {"ry", 0.6},
        {"ɾ", 0.6}, {"ɹ", 0.6}, {"ɻ", 0.6}, {"ɭ", 0.6}, {"ɥ", 0.6},
    };
    return table;
}

}  // namespace

EstimationParams EstimationParams::from_tightness(double tightness, std::optional<RecordingStyle> style) {
    const double t = std::clamp(tightness, 0.0, 1.0);

    EstimationParams params;
    params.offsetPaddingMs = lerp(20.0, 5.0, t);
    params.cutoffPaddingMs = lerp(30.0, 10.0, t);
    params.overlapRatio = lerp(0.5, 0.3, t);
    params.consonantVowelExtension = lerp(0.4, 0.25, t);
    params.minConfidence = lerp(0.2, 0.4, t);

    if (style) {
        switch (*style) {
            case RecordingStyle::Cv: params.overlapRatio -= 0.1; break;
            case RecordingStyle::Vcv: params.overlapRatio += 0.1; break;
            case RecordingStyle::Cvvc: params.overlapRatio += 0.05; break;
            default: break;
        }
        params.overlapRatio = std::clamp(params.overlapRatio, 0.0, 1.0);
    }
    return params;
}

std::optional<double> consonant_overlap_ratio(const std::string& consonant) {
    const auto& table = overlap_ratio_table();
    const auto it = table.find(consonant);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

const PhonemeSegment& find_main_vowel(const std::vector<PhonemeSegment>& consonants,
                                      const std::vector<PhonemeSegment>& vowels) {
    if (consonants.empty()) {
        return earliest_start(vowels);
    }

    const double lastConsonantEnd = latest_end(consonants).endMs;
    const PhonemeSegment* best = nullptr;
    for (const auto& v : vowels) {
        if (v.startMs >= lastConsonantEnd - kBoundaryEpsilonMs && (best == nullptr || v.startMs < best->startMs)) {
            best = &v;
        }
    }
    if (best) {
        return *best;
    }

    // Boundaries may overlap slightly: accept any vowel starting after the first consonant.
    const double firstConsonantStart = earliest_start(consonants).startMs;
    for (const auto& v : vowels) {
        if (v.startMs > firstConsonantStart && (best == nullptr || v.startMs < best->startMs)) {
            best = &v;
        }
    }
    return best ? *best : earliest_start(vowels);
}

OtoEstimator::OtoEstimator(EstimationParams params) : params_(params) {}

double OtoEstimator::calculate_confidence(const std::vector<PhonemeSegment>& segments, double audioDurationMs) const {
    if (segments.empty()) {
        return 0.0;
    }

    const double meanConfidence =
        std::accumulate(segments.begin(), segments.end(), 0.0,
                        [](double acc, const auto& s) { return acc + s.confidence; }) /
        static_cast<double>(segments.size());

    const double covered = std::accumulate(segments.begin(), segments.end(), 0.0,
                                           [](double acc, const auto& s) { return acc + s.duration_ms(); });
    const double coverage = audioDurationMs > 0.0 ? std::min(1.0, covered / audioDurationMs) : 0.0;

    const double confidence =
        0.5 * meanConfidence + 0.3 * coverage + 0.2 * segment_count_score(segments.size());
    return std::clamp(confidence, 0.0, 1.0);
}

double OtoEstimator::estimate_offset(const std::vector<PhonemeSegment>& segments) const {
    if (segments.empty()) {
        return kDefaultOffsetMs;
    }
    for (const auto& segment : segments) {
        if (segment.confidence >= params_.minConfidence) {
            return std::max(0.0, segment.startMs - params_.offsetPaddingMs);
        }
    }
    return std::max(0.0, segments.front().startMs - params_.offsetPaddingMs);
}

double OtoEstimator::estimate_consonant_end(const std::vector<PhonemeSegment>& segments,
                                            const PhonemeClassification& classification) const {
    if (segments.empty()) {
        return kDefaultConsonantMs;
    }

    const auto& consonants = classification.consonants;
    const auto& vowels = classification.vowels;

    if (!consonants.empty() && !vowels.empty()) {
        const auto& vowel = find_main_vowel(consonants, vowels);
        const double extension = vowel.duration_ms() * params_.consonantVowelExtension;
        if (const auto* c = last_consonant_before(consonants, vowel.startMs)) {
            return c->endMs + extension;
        }
        return vowel.startMs + extension;
    }
    if (!consonants.empty()) {
        return latest_end(consonants).endMs + kConsonantOnlyPadMs;
    }
    if (!vowels.empty()) {
        const auto& vowel = earliest_start(vowels);
        return vowel.startMs + vowel.duration_ms() * kVowelOnlyFixedRatio;
    }
    return segments.back().endMs;
}

double OtoEstimator::estimate_preutterance(const std::vector<PhonemeSegment>& segments,
                                           const PhonemeClassification& classification) const {
    if (segments.empty()) {
        return kDefaultPreutterMs;
    }

    const auto& consonants = classification.consonants;
    const auto& vowels = classification.vowels;

    if (!consonants.empty() && !vowels.empty()) {
        const auto& vowel = find_main_vowel(consonants, vowels);
        if (const auto* c = last_consonant_before(consonants, vowel.startMs)) {
            return c->endMs;
        }
        return vowel.startMs;
    }
    if (!consonants.empty()) {
        return latest_end(consonants).endMs;
    }
    if (!vowels.empty()) {
        return earliest_start(vowels).startMs;
    }
    return segments.front().endMs;
}

double OtoEstimator::estimate_overlap(double offsetMs,
                                      double preutterMs,
                                      const std::optional<std::string>& consonant) const {
    double ratio = params_.overlapRatio;
    if (params_.consonantAwareOverlap && consonant) {
        ratio = consonant_overlap_ratio(*consonant).value_or(ratio);
    }
    if (preutterMs <= offsetMs) {
        return offsetMs;
    }
    return offsetMs + (preutterMs - offsetMs) * ratio;
}

double OtoEstimator::estimate_cutoff(double audioDurationMs, const std::vector<PhonemeSegment>& segments) const {
    if (segments.empty()) {
        return kDefaultCutoffMs;
    }

    const PhonemeSegment* last = &segments.back();
    for (auto it = segments.rbegin(); it != segments.rend(); ++it) {
        if (it->confidence >= params_.minConfidence) {
            last = &*it;
            break;
        }
    }

    const double soundEnd = last->endMs + params_.cutoffPaddingMs;
    return std::min(-(audioDurationMs - soundEnd), kMinCutoffMs);
}

OtoSuggestion OtoEstimator::estimate(const std::vector<PhonemeSegment>& input,
                                     double audioDurationMs,
                                     std::string wavFile,
                                     std::string alias) const {
    const auto segments = sanitize(input);
    if (!std::isfinite(audioDurationMs) || audioDurationMs < 0.0) {
        audioDurationMs = segments.empty() ? 0.0 : latest_end(segments).endMs;
    }

    OtoSuggestion suggestion;
    suggestion.wavFile = std::move(wavFile);
    suggestion.alias = std::move(alias);
    suggestion.audioDurationMs = round_to(audioDurationMs, 10.0);
    suggestion.phonemesDetected = segments;

    const auto classification = classify_segments(segments);
    double confidence = calculate_confidence(segments, audioDurationMs);

    OtoParams raw;
    if (segments.empty() || confidence < params_.minConfidence) {
        qCInfo(lcUvmEngine).noquote() << "low confidence" << confidence << "or no segments for"
                                      << QString::fromStdString(suggestion.wavFile) << "- using defaults";
        confidence = 0.0;
        raw = {kDefaultOffsetMs, kDefaultConsonantMs, kDefaultCutoffMs, kDefaultPreutterMs, kDefaultOverlapMs};
    } else {
        raw.offsetMs = estimate_offset(segments);
        raw.preutterMs = estimate_preutterance(segments, classification);
        raw.consonantMs = estimate_consonant_end(segments, classification);
        raw.cutoffMs = estimate_cutoff(audioDurationMs, segments);
        raw.overlapMs = estimate_overlap(raw.offsetMs, raw.preutterMs, preutterance_consonant(classification));
    }
    raw.consonantMs = std::max(raw.consonantMs, raw.preutterMs + kConsonantPastPreutterMs);

    raw.offsetMs = round_to(raw.offsetMs, 10.0);
    raw.consonantMs = round_to(raw.consonantMs, 10.0);
    raw.cutoffMs = round_to(raw.cutoffMs, 10.0);
    raw.preutterMs = round_to(raw.preutterMs, 10.0);
    raw.overlapMs = round_to(raw.overlapMs, 10.0);

    auto [params, warnings] = clamp(raw);
    for (const auto& warning : warnings) {
        qCDebug(lcUvmEngine).noquote() << QString::fromStdString(suggestion.wavFile) << ":"
                                       << QString::fromStdString(warning);
    }
    suggestion.params = params;
    suggestion.validationWarnings = std::move(warnings);
    suggestion.confidence = round_to(confidence, 1000.0);
    return suggestion;
}

OtoSuggestion OtoEstimator::suggest(Aligner& aligner,
                                    const std::filesystem::path& wavPath,
                                    std::optional<std::string> alias,
                                    const std::string& language) const {
    const auto filename = wavPath.filename().string();
    const auto resolvedAlias = alias ? *alias : alias_from_filename(filename);

    AlignmentResult alignment;
    try {
        alignment = aligner.align(wavPath, transcript_from_filename(filename), language);
        qCInfo(lcUvmEngine).noquote() << QString::fromStdString(alignment.method) << "alignment for"
                                      << QString::fromStdString(filename) << ":" << alignment.segments.size()
                                      << "segments";
    } catch (const AlignmentError& e) {
        qCWarning(lcUvmEngine).noquote() << "alignment failed for" << QString::fromStdString(filename)
                                         << ", using defaults:" << e.what();
    }

    if (alignment.segments.empty() && alignment.durationMs <= 0.0) {
        try {
            alignment.durationMs = wav_duration_ms(wavPath);
        } catch (const AudioError& e) {
            qCWarning(lcUvmEngine).noquote() << "cannot read duration of" << QString::fromStdString(filename)
                                             << ":" << e.what();
            alignment.durationMs = 1000.0;
        }
    }

    return estimate(alignment.segments, alignment.durationMs, filename, resolvedAlias);
}

std::string alias_from_filename(const std::string& filename) {
    auto stem = std::filesystem::path(filename).stem().string();
    if (stem.starts_with("_")) {
        stem.erase(0, 1);
    }
    const bool alphabetic = !stem.empty() && std::all_of(stem.begin(), stem.end(), [](unsigned char ch) {
        return std::isalpha(ch) != 0;
    });
    if (alphabetic && stem.size() <= 3) {
        return "- " + stem;
    }
    return stem;
}

std::string transcript_from_filename(const std::string& filename) {
    auto stem = std::filesystem::path(filename).stem().string();

    // Recorded takes are stored as "NNNN_prompt.wav".
    const auto underscore = stem.find('_');
    if (underscore != std::string::npos && underscore > 0 &&
        std::all_of(stem.begin(), stem.begin() + static_cast<std::ptrdiff_t>(underscore),
                    [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
        stem.erase(0, underscore + 1);
    }

    while (stem.starts_with("_")) {
        stem.erase(0, 1);
    }
    std::replace(stem.begin(), stem.end(), '_', ' ');
    return trim(stem);
}

}  // namespace uvm::engine
