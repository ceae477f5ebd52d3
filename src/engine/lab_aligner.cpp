#include "uvm/engine/aligner.hpp"

#include "uvm/engine/encoding.hpp"
#include "uvm/engine/phoneme.hpp"
#include "uvm/engine/wav.hpp"
#include "uvm/errors.hpp"

#include <fstream>
#include <iterator>
#include <sstream>

namespace uvm::engine {

namespace {

// HTK time unit is 100 ns.
constexpr double kHtkUnitsPerMs = 10000.0;

}  // namespace

std::vector<PhonemeSegment> parse_lab(const std::string& text) {
    std::vector<PhonemeSegment> segments;
    std::stringstream ss(normalize_text(text));
    std::string line;
    int lineNo = 0;

    while (std::getline(ss, line)) {
        ++lineNo;
        if (trim(line).empty()) {
            continue;
        }

        std::istringstream fields(line);
        long long start = 0;
        long long end = 0;
        std::string phoneme;
        if (!(fields >> start >> end >> phoneme) || end < start || start < 0) {
            throw AlignmentError("malformed label at line " + std::to_string(lineNo) + ": " + line);
        }
        if (is_silence(phoneme)) {
            continue;
        }

        segments.push_back({phoneme, start / kHtkUnitsPerMs, end / kHtkUnitsPerMs, 1.0});
    }
    return segments;
}

LabFileAligner::LabFileAligner(std::filesystem::path labPath) : labPath_(std::move(labPath)) {}

AlignmentResult LabFileAligner::align(const std::filesystem::path& audio,
                                      const std::string& /*transcript*/,
                                      const std::string& /*language*/) {
    auto labPath = labPath_.value_or(audio);
    if (!labPath_) {
        labPath.replace_extension(".lab");
    }

    std::ifstream in(labPath, std::ios::binary);
    if (!in) {
        throw AlignmentError("label file not found: " + labPath.string());
    }
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    AlignmentResult result;
    result.method = "lab";
    result.segments = parse_lab(text);
    try {
        result.durationMs = wav_duration_ms(audio);
    } catch (const AudioError& e) {
        throw AlignmentError(std::string("cannot read audio for alignment: ") + e.what());
    }
    return result;
}

}  // namespace uvm::engine
