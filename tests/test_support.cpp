#include "test_support.hpp"

#include "uvm/errors.hpp"

#include <QUuid>

#include <cmath>
#include <fstream>
#include <iterator>

namespace uvm::test {

TempDir::TempDir()
    : path_(std::filesystem::temp_directory_path() /
            ("uvm-test-" + QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString())) {
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

engine::WavData make_tone(double durationMs, int sampleRate, int channels, float amplitude) {
    constexpr double kPi = 3.14159265358979323846;
    const auto frames = static_cast<std::size_t>(durationMs * sampleRate / 1000.0);

    engine::WavData wav;
    wav.sampleRate = sampleRate;
    wav.channels = channels;
    wav.interleaved.reserve(frames * static_cast<std::size_t>(channels));
    for (std::size_t i = 0; i < frames; ++i) {
        const auto value = amplitude * static_cast<float>(std::sin(2.0 * kPi * 220.0 * static_cast<double>(i) / sampleRate));
        for (int ch = 0; ch < channels; ++ch) {
            wav.interleaved.push_back(value);
        }
    }
    return wav;
}

std::filesystem::path write_tone(const std::filesystem::path& path, double durationMs, int sampleRate) {
    const auto tone = make_tone(durationMs, sampleRate);
    engine::AudioBuffer buffer;
    buffer.sampleRate = sampleRate;
    buffer.samples = tone.interleaved;
    engine::write_wav(buffer, path);
    return path;
}

std::string read_bytes(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

engine::AlignmentResult FakeAligner::align(const std::filesystem::path& audio,
                                           const std::string& /*transcript*/,
                                           const std::string& /*language*/) {
    ++calls;
    if (fail) {
        throw AlignmentError("aligner unavailable");
    }
    engine::AlignmentResult result;
    result.method = "fake";
    result.segments = bySource ? bySource(audio) : segments;
    result.durationMs = durationMs > 0.0 ? durationMs : engine::wav_duration_ms(audio);
    return result;
}

}  // namespace uvm::test
