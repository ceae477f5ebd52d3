#pragma once

#include "uvm/engine/types.hpp"

#include <filesystem>
#include <vector>

namespace uvm::engine {

struct WavData {
    int sampleRate = 0;
    int channels = 0;
    // Frames interleaved by channel, scaled to [-1, 1].
    std::vector<float> interleaved;

    [[nodiscard]] std::size_t frames() const {
        return channels > 0 ? interleaved.size() / static_cast<std::size_t>(channels) : 0;
    }
    [[nodiscard]] double duration_ms() const {
        return sampleRate > 0 ? static_cast<double>(frames()) * 1000.0 / sampleRate : 0.0;
    }
};

// PCM 8/16/24/32-bit and IEEE float 32/64-bit, any channel count.
// Throws AudioError on unreadable or unsupported files.
WavData read_wav(const std::filesystem::path& path);

// Reads only the header chunks.
double wav_duration_ms(const std::filesystem::path& path);

// Mono 16-bit PCM.
void write_wav(const AudioBuffer& buffer, const std::filesystem::path& path);

}  // namespace uvm::engine
