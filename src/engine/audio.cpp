#include "uvm/engine/audio.hpp"

#include <algorithm>
#include <cmath>

namespace uvm::engine {

AudioBuffer to_mono(const WavData& wav) {
    AudioBuffer mono;
    mono.sampleRate = wav.sampleRate;
    if (wav.channels <= 1) {
        mono.samples = wav.interleaved;
        return mono;
    }

    const auto frames = wav.frames();
    mono.samples.resize(frames);
    for (std::size_t frame = 0; frame < frames; ++frame) {
        float sum = 0.0f;
        for (int ch = 0; ch < wav.channels; ++ch) {
            sum += wav.interleaved[frame * wav.channels + ch];
        }
        mono.samples[frame] = sum / static_cast<float>(wav.channels);
    }
    return mono;
}

AudioBuffer resample_linear(const AudioBuffer& buffer, int targetRate) {
    if (buffer.sampleRate == targetRate || buffer.samples.empty() || buffer.sampleRate <= 0) {
        AudioBuffer out = buffer;
        out.sampleRate = targetRate;
        return out;
    }

    const double ratio = static_cast<double>(buffer.sampleRate) / targetRate;
    const auto outCount = static_cast<std::size_t>(
        std::llround(static_cast<double>(buffer.samples.size()) * targetRate / buffer.sampleRate));
    const std::size_t last = buffer.samples.size() - 1;

    AudioBuffer out;
    out.sampleRate = targetRate;
    out.samples.resize(outCount);
    for (std::size_t i = 0; i < outCount; ++i) {
        const double pos = static_cast<double>(i) * ratio;
        const auto left = std::min(static_cast<std::size_t>(pos), last);
        const auto right = std::min(left + 1, last);
        const auto frac = static_cast<float>(pos - static_cast<double>(left));
        out.samples[i] = buffer.samples[left] + (buffer.samples[right] - buffer.samples[left]) * frac;
    }
    return out;
}

void peak_normalize(AudioBuffer& buffer, float target) {
    float peak = 0.0f;
    for (const float sample : buffer.samples) {
        peak = std::max(peak, std::abs(sample));
    }
    if (peak <= 0.0f) {
        return;
    }
    const float gain = target / peak;
    for (float& sample : buffer.samples) {
        sample *= gain;
    }
}

void apply_fade(AudioBuffer& buffer, double fadeMs) {
    auto fadeSamples = static_cast<std::size_t>(fadeMs * buffer.sampleRate / 1000.0);
    fadeSamples = std::min(fadeSamples, buffer.samples.size() / 4);
    if (fadeSamples < 2) {
        return;
    }

    const auto denom = static_cast<float>(fadeSamples - 1);
    const std::size_t n = buffer.samples.size();
    for (std::size_t i = 0; i < fadeSamples; ++i) {
        const float gain = static_cast<float>(i) / denom;
        buffer.samples[i] *= gain;
        buffer.samples[n - 1 - i] *= gain;
    }
}

AudioBuffer slice_ms(const AudioBuffer& buffer, double startMs, double endMs) {
    AudioBuffer out;
    out.sampleRate = buffer.sampleRate;

    const auto toSample = [&](double ms) {
        const auto index = static_cast<long long>(ms * buffer.sampleRate / 1000.0);
        return static_cast<std::size_t>(std::clamp<long long>(index, 0, static_cast<long long>(buffer.samples.size())));
    };
    const auto begin = toSample(startMs);
    const auto end = toSample(endMs);
    if (end > begin) {
        out.samples.assign(buffer.samples.begin() + static_cast<std::ptrdiff_t>(begin),
                           buffer.samples.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return out;
}

}  // namespace uvm::engine
