#pragma once

#include "uvm/engine/types.hpp"
#include "uvm/engine/wav.hpp"

#include <vector>

namespace uvm::engine {

inline constexpr int kTargetSampleRate = 44100;
inline constexpr float kPeakTarget = 0.95f;
inline constexpr double kFadeMs = 5.0;

// Averages all channels of each frame.
AudioBuffer to_mono(const WavData& wav);

// Linear interpolation. Returns the input unchanged when the rates match.
AudioBuffer resample_linear(const AudioBuffer& buffer, int targetRate);

// Scales so the absolute peak equals target. Silent buffers are left alone.
void peak_normalize(AudioBuffer& buffer, float target = kPeakTarget);

// Linear fade-in and fade-out, capped to a quarter of the buffer; no-op below 2 samples.
void apply_fade(AudioBuffer& buffer, double fadeMs = kFadeMs);

// Copies [startMs, endMs) clamped to the buffer; empty if the range is empty.
AudioBuffer slice_ms(const AudioBuffer& buffer, double startMs, double endMs);

}  // namespace uvm::engine
