#pragma once

#include "uvm/engine/aligner.hpp"
#include "uvm/engine/types.hpp"
#include "uvm/engine/wav.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace uvm::test {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Sine tone with the given peak amplitude.
engine::WavData make_tone(double durationMs, int sampleRate = 44100, int channels = 1, float amplitude = 0.5f);

// Writes a mono 16-bit tone and returns its path.
std::filesystem::path write_tone(const std::filesystem::path& path, double durationMs, int sampleRate = 44100);

std::string read_bytes(const std::filesystem::path& path);

// Returns a canned alignment, or throws AlignmentError when configured to fail.
class FakeAligner : public engine::Aligner {
public:
    std::vector<engine::PhonemeSegment> segments;
    double durationMs = 0.0;
    bool fail = false;
    // Overrides `segments` per audio file when set.
    std::function<std::vector<engine::PhonemeSegment>(const std::filesystem::path&)> bySource;
    int calls = 0;

    engine::AlignmentResult align(const std::filesystem::path& audio,
                                  const std::string& transcript,
                                  const std::string& language) override;
};

}  // namespace uvm::test
