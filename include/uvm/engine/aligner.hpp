#pragma once

#include "uvm/engine/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace uvm::engine {

struct AlignmentResult {
    std::vector<PhonemeSegment> segments;
    double durationMs = 0.0;
    std::string method;
};

// Forced-alignment collaborator. Implementations throw AlignmentError.
class Aligner {
public:
    virtual ~Aligner() = default;

    virtual AlignmentResult align(const std::filesystem::path& audio,
                                  const std::string& transcript,
                                  const std::string& language) = 0;

    [[nodiscard]] virtual bool is_available() const { return true; }
};

// Reads HTK-style label files: "<start> <end> <phoneme>" per line in 100 ns units.
// Without an explicit label path, "<audio stem>.lab" next to the audio is used.
class LabFileAligner : public Aligner {
public:
    LabFileAligner() = default;
    explicit LabFileAligner(std::filesystem::path labPath);

    AlignmentResult align(const std::filesystem::path& audio,
                          const std::string& transcript,
                          const std::string& language) override;

private:
    std::optional<std::filesystem::path> labPath_;
};

// Parses label text. Silence labels are dropped; malformed lines throw AlignmentError.
std::vector<PhonemeSegment> parse_lab(const std::string& text);

}  // namespace uvm::engine
