#include "uvm/engine/types.hpp"

#include "uvm/engine/encoding.hpp"

#include <stdexcept>

namespace uvm::engine {

RecordingStyle parse_recording_style(const std::string& value) {
    const auto key = to_lower_ascii(trim(value));
    if (key == "cv") return RecordingStyle::Cv;
    if (key == "vcv") return RecordingStyle::Vcv;
    if (key == "cvvc") return RecordingStyle::Cvvc;
    if (key == "vccv") return RecordingStyle::Vccv;
    if (key == "arpasing") return RecordingStyle::Arpasing;
    throw std::invalid_argument("unsupported recording style: " + value);
}

std::string to_string(RecordingStyle style) {
    switch (style) {
        case RecordingStyle::Cv: return "cv";
        case RecordingStyle::Vcv: return "vcv";
        case RecordingStyle::Cvvc: return "cvvc";
        case RecordingStyle::Vccv: return "vccv";
        case RecordingStyle::Arpasing: return "arpasing";
    }
    return "cv";
}

}  // namespace uvm::engine
