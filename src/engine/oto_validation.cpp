#include "uvm/engine/oto_validation.hpp"

#include "uvm/errors.hpp"

#include <sstream>

namespace uvm::engine {

namespace {

std::string clamp_message(const char* field, double from, double to, const char* reason) {
    std::ostringstream ss;
    ss << "clamped " << field << " from " << from << " to " << to << ": " << reason;
    return ss.str();
}

}  // namespace

void validate_strict(const OtoParams& params) {
    if (params.consonantMs < params.offsetMs) {
        throw InvalidTimingError("consonant", params.consonantMs, params.offsetMs);
    }
    if (params.preutterMs < params.offsetMs) {
        throw InvalidTimingError("preutterance", params.preutterMs, params.offsetMs);
    }
}

std::pair<OtoParams, std::vector<std::string>> clamp(const OtoParams& params) {
    OtoParams out = params;
    std::vector<std::string> warnings;

    if (out.consonantMs < out.offsetMs) {
        warnings.push_back(clamp_message("consonant", out.consonantMs, out.offsetMs,
                                         "fixed region end cannot precede playback start"));
        out.consonantMs = out.offsetMs;
    }

    if (out.preutterMs < out.offsetMs) {
        warnings.push_back(clamp_message("preutterance", out.preutterMs, out.offsetMs,
                                         "note alignment point cannot precede playback start"));
        out.preutterMs = out.offsetMs;
    }

    // Checked after preutterance is repaired so a second pass finds nothing to do.
    if (out.overlapMs > out.preutterMs) {
        warnings.push_back(clamp_message("overlap", out.overlapMs, out.preutterMs,
                                         "overlap longer than preutterance causes synthesis artifacts"));
        out.overlapMs = out.preutterMs;
    }

    return {out, std::move(warnings)};
}

std::vector<std::string> check_soft_warnings(const OtoParams& params) {
    std::vector<std::string> warnings;

    if (params.cutoffMs >= 0.0) {
        std::ostringstream ss;
        ss << "cutoff is non-negative (" << params.cutoffMs
           << "): it is normally negative, measured from the end of the sample";
        warnings.push_back(ss.str());
    }

    if (params.overlapMs > params.preutterMs) {
        std::ostringstream ss;
        ss << "overlap (" << params.overlapMs << ") exceeds preutterance (" << params.preutterMs
           << "): may cause synthesis artifacts";
        warnings.push_back(ss.str());
    }

    return warnings;
}

}  // namespace uvm::engine
