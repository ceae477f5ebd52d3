#pragma once

#include "uvm/engine/types.hpp"

#include <string>
#include <utility>
#include <vector>

namespace uvm::engine {

// Throws InvalidTimingError when consonant or preutterance precede offset.
// Used on every human edit path.
void validate_strict(const OtoParams& params);

// Repairs machine-generated values instead of rejecting them. The returned
// warnings list is empty when nothing had to change.
std::pair<OtoParams, std::vector<std::string>> clamp(const OtoParams& params);

// Advisory checks for unusual but legal values.
std::vector<std::string> check_soft_warnings(const OtoParams& params);

}  // namespace uvm::engine
