#include "uvm/errors.hpp"

#include <sstream>
#include <utility>

namespace uvm {

namespace {

std::string describe(const std::string& field, double value, double offset) {
    std::ostringstream ss;
    ss << field << " (" << value << ") must be >= offset (" << offset << "), short by " << (offset - value) << " ms";
    return ss.str();
}

}  // namespace

InvalidTimingError::InvalidTimingError(std::string field, double value, double offset)
    : Error(describe(field, value, offset)), field_(std::move(field)), shortfall_(offset - value) {}

}  // namespace uvm
