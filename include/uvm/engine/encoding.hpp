#pragma once

#include <string>

namespace uvm::engine {

// Strips a UTF-8 byte order mark and carriage returns.
// oto.ini files from older voicebanks are often Shift-JIS; those bytes pass through untouched.
std::string normalize_text(std::string raw);

std::string to_lower_ascii(std::string value);
std::string trim(const std::string& value);

}  // namespace uvm::engine
